#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace nadeef {

/// Name of the conventional integer row-identifier column.
inline constexpr const char* kTidColumn = "tid";

/// True when `name` is the row-identifier column, compared case-insensitively
/// like SQL identifiers.
[[nodiscard]] inline auto is_tid_name(std::string_view name) noexcept -> bool {
    std::string_view tid = kTidColumn;
    return name.size() == tid.size() &&
           std::equal(name.begin(), name.end(), tid.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == b;
           });
}

/// A (table, column) identity pair.
struct Column {
    std::string table;
    std::string name;

    Column() = default;
    Column(std::string table_name, std::string column_name)
        : table(std::move(table_name)), name(std::move(column_name)) {}

    /// "table.name" rendering.
    [[nodiscard]] auto full_name() const -> std::string { return table + "." + name; }

    /// True for the reserved row-identifier column.
    [[nodiscard]] auto is_tid() const noexcept -> bool { return is_tid_name(name); }

    auto operator==(const Column&) const -> bool = default;
};

[[nodiscard]] inline auto hash_combine(std::size_t seed, std::size_t value) noexcept
    -> std::size_t {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return seed;
}

}  // namespace nadeef

namespace std {

template <>
struct hash<nadeef::Column> {
    auto operator()(const nadeef::Column& c) const noexcept -> std::size_t {
        return nadeef::hash_combine(std::hash<std::string>{}(c.table),
                                    std::hash<std::string>{}(c.name));
    }
};

}  // namespace std
