#include <nadeef/core/error.hpp>
#include <nadeef/core/schema.hpp>

#include <fmt/format.h>

namespace nadeef {

Schema::Schema(std::string table_name, std::vector<Column> columns)
    : table_name_(std::move(table_name)), columns_(std::move(columns)) {
    index_.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (!index_.emplace(columns_[i], i).second) {
            throw IntegrityError(
                fmt::format("duplicate column {} in schema of {}", columns_[i].full_name(),
                            table_name_));
        }
    }
}

auto Schema::index_of(const Column& column) const -> std::size_t {
    if (auto it = index_.find(column); it != index_.end()) {
        return it->second;
    }
    throw LookupError(
        fmt::format("column {} not found in schema of {}", column.full_name(), table_name_));
}

auto Schema::find(const Column& column) const -> std::optional<std::size_t> {
    if (auto it = index_.find(column); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Schema::column(std::string_view name) const -> const Column& {
    for (const auto& c : columns_) {
        if (c.name == name) {
            return c;
        }
    }
    throw LookupError(fmt::format("column {} not found in schema of {}", name, table_name_));
}

auto Schema::tid_index() const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].is_tid()) {
            return i;
        }
    }
    return std::nullopt;
}

}  // namespace nadeef
