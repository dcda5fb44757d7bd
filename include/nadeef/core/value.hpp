#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <variant>

namespace nadeef {

/// A single cell value as read from the store. std::monostate is SQL NULL.
using Value = std::variant<std::monostate, std::int64_t, double, std::string>;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/// Human-readable rendering (NULL prints as "NULL").
[[nodiscard]] auto to_string(const Value& value) -> std::string;

/// SQL literal rendering: text is single-quoted with embedded quotes doubled.
[[nodiscard]] auto to_sql_literal(const Value& value) -> std::string;

/// Total order used for sorting and grouping: NULL first, then numbers
/// (compared numerically across int and double), then text.
[[nodiscard]] auto order_values(const Value& lhs, const Value& rhs) -> std::weak_ordering;

struct ValueLess {
    auto operator()(const Value& lhs, const Value& rhs) const -> bool {
        return order_values(lhs, rhs) < 0;
    }
};

}  // namespace nadeef
