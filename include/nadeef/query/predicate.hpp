#pragma once

#include <nadeef/core/column.hpp>
#include <nadeef/core/value.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace nadeef::query {

/// Supported comparison operators.
enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    IsNull,
};

/// A single-column comparison against a literal, e.g. `quantity > 0`.
struct Predicate {
    Column column;
    CompareOp op = CompareOp::Eq;
    Value value;

    /// Equality against `value`; a NULL value produces an IS NULL predicate.
    [[nodiscard]] static auto equal(Column column, Value value) -> Predicate;

    /// SQL rendering, e.g. `region = 'EU'`.
    [[nodiscard]] auto to_sql() const -> std::string;

    /// In-memory evaluation with SQL semantics: comparisons against NULL are false.
    [[nodiscard]] auto matches(const Value& candidate) const -> bool;

    auto operator==(const Predicate&) const -> bool = default;
};

[[nodiscard]] auto to_sql(CompareOp op) -> std::string_view;

/// Parse `<column> <op> <literal>` or `<column> IS NULL`.
/// Literals: integers, decimals, 'quoted text' and NULL.
[[nodiscard]] auto parse_predicate(std::string_view text, std::string_view table)
    -> std::expected<Predicate, std::string>;

}  // namespace nadeef::query
