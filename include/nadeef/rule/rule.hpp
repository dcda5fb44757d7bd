#pragma once

#include <nadeef/core/column.hpp>
#include <nadeef/core/row.hpp>
#include <nadeef/rule/violation.hpp>
#include <nadeef/table/table.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nadeef {

/// Number of rows a rule inspects at once.
enum class RuleArity : std::uint8_t {
    /// The rule sees a whole table (or block) at a time.
    Single,
    /// The rule sees pairs of rows.
    Pair,
};

/// A pluggable cleaning rule.
///
/// The engine never looks inside a rule: it asks for the source tables,
/// lets the rule shape the query, then calls the detect/repair hooks that
/// match the declared arity.
class Rule {
   public:
    Rule(std::string name, std::vector<std::string> tables)
        : name_(std::move(name)), tables_(std::move(tables)) {}
    virtual ~Rule() = default;

    /// Unique identity, used as the cache key and recorded with violations.
    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

    /// Source relations, one or two.
    [[nodiscard]] auto tables() const noexcept -> const std::vector<std::string>& {
        return tables_;
    }

    [[nodiscard]] virtual auto arity() const -> RuleArity { return RuleArity::Single; }

    /// Narrow the rows read for `table` (projection, predicates, ordering).
    virtual void scope(Table& /*table*/) const {}

    /// Columns to block on; rows in different blocks are never compared.
    [[nodiscard]] virtual auto block_columns() const -> std::vector<Column> { return {}; }

    [[nodiscard]] virtual auto detect(Table& /*table*/) const -> std::vector<Violation> {
        return {};
    }

    [[nodiscard]] virtual auto detect(const Row& /*left*/, const Row& /*right*/) const
        -> std::vector<Violation> {
        return {};
    }

    [[nodiscard]] virtual auto repair(const Violation& /*violation*/) const -> std::vector<Fix> {
        return {};
    }

   private:
    std::string name_;
    std::vector<std::string> tables_;
};

using RulePtr = std::shared_ptr<const Rule>;

}  // namespace nadeef
