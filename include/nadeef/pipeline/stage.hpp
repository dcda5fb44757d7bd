#pragma once

#include <nadeef/rule/rule.hpp>
#include <nadeef/table/table.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace nadeef::pipeline {

/// Source relations of a rule, unshaped.
struct RuleTables {
    RulePtr rule;
    std::vector<TablePtr> tables;
};

/// Shaped and materialized inputs: the blocks of a single-source rule, or
/// the two relations of a two-source rule.
struct RuleBlocks {
    RulePtr rule;
    std::vector<TablePtr> tables;
};

struct RuleViolations {
    RulePtr rule;
    std::vector<Violation> violations;
};

/// Final output of a flow: how many violations were exported or fixes applied.
struct StageSummary {
    std::string rule;
    std::size_t count = 0;
};

/// Value passed between stages. The first stage of every flow receives the
/// flow's input key.
using StageData = std::variant<std::string, RuleTables, RuleBlocks, RuleViolations, StageSummary>;

/// Tag of each StageData alternative, in variant order.
enum class DataKind : std::uint8_t {
    Key,
    Tables,
    Blocks,
    Violations,
    Summary,
};

[[nodiscard]] inline auto kind_of(const StageData& data) noexcept -> DataKind {
    return static_cast<DataKind>(data.index());
}

[[nodiscard]] auto to_string(DataKind kind) -> std::string_view;

/// A named unit of a flow with a fixed input and output kind.
class Stage {
   public:
    Stage(std::string name, DataKind input, DataKind output)
        : name_(std::move(name)), input_(input), output_(output) {}
    virtual ~Stage() = default;

    Stage(const Stage&) = delete;
    auto operator=(const Stage&) -> Stage& = delete;

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto input() const noexcept -> DataKind { return input_; }
    [[nodiscard]] auto output() const noexcept -> DataKind { return output_; }

    /// Check the input kind, execute, and check the output kind.
    [[nodiscard]] auto run(StageData data) -> std::expected<StageData, std::string>;

   protected:
    [[nodiscard]] virtual auto execute(StageData data)
        -> std::expected<StageData, std::string> = 0;

   private:
    std::string name_;
    DataKind input_;
    DataKind output_;
};

}  // namespace nadeef::pipeline
