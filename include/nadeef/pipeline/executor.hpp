#pragma once

#include <nadeef/pipeline/context.hpp>
#include <nadeef/pipeline/flow.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace nadeef::pipeline {

/// Outcome of one detect or repair batch.
struct ExecutionReport {
    /// False when any flow failed to assemble; then no flow ran.
    bool assembled = false;
    std::string error;
    /// One entry per rule, in rule order.
    std::vector<FlowResult> results;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto succeeded() const -> bool {
        if (!assembled) {
            return false;
        }
        for (const auto& result : results) {
            if (result.status != FlowStatus::Completed) {
                return false;
            }
        }
        return true;
    }
};

/// Builds one flow per rule and runs the flows concurrently.
///
/// Detect flows: deserializer -> query -> detector -> export.
/// Repair flows: deserializer -> repair.
class CleanExecutor {
   public:
    explicit CleanExecutor(std::shared_ptr<const CleanContext> context);

    CleanExecutor(const CleanExecutor&) = delete;
    auto operator=(const CleanExecutor&) -> CleanExecutor& = delete;

    /// Detection flows for `rules`. Either every flow assembles or none is
    /// returned; keys minted for a failed batch are released.
    [[nodiscard]] auto assemble_detect(const std::vector<RulePtr>& rules)
        -> std::expected<std::vector<Flow>, AssemblyError>;
    [[nodiscard]] auto assemble_repair(const std::vector<RulePtr>& rules)
        -> std::expected<std::vector<Flow>, AssemblyError>;

    auto detect(const std::vector<RulePtr>& rules) -> ExecutionReport;
    auto repair(const std::vector<RulePtr>& rules) -> ExecutionReport;

    /// Same, over the rules of the plan.
    auto detect() -> ExecutionReport;
    auto repair() -> ExecutionReport;

    /// Stop running flows before their next stage. Cleared when the next
    /// batch starts.
    void cancel() noexcept;

    [[nodiscard]] auto context() const noexcept -> const CleanContext& { return *context_; }

   private:
    enum class FlowShape : std::uint8_t { Detect, Repair };

    [[nodiscard]] auto assemble(const std::vector<RulePtr>& rules, FlowShape shape)
        -> std::expected<std::vector<Flow>, AssemblyError>;
    [[nodiscard]] auto assemble_one(const RulePtr& rule, FlowShape shape)
        -> std::expected<Flow, AssemblyError>;
    auto execute(const std::vector<RulePtr>& rules, FlowShape shape) -> ExecutionReport;
    void release(const std::vector<Flow>& flows);

    std::shared_ptr<const CleanContext> context_;
    std::atomic<bool> cancelled_{false};
};

}  // namespace nadeef::pipeline
