#pragma once

#include <nadeef/pipeline/stage.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nadeef::pipeline {

struct AssemblyError {
    std::string message;
};

enum class FlowStatus : std::uint8_t {
    Completed,
    Failed,
    Cancelled,
};

struct FlowResult {
    std::string key;
    FlowStatus status = FlowStatus::Completed;
    /// Stage that failed or was about to run when cancelled.
    std::string stage;
    std::string error;
    /// Output of the last stage when completed.
    std::optional<StageData> output;
    std::chrono::milliseconds elapsed{0};
};

/// An ordered chain of stages fed from one input key.
class Flow {
   public:
    explicit Flow(std::string input_key) : input_key_(std::move(input_key)) {}

    Flow(Flow&&) = default;
    auto operator=(Flow&&) -> Flow& = default;

    /// Append a stage. The first stage must accept the key; every later
    /// stage must accept what the previous one produces.
    [[nodiscard]] auto add_stage(std::unique_ptr<Stage> stage) -> std::expected<void, AssemblyError>;

    [[nodiscard]] auto input_key() const noexcept -> const std::string& { return input_key_; }
    [[nodiscard]] auto stages() const noexcept -> const std::vector<std::unique_ptr<Stage>>& {
        return stages_;
    }

    /// Run every stage in order. Stops at the first failure, or before the
    /// next stage once `cancelled` is set. Never throws.
    [[nodiscard]] auto run(const std::atomic<bool>& cancelled) -> FlowResult;
    [[nodiscard]] auto run() -> FlowResult;

   private:
    std::string input_key_;
    std::vector<std::unique_ptr<Stage>> stages_;
};

}  // namespace nadeef::pipeline
