#include <nadeef/pipeline/flow.hpp>

#include <fmt/format.h>

#include <exception>

namespace nadeef::pipeline {

auto Flow::add_stage(std::unique_ptr<Stage> stage) -> std::expected<void, AssemblyError> {
    if (stage == nullptr) {
        return std::unexpected(AssemblyError{.message = "cannot add a null stage"});
    }
    DataKind expected = stages_.empty() ? DataKind::Key : stages_.back()->output();
    if (stage->input() != expected) {
        return std::unexpected(AssemblyError{
            .message = fmt::format("stage {} accepts {} but the flow provides {}", stage->name(),
                                   to_string(stage->input()), to_string(expected))});
    }
    stages_.push_back(std::move(stage));
    return {};
}

auto Flow::run() -> FlowResult {
    std::atomic<bool> never{false};
    return run(never);
}

auto Flow::run(const std::atomic<bool>& cancelled) -> FlowResult {
    auto start = std::chrono::steady_clock::now();
    FlowResult result{.key = input_key_};
    auto finish = [&](FlowStatus status) {
        result.status = status;
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return std::move(result);
    };

    StageData data = input_key_;
    for (const auto& stage : stages_) {
        result.stage = stage->name();
        if (cancelled.load(std::memory_order_acquire)) {
            result.error = "cancelled";
            return finish(FlowStatus::Cancelled);
        }
        try {
            auto next = stage->run(std::move(data));
            if (!next) {
                result.error = std::move(next.error());
                return finish(FlowStatus::Failed);
            }
            data = std::move(*next);
        } catch (const std::exception& e) {
            result.error = fmt::format("stage {} raised: {}", stage->name(), e.what());
            return finish(FlowStatus::Failed);
        } catch (...) {
            result.error = fmt::format("stage {} raised an unknown exception", stage->name());
            return finish(FlowStatus::Failed);
        }
    }
    result.stage.clear();
    result.output = std::move(data);
    return finish(FlowStatus::Completed);
}

}  // namespace nadeef::pipeline
