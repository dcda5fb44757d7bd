#include <nadeef/pipeline/executor.hpp>
#include <nadeef/pipeline/stages.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <thread>

namespace nadeef::pipeline {

CleanExecutor::CleanExecutor(std::shared_ptr<const CleanContext> context)
    : context_(std::move(context)) {
    if (context_ == nullptr) {
        throw std::invalid_argument("CleanExecutor needs a context");
    }
    if (context_->connections == nullptr) {
        throw std::invalid_argument("CleanExecutor needs a connection factory");
    }
    if (context_->sink == nullptr || context_->cache == nullptr) {
        throw std::invalid_argument("CleanExecutor needs a diagnostics sink and a rule cache");
    }
}

auto CleanExecutor::assemble_detect(const std::vector<RulePtr>& rules)
    -> std::expected<std::vector<Flow>, AssemblyError> {
    return assemble(rules, FlowShape::Detect);
}

auto CleanExecutor::assemble_repair(const std::vector<RulePtr>& rules)
    -> std::expected<std::vector<Flow>, AssemblyError> {
    return assemble(rules, FlowShape::Repair);
}

auto CleanExecutor::assemble_one(const RulePtr& rule, FlowShape shape)
    -> std::expected<Flow, AssemblyError> {
    if (rule == nullptr) {
        return std::unexpected(AssemblyError{.message = "null rule"});
    }
    const auto sources = rule->tables().size();
    if (sources == 0 || sources > 2) {
        return std::unexpected(AssemblyError{
            .message = fmt::format("rule {} names {} source tables; expected 1 or 2",
                                   rule->name(), sources)});
    }
    if (sources == 2 && rule->arity() != RuleArity::Pair) {
        return std::unexpected(AssemblyError{
            .message = fmt::format("rule {} reads two tables but does not compare row pairs",
                                   rule->name())});
    }

    Flow flow(context_->cache->put(rule));
    auto add = [&](std::unique_ptr<Stage> stage) -> std::expected<void, AssemblyError> {
        return flow.add_stage(std::move(stage));
    };
    std::expected<void, AssemblyError> added;
    if (shape == FlowShape::Detect) {
        added = add(std::make_unique<SourceDeserializer>(context_))
                    .and_then([&] { return add(std::make_unique<QueryEngine>(context_)); })
                    .and_then([&] { return add(ViolationDetector::for_rule(context_, *rule)); })
                    .and_then([&] { return add(std::make_unique<ViolationExport>(context_)); });
    } else {
        added = add(std::make_unique<ViolationDeserializer>(context_))
                    .and_then([&] { return add(std::make_unique<ViolationRepair>(context_)); });
    }
    if (!added) {
        context_->cache->erase(flow.input_key());
        return std::unexpected(added.error());
    }
    return flow;
}

auto CleanExecutor::assemble(const std::vector<RulePtr>& rules, FlowShape shape)
    -> std::expected<std::vector<Flow>, AssemblyError> {
    std::vector<Flow> flows;
    flows.reserve(rules.size());
    for (const auto& rule : rules) {
        auto flow = assemble_one(rule, shape);
        if (!flow) {
            release(flows);
            return std::unexpected(flow.error());
        }
        flows.push_back(std::move(*flow));
    }
    return flows;
}

void CleanExecutor::release(const std::vector<Flow>& flows) {
    for (const auto& flow : flows) {
        context_->cache->erase(flow.input_key());
    }
}

auto CleanExecutor::execute(const std::vector<RulePtr>& rules, FlowShape shape)
    -> ExecutionReport {
    auto& sink = *context_->sink;
    auto start = std::chrono::steady_clock::now();
    cancelled_.store(false, std::memory_order_release);

    ExecutionReport report;
    auto flows = assemble(rules, shape);
    if (!flows) {
        report.error = flows.error().message;
        sink.error(fmt::format("flow assembly failed, nothing was run: {}", report.error));
        return report;
    }
    report.assembled = true;
    report.results.resize(flows->size());

    {
        ScopedTimer timer(sink, StatType::FlowTime);
        std::vector<std::thread> workers;
        workers.reserve(flows->size());
        for (std::size_t i = 0; i < flows->size(); ++i) {
            workers.emplace_back([this, &flows, &report, i] {
                report.results[i] = (*flows)[i].run(cancelled_);
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }
    release(*flows);

    for (const auto& result : report.results) {
        if (result.status == FlowStatus::Failed) {
            sink.error(fmt::format("flow {} failed in stage {}: {}", result.key, result.stage,
                                   result.error));
        } else if (result.status == FlowStatus::Cancelled) {
            sink.warn(fmt::format("flow {} cancelled before stage {}", result.key, result.stage));
        }
    }
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    sink.info(fmt::format("Cleaning finished in {} ms.", report.elapsed.count()));
    return report;
}

auto CleanExecutor::detect(const std::vector<RulePtr>& rules) -> ExecutionReport {
    return execute(rules, FlowShape::Detect);
}

auto CleanExecutor::repair(const std::vector<RulePtr>& rules) -> ExecutionReport {
    return execute(rules, FlowShape::Repair);
}

auto CleanExecutor::detect() -> ExecutionReport {
    return detect(context_->plan.rules);
}

auto CleanExecutor::repair() -> ExecutionReport {
    return repair(context_->plan.rules);
}

void CleanExecutor::cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
}

}  // namespace nadeef::pipeline
