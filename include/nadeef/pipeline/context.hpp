#pragma once

#include <nadeef/core/diagnostics.hpp>
#include <nadeef/pipeline/rule_cache.hpp>
#include <nadeef/rule/rule.hpp>
#include <nadeef/store/store.hpp>

#include <memory>
#include <string>
#include <vector>

namespace nadeef::pipeline {

/// What to clean and where.
struct CleanPlan {
    store::StoreConfig source;
    /// Store table receiving detected violations.
    std::string violation_table = "violation";
    std::vector<RulePtr> rules;
};

/// Everything flow assembly and the stages need, passed explicitly.
struct CleanContext {
    CleanPlan plan;
    std::shared_ptr<store::ConnectionFactory> connections;
    std::shared_ptr<DiagnosticsSink> sink = default_sink();
    /// Non-owning; defaults to the process-wide cache.
    RuleCache* cache = &RuleCache::instance();
};

}  // namespace nadeef::pipeline
