#include <nadeef/pipeline/rule_cache.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace nadeef::pipeline {

auto RuleCache::instance() -> RuleCache& {
    static RuleCache cache;
    return cache;
}

auto RuleCache::put(RulePtr rule) -> std::string {
    if (rule == nullptr) {
        throw std::invalid_argument("cannot cache a null rule");
    }
    std::lock_guard lock(mutex_);
    auto key = fmt::format("{}#{}", rule->name(), next_id_++);
    entries_.emplace(key, std::move(rule));
    return key;
}

auto RuleCache::get(const std::string& key) const -> RulePtr {
    std::lock_guard lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
        return it->second;
    }
    return nullptr;
}

auto RuleCache::erase(const std::string& key) -> bool {
    std::lock_guard lock(mutex_);
    return entries_.erase(key) > 0;
}

auto RuleCache::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

}  // namespace nadeef::pipeline
