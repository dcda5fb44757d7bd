#pragma once

#include <nadeef/rule/rule.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace nadeef::pipeline {

/// Keyed store that hands a rule to the first stage of its flow.
///
/// Keys have the form `<rule-name>#<n>` and are never reused within the
/// lifetime of a cache.
class RuleCache {
   public:
    RuleCache() = default;

    RuleCache(const RuleCache&) = delete;
    auto operator=(const RuleCache&) -> RuleCache& = delete;

    /// Process-wide cache, alive until exit.
    [[nodiscard]] static auto instance() -> RuleCache&;

    /// Store `rule` under a freshly minted key. Throws std::invalid_argument
    /// for a null rule.
    [[nodiscard]] auto put(RulePtr rule) -> std::string;

    /// Rule stored under `key`, or nullptr.
    [[nodiscard]] auto get(const std::string& key) const -> RulePtr;

    auto erase(const std::string& key) -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

   private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RulePtr> entries_;
    std::uint64_t next_id_ = 1;
};

}  // namespace nadeef::pipeline
