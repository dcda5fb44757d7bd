#include <nadeef/core/diagnostics.hpp>

#include <spdlog/spdlog.h>

namespace nadeef {

auto to_string(StatType stat) -> std::string_view {
    switch (stat) {
        case StatType::DbLoadTime:
            return "db-load";
        case StatType::QueryTime:
            return "query";
        case StatType::DetectTime:
            return "detect";
        case StatType::ExportTime:
            return "export";
        case StatType::RepairTime:
            return "repair";
        case StatType::FlowTime:
            return "flow";
    }
    return "unknown";
}

void SpdlogSink::log(LogLevel level, std::string_view message) {
    switch (level) {
        case LogLevel::Debug:
            spdlog::debug("{}", message);
            break;
        case LogLevel::Info:
            spdlog::info("{}", message);
            break;
        case LogLevel::Warn:
            spdlog::warn("{}", message);
            break;
        case LogLevel::Error:
            spdlog::error("{}", message);
            break;
    }
}

void SpdlogSink::record(StatType stat, std::chrono::milliseconds elapsed) {
    std::lock_guard lock(mutex_);
    auto& entry = stats_[static_cast<std::size_t>(stat)];
    entry.total += elapsed;
    ++entry.count;
}

auto SpdlogSink::stat(StatType stat) const -> StatEntry {
    std::lock_guard lock(mutex_);
    return stats_[static_cast<std::size_t>(stat)];
}

void SpdlogSink::dump_stats() {
    for (std::size_t i = 0; i < kStatTypeCount; ++i) {
        auto entry = stat(static_cast<StatType>(i));
        if (entry.count == 0) {
            continue;
        }
        spdlog::info("{}: {} ms over {} call(s)", to_string(static_cast<StatType>(i)),
                     entry.total.count(), entry.count);
    }
}

auto default_sink() -> std::shared_ptr<DiagnosticsSink> {
    static auto sink = std::make_shared<SpdlogSink>();
    return sink;
}

}  // namespace nadeef
