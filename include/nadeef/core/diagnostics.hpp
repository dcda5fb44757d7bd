#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

namespace nadeef {

enum class LogLevel : std::uint8_t {
    Debug,
    Info,
    Warn,
    Error,
};

/// Duration measurements collected while cleaning.
enum class StatType : std::uint8_t {
    DbLoadTime,
    QueryTime,
    DetectTime,
    ExportTime,
    RepairTime,
    FlowTime,
};

inline constexpr std::size_t kStatTypeCount = 6;

[[nodiscard]] auto to_string(StatType stat) -> std::string_view;

/// Receiver for leveled messages and timings.
class DiagnosticsSink {
   public:
    virtual ~DiagnosticsSink() = default;

    virtual void log(LogLevel level, std::string_view message) = 0;
    virtual void record(StatType stat, std::chrono::milliseconds elapsed) = 0;

    void debug(std::string_view message) { log(LogLevel::Debug, message); }
    void info(std::string_view message) { log(LogLevel::Info, message); }
    void warn(std::string_view message) { log(LogLevel::Warn, message); }
    void error(std::string_view message) { log(LogLevel::Error, message); }
};

/// Discards everything.
class NullSink final : public DiagnosticsSink {
   public:
    void log(LogLevel /*level*/, std::string_view /*message*/) override {}
    void record(StatType /*stat*/, std::chrono::milliseconds /*elapsed*/) override {}
};

/// Forwards messages to spdlog and keeps running totals per stat.
class SpdlogSink final : public DiagnosticsSink {
   public:
    struct StatEntry {
        std::chrono::milliseconds total{0};
        std::size_t count = 0;
    };

    void log(LogLevel level, std::string_view message) override;
    void record(StatType stat, std::chrono::milliseconds elapsed) override;

    [[nodiscard]] auto stat(StatType stat) const -> StatEntry;

    /// Log a one-line summary of every recorded stat at info level.
    void dump_stats();

   private:
    mutable std::mutex mutex_;
    std::array<StatEntry, kStatTypeCount> stats_{};
};

/// Process-wide spdlog-backed sink.
[[nodiscard]] auto default_sink() -> std::shared_ptr<DiagnosticsSink>;

/// Measures the lifetime of a scope and records it on destruction.
class ScopedTimer {
   public:
    ScopedTimer(DiagnosticsSink& sink, StatType stat)
        : sink_(sink), stat_(stat), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer() {
        sink_.record(stat_, std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start_));
    }

    ScopedTimer(const ScopedTimer&) = delete;
    auto operator=(const ScopedTimer&) -> ScopedTimer& = delete;

   private:
    DiagnosticsSink& sink_;
    StatType stat_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace nadeef
