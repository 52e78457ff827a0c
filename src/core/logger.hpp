/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * Provides ILogSink (virtual interface for runtime-configurable log
 * destinations) and a thread-safe Logger front-end. Task bodies and unit
 * threads may log concurrently; every record is one NDJSON line.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace taskpipe {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Parse "debug" / "info" / "warn" / "error" (also "warning").
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// ILogSink
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * Records carry the logger's component name, so one sink can be shared by
 * the graph builder, the scheduler and the report.
 */
class Logger {
public:
    explicit Logger(std::shared_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info,
                    std::string component = "taskpipe");

    /// Logger sharing this logger's sink and level under another component.
    [[nodiscard]] Logger child(std::string component) const;

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level >= min_level_; }
    [[nodiscard]] const std::string& component() const noexcept { return component_; }

private:
    struct Shared {
        std::shared_ptr<ILogSink> sink;
        std::mutex mutex;
    };

    Logger(std::shared_ptr<Shared> shared, LogLevel min_level, std::string component);

    std::shared_ptr<Shared> shared_;
    LogLevel min_level_;
    std::string component_;
};

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

}  // namespace taskpipe
