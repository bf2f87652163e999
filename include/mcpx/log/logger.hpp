#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as given on the command line ("debug", "WARN", "off").
/// "warning" and "critical" are accepted as aliases.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// LogFormat
// ─────────────────────────────────────────────────────────────────────────────
// A compile-checked format string that also records where the logging call
// was written, so `*_fmt` records point at the caller rather than this file.

template<typename... Args>
struct LogFormat {
    std::format_string<Args...> text;
    std::source_location location;

    template<typename T>
    consteval LogFormat(const T& fmt, std::source_location loc = std::source_location::current())
        : text(fmt)
        , location(loc)
    {}
};

template<typename... Args>
using LogFormatFor = LogFormat<std::type_identity_t<Args>...>;

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    /// Cheap level check so callers can skip message construction.
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }
    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }
    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }
    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }
    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }
    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, loc);
    }

    // Arguments are only formatted when the level is enabled.

    template<typename... Args>
    void trace_fmt(LogFormatFor<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }
    template<typename... Args>
    void debug_fmt(LogFormatFor<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }
    template<typename... Args>
    void info_fmt(LogFormatFor<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }
    template<typename... Args>
    void warn_fmt(LogFormatFor<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }
    template<typename... Args>
    void error_fmt(LogFormatFor<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

private:
    void write(LogLevel level, std::string_view msg, std::source_location loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    template<typename... Args>
    void write_fmt(LogLevel level, const LogFormatFor<Args...>& fmt, Args&&... args) {
        if (should_log(level) == false) {
            return;
        }
        log(LogRecord(level, std::format(fmt.text, std::forward<Args>(args)...), fmt.location));
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - installed until the front end configures a backend
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

/// Replace the process-wide logger. Passing nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define MCPX_LOG_TRACE(msg) \
    do { if (::mcpx::get_logger().should_log(::mcpx::LogLevel::Trace)) \
         ::mcpx::get_logger().trace(msg); } while(false)

#define MCPX_LOG_DEBUG(msg) \
    do { if (::mcpx::get_logger().should_log(::mcpx::LogLevel::Debug)) \
         ::mcpx::get_logger().debug(msg); } while(false)

#define MCPX_LOG_INFO(msg) \
    do { if (::mcpx::get_logger().should_log(::mcpx::LogLevel::Info)) \
         ::mcpx::get_logger().info(msg); } while(false)

#define MCPX_LOG_WARN(msg) \
    do { if (::mcpx::get_logger().should_log(::mcpx::LogLevel::Warn)) \
         ::mcpx::get_logger().warn(msg); } while(false)

#define MCPX_LOG_ERROR(msg) \
    do { if (::mcpx::get_logger().should_log(::mcpx::LogLevel::Error)) \
         ::mcpx::get_logger().error(msg); } while(false)

}  // namespace mcpx
