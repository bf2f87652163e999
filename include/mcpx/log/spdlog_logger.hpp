#pragma once

#include "mcpx/log/logger.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace mcpx {

/// Thread id is included: stream pipelines, HTTP workers and the stdio
/// bridge all log concurrently.
inline constexpr const char* kDefaultLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] [%s:%#] %v";

/// What an async logger does when its queue is full.
enum class LogOverflow {
    Block,      ///< the logging thread waits for room
    DropOldest  ///< the oldest queued record is discarded
};

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogConfig
// ─────────────────────────────────────────────────────────────────────────────
// Console output goes to stderr: the stdio front end owns stdout for
// protocol traffic.
//
//   SpdlogConfig config;
//   config.with_level(LogLevel::Debug)
//         .with_file("/var/log/mcpx.log")
//         .with_overflow(LogOverflow::Block);

struct SpdlogConfig {
    LogLevel min_level{LogLevel::Info};
    bool to_stderr{true};
    std::optional<std::string> file;

    /// Records are formatted and written on spdlog's thread pool.
    bool async{true};
    std::size_t queue_size{8192};
    LogOverflow overflow{LogOverflow::DropOldest};

    std::string pattern{kDefaultLogPattern};

    SpdlogConfig& with_level(LogLevel level) {
        min_level = level;
        return *this;
    }

    SpdlogConfig& with_stderr(bool enabled) {
        to_stderr = enabled;
        return *this;
    }

    SpdlogConfig& with_file(std::string path) {
        file = std::move(path);
        return *this;
    }

    SpdlogConfig& with_async(bool enabled) {
        async = enabled;
        return *this;
    }

    SpdlogConfig& with_overflow(LogOverflow policy) {
        overflow = policy;
        return *this;
    }

    SpdlogConfig& with_pattern(std::string value) {
        pattern = std::move(value);
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────

class SpdlogLogger final : public ILogger {
public:
    /// Wrap an existing spdlog logger; the level is taken from it.
    /// Throws std::invalid_argument on null.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;
    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<LogLevel> min_level_;
};

/// Builds the logger `config` describes. Throws std::invalid_argument when
/// it names no sink, and spdlog::spdlog_ex when the log file cannot be
/// opened. The async thread pool is shared; the first async logger built
/// decides its queue size.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_logger(const SpdlogConfig& config);

}  // namespace mcpx
