#include "mcpx/log/spdlog_logger.hpp"

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <stdexcept>

namespace mcpx {

namespace {

// Loggers stay out of spdlog's registry; names only need to be distinct.
std::string unique_logger_name(std::string_view base_name) {
    static std::atomic<std::uint64_t> counter{0};
    return std::string(base_name) + "_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

std::shared_ptr<spdlog::details::thread_pool> shared_thread_pool(std::size_t queue_size) {
    static std::once_flag init_flag;
    static std::shared_ptr<spdlog::details::thread_pool> pool;
    std::call_once(init_flag, [queue_size]() {
        pool = std::make_shared<spdlog::details::thread_pool>(queue_size == 0 ? 1 : queue_size, 1);
    });
    return pool;
}

spdlog::async_overflow_policy to_spdlog_overflow(LogOverflow overflow) noexcept {
    return overflow == LogOverflow::Block
        ? spdlog::async_overflow_policy::block
        : spdlog::async_overflow_policy::overrun_oldest;
}

}  // namespace

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Fatal: return spdlog::level::critical;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , min_level_(LogLevel::Info)
{
    if (logger_ == nullptr) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    min_level_ = from_spdlog_level(logger_->level());
}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(std::make_shared<spdlog::logger>(unique_logger_name("mcpx"), sinks.begin(), sinks.end()))
    , min_level_(min_level)
{
    logger_->set_level(to_spdlog_level(min_level));
    logger_->set_pattern(kDefaultLogPattern);
}

void SpdlogLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }
    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    logger_->log(where, to_spdlog_level(record.level), "{}", record.message);
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    const LogLevel threshold = min_level_.load(std::memory_order_relaxed);
    return level != LogLevel::Off
        && static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_.store(level, std::memory_order_relaxed);
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

std::unique_ptr<SpdlogLogger> make_spdlog_logger(const SpdlogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.to_stderr) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (config.file.has_value()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*config.file));
    }
    if (sinks.empty()) {
        throw std::invalid_argument("SpdlogConfig names no log sink");
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        logger = std::make_shared<spdlog::async_logger>(
            unique_logger_name("mcpx_async"),
            sinks.begin(),
            sinks.end(),
            shared_thread_pool(config.queue_size),
            to_spdlog_overflow(config.overflow));
    } else {
        logger = std::make_shared<spdlog::logger>(unique_logger_name("mcpx"), sinks.begin(), sinks.end());
    }

    logger->set_level(SpdlogLogger::to_spdlog_level(config.min_level));
    logger->set_pattern(config.pattern);
    return std::make_unique<SpdlogLogger>(std::move(logger));
}

}  // namespace mcpx
