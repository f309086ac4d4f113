#include "mcpcall/log/spdlog_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <atomic>
#include <stdexcept>

namespace mcpcall {

namespace {

constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

// Loggers stay out of spdlog's registry; the suffix only tells them apart in
// spdlog's own error messages.
std::string next_logger_name() {
    static std::atomic<std::uint64_t> counter{0};
    return "mcpcall_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

}  // namespace

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
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

LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        default:                      return LogLevel::Off;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(std::make_shared<spdlog::logger>(next_logger_name(), sinks.begin(), sinks.end()))
    , min_level_(min_level)
{
    logger_->set_level(to_spdlog_level(min_level));
    logger_->set_pattern(kDefaultPattern);
}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , min_level_(LogLevel::Off)
{
    if (logger_ == nullptr) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    min_level_ = from_spdlog_level(logger_->level());
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
    return level_enabled(level, min_level_);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// make_spdlog_logger
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<std::unique_ptr<SpdlogLogger>, std::string> make_spdlog_logger(const LogSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;

    if (settings.console) {
        if (settings.color) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        } else {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
        }
    }

    if (settings.file.has_value()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*settings.file));
        } catch (const spdlog::spdlog_ex& e) {
            return tl::unexpected(std::string(e.what()));
        }
    }

    auto logger = std::make_unique<SpdlogLogger>(std::move(sinks), settings.level);
    // Errors reach the file without an explicit flush
    logger->backend()->flush_on(spdlog::level::err);
    return logger;
}

}  // namespace mcpcall
