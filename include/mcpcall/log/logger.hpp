#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// Diagnostic Logging
// ─────────────────────────────────────────────────────────────────────────────
// Library code logs through one process-wide ILogger. Until the host installs
// a backend (see spdlog_logger.hpp) everything goes to a NullLogger, so a
// library consumer that never calls set_logger() pays for one virtual
// should_log() per statement.
//
// Logging is diagnostics only. Call outcomes are reported through CallResult
// and traces, never through the log.

enum class LogLevel : std::uint8_t {
    Trace = 0,  // wire-level detail: SSE lines, raw payloads
    Debug = 1,  // state transitions, config entries
    Info  = 2,  // reconnects, retries, process lifecycle
    Warn  = 3,  // dropped config entries, recoverable faults
    Error = 4,  // failed calls, internal faults
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

/// Parse "trace", "debug", "info", "warn"/"warning", "error", "fatal"/"critical"
/// or "off" (case-insensitive). Returns nullopt for anything else.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

[[nodiscard]] constexpr bool level_enabled(LogLevel level, LogLevel threshold) noexcept {
    if ((level == LogLevel::Off) || (threshold == LogLevel::Off)) {
        return false;
    }
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold);
}

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(LogLevel lvl, std::string msg, std::source_location loc = std::source_location::current())
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string_view message,
               std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(message), loc));
        }
    }

    /// std::format is only evaluated when the level is enabled
    template <typename... Args>
    void logf(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

[[nodiscard]] ILogger& get_logger() noexcept;

// Takes ownership; nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// `msg` is only evaluated when the level is enabled
#define MCPCALL_LOG(level, msg)                                          \
    do {                                                                 \
        ::mcpcall::ILogger& mcpcall_logger_ = ::mcpcall::get_logger();   \
        if (mcpcall_logger_.should_log(level)) {                         \
            mcpcall_logger_.write(level, msg);                           \
        }                                                                \
    } while (false)

#define MCPCALL_LOG_TRACE(msg) MCPCALL_LOG(::mcpcall::LogLevel::Trace, msg)
#define MCPCALL_LOG_DEBUG(msg) MCPCALL_LOG(::mcpcall::LogLevel::Debug, msg)
#define MCPCALL_LOG_INFO(msg)  MCPCALL_LOG(::mcpcall::LogLevel::Info, msg)
#define MCPCALL_LOG_WARN(msg)  MCPCALL_LOG(::mcpcall::LogLevel::Warn, msg)
#define MCPCALL_LOG_ERROR(msg) MCPCALL_LOG(::mcpcall::LogLevel::Error, msg)
#define MCPCALL_LOG_FATAL(msg) MCPCALL_LOG(::mcpcall::LogLevel::Fatal, msg)

}  // namespace mcpcall
