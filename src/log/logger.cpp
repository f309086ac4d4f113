#include "mcpcall/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <new>
#include <string>
#include <vector>

namespace mcpcall {

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lowered(text);
    std::ranges::transform(lowered, lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if ((lowered == "warn") || (lowered == "warning")) return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if ((lowered == "fatal") || (lowered == "critical")) return LogLevel::Fatal;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide Logger
// ─────────────────────────────────────────────────────────────────────────────
// get_logger() hands out a reference that callers use after the lock is
// released, so a replaced logger is retired rather than destroyed. The CLI
// installs a logger once at startup; tests swap a few in and out.

namespace {

struct LoggerSlot {
    std::mutex mutex;
    NullLogger null_logger;
    ILogger* active{&null_logger};
    std::vector<std::unique_ptr<ILogger>> installed;
};

LoggerSlot& slot() {
    static LoggerSlot instance;
    return instance;
}

}  // namespace

ILogger& get_logger() noexcept {
    LoggerSlot& s = slot();
    std::lock_guard<std::mutex> lock(s.mutex);
    return *s.active;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    LoggerSlot& s = slot();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (logger == nullptr) {
        s.active = &s.null_logger;
        return;
    }
    try {
        s.installed.push_back(std::move(logger));
        s.active = s.installed.back().get();
    } catch (const std::bad_alloc&) {
        // The previous backend stays active
    }
}

}  // namespace mcpcall
