#pragma once

#include "mcpcall/log/logger.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <tl/expected.hpp>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Console output goes to stderr: stdout is reserved for call results, which
// the CLI prints there (optionally as JSON for scripts).

class SpdlogLogger final : public ILogger {
public:
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    /// Wrap an existing spdlog logger; its level becomes the threshold.
    /// Throws std::invalid_argument for nullptr.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;
    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }
    void set_level(LogLevel level) noexcept;
    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] const std::shared_ptr<spdlog::logger>& backend() const noexcept { return logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Construction from settings
// ─────────────────────────────────────────────────────────────────────────────

struct LogSettings {
    LogLevel level{LogLevel::Warn};
    bool console{true};                 // stderr
    bool color{true};                   // ANSI colours on the console sink
    std::optional<std::string> file;    // appended, created if missing
};

/// Console and/or file sinks per `settings`. Fails with spdlog's reason when
/// the log file cannot be opened. With neither console nor file, the logger
/// has no sinks and only filters.
[[nodiscard]] tl::expected<std::unique_ptr<SpdlogLogger>, std::string> make_spdlog_logger(
    const LogSettings& settings
);

}  // namespace mcpcall
