#pragma once

#include "mcpcall/transport.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/common.h>

namespace spdlog {
class logger;
}

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// Trace Records
// ─────────────────────────────────────────────────────────────────────────────

struct TraceRecord {
    std::string service;
    std::string transport;
    std::string stage;     // dispatch, attempt, connect, endpoint, handshake, request, reconnect, result
    std::string message;
    Json metadata = Json::object();
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    [[nodiscard]] Json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// ITraceSink
// ─────────────────────────────────────────────────────────────────────────────
// Best effort. A sink must accept concurrent calls and must not let its own
// failures reach the caller.

class ITraceSink {
public:
    virtual ~ITraceSink() = default;

    virtual void trace(const TraceRecord& record) noexcept = 0;

    void trace(std::string service,
               std::string transport,
               std::string stage,
               std::string message,
               Json metadata = Json::object()) noexcept;
};

class NullTraceSink final : public ITraceSink {
public:
    using ITraceSink::trace;
    void trace(const TraceRecord& /*record*/) noexcept override {}
};

// ─────────────────────────────────────────────────────────────────────────────
// JsonlTraceSink - one JSON object per line
// ─────────────────────────────────────────────────────────────────────────────
// Lines are written through a thread-safe spdlog sink with a bare "%v"
// pattern, so concurrent records never interleave within a line.

class JsonlTraceSink final : public ITraceSink {
public:
    explicit JsonlTraceSink(spdlog::sink_ptr sink);

    using ITraceSink::trace;
    void trace(const TraceRecord& record) noexcept override;

    void flush() noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/// Appending file sink. The error carries spdlog's reason.
[[nodiscard]] tl::expected<std::shared_ptr<JsonlTraceSink>, std::string> make_jsonl_trace_sink(
    const std::string& path
);

}  // namespace mcpcall
