#pragma once

#include "mcpcall/transport.hpp"
#include "mcpcall/transport/http_types.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// Transport Descriptors
// ─────────────────────────────────────────────────────────────────────────────
// One shape per supported transport kind. Required fields may still be empty
// after loading; the engines report MISSING_URL / MISSING_COMMAND at call time.

/// text/event-stream. POST selects the single-phase protocol, GET the legacy
/// endpoint-discovery handshake.
struct SseEndpoint {
    std::string url;
    HttpMethod method{HttpMethod::Post};
    HeaderMap headers;
    bool debug{false};
};

struct WebSocketEndpoint {
    std::string url;
    HeaderMap headers;
};

struct StdioCommand {
    std::string command;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;  // overrides, in config order
};

/// Plain request/response ("streamableHttp")
struct HttpEndpoint {
    std::string url;
    HttpMethod method{HttpMethod::Post};
    HeaderMap headers;
};

using TransportSpec = std::variant<SseEndpoint, WebSocketEndpoint, StdioCommand, HttpEndpoint>;

enum class TransportKind {
    Sse,
    WebSocket,
    Stdio,
    Http
};

/// Config-file spelling: "sse", "websocket", "stdio", "streamableHttp"
[[nodiscard]] constexpr std::string_view to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::Sse:       return "sse";
        case TransportKind::WebSocket: return "websocket";
        case TransportKind::Stdio:     return "stdio";
        case TransportKind::Http:      return "streamableHttp";
    }
    return "sse";
}

/// Case-insensitive; also accepts "ws", "http" and "streamable-http".
[[nodiscard]] std::optional<TransportKind> parse_transport_kind(std::string_view text);

[[nodiscard]] TransportKind kind_of(const TransportSpec& spec) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// ServiceConfig
// ─────────────────────────────────────────────────────────────────────────────

struct ServiceConfig {
    std::string name;
    TransportSpec transport{SseEndpoint{}};
    std::chrono::seconds timeout{30};
    std::optional<std::chrono::seconds> idle_timeout;   // defaults to timeout
    std::optional<std::chrono::seconds> total_timeout;  // defaults to max(timeout, idle)
    std::size_t retry_count{1};

    [[nodiscard]] TransportKind kind() const noexcept { return kind_of(transport); }
    [[nodiscard]] std::string_view transport_name() const noexcept { return to_string(kind()); }

    [[nodiscard]] std::chrono::seconds effective_idle_timeout() const noexcept {
        return idle_timeout.value_or(timeout);
    }

    [[nodiscard]] std::chrono::seconds effective_total_timeout() const noexcept {
        return total_timeout.value_or(std::max(timeout, effective_idle_timeout()));
    }

    /// url for network transports, command line for stdio
    [[nodiscard]] std::string target() const;
};

}  // namespace mcpcall
