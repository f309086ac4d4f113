#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Call Error Taxonomy
// ═══════════════════════════════════════════════════════════════════════════
// Stable error keys carried by every failed CallResult. The string forms are
// part of the public contract: callers branch on them and they appear in
// traces and CLI output, so existing keys are never renamed.

#include <optional>
#include <string_view>

namespace mcpcall {

enum class ErrorCode {
    // Configuration faults (never retried)
    ServiceNotFound,
    MissingUrl,
    MissingCommand,
    TransportUnsupported,

    // Connection and HTTP level
    RequestFailed,
    BadStatus,
    StreamInitFailed,
    StreamClosed,

    // Payload shape
    ResponseTooLarge,
    BinaryUnsupported,
    RemoteError,
    SchemaInvalid,

    // Control flow
    Timeout,
    Cancelled,
    NoResponse,

    // Transport specific
    StdioSpawnFailed,
    StdioProcessFailed,
    StdioNoOutput,
    StdioInvalidJson,
    WebSocketConnectFailed,
    WebSocketInvalidJson,
    WebSocketClosed,
    WebSocketUnsupported,
    HttpInvalidJson,

    InternalError,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ServiceNotFound:        return "SERVICE_NOT_FOUND";
        case ErrorCode::MissingUrl:             return "MISSING_URL";
        case ErrorCode::MissingCommand:         return "MISSING_COMMAND";
        case ErrorCode::TransportUnsupported:   return "TRANSPORT_UNSUPPORTED";
        case ErrorCode::RequestFailed:          return "REQUEST_FAILED";
        case ErrorCode::BadStatus:              return "BAD_STATUS";
        case ErrorCode::StreamInitFailed:       return "STREAM_INIT_FAILED";
        case ErrorCode::StreamClosed:           return "STREAM_CLOSED";
        case ErrorCode::ResponseTooLarge:       return "RESPONSE_TOO_LARGE";
        case ErrorCode::BinaryUnsupported:      return "BINARY_UNSUPPORTED";
        case ErrorCode::RemoteError:            return "REMOTE_ERROR";
        case ErrorCode::SchemaInvalid:          return "SCHEMA_INVALID";
        case ErrorCode::Timeout:                return "TIMEOUT";
        case ErrorCode::Cancelled:              return "CANCELLED";
        case ErrorCode::NoResponse:             return "NO_RESPONSE";
        case ErrorCode::StdioSpawnFailed:       return "STDIO_SPAWN_FAILED";
        case ErrorCode::StdioProcessFailed:     return "STDIO_PROCESS_FAILED";
        case ErrorCode::StdioNoOutput:          return "STDIO_NO_OUTPUT";
        case ErrorCode::StdioInvalidJson:       return "STDIO_INVALID_JSON";
        case ErrorCode::WebSocketConnectFailed: return "WEBSOCKET_CONNECT_FAILED";
        case ErrorCode::WebSocketInvalidJson:   return "WEBSOCKET_INVALID_JSON";
        case ErrorCode::WebSocketClosed:        return "WEBSOCKET_CLOSED";
        case ErrorCode::WebSocketUnsupported:   return "WEBSOCKET_UNSUPPORTED";
        case ErrorCode::HttpInvalidJson:        return "HTTP_INVALID_JSON";
        case ErrorCode::InternalError:          return "INTERNAL_ERROR";
        case ErrorCode::Unknown:                return "UNKNOWN";
    }
    return "UNKNOWN";
}

/// Reverse of to_string; nullopt for keys this build does not know.
[[nodiscard]] std::optional<ErrorCode> error_code_from_string(std::string_view key) noexcept;

/// Missing service, url or command, or a transport (or transport feature)
/// this build cannot serve.
[[nodiscard]] constexpr bool is_configuration_fault(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ServiceNotFound:
        case ErrorCode::MissingUrl:
        case ErrorCode::MissingCommand:
        case ErrorCode::TransportUnsupported:
        case ErrorCode::WebSocketUnsupported:
            return true;
        default:
            return false;
    }
}

/// Whether a failed attempt may be repeated as a whole.
[[nodiscard]] constexpr bool is_retryable(ErrorCode code) noexcept {
    if (is_configuration_fault(code)) {
        return false;
    }
    switch (code) {
        case ErrorCode::RemoteError:
        case ErrorCode::Cancelled:
        case ErrorCode::ResponseTooLarge:
        case ErrorCode::BinaryUnsupported:
        case ErrorCode::StdioSpawnFailed:
            return false;
        default:
            return true;
    }
}

}  // namespace mcpcall
