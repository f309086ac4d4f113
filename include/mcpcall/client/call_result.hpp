#pragma once

#include "mcpcall/client/call_error.hpp"
#include "mcpcall/transport.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// CallResult
// ─────────────────────────────────────────────────────────────────────────────
// The only channel through which a call reports back. Every operation on the
// dispatcher and every engine returns one; none of them throw.
//
// JSON form (CallResult::to_json):
//   { "success": bool, "error": string|null, "errorCode": string|null,
//     "service": string, "transport": string, "data": any|null,
//     "timestamp": "2024-01-01T12:00:00.000Z" }

struct CallResult {
    bool success{false};
    std::optional<std::string> error;
    std::optional<ErrorCode> error_code;
    std::string service;
    std::string transport;
    Json data;  // null when absent
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    [[nodiscard]] static CallResult ok(std::string service, std::string transport, Json data);

    [[nodiscard]] static CallResult failure(
        ErrorCode code,
        std::string message,
        std::string service = {},
        std::string transport = {}
    );

    [[nodiscard]] bool failed_with(ErrorCode code) const noexcept {
        return (success == false) && error_code.has_value() && (*error_code == code);
    }

    /// Stable key ("TIMEOUT", ...) or empty on success
    [[nodiscard]] std::string_view error_key() const noexcept;

    [[nodiscard]] Json to_json() const;
};

/// ISO-8601 UTC with milliseconds
[[nodiscard]] std::string format_utc_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace mcpcall
