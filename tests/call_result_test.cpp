#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpcall/client/call_result.hpp"

#include <set>

using namespace mcpcall;
using Catch::Matchers::ContainsSubstring;

// ─────────────────────────────────────────────────────────────────────────────
// Error Keys
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Error keys are stable and unique", "[result][errors]") {
    REQUIRE(to_string(ErrorCode::ServiceNotFound) == "SERVICE_NOT_FOUND");
    REQUIRE(to_string(ErrorCode::Timeout) == "TIMEOUT");
    REQUIRE(to_string(ErrorCode::BinaryUnsupported) == "BINARY_UNSUPPORTED");
    REQUIRE(to_string(ErrorCode::WebSocketInvalidJson) == "WEBSOCKET_INVALID_JSON");
    REQUIRE(to_string(ErrorCode::HttpInvalidJson) == "HTTP_INVALID_JSON");

    std::set<std::string_view> keys;
    for (int i = 0; i <= static_cast<int>(ErrorCode::Unknown); ++i) {
        const auto code = static_cast<ErrorCode>(i);
        const auto key = to_string(code);
        keys.insert(key);
        REQUIRE(error_code_from_string(key) == code);
    }
    REQUIRE(keys.size() == static_cast<std::size_t>(ErrorCode::Unknown) + 1);
}

TEST_CASE("error_code_from_string rejects unknown keys", "[result][errors]") {
    REQUIRE(error_code_from_string("").has_value() == false);
    REQUIRE(error_code_from_string("timeout").has_value() == false);
    REQUIRE(error_code_from_string("NOT_A_KEY").has_value() == false);
}

TEST_CASE("Configuration faults are never retryable", "[result][errors]") {
    REQUIRE(is_configuration_fault(ErrorCode::MissingCommand));
    REQUIRE(is_configuration_fault(ErrorCode::TransportUnsupported));
    REQUIRE(is_configuration_fault(ErrorCode::WebSocketUnsupported));
    REQUIRE(to_string(ErrorCode::WebSocketUnsupported) == "WEBSOCKET_UNSUPPORTED");
    REQUIRE(is_configuration_fault(ErrorCode::Timeout) == false);

    REQUIRE(is_retryable(ErrorCode::ServiceNotFound) == false);
    REQUIRE(is_retryable(ErrorCode::NoResponse));
    REQUIRE(is_retryable(ErrorCode::SchemaInvalid));
}

// ─────────────────────────────────────────────────────────────────────────────
// CallResult
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("CallResult::ok carries data and no error", "[result]") {
    const auto result = CallResult::ok("search", "sse", Json{{"hits", 2}});

    REQUIRE(result.success);
    REQUIRE(result.error.has_value() == false);
    REQUIRE(result.error_key().empty());
    REQUIRE(result.failed_with(ErrorCode::Timeout) == false);

    const auto j = result.to_json();
    REQUIRE(j["success"] == true);
    REQUIRE(j["error"].is_null());
    REQUIRE(j["errorCode"].is_null());
    REQUIRE(j["service"] == "search");
    REQUIRE(j["transport"] == "sse");
    REQUIRE(j["data"]["hits"] == 2);
}

TEST_CASE("CallResult::failure carries the key and message", "[result]") {
    const auto result = CallResult::failure(ErrorCode::BadStatus, "HTTP 503", "search", "sse");

    REQUIRE(result.success == false);
    REQUIRE(result.failed_with(ErrorCode::BadStatus));
    REQUIRE(result.failed_with(ErrorCode::Timeout) == false);
    REQUIRE(result.error_key() == "BAD_STATUS");

    const auto j = result.to_json();
    REQUIRE(j["success"] == false);
    REQUIRE(j["error"] == "HTTP 503");
    REQUIRE(j["errorCode"] == "BAD_STATUS");
    REQUIRE(j["data"].is_null());
}

TEST_CASE("format_utc_timestamp renders ISO-8601 with milliseconds", "[result][timestamp]") {
    // 2024-01-02T03:04:05.678Z
    const std::chrono::system_clock::time_point tp{std::chrono::milliseconds{1704164645678}};

    REQUIRE(format_utc_timestamp(tp) == "2024-01-02T03:04:05.678Z");
    REQUIRE(format_utc_timestamp(std::chrono::system_clock::time_point{}) == "1970-01-01T00:00:00.000Z");

    const auto j = CallResult::ok({}, {}, Json()).to_json();
    REQUIRE_THAT(j["timestamp"].get<std::string>(), ContainsSubstring("T"));
    REQUIRE(j["timestamp"].get<std::string>().back() == 'Z');
}
