#include "mcpcall/client/call_result.hpp"

#include <array>
#include <ctime>
#include <format>

namespace mcpcall {

std::optional<ErrorCode> error_code_from_string(std::string_view key) noexcept {
    static constexpr std::array kAllCodes{
        ErrorCode::ServiceNotFound, ErrorCode::MissingUrl, ErrorCode::MissingCommand,
        ErrorCode::TransportUnsupported, ErrorCode::RequestFailed, ErrorCode::BadStatus,
        ErrorCode::StreamInitFailed, ErrorCode::StreamClosed, ErrorCode::ResponseTooLarge,
        ErrorCode::BinaryUnsupported, ErrorCode::RemoteError, ErrorCode::SchemaInvalid,
        ErrorCode::Timeout, ErrorCode::Cancelled, ErrorCode::NoResponse,
        ErrorCode::StdioSpawnFailed, ErrorCode::StdioProcessFailed, ErrorCode::StdioNoOutput,
        ErrorCode::StdioInvalidJson, ErrorCode::WebSocketConnectFailed,
        ErrorCode::WebSocketInvalidJson, ErrorCode::WebSocketClosed,
        ErrorCode::WebSocketUnsupported, ErrorCode::HttpInvalidJson, ErrorCode::InternalError, ErrorCode::Unknown
    };
    for (const ErrorCode code : kAllCodes) {
        if (to_string(code) == key) {
            return code;
        }
    }
    return std::nullopt;
}

CallResult CallResult::ok(std::string service, std::string transport, Json data) {
    CallResult result;
    result.success = true;
    result.service = std::move(service);
    result.transport = std::move(transport);
    result.data = std::move(data);
    return result;
}

CallResult CallResult::failure(
    ErrorCode code,
    std::string message,
    std::string service,
    std::string transport
) {
    CallResult result;
    result.success = false;
    result.error = std::move(message);
    result.error_code = code;
    result.service = std::move(service);
    result.transport = std::move(transport);
    return result;
}

std::string_view CallResult::error_key() const noexcept {
    if (error_code.has_value() == false) {
        return {};
    }
    return to_string(*error_code);
}

Json CallResult::to_json() const {
    Json payload = Json::object();
    payload["success"] = success;
    payload["error"] = error.has_value() ? Json(*error) : Json(nullptr);
    payload["errorCode"] = error_code.has_value() ? Json(std::string(to_string(*error_code))) : Json(nullptr);
    payload["service"] = service;
    payload["transport"] = transport;
    payload["data"] = data;
    payload["timestamp"] = format_utc_timestamp(timestamp);
    return payload;
}

std::string format_utc_timestamp(std::chrono::system_clock::time_point tp) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);

    std::array<char, 32> date{};
    const std::size_t written = std::strftime(date.data(), date.size(), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::format("{}.{:03}Z", std::string_view(date.data(), written), ms);
}

}  // namespace mcpcall
