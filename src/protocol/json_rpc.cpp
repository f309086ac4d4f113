#include "mcpcall/protocol/json_rpc.hpp"

#include <atomic>
#include <charconv>
#include <format>
#include <random>

namespace mcpcall {

namespace {

constexpr std::string_view kJsonRpcVersion{"2.0"};

std::string safe_dump(const Json& node) {
    return node.dump(-1, ' ', false, Json::error_handler_t::replace);
}

bool parse_decimal(std::string_view text, std::int64_t& out) {
    const char* end = text.data() + text.size();
    const auto [stop, ec] = std::from_chars(text.data(), end, out);
    return (text.empty() == false) && (ec == std::errc{}) && (stop == end);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& v) { return Json(v); }, value_);
}

std::string JsonRpcId::to_string() const {
    if (const auto* text = std::get_if<std::string>(&value_)) {
        return *text;
    }
    return std::to_string(std::get<std::int64_t>(value_));
}

bool JsonRpcId::matches(const Json& id_node) const {
    if (id_node.is_string()) {
        return matches(std::string_view(id_node.get_ref<const std::string&>()));
    }
    const auto* number = std::get_if<std::int64_t>(&value_);
    if ((number == nullptr) || (id_node.is_number_integer() == false)) {
        return false;
    }
    return *number == id_node.get<std::int64_t>();
}

bool JsonRpcId::matches(std::string_view event_id) const {
    if (const auto* text = std::get_if<std::string>(&value_)) {
        return *text == event_id;
    }
    std::int64_t parsed = 0;
    return parse_decimal(event_id, parsed) && (parsed == std::get<std::int64_t>(value_));
}

// ─────────────────────────────────────────────────────────────────────────────
// Outbound envelopes
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcRequest::to_json() const {
    Json envelope{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id_.to_json()},
        {"method", method_}
    };
    if (params_.is_null() == false) {
        envelope["params"] = params_;
    }
    return envelope;
}

std::string make_request_id() {
    static std::atomic<std::uint64_t> sequence{0};
    thread_local std::mt19937_64 rng{std::random_device{}()};

    const std::uint64_t nonce = rng();
    const std::uint64_t seq = sequence.fetch_add(1, std::memory_order_relaxed) + 1;
    return std::format("mc-{:016x}-{}", nonce, seq);
}

JsonRpcRequest make_request(std::string method, Json params) {
    return JsonRpcRequest(std::move(method), JsonRpcId(make_request_id()), std::move(params));
}

Json make_notification(std::string_view method, Json params) {
    Json envelope{
        {"jsonrpc", kJsonRpcVersion},
        {"method", method}
    };
    if (params.is_null() == false) {
        envelope["params"] = std::move(params);
    }
    return envelope;
}

JsonRpcRequest make_initialize_request(const ClientIdentity& client, std::string_view protocol_version) {
    Json params{
        {"protocolVersion", protocol_version},
        {"capabilities", Json::object()},
        {"clientInfo", {{"name", client.name}, {"version", client.version}}}
    };
    return JsonRpcRequest("initialize", JsonRpcId("init-" + make_request_id()), std::move(params));
}

Json make_initialized_notification() {
    return make_notification("notifications/initialized");
}

// ─────────────────────────────────────────────────────────────────────────────
// Reply Decoding
// ─────────────────────────────────────────────────────────────────────────────

std::string describe_rpc_error(const Json& error) {
    if (error.is_object()) {
        const auto message_it = error.find("message");
        const bool has_text = (message_it != error.end()) && message_it->is_string();
        if (has_text) {
            return message_it->get<std::string>();
        }
    }
    if (error.is_string()) {
        return error.get<std::string>();
    }
    return safe_dump(error);
}

DecodedReply decode_reply(const Json& payload) {
    DecodedReply decoded;
    if (payload.is_object() == false) {
        return decoded;
    }

    if (const auto result_it = payload.find("result"); result_it != payload.end()) {
        decoded.kind = ReplyKind::Result;
        decoded.data = *result_it;
        return decoded;
    }

    if (const auto error_it = payload.find("error"); error_it != payload.end()) {
        // {"success": false, "error": "..."} is the compatibility shape, not JSON-RPC
        const auto success_it = payload.find("success");
        const bool compat_failure = (success_it != payload.end()) && success_it->is_boolean();
        decoded.kind = compat_failure ? ReplyKind::CompatFailure : ReplyKind::Error;
        decoded.error_message = describe_rpc_error(*error_it);
        return decoded;
    }

    const auto success_it = payload.find("success");
    const bool has_success_flag = (success_it != payload.end()) && success_it->is_boolean();
    if (has_success_flag) {
        const bool succeeded = success_it->get<bool>();
        if (succeeded) {
            decoded.kind = ReplyKind::CompatSuccess;
            decoded.data = payload.value("data", Json());
        } else {
            decoded.kind = ReplyKind::CompatFailure;
            decoded.error_message = describe_rpc_error(payload.value("message", Json("Service reported failure")));
        }
    }
    return decoded;
}

}  // namespace mcpcall
