#pragma once

#include "mcpcall/transport.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace mcpcall {

// Protocol revision announced by the legacy SSE handshake
inline constexpr std::string_view kMcpProtocolVersion{"2024-11-05"};

// ─────────────────────────────────────────────────────────────────────────────
// Request ids
// ─────────────────────────────────────────────────────────────────────────────

class JsonRpcId {
public:
    explicit JsonRpcId(std::int64_t number) : value_(number) {}
    explicit JsonRpcId(std::string text) : value_(std::move(text)) {}

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] std::string to_string() const;

    /// True when a reply's "id" names this request. Servers that echo an
    /// integer id as a string ("7") are matched too; the reverse is not.
    [[nodiscard]] bool matches(const Json& id_node) const;

    /// SSE `id:` lines carry the request id as text
    [[nodiscard]] bool matches(std::string_view event_id) const;

private:
    std::variant<std::int64_t, std::string> value_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Outbound envelopes
// ─────────────────────────────────────────────────────────────────────────────

/// {"jsonrpc":"2.0","id":...,"method":...,"params":...}. Null params are left
/// out of the wire form rather than sent as null.
class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, JsonRpcId id, Json params = nullptr)
        : method_(std::move(method)), id_(std::move(id)), params_(std::move(params)) {}

    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const JsonRpcId& id() const noexcept { return id_; }
    [[nodiscard]] const Json& params() const noexcept { return params_; }

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    JsonRpcId id_;
    Json params_;
};

/// Process-unique request id ("mc-<random>-<sequence>"). Every call and every
/// retry gets a new one so that late replies to an abandoned attempt never
/// correlate with the current one.
[[nodiscard]] std::string make_request_id();

/// Envelope with a fresh id
[[nodiscard]] JsonRpcRequest make_request(std::string method, Json params = nullptr);

/// Envelope without an id; servers do not answer these
[[nodiscard]] Json make_notification(std::string_view method, Json params = nullptr);

struct ClientIdentity {
    std::string name{"mcpcall"};
    std::string version{"1.0.0"};
};

[[nodiscard]] JsonRpcRequest make_initialize_request(
    const ClientIdentity& client,
    std::string_view protocol_version = kMcpProtocolVersion
);

[[nodiscard]] Json make_initialized_notification();

// ─────────────────────────────────────────────────────────────────────────────
// Reply Decoding
// ─────────────────────────────────────────────────────────────────────────────

enum class ReplyKind {
    Result,         // {"result": ...}
    Error,          // {"error": {...}}
    CompatSuccess,  // {"success": true, "data": ...}
    CompatFailure,  // {"success": false, "error": ...}
    Incomplete      // well-formed JSON with none of the above
};

struct DecodedReply {
    ReplyKind kind{ReplyKind::Incomplete};
    Json data;                  // result / data (null when absent)
    std::string error_message;  // for Error / CompatFailure
};

[[nodiscard]] DecodedReply decode_reply(const Json& payload);

/// error.message when it is a string, else the error's serialisation
[[nodiscard]] std::string describe_rpc_error(const Json& error);

}  // namespace mcpcall
