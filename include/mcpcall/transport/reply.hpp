#pragma once

#include "mcpcall/client/call_result.hpp"
#include "mcpcall/protocol/json_rpc.hpp"

#include <string>

namespace mcpcall {

/// Map a parsed reply to a CallResult, for the single-shot engines.
///
///   {"result": x} / {"success": true, "data": x}   -> success, data = x
///   {"error": ...} / {"success": false, ...}       -> REMOTE_ERROR
///   anything else                                  -> SCHEMA_INVALID
[[nodiscard]] CallResult result_from_reply(
    const Json& payload,
    const std::string& service,
    const std::string& transport
);

/// True when payload is a server notification or request (has "method", no
/// matching reply semantics) and should be skipped while waiting for a reply.
[[nodiscard]] bool is_server_message(const Json& payload);

/// True when payload carries a non-null "id" other than `id`. Such a reply
/// belongs to another request and is never used as a fallback.
[[nodiscard]] bool answers_other_request(const Json& payload, const JsonRpcId& id);

}  // namespace mcpcall
