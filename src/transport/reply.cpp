#include "mcpcall/transport/reply.hpp"

namespace mcpcall {

CallResult result_from_reply(
    const Json& payload,
    const std::string& service,
    const std::string& transport
) {
    const DecodedReply reply = decode_reply(payload);
    switch (reply.kind) {
        case ReplyKind::Result:
        case ReplyKind::CompatSuccess:
            return CallResult::ok(service, transport, reply.data);

        case ReplyKind::Error:
        case ReplyKind::CompatFailure:
            return CallResult::failure(ErrorCode::RemoteError, reply.error_message, service, transport);

        case ReplyKind::Incomplete:
            break;
    }
    return CallResult::failure(ErrorCode::SchemaInvalid,
                               "reply has neither result nor error", service, transport);
}

bool is_server_message(const Json& payload) {
    return payload.is_object() && payload.contains("method");
}

bool answers_other_request(const Json& payload, const JsonRpcId& id) {
    if (payload.is_object() == false) {
        return false;
    }
    const auto it = payload.find("id");
    return (it != payload.end()) && (it->is_null() == false) && (id.matches(*it) == false);
}

}  // namespace mcpcall
