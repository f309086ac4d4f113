#include "mcpcall/transport/websocket_engine.hpp"
#include "mcpcall/json/fast_json.hpp"
#include "mcpcall/log/logger.hpp"
#include "mcpcall/transport/reply.hpp"

#include <algorithm>
#include <chrono>
#include <format>

namespace mcpcall {

namespace {

constexpr std::string_view kTransportName = "websocket";

std::string preview(std::string_view text) {
    constexpr std::size_t limit = 120;
    if (text.size() <= limit) {
        return std::string(text);
    }
    return std::string(text.substr(0, limit)) + "...";
}

}  // namespace

WebSocketEngine::WebSocketEngine(
    std::shared_ptr<IWebSocketConnector> connector,
    std::shared_ptr<ITraceSink> trace
)
    : connector_(std::move(connector))
    , trace_(std::move(trace))
{
    if (trace_ == nullptr) {
        trace_ = std::make_shared<NullTraceSink>();
    }
}

CallResult WebSocketEngine::call(
    const ServiceConfig& service,
    const JsonRpcRequest& envelope,
    const CallPolicy& policy
) {
    const std::string transport{kTransportName};

    const auto* endpoint = std::get_if<WebSocketEndpoint>(&service.transport);
    if (endpoint == nullptr) {
        return CallResult::failure(ErrorCode::TransportUnsupported,
            std::format("service '{}' is not a WebSocket service", service.name),
            service.name, std::string(service.transport_name()));
    }
    if (endpoint->url.empty()) {
        return CallResult::failure(ErrorCode::MissingUrl,
            std::format("WebSocket service '{}' has no url", service.name),
            service.name, transport);
    }

    auto fail = [&](ErrorCode code, std::string message) {
        return CallResult::failure(code, std::move(message), service.name, transport);
    };

    try {
        trace_->trace(service.name, transport, "connect", endpoint->url);
        auto connected = connector_->connect(endpoint->url, endpoint->headers, policy.timeout);
        if (connected.has_value() == false) {
            const bool unsupported = (connected.error().code == WebSocketError::Code::Unsupported);
            return fail(unsupported ? ErrorCode::WebSocketUnsupported : ErrorCode::WebSocketConnectFailed,
                        connected.error().message);
        }
        std::unique_ptr<IWebSocketConnection> connection = std::move(*connected);

        trace_->trace(service.name, transport, "request", envelope.method(),
                      Json{{"id", envelope.id().to_string()}});
        auto sent = connection->send_text(envelope.to_json().dump());
        if (sent.has_value() == false) {
            connection->close();
            return fail(ErrorCode::WebSocketClosed, sent.error().message);
        }

        const auto deadline = std::chrono::steady_clock::now() + policy.timeout;
        while (true) {
            if (policy.cancel_requested()) {
                connection->close();
                return fail(ErrorCode::Cancelled, "cancelled by user");
            }

            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                connection->close();
                return fail(ErrorCode::Timeout, std::format("no reply within {}s",
                    std::chrono::duration_cast<std::chrono::seconds>(policy.timeout).count()));
            }

            const auto remaining = std::chrono::duration_cast<Millis>(deadline - now);
            const WebSocketPoll polled = connection->poll(std::min(remaining, policy.poll_interval));

            if (polled.kind == WebSocketPoll::Kind::Idle) {
                continue;
            }
            if (polled.kind == WebSocketPoll::Kind::Closed) {
                connection->close();
                return fail(ErrorCode::WebSocketClosed, "connection closed before a reply arrived");
            }

            const bool parsable = looks_like_json(polled.text);
            auto parsed = parsable ? fast_parse(polled.text)
                                   : JsonParseResult(tl::unexpected(JsonParseError{"not a JSON document"}));
            if (parsed.has_value() == false) {
                connection->close();
                return fail(ErrorCode::WebSocketInvalidJson,
                    std::format("invalid WebSocket payload ({}): {}", parsed.error().message, preview(polled.text)));
            }

            if (is_server_message(*parsed)) {
                continue;
            }
            const auto id_node = parsed->find("id");
            const bool other_id = (id_node != parsed->end()) && (id_node->is_null() == false) &&
                                  (envelope.id().matches(*id_node) == false);
            if (other_id) {
                MCPCALL_LOG_DEBUG(std::format("[{}] skipping WebSocket reply for id {}",
                                              service.name, id_node->dump()));
                continue;
            }

            connection->close();
            return result_from_reply(*parsed, service.name, transport);
        }
    } catch (const std::exception& e) {
        MCPCALL_LOG_ERROR(std::format("[{}] WebSocket call failed internally: {}", service.name, e.what()));
        return fail(ErrorCode::InternalError, e.what());
    }
}

}  // namespace mcpcall
