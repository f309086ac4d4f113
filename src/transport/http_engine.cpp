#include "mcpcall/transport/http_engine.hpp"
#include "mcpcall/json/fast_json.hpp"
#include "mcpcall/log/logger.hpp"
#include "mcpcall/transport/reply.hpp"
#include "mcpcall/transport/sse_parser.hpp"

#include <format>

namespace mcpcall {

namespace {

constexpr std::string_view kTransportName = "streamableHttp";

// Payload of the event answering `id`: matched by JSON id first, then by the
// SSE id field. Falls back to the last JSON event that carries no JSON-RPC id
// of its own when nothing correlates.
std::optional<Json> pick_sse_reply(const std::string& body, const JsonRpcId& id) {
    SseParser parser(SseParserConfig{body.size() + 1, body.size() + 1});
    std::vector<SseEvent> events = parser.feed(body);
    if (auto tail = parser.finish(); tail.has_value()) {
        events.push_back(std::move(*tail));
    }

    std::optional<Json> last_json;
    for (const auto& event : events) {
        if (looks_like_json(event.data) == false) {
            continue;
        }
        auto parsed = fast_parse(event.data);
        if (parsed.has_value() == false || is_server_message(*parsed)) {
            continue;
        }
        const bool id_matches = parsed->is_object() && parsed->contains("id") && id.matches((*parsed)["id"]);
        const bool event_id_matches = event.id.has_value() && id.matches(*event.id);
        if (id_matches || event_id_matches) {
            return std::move(*parsed);
        }
        if (answers_other_request(*parsed, id) == false) {
            last_json = std::move(*parsed);
        }
    }
    return last_json;
}

}  // namespace

HttpEngine::HttpEngine(
    std::shared_ptr<IHttpClient> http,
    HttpEngineConfig config,
    std::shared_ptr<ITraceSink> trace
)
    : http_(std::move(http))
    , config_(config)
    , trace_(std::move(trace))
{
    if (trace_ == nullptr) {
        trace_ = std::make_shared<NullTraceSink>();
    }
}

CallResult HttpEngine::call(
    const ServiceConfig& service,
    const JsonRpcRequest& envelope,
    const CallPolicy& policy
) {
    const std::string transport{kTransportName};

    const auto* endpoint = std::get_if<HttpEndpoint>(&service.transport);
    if (endpoint == nullptr) {
        return CallResult::failure(ErrorCode::TransportUnsupported,
            std::format("service '{}' is not an HTTP service", service.name),
            service.name, std::string(service.transport_name()));
    }
    if (endpoint->url.empty()) {
        return CallResult::failure(ErrorCode::MissingUrl,
            std::format("HTTP service '{}' has no url", service.name),
            service.name, transport);
    }

    auto fail = [&](ErrorCode code, std::string message) {
        return CallResult::failure(code, std::move(message), service.name, transport);
    };

    if (policy.cancel_requested()) {
        return fail(ErrorCode::Cancelled, "cancelled by user");
    }

    try {
        HttpRequest request;
        request.method = endpoint->method;
        request.url = endpoint->url;
        request.headers = endpoint->headers;
        request.with_header("Accept", "application/json, text/event-stream");
        if (request.method == HttpMethod::Post) {
            request.with_header("Content-Type", "application/json");
            request.with_body(envelope.to_json().dump());
        }

        trace_->trace(service.name, transport, "request", envelope.method(),
                      Json{{"id", envelope.id().to_string()}, {"url", endpoint->url}});

        auto response = http_->send(request, policy.timeout);
        if (response.has_value() == false) {
            const bool timed_out = response.error().timed_out();
            if (timed_out) {
                return fail(ErrorCode::Timeout, std::format("no reply within {}s: {}",
                    std::chrono::duration_cast<std::chrono::seconds>(policy.timeout).count(),
                    response.error().message));
            }
            return fail(ErrorCode::RequestFailed, response.error().message);
        }

        if (response->is_success() == false) {
            return fail(ErrorCode::BadStatus, std::format("HTTP {} from {}", response->status_code, endpoint->url));
        }
        if (response->body.size() > config_.max_body_bytes) {
            return fail(ErrorCode::ResponseTooLarge, std::format("response body of {} bytes exceeds the {} byte limit",
                                                                 response->body.size(), config_.max_body_bytes));
        }

        if (response->is_sse()) {
            auto reply = pick_sse_reply(response->body, envelope.id());
            if (reply.has_value() == false) {
                return fail(ErrorCode::HttpInvalidJson, "event-stream reply carried no JSON reply to this request");
            }
            return result_from_reply(*reply, service.name, transport);
        }

        const bool parsable = looks_like_json(response->body);
        if (parsable == false) {
            return fail(ErrorCode::HttpInvalidJson, "reply body is not JSON");
        }
        auto parsed = fast_parse(response->body);
        if (parsed.has_value() == false) {
            return fail(ErrorCode::HttpInvalidJson, std::format("invalid JSON reply: {}", parsed.error().message));
        }
        return result_from_reply(*parsed, service.name, transport);
    } catch (const std::exception& e) {
        MCPCALL_LOG_ERROR(std::format("[{}] HTTP call failed internally: {}", service.name, e.what()));
        return fail(ErrorCode::InternalError, e.what());
    }
}

}  // namespace mcpcall
