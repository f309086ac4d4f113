#include "mcpcall/transport/sse_engine.hpp"
#include "mcpcall/json/fast_json.hpp"
#include "mcpcall/log/logger.hpp"
#include "mcpcall/transport/reply.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <thread>

namespace mcpcall {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::string_view kTransportName = "sse";

enum class Mode {
    Modern,
    Legacy
};

enum class LegacyStage {
    AwaitEndpoint,
    InitializeSent,
    AwaitInitializeResult,
    InitializedNotified,
    RequestSent,
    AwaitResponse
};

std::string_view to_string(LegacyStage stage) {
    switch (stage) {
        case LegacyStage::AwaitEndpoint:         return "await_endpoint";
        case LegacyStage::InitializeSent:        return "initialize_sent";
        case LegacyStage::AwaitInitializeResult: return "await_initialize_result";
        case LegacyStage::InitializedNotified:   return "initialized_notified";
        case LegacyStage::RequestSent:           return "request_sent";
        case LegacyStage::AwaitResponse:         return "await_response";
    }
    return "unknown";
}

long long whole_seconds(Millis duration) {
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

bool contains_nul(std::string_view data) {
    return data.find('\0') != std::string_view::npos;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Connection State
// ─────────────────────────────────────────────────────────────────────────────
// Everything one connection attempt reads and writes. Threaded through the
// handlers explicitly; a new Connection is built for every reconnect.

struct SseEngine::Connection {
    const ServiceConfig& service;
    const SseEndpoint& endpoint;
    const JsonRpcRequest& envelope;
    const CallPolicy& policy;
    Mode mode;
    std::size_t number;  // 0 for the first connection of the call

    SseParser parser;
    Clock::time_point started{Clock::now()};
    Clock::time_point last_activity{started};

    // Modern POST answered with application/json instead of a stream
    bool json_body{false};
    std::string body;

    // Legacy handshake
    LegacyStage stage{LegacyStage::AwaitEndpoint};
    std::optional<std::string> post_url;
    std::optional<JsonRpcId> initialize_id;

    std::optional<CallResult> outcome;

    Connection(const ServiceConfig& svc,
               const SseEndpoint& ep,
               const JsonRpcRequest& env,
               const CallPolicy& pol,
               std::size_t index,
               std::size_t max_event_bytes)
        : service(svc)
        , endpoint(ep)
        , envelope(env)
        , policy(pol)
        , mode(ep.method == HttpMethod::Get ? Mode::Legacy : Mode::Modern)
        , number(index)
        , parser(SseParserConfig{std::max<std::size_t>(2 * max_event_bytes, 64 * 1024), max_event_bytes})
    {}

    [[nodiscard]] bool legacy() const noexcept { return mode == Mode::Legacy; }

    [[nodiscard]] Millis elapsed(Clock::time_point now) const {
        return std::chrono::duration_cast<Millis>(now - started);
    }

    [[nodiscard]] Millis idle_for(Clock::time_point now) const {
        return std::chrono::duration_cast<Millis>(now - last_activity);
    }

    void advance(LegacyStage next) {
        MCPCALL_LOG_DEBUG(std::format("[{}] legacy handshake: {} -> {}",
                                      service.name, to_string(stage), to_string(next)));
        stage = next;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// SseEngine
// ─────────────────────────────────────────────────────────────────────────────

SseEngine::SseEngine(
    std::shared_ptr<IHttpClient> http,
    SseEngineConfig config,
    std::shared_ptr<ITraceSink> trace
)
    : http_(std::move(http))
    , config_(std::move(config))
    , trace_(std::move(trace))
{
    if (config_.reconnect_backoff == nullptr) {
        config_.reconnect_backoff = std::make_shared<ExponentialBackoff>(
            std::chrono::milliseconds{250}, 2.0, std::chrono::milliseconds{2'000}, 0.25);
    }
    if (trace_ == nullptr) {
        trace_ = std::make_shared<NullTraceSink>();
    }
    config_.legacy_post_attempts = std::max<std::size_t>(1, config_.legacy_post_attempts);
}

CallResult SseEngine::call(
    const ServiceConfig& service,
    const JsonRpcRequest& envelope,
    const CallPolicy& policy
) {
    const std::string transport{kTransportName};

    const auto* endpoint = std::get_if<SseEndpoint>(&service.transport);
    if (endpoint == nullptr) {
        return CallResult::failure(ErrorCode::TransportUnsupported,
            std::format("service '{}' is not an SSE service", service.name),
            service.name, std::string(service.transport_name()));
    }
    if (endpoint->url.empty()) {
        return CallResult::failure(ErrorCode::MissingUrl,
            std::format("SSE service '{}' has no url", service.name),
            service.name, transport);
    }
    const bool is_http_url = has_scheme(endpoint->url, {"http", "https"});
    if (is_http_url == false) {
        return CallResult::failure(ErrorCode::MissingUrl,
            std::format("SSE service '{}' url '{}' is not an http(s) URL", service.name, endpoint->url),
            service.name, transport);
    }

    try {
        std::size_t reconnects = 0;
        while (true) {
            Connection conn(service, *endpoint, envelope, policy, reconnects, config_.max_event_bytes);
            CallResult result = run_connection(conn);

            if (result.success) {
                return result;
            }

            const ErrorCode code = result.error_code.value_or(ErrorCode::Unknown);
            const bool reconnectable = ReconnectPolicy::warrants_reconnect(code);
            const bool budget_left = policy.reconnect.allows(reconnects);
            if ((reconnectable == false) || (budget_left == false)) {
                return result;
            }

            const auto delay = config_.reconnect_backoff->next_delay(reconnects);
            ++reconnects;

            MCPCALL_LOG_WARN(std::format("[{}] SSE connection failed ({}: {}), reconnecting ({}/{})",
                service.name, to_string(code), result.error.value_or(""),
                reconnects, policy.reconnect.max_reconnects));
            trace_->trace(service.name, transport, "reconnect", result.error.value_or(""),
                Json{{"reconnect", reconnects},
                     {"maxReconnects", policy.reconnect.max_reconnects},
                     {"reason", std::string(to_string(code))},
                     {"delayMs", delay.count()}});

            const bool waited = wait_unless_cancelled(policy, delay);
            if (waited == false) {
                return CallResult::failure(ErrorCode::Cancelled, "cancelled by user",
                                           service.name, transport);
            }
        }
    } catch (const std::exception& e) {
        MCPCALL_LOG_ERROR(std::format("[{}] SSE call failed internally: {}", service.name, e.what()));
        return CallResult::failure(ErrorCode::InternalError, e.what(), service.name, transport);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection Loop
// ─────────────────────────────────────────────────────────────────────────────

CallResult SseEngine::run_connection(Connection& conn) {
    const std::string transport{kTransportName};
    const Json envelope_json = conn.envelope.to_json();

    HttpRequest request;
    request.url = conn.endpoint.url;
    request.headers = conn.endpoint.headers;
    if (conn.legacy()) {
        request.method = HttpMethod::Get;
        request.with_header("Accept", "text/event-stream");
    } else {
        request.method = HttpMethod::Post;
        request.with_header("Accept", "text/event-stream, application/json");
        request.with_header("Content-Type", "application/json");
        request.with_body(envelope_json.dump());
    }
    request.with_header("Cache-Control", "no-cache");

    trace_->trace(conn.service.name, transport, "connect",
        std::format("{} {}", to_string(request.method), request.url),
        Json{{"connection", conn.number},
             {"mode", conn.legacy() ? "legacy" : "modern"},
             {"id", conn.envelope.id().to_string()}});
    MCPCALL_LOG_DEBUG(std::format("[{}] opening SSE {} stream to {}",
        conn.service.name, conn.legacy() ? "legacy" : "modern", request.url));

    const auto connect_timeout = std::min(config_.connect_timeout, conn.policy.total_timeout);
    std::unique_ptr<IHttpStream> stream = http_->open_stream(request, connect_timeout);

    while (conn.outcome.has_value() == false) {
        if (conn.policy.cancel_requested()) {
            fail(conn, ErrorCode::Cancelled, "cancelled by user");
            break;
        }

        // Events that queued while a handler blocked (legacy POSTs) are read
        // before the timers are judged
        StreamEvent event = stream->read(Millis{0});
        if (event.kind == StreamEvent::Kind::Pending) {
            const auto now = Clock::now();
            const auto elapsed = conn.elapsed(now);
            const auto idle = conn.idle_for(now);
            if (elapsed >= conn.policy.total_timeout) {
                fail(conn, ErrorCode::Timeout, std::format("no reply within total timeout of {}s",
                    whole_seconds(conn.policy.total_timeout)));
                break;
            }
            if (idle >= conn.policy.idle_timeout) {
                fail(conn, ErrorCode::Timeout, std::format("no data received for {}s (idle timeout)",
                    whole_seconds(conn.policy.idle_timeout)));
                break;
            }

            const auto wait = std::min({conn.policy.poll_interval,
                                        conn.policy.total_timeout - elapsed,
                                        conn.policy.idle_timeout - idle});
            event = stream->read(std::max(wait, Millis{1}));
        }

        switch (event.kind) {
            case StreamEvent::Kind::Pending:
                break;
            case StreamEvent::Kind::Headers:
                on_headers(conn, event);
                break;
            case StreamEvent::Kind::Data:
                on_data(conn, event.data);
                break;
            case StreamEvent::Kind::End:
                on_end(conn);
                break;
            case StreamEvent::Kind::Error:
                on_transport_error(conn, event.error.value_or(HttpClientError{HttpClientError::Code::ConnectionFailed, "stream error"}));
                break;
        }
    }

    stream->close();
    return std::move(*conn.outcome);
}

void SseEngine::on_headers(Connection& conn, const StreamEvent& event) {
    const bool is_success = (event.status_code >= 200) && (event.status_code < 300);
    if (is_success == false) {
        fail(conn, ErrorCode::BadStatus, std::format("HTTP {} from {}", event.status_code, conn.endpoint.url));
        return;
    }

    const bool event_stream = is_event_stream(event.headers);
    if (event_stream) {
        return;
    }

    const bool json_reply = (conn.legacy() == false) && is_json_content(event.headers);
    if (json_reply) {
        conn.json_body = true;
        return;
    }

    const auto content_type = get_header(event.headers, "Content-Type").value_or("none");
    fail(conn, ErrorCode::StreamInitFailed,
         std::format("expected text/event-stream, got content type '{}'", content_type));
}

void SseEngine::on_data(Connection& conn, const std::string& bytes) {
    if (conn.json_body) {
        conn.body += bytes;
        conn.last_activity = Clock::now();
        if (conn.body.size() > config_.max_event_bytes) {
            fail(conn, ErrorCode::ResponseTooLarge,
                 std::format("response body exceeds the {} byte limit", config_.max_event_bytes));
        }
        return;
    }

    const auto lines_before = conn.parser.lines_seen();
    std::vector<SseEvent> events;
    try {
        events = conn.parser.feed(bytes);
    } catch (const SseBufferOverflowError& e) {
        fail(conn, ErrorCode::ResponseTooLarge, e.what());
        return;
    }

    if (conn.parser.lines_seen() != lines_before) {
        conn.last_activity = Clock::now();
    }

    for (const auto& event : events) {
        flush_event(conn, event);
        if (conn.outcome.has_value()) {
            return;
        }
    }
}

void SseEngine::on_end(Connection& conn) {
    if (conn.json_body) {
        const bool parsable = looks_like_json(conn.body);
        if (parsable) {
            auto parsed = fast_parse(conn.body);
            if (parsed) {
                handle_payload(conn, *parsed, std::nullopt);
            }
        }
    } else {
        const auto tail = conn.parser.finish();
        if (tail.has_value()) {
            flush_event(conn, *tail);
        }
    }

    if (conn.outcome.has_value() == false) {
        fail(conn, ErrorCode::StreamClosed, "event stream ended before a reply arrived");
    }
}

void SseEngine::on_transport_error(Connection& conn, const HttpClientError& error) {
    const bool timed_out = error.timed_out();
    if (timed_out) {
        fail(conn, ErrorCode::Timeout, std::format("connection timed out: {}", error.message));
        return;
    }
    fail(conn, ErrorCode::RequestFailed, std::format("connection to {} failed: {}",
                                                     conn.endpoint.url, error.message));
}

// ─────────────────────────────────────────────────────────────────────────────
// Event Flush and Correlation
// ─────────────────────────────────────────────────────────────────────────────

void SseEngine::flush_event(Connection& conn, const SseEvent& event) {
    if (conn.endpoint.debug) {
        MCPCALL_LOG_INFO(std::format("[{}] SSE event name={} id={} bytes={}", conn.service.name,
            event.event.value_or("message"), event.id.value_or("-"), event.data_bytes));
    }

    if (event.oversized) {
        fail(conn, ErrorCode::ResponseTooLarge,
             std::format("SSE event of {} bytes exceeds the {} byte limit",
                         event.data_bytes, config_.max_event_bytes));
        return;
    }

    const bool is_binary = event.is_named("binary") || contains_nul(event.data);
    if (is_binary) {
        fail(conn, ErrorCode::BinaryUnsupported, "binary SSE payloads are not supported");
        return;
    }

    const bool is_endpoint = conn.legacy() && event.is_named("endpoint") && (conn.post_url.has_value() == false);
    if (is_endpoint) {
        on_endpoint(conn, event.data);
        return;
    }

    if (looks_like_json(event.data) == false) {
        return;
    }

    auto parsed = fast_parse(event.data);
    if (parsed.has_value() == false) {
        MCPCALL_LOG_DEBUG(std::format("[{}] ignoring unparsable SSE payload: {}",
                                      conn.service.name, parsed.error().message));
        return;
    }

    if (parsed->is_array()) {
        for (const auto& item : *parsed) {
            handle_payload(conn, item, event.id);
            if (conn.outcome.has_value()) {
                return;
            }
        }
        return;
    }
    handle_payload(conn, *parsed, event.id);
}

void SseEngine::handle_payload(
    Connection& conn,
    const Json& payload,
    const std::optional<std::string>& event_id
) {
    if (payload.is_object() == false) {
        return;
    }

    const auto id_node = payload.find("id");
    const bool has_id = (id_node != payload.end());

    if (is_server_message(payload)) {
        return;
    }

    const bool awaiting_initialize =
        conn.legacy() &&
        conn.initialize_id.has_value() &&
        (conn.stage == LegacyStage::InitializeSent || conn.stage == LegacyStage::AwaitInitializeResult);
    if (awaiting_initialize && has_id && conn.initialize_id->matches(*id_node)) {
        on_initialize_reply(conn, payload);
        return;
    }

    const bool id_matches = has_id && conn.envelope.id().matches(*id_node);
    const bool event_id_matches = event_id.has_value() && conn.envelope.id().matches(*event_id);
    // A bare JSON body answering a modern POST may omit the id
    const bool uncorrelated_body = conn.json_body && (has_id == false);
    if ((id_matches || event_id_matches || uncorrelated_body) == false) {
        return;
    }

    finish(conn, result_from_reply(payload, conn.service.name, std::string(kTransportName)));
}

// ─────────────────────────────────────────────────────────────────────────────
// Legacy Handshake
// ─────────────────────────────────────────────────────────────────────────────

void SseEngine::on_endpoint(Connection& conn, const std::string& data) {
    const std::string reference{trim_ascii(data)};
    auto resolved = resolve_url(conn.endpoint.url, reference);
    if (resolved.has_value() == false) {
        fail(conn, ErrorCode::StreamInitFailed, std::format("invalid endpoint event '{}'", reference));
        return;
    }

    conn.post_url = std::move(*resolved);
    trace_->trace(conn.service.name, std::string(kTransportName), "endpoint", *conn.post_url,
                  Json{{"connection", conn.number}});
    MCPCALL_LOG_DEBUG(std::format("[{}] legacy POST endpoint: {}", conn.service.name, *conn.post_url));

    const JsonRpcRequest initialize = make_initialize_request(config_.client, config_.protocol_version);
    conn.initialize_id = initialize.id();
    conn.advance(LegacyStage::InitializeSent);

    trace_->trace(conn.service.name, std::string(kTransportName), "handshake", "initialize",
                  Json{{"id", initialize.id().to_string()}});

    const bool posted = post_to_endpoint(conn, initialize.to_json(), "initialize");
    if (posted && (conn.stage == LegacyStage::InitializeSent)) {
        conn.advance(LegacyStage::AwaitInitializeResult);
    }
}

void SseEngine::on_initialize_reply(Connection& conn, const Json& payload) {
    const DecodedReply reply = decode_reply(payload);
    const bool accepted = (reply.kind == ReplyKind::Result) || (reply.kind == ReplyKind::CompatSuccess);
    if (accepted == false) {
        const std::string reason = reply.error_message.empty()
            ? std::string("reply has neither result nor error")
            : reply.error_message;
        fail(conn, ErrorCode::RemoteError, std::format("initialize rejected: {}", reason));
        return;
    }

    const Json notification = make_initialized_notification();
    conn.advance(LegacyStage::InitializedNotified);
    trace_->trace(conn.service.name, std::string(kTransportName), "handshake", "notifications/initialized");

    const bool notified = post_to_endpoint(conn, notification, "notifications/initialized");
    if (notified == false) {
        return;
    }
    send_envelope(conn);
}

void SseEngine::send_envelope(Connection& conn) {
    conn.advance(LegacyStage::RequestSent);
    trace_->trace(conn.service.name, std::string(kTransportName), "request", conn.envelope.method(),
                  Json{{"id", conn.envelope.id().to_string()}});

    const bool posted = post_to_endpoint(conn, conn.envelope.to_json(), conn.envelope.method());
    if (posted && (conn.outcome.has_value() == false)) {
        conn.advance(LegacyStage::AwaitResponse);
    }
}

bool SseEngine::post_to_endpoint(Connection& conn, const Json& message, std::string_view label) {
    HttpRequest request;
    request.method = HttpMethod::Post;
    request.url = conn.post_url.value_or(conn.endpoint.url);
    request.headers = conn.endpoint.headers;
    request.with_header("Content-Type", "application/json");
    request.with_header("Accept", "application/json, text/event-stream");
    request.with_body(message.dump());

    ErrorCode last_code = ErrorCode::RequestFailed;
    std::string last_message;

    for (std::size_t attempt = 1; attempt <= config_.legacy_post_attempts; ++attempt) {
        if (conn.policy.cancel_requested()) {
            fail(conn, ErrorCode::Cancelled, "cancelled by user");
            return false;
        }

        const auto remaining = conn.policy.total_timeout - conn.elapsed(Clock::now());
        if (remaining <= Millis{0}) {
            fail(conn, ErrorCode::Timeout, std::format("no reply within total timeout of {}s",
                whole_seconds(conn.policy.total_timeout)));
            return false;
        }

        auto response = http_->send(request, std::min(config_.legacy_post_timeout, remaining));
        // The stream was not being read while the POST blocked
        conn.last_activity = std::max(conn.last_activity, Clock::now());
        if (response.has_value() == false) {
            last_code = response.error().timed_out()
                ? ErrorCode::Timeout
                : ErrorCode::RequestFailed;
            last_message = response.error().message;
        } else if (response->is_success() == false) {
            last_code = ErrorCode::BadStatus;
            last_message = std::format("HTTP {}", response->status_code);
        } else {
            // Some servers answer on the POST itself instead of the stream
            const bool has_json_body = looks_like_json(response->body);
            if (has_json_body) {
                auto parsed = fast_parse(response->body);
                if (parsed) {
                    handle_payload(conn, *parsed, std::nullopt);
                }
            }
            return true;
        }

        MCPCALL_LOG_WARN(std::format("[{}] legacy POST {} failed (try {}/{}): {}", conn.service.name,
            label, attempt, config_.legacy_post_attempts, last_message));

        const bool more_tries = (attempt < config_.legacy_post_attempts);
        if (more_tries) {
            const bool waited = wait_unless_cancelled(conn.policy, conn.policy.poll_interval);
            if (waited == false) {
                fail(conn, ErrorCode::Cancelled, "cancelled by user");
                return false;
            }
        }
    }

    fail(conn, last_code, std::format("POST {} to {} failed: {}", label, request.url, last_message));
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
// Outcome
// ─────────────────────────────────────────────────────────────────────────────

void SseEngine::finish(Connection& conn, CallResult result) {
    if (conn.outcome.has_value()) {
        return;
    }
    result.service = conn.service.name;
    result.transport = std::string(kTransportName);
    conn.outcome = std::move(result);
}

void SseEngine::fail(Connection& conn, ErrorCode code, std::string message) {
    finish(conn, CallResult::failure(code, std::move(message)));
}

}  // namespace mcpcall
