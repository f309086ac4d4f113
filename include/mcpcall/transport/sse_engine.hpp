#pragma once

#include "mcpcall/protocol/json_rpc.hpp"
#include "mcpcall/trace/trace_sink.hpp"
#include "mcpcall/transport/backoff_policy.hpp"
#include "mcpcall/transport/http_client.hpp"
#include "mcpcall/transport/sse_parser.hpp"
#include "mcpcall/transport/transport_engine.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// SSE Engine Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct SseEngineConfig {
    // Events whose accumulated data exceeds this fail with RESPONSE_TOO_LARGE
    std::size_t max_event_bytes{1024 * 1024};

    // POSTs to a legacy endpoint are tried this many times before the
    // connection is given up
    std::size_t legacy_post_attempts{3};
    Millis legacy_post_timeout{std::chrono::seconds{10}};

    Millis connect_timeout{std::chrono::seconds{10}};

    ClientIdentity client{};
    std::string protocol_version{kMcpProtocolVersion};

    // Wait between reconnects; null selects 250ms doubling to 2s
    std::shared_ptr<IBackoffPolicy> reconnect_backoff;
};

// ─────────────────────────────────────────────────────────────────────────────
// SseEngine
// ─────────────────────────────────────────────────────────────────────────────
// Carries one call over text/event-stream. Two protocol shapes:
//
//   Modern (method POST): the envelope is POSTed and the reply arrives on
//   the response stream (or as a plain JSON body).
//
//   Legacy (method GET): a GET opens the stream, which announces a POST
//   endpoint in an "endpoint" event. The engine then runs
//
//     AwaitEndpoint -> InitializeSent -> AwaitInitializeResult
//       -> InitializedNotified -> RequestSent -> AwaitResponse
//
//   posting initialize, notifications/initialized and finally the envelope
//   to that endpoint. Replies come back on the GET stream, matched by id.
//
// Each connection is bounded by an idle timer (reset on every received line,
// heartbeats included) and a total timer. Connection failures, bad statuses,
// early end of stream and timeouts reopen a fresh connection while
// CallPolicy::reconnect allows it; handshake progress starts over on each
// connection. Cancellation is checked every poll interval and ends the call
// at once.

class SseEngine final : public ITransportEngine {
public:
    explicit SseEngine(
        std::shared_ptr<IHttpClient> http,
        SseEngineConfig config = {},
        std::shared_ptr<ITraceSink> trace = nullptr
    );

    [[nodiscard]] CallResult call(
        const ServiceConfig& service,
        const JsonRpcRequest& envelope,
        const CallPolicy& policy
    ) override;

    [[nodiscard]] const SseEngineConfig& config() const noexcept { return config_; }

private:
    struct Connection;

    std::shared_ptr<IHttpClient> http_;
    SseEngineConfig config_;
    std::shared_ptr<ITraceSink> trace_;

    [[nodiscard]] CallResult run_connection(Connection& conn);

    void on_headers(Connection& conn, const StreamEvent& event);
    void on_data(Connection& conn, const std::string& bytes);
    void on_end(Connection& conn);
    void on_transport_error(Connection& conn, const HttpClientError& error);

    void flush_event(Connection& conn, const SseEvent& event);
    void handle_payload(Connection& conn, const Json& payload, const std::optional<std::string>& event_id);

    void on_endpoint(Connection& conn, const std::string& data);
    void on_initialize_reply(Connection& conn, const Json& payload);
    void send_envelope(Connection& conn);

    /// POST one message to the legacy endpoint, retrying per config.
    /// Returns false with conn's outcome set when every try failed.
    bool post_to_endpoint(Connection& conn, const Json& message, std::string_view label);

    void finish(Connection& conn, CallResult result);
    void fail(Connection& conn, ErrorCode code, std::string message);
};

}  // namespace mcpcall
