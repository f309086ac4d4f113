#pragma once

#include "mcpcall/transport.hpp"
#include "mcpcall/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// Results
// ─────────────────────────────────────────────────────────────────────────────
// A transfer that produced an HTTP status is a response, whatever the status.
// HttpClientError is for transfers that never got one.

struct HttpClientError {
    enum class Code {
        ConnectionFailed,  // DNS, refused, reset, TLS
        Timeout,
        Cancelled          // close() or destruction of the stream
    };

    Code code{Code::ConnectionFailed};
    std::string message;

    [[nodiscard]] bool timed_out() const noexcept { return code == Code::Timeout; }
};

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const { return (status_code >= 200) && (status_code < 300); }
    [[nodiscard]] bool is_sse() const { return is_event_stream(headers); }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// Streaming Responses
// ─────────────────────────────────────────────────────────────────────────────
// A stream delivers, in order: one Headers event, any number of Data events,
// then exactly one End or Error. read() returns Pending when nothing arrived
// within the wait, which is how callers interleave their own timers and
// cancellation checks with the network.

struct StreamEvent {
    enum class Kind {
        Pending,
        Headers,
        Data,
        End,
        Error
    };

    Kind kind{Kind::Pending};
    int status_code{0};              // Headers
    HeaderMap headers;               // Headers
    std::string data;                // Data
    std::optional<HttpClientError> error;  // Error

    static StreamEvent pending() { return {}; }

    static StreamEvent head(int status, HeaderMap response_headers) {
        StreamEvent event;
        event.kind = Kind::Headers;
        event.status_code = status;
        event.headers = std::move(response_headers);
        return event;
    }

    static StreamEvent chunk(std::string bytes) {
        StreamEvent event;
        event.kind = Kind::Data;
        event.data = std::move(bytes);
        return event;
    }

    static StreamEvent end() {
        StreamEvent event;
        event.kind = Kind::End;
        return event;
    }

    static StreamEvent failure(HttpClientError err) {
        StreamEvent event;
        event.kind = Kind::Error;
        event.error = std::move(err);
        return event;
    }
};

class IHttpStream {
public:
    virtual ~IHttpStream() = default;

    /// Wait up to `wait` for the next event.
    [[nodiscard]] virtual StreamEvent read(std::chrono::milliseconds wait) = 0;

    /// Abort the transfer. Idempotent; also done by the destructor.
    virtual void close() noexcept = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// Stateless between requests: every call carries its own absolute URL and
// headers, so one client is shared by concurrent calls.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /// Buffered request/response. `timeout` bounds the whole exchange.
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> send(
        const HttpRequest& request,
        std::chrono::milliseconds timeout
    ) = 0;

    /// Start a streaming request. Never fails synchronously; connection
    /// errors arrive as an Error event. `connect_timeout` bounds only the
    /// connection phase; the caller owns read deadlines.
    [[nodiscard]] virtual std::unique_ptr<IHttpStream> open_stream(
        const HttpRequest& request,
        std::chrono::milliseconds connect_timeout
    ) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Function
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientConfig {
    bool verify_ssl{true};
    std::string user_agent{"mcpcall/1.0"};
    // How long close() waits for an aborted transfer before detaching it
    std::chrono::milliseconds close_grace{2000};
};

/// cpr (libcurl) backed client
std::unique_ptr<IHttpClient> make_http_client(HttpClientConfig config = {});

}  // namespace mcpcall
