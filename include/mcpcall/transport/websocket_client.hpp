#pragma once

#include "mcpcall/transport.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// WebSocket Client Abstraction
// ─────────────────────────────────────────────────────────────────────────────
// The engine only needs text frames out, text frames in, and close. Kept
// behind an interface so tests substitute a scripted connection.

struct WebSocketError {
    enum class Code {
        ConnectFailed,
        Unsupported,  // the request needs a feature this client lacks
        SendFailed,
        Closed
    };

    Code code{Code::ConnectFailed};
    std::string message;
};

template <typename T>
using WebSocketResult = tl::expected<T, WebSocketError>;

struct WebSocketPoll {
    enum class Kind {
        Idle,     // nothing within the wait
        Message,  // one text frame in `text`
        Closed    // peer closed or the socket failed
    };

    Kind kind{Kind::Idle};
    std::string text;

    static WebSocketPoll idle() { return {}; }
    static WebSocketPoll message(std::string frame) { return {Kind::Message, std::move(frame)}; }
    static WebSocketPoll closed() { return {Kind::Closed, {}}; }
};

class IWebSocketConnection {
public:
    virtual ~IWebSocketConnection() = default;

    [[nodiscard]] virtual WebSocketResult<void> send_text(const std::string& text) = 0;

    /// Wait up to `wait` for the next frame.
    [[nodiscard]] virtual WebSocketPoll poll(Millis wait) = 0;

    virtual void close() noexcept = 0;
};

class IWebSocketConnector {
public:
    virtual ~IWebSocketConnector() = default;

    [[nodiscard]] virtual WebSocketResult<std::unique_ptr<IWebSocketConnection>> connect(
        const std::string& url,
        const HeaderMap& headers,
        Millis connect_timeout
    ) = 0;
};

/// What make_websocket_connector() cannot honour for this url and header
/// set, or nullopt when it can: it speaks plain ws:// and sends no header
/// besides Origin.
[[nodiscard]] std::optional<std::string> unsupported_websocket_feature(
    const std::string& url,
    const HeaderMap& headers
);

/// easywsclient backed connector. Fails with Code::Unsupported, without
/// connecting, whenever unsupported_websocket_feature() names something.
[[nodiscard]] std::unique_ptr<IWebSocketConnector> make_websocket_connector();

}  // namespace mcpcall
