#include "mcpcall/transport/websocket_client.hpp"
#include "mcpcall/log/logger.hpp"
#include "mcpcall/transport/http_types.hpp"

#include <easywsclient.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <thread>

namespace mcpcall {

namespace {

using easywsclient::WebSocket;

// easywsclient polls in whole milliseconds and blocks for at most that long
constexpr int kMaxPollSliceMs = 50;

class EasyWsConnection final : public IWebSocketConnection {
public:
    explicit EasyWsConnection(std::unique_ptr<WebSocket> socket)
        : socket_(std::move(socket))
    {}

    ~EasyWsConnection() override {
        close();
    }

    WebSocketResult<void> send_text(const std::string& text) override {
        const bool open = (socket_ != nullptr) && (socket_->getReadyState() == WebSocket::OPEN);
        if (open == false) {
            return tl::unexpected(WebSocketError{WebSocketError::Code::Closed, "socket is not open"});
        }
        socket_->send(text);
        // The frame is queued; flush it without waiting for input
        socket_->poll(0);
        return {};
    }

    WebSocketPoll poll(Millis wait) override {
        if (pending_.empty() == false) {
            return take_pending();
        }
        if ((socket_ == nullptr) || (socket_->getReadyState() == WebSocket::CLOSED)) {
            return WebSocketPoll::closed();
        }

        const auto deadline = std::chrono::steady_clock::now() + wait;
        do {
            const auto remaining = std::chrono::duration_cast<Millis>(
                deadline - std::chrono::steady_clock::now());
            const int slice = static_cast<int>(std::clamp<long long>(remaining.count(), 0, kMaxPollSliceMs));

            socket_->poll(slice);
            socket_->dispatch([this](const std::string& frame) {
                pending_.push_back(frame);
            });

            if (pending_.empty() == false) {
                return take_pending();
            }
            if (socket_->getReadyState() == WebSocket::CLOSED) {
                return WebSocketPoll::closed();
            }
        } while (std::chrono::steady_clock::now() < deadline);

        return WebSocketPoll::idle();
    }

    void close() noexcept override {
        if (socket_ == nullptr) {
            return;
        }
        if (socket_->getReadyState() != WebSocket::CLOSED) {
            socket_->close();
            socket_->poll(0);
        }
        socket_.reset();
    }

private:
    std::unique_ptr<WebSocket> socket_;
    std::deque<std::string> pending_;

    WebSocketPoll take_pending() {
        WebSocketPoll result = WebSocketPoll::message(std::move(pending_.front()));
        pending_.pop_front();
        return result;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Pending Connect
// ─────────────────────────────────────────────────────────────────────────────
// WebSocket::from_url blocks in connect() and the handshake with no timeout
// of its own, so it runs on a worker that owns this state through
// shared_ptr. A worker that misses the deadline is detached and its socket
// is dropped when it finally returns.

struct PendingConnect {
    std::mutex mutex;
    std::condition_variable cv;
    bool finished{false};
    std::unique_ptr<WebSocket> socket;
};

class EasyWsConnector final : public IWebSocketConnector {
public:
    WebSocketResult<std::unique_ptr<IWebSocketConnection>> connect(
        const std::string& url,
        const HeaderMap& headers,
        Millis connect_timeout
    ) override {
        if (auto missing = unsupported_websocket_feature(url, headers)) {
            return tl::unexpected(WebSocketError{WebSocketError::Code::Unsupported, std::move(*missing)});
        }

        auto pending = std::make_shared<PendingConnect>();
        const std::string origin = get_header(headers, "Origin").value_or(std::string{});
        std::thread worker([pending, url, origin]() {
            std::unique_ptr<WebSocket> socket(WebSocket::from_url(url, origin));
            {
                std::lock_guard<std::mutex> lock(pending->mutex);
                pending->socket = std::move(socket);
                pending->finished = true;
            }
            pending->cv.notify_all();
        });

        bool finished = false;
        {
            std::unique_lock<std::mutex> lock(pending->mutex);
            finished = pending->cv.wait_for(lock, connect_timeout, [&pending] { return pending->finished; });
        }
        if (finished == false) {
            MCPCALL_LOG_DEBUG(std::format("Detaching WebSocket connect to {} after {}ms", url, connect_timeout.count()));
            worker.detach();
            return tl::unexpected(WebSocketError{
                WebSocketError::Code::ConnectFailed,
                std::format("could not connect to {} within {}ms", url, connect_timeout.count())
            });
        }
        worker.join();

        if (pending->socket == nullptr) {
            return tl::unexpected(WebSocketError{
                WebSocketError::Code::ConnectFailed,
                std::format("could not connect to {}", url)
            });
        }
        return std::make_unique<EasyWsConnection>(std::move(pending->socket));
    }
};

}  // namespace

std::optional<std::string> unsupported_websocket_feature(const std::string& url, const HeaderMap& headers) {
    if (has_scheme(url, {"wss"})) {
        return std::format("secure WebSocket (wss://) is not supported: {}", url);
    }

    std::string dropped;
    const HeaderNameLess less;
    for (const auto& [name, value] : headers) {
        const bool is_origin = (less(name, "Origin") == false) && (less("Origin", name) == false);
        if (is_origin == false) {
            dropped += dropped.empty() ? name : ", " + name;
        }
    }
    if (dropped.empty() == false) {
        return std::format("WebSocket handshake cannot carry header(s) {}; only Origin is sent", dropped);
    }
    return std::nullopt;
}

std::unique_ptr<IWebSocketConnector> make_websocket_connector() {
    return std::make_unique<EasyWsConnector>();
}

}  // namespace mcpcall
