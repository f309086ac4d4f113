#include "mcpcall/transport/http_client.hpp"
#include "mcpcall/log/logger.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <atomic>
#include <charconv>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>

namespace mcpcall {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// cpr Helpers
// ─────────────────────────────────────────────────────────────────────────────

cpr::Header build_headers(const HttpRequest& request, const HttpClientConfig& config) {
    cpr::Header cpr_headers;
    cpr_headers["User-Agent"] = config.user_agent;
    for (const auto& [name, value] : request.headers) {
        cpr_headers[name] = value;
    }
    return cpr_headers;
}

HttpClientError map_error(const cpr::Error& error) {
    const auto code = (error.code == cpr::ErrorCode::OPERATION_TIMEDOUT)
        ? HttpClientError::Code::Timeout
        : HttpClientError::Code::ConnectionFailed;
    return HttpClientError{code, error.message};
}

std::string_view strip_line_end(std::string_view line) {
    while ((line.empty() == false) && ((line.back() == '\n') || (line.back() == '\r'))) {
        line.remove_suffix(1);
    }
    return line;
}

// ─────────────────────────────────────────────────────────────────────────────
// Stream State
// ─────────────────────────────────────────────────────────────────────────────
// Shared between the transfer thread (producer) and the engine (consumer).
// Owned through shared_ptr so a detached transfer can outlive its stream.

struct StreamState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<StreamEvent> events;
    std::atomic<bool> abort{false};
    bool finished{false};

    // Header block of the most recent response (redirects produce several)
    int status_code{0};
    HeaderMap headers;
    bool headers_delivered{false};

    void on_header_line(std::string_view raw) {
        const std::string_view line = strip_line_end(raw);
        std::lock_guard<std::mutex> lock(mutex);

        const bool is_status_line = line.starts_with("HTTP/");
        if (is_status_line) {
            headers.clear();
            status_code = 0;
            const auto space = line.find(' ');
            if (space != std::string_view::npos) {
                const auto code_text = line.substr(space + 1, 3);
                std::from_chars(code_text.data(), code_text.data() + code_text.size(), status_code);
            }
            return;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return;
        }
        std::string_view value = line.substr(colon + 1);
        while ((value.empty() == false) && (value.front() == ' ')) {
            value.remove_prefix(1);
        }
        headers[std::string(line.substr(0, colon))] = std::string(value);
    }

    void deliver_headers_locked(int fallback_status) {
        if (headers_delivered) {
            return;
        }
        headers_delivered = true;
        const int status = (status_code != 0) ? status_code : fallback_status;
        events.push_back(StreamEvent::head(status, headers));
    }

    void on_data(std::string_view data) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            deliver_headers_locked(0);
            events.push_back(StreamEvent::chunk(std::string(data)));
        }
        cv.notify_all();
    }

    void on_complete(const cpr::Response& response) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            const bool failed = (response.error.code != cpr::ErrorCode::OK);
            if (abort.load()) {
                events.push_back(StreamEvent::failure(HttpClientError{HttpClientError::Code::Cancelled, "transfer aborted"}));
            } else if (failed) {
                events.push_back(StreamEvent::failure(map_error(response.error)));
            } else {
                deliver_headers_locked(static_cast<int>(response.status_code));
                events.push_back(StreamEvent::end());
            }
            finished = true;
        }
        cv.notify_all();
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpStream
// ─────────────────────────────────────────────────────────────────────────────
// Runs the transfer on its own thread with cpr's write callback, since a
// blocking cpr::Session call only returns once the whole body is in.

class CprHttpStream final : public IHttpStream {
public:
    CprHttpStream(HttpRequest request,
                  std::chrono::milliseconds connect_timeout,
                  const HttpClientConfig& config)
        : state_(std::make_shared<StreamState>())
        , close_grace_(config.close_grace)
    {
        auto state = state_;
        auto headers = build_headers(request, config);
        const bool verify_ssl = config.verify_ssl;

        worker_ = std::thread([state, request = std::move(request), headers = std::move(headers),
                               connect_timeout, verify_ssl]() {
            cpr::Session session;
            session.SetUrl(cpr::Url{request.url});
            session.SetHeader(headers);
            session.SetConnectTimeout(cpr::ConnectTimeout{connect_timeout});
            session.SetVerifySsl(cpr::VerifySsl{verify_ssl});
            session.SetHeaderCallback(cpr::HeaderCallback{
                [state](std::string_view line, intptr_t) -> bool {
                    state->on_header_line(line);
                    return state->abort.load() == false;
                }});
            session.SetWriteCallback(cpr::WriteCallback{
                [state](std::string_view data, intptr_t) -> bool {
                    if (state->abort.load()) {
                        return false;
                    }
                    state->on_data(data);
                    return true;
                }});
            // libcurl calls this at least once a second even on an idle
            // connection, which bounds how long an abort goes unnoticed
            session.SetProgressCallback(cpr::ProgressCallback{
                [state](auto, auto, auto, auto, intptr_t) -> bool {
                    return state->abort.load() == false;
                }});

            cpr::Response response;
            if (request.method == HttpMethod::Post) {
                session.SetBody(cpr::Body{request.body.value_or(std::string{})});
                response = session.Post();
            } else {
                response = session.Get();
            }
            state->on_complete(response);
        });
    }

    ~CprHttpStream() override {
        close();
    }

    StreamEvent read(std::chrono::milliseconds wait) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        const bool has_event = state_->cv.wait_for(lock, wait, [this] {
            return state_->events.empty() == false;
        });
        if (has_event == false) {
            return StreamEvent::pending();
        }
        StreamEvent event = std::move(state_->events.front());
        state_->events.pop_front();
        return event;
    }

    void close() noexcept override {
        if (worker_.joinable() == false) {
            return;
        }
        state_->abort.store(true);

        bool finished = false;
        {
            std::unique_lock<std::mutex> lock(state_->mutex);
            finished = state_->cv.wait_for(lock, close_grace_, [this] {
                return state_->finished;
            });
        }

        if (finished) {
            worker_.join();
        } else {
            // The transfer holds its own reference to the state and exits at
            // libcurl's next progress tick.
            MCPCALL_LOG_DEBUG("Detaching HTTP stream that did not stop within the grace period");
            worker_.detach();
        }
    }

private:
    std::shared_ptr<StreamState> state_;
    std::chrono::milliseconds close_grace_;
    std::thread worker_;
};

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────

class CprHttpClient final : public IHttpClient {
public:
    explicit CprHttpClient(HttpClientConfig config)
        : config_(std::move(config))
    {}

    HttpClientResult<HttpClientResponse> send(
        const HttpRequest& request,
        std::chrono::milliseconds timeout
    ) override {
        const auto connect_timeout = std::min(timeout, std::chrono::milliseconds{10'000});
        const auto headers = build_headers(request, config_);

        cpr::Response response;
        if (request.method == HttpMethod::Post) {
            response = cpr::Post(
                cpr::Url{request.url},
                headers,
                cpr::Body{request.body.value_or(std::string{})},
                cpr::ConnectTimeout{connect_timeout},
                cpr::Timeout{timeout},
                cpr::VerifySsl{config_.verify_ssl}
            );
        } else {
            response = cpr::Get(
                cpr::Url{request.url},
                headers,
                cpr::ConnectTimeout{connect_timeout},
                cpr::Timeout{timeout},
                cpr::VerifySsl{config_.verify_ssl}
            );
        }

        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = std::move(response.text);
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    std::unique_ptr<IHttpStream> open_stream(
        const HttpRequest& request,
        std::chrono::milliseconds connect_timeout
    ) override {
        get_logger().logf(LogLevel::Debug, "Opening {} stream to {}", to_string(request.method), request.url);
        return std::make_unique<CprHttpStream>(request, connect_timeout, config_);
    }

private:
    HttpClientConfig config_;
};

}  // namespace

std::unique_ptr<IHttpClient> make_http_client(HttpClientConfig config) {
    return std::make_unique<CprHttpClient>(std::move(config));
}

}  // namespace mcpcall
