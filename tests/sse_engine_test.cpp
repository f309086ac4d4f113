// ─────────────────────────────────────────────────────────────────────────────
// SseEngine Tests
// ─────────────────────────────────────────────────────────────────────────────
// Driven entirely through MockHttpClient: streams are scripted per connection
// and legacy POSTs are answered by a send handler that pushes replies onto the
// open stream, the way a real legacy server does.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include "mcpcall/transport/sse_engine.hpp"
#include "mocks/mock_http_client.hpp"
#include "mocks/recording_trace_sink.hpp"

#include <atomic>
#include <thread>

using namespace mcpcall;
using namespace mcpcall::testing;
using Catch::Matchers::ContainsSubstring;
using namespace std::chrono_literals;

namespace {

ServiceConfig sse_service(const std::string& url = "http://localhost:9000/mcp",
                          HttpMethod method = HttpMethod::Post) {
    ServiceConfig service;
    service.name = "search";
    SseEndpoint endpoint;
    endpoint.url = url;
    endpoint.method = method;
    service.transport = endpoint;
    return service;
}

ServiceConfig legacy_service() {
    return sse_service("http://localhost:9000/sse", HttpMethod::Get);
}

CallPolicy fast_policy(std::size_t max_reconnects = 0) {
    CallPolicy policy;
    policy.timeout = 2s;
    policy.idle_timeout = 2s;
    policy.total_timeout = 2s;
    policy.poll_interval = 10ms;
    policy.reconnect.max_reconnects = max_reconnects;
    return policy;
}

struct Fixture {
    std::shared_ptr<MockHttpClient> http = std::make_shared<MockHttpClient>();
    std::shared_ptr<RecordingTraceSink> trace = std::make_shared<RecordingTraceSink>();
    SseEngineConfig config;

    Fixture() {
        config.reconnect_backoff = std::make_shared<NoBackoff>();
    }

    SseEngine engine() const {
        return SseEngine(http, config, trace);
    }
};

nlohmann::json result_for(const nlohmann::json& id, nlohmann::json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

// Id of the envelope carried by a recorded request body
nlohmann::json id_of(const HttpRequest& request) {
    return nlohmann::json::parse(request.body.value_or("{}"))["id"];
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Modern (POST) Protocol
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SseEngine returns the reply that matches the envelope id", "[sse][engine]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest& request, MockStream& stream) {
        stream.push_headers();
        stream.push_json(result_for(id_of(request), {{"content", {{{"type", "text"}, {"text", "42"}}}}}));
    });

    const auto request = make_request("tools/call", nlohmann::json{{"name", "answer"}, {"arguments", nlohmann::json::object()}});
    const CallResult result = f.engine().call(sse_service(), request, fast_policy());

    REQUIRE(result.success);
    REQUIRE(result.service == "search");
    REQUIRE(result.transport == "sse");
    REQUIRE(result.data["content"][0]["text"] == "42");

    const auto requests = f.http->requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].method == HttpMethod::Post);
    REQUIRE(requests[0].streaming);
    REQUIRE(requests[0].json_body()["method"] == "tools/call");
    REQUIRE(requests[0].json_body()["jsonrpc"] == "2.0");
    REQUIRE_THAT(get_header(requests[0].headers, "accept").value_or(""), ContainsSubstring("text/event-stream"));
}

TEST_CASE("SseEngine skips replies to other ids and server notifications", "[sse][engine]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest& request, MockStream& stream) {
        stream.push_headers();
        stream.push_json({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}, {"params", {{"progress", 1}}}});
        stream.push_json(result_for("stale-id", {{"value", "stale"}}));
        stream.push_json(result_for(id_of(request), {{"value", "fresh"}}));
    });

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy());

    REQUIRE(result.success);
    REQUIRE(result.data["value"] == "fresh");
}

TEST_CASE("SseEngine correlates by SSE event id when the payload has none", "[sse][engine]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest& request, MockStream& stream) {
        stream.push_headers();
        const std::string id = id_of(request).get<std::string>();
        stream.push_event(R"({"result":{"ok":true}})", std::nullopt, id);
    });

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy());

    REQUIRE(result.success);
    REQUIRE(result.data["ok"] == true);
}

TEST_CASE("SseEngine accepts a batch array on one event", "[sse][engine]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest& request, MockStream& stream) {
        stream.push_headers();
        nlohmann::json batch = nlohmann::json::array();
        batch.push_back(result_for("other", 1));
        batch.push_back(result_for(id_of(request), 2));
        stream.push_json(batch);
    });

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy());

    REQUIRE(result.success);
    REQUIRE(result.data == 2);
}

TEST_CASE("SseEngine accepts a plain JSON body answering the POST", "[sse][engine]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest& request, MockStream& stream) {
        stream.push_headers(200, "application/json; charset=utf-8");
        const std::string body = result_for(id_of(request), {{"tools", nlohmann::json::array()}}).dump();
        stream.push_data(body.substr(0, 10));
        stream.push_data(body.substr(10));
        stream.push_end();
    });

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy());

    REQUIRE(result.success);
    REQUIRE(result.data["tools"].is_array());
}

TEST_CASE("SseEngine reports a JSON-RPC error as REMOTE_ERROR", "[sse][engine][errors]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest& request, MockStream& stream) {
        stream.push_headers();
        stream.push_json({{"jsonrpc", "2.0"}, {"id", id_of(request)},
                          {"error", {{"code", -32601}, {"message", "Method not found"}}}});
    });

    const CallResult result = f.engine().call(sse_service(), make_request("nope"), fast_policy(2));

    REQUIRE(result.failed_with(ErrorCode::RemoteError));
    REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("Method not found"));
    // A definitive answer is never retried on a new connection
    REQUIRE(f.http->stream_count() == 1);
}

TEST_CASE("SseEngine rejects a matched reply without result or error", "[sse][engine][errors]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest& request, MockStream& stream) {
        stream.push_headers();
        stream.push_json({{"jsonrpc", "2.0"}, {"id", id_of(request)}});
    });

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy());

    REQUIRE(result.failed_with(ErrorCode::SchemaInvalid));
}

// ═══════════════════════════════════════════════════════════════════════════
// Payload Limits
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SseEngine fails an oversized event with RESPONSE_TOO_LARGE", "[sse][engine][limits]") {
    Fixture f;
    f.config.max_event_bytes = 64;
    f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
        stream.push_headers();
        stream.push_event(std::string(256, 'x'));
    });

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy(1));

    REQUIRE(result.failed_with(ErrorCode::ResponseTooLarge));
    REQUIRE(f.http->stream_count() == 1);
}

TEST_CASE("SseEngine fails binary events with BINARY_UNSUPPORTED", "[sse][engine][limits]") {
    Fixture f;

    SECTION("event named binary") {
        f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
            stream.push_headers();
            stream.push_event("AAECAwQ=", std::string("binary"));
        });
    }

    SECTION("NUL byte in the data") {
        f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
            stream.push_headers();
            stream.push_data(std::string("data: ab\0cd\n\n", 13));
        });
    }

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy());

    REQUIRE(result.failed_with(ErrorCode::BinaryUnsupported));
}

// ═══════════════════════════════════════════════════════════════════════════
// Stream Failures and Reconnects
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SseEngine reports BAD_STATUS for a non-2xx stream", "[sse][engine][errors]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
        stream.push_headers(503, "text/plain");
    });

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy());

    REQUIRE(result.failed_with(ErrorCode::BadStatus));
    REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("503"));
}

TEST_CASE("SseEngine reports STREAM_INIT_FAILED for a non-stream content type", "[sse][engine][errors]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
        stream.push_headers(200, "text/html");
    });

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy());

    REQUIRE(result.failed_with(ErrorCode::StreamInitFailed));
    REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("text/html"));
}

TEST_CASE("SseEngine reports STREAM_CLOSED when the stream ends without a reply", "[sse][engine][errors]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
        stream.push_headers();
        stream.push_data(": connected\n\n");
        stream.push_end();
    });

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy());

    REQUIRE(result.failed_with(ErrorCode::StreamClosed));
}

TEST_CASE("SseEngine reports REQUEST_FAILED when the connection fails", "[sse][engine][errors]") {
    Fixture f;  // no stream handler: every stream fails to connect

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy(2));

    REQUIRE(result.failed_with(ErrorCode::RequestFailed));
    REQUIRE(f.http->stream_count() == 3);
}

TEST_CASE("SseEngine reconnects with the same envelope id", "[sse][engine][reconnect]") {
    Fixture f;
    std::atomic<int> opened{0};
    f.http->set_stream_handler([&opened](const HttpRequest& request, MockStream& stream) {
        if (opened.fetch_add(1) == 0) {
            stream.push_headers(503, "text/plain");
            return;
        }
        stream.push_headers();
        stream.push_json(result_for(id_of(request), "second time lucky"));
    });

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), fast_policy(1));

    REQUIRE(result.success);
    REQUIRE(result.data == "second time lucky");

    const auto requests = f.http->requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[0].json_body()["id"] == requests[1].json_body()["id"]);

    const auto reconnects = f.trace->stage("reconnect");
    REQUIRE(reconnects.size() == 1);
    REQUIRE(reconnects[0].metadata["reason"] == "BAD_STATUS");
}

TEST_CASE("SseEngine idle timeout fires after every allowed reconnect", "[sse][engine][timeout]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
        stream.push_headers();
    });

    CallPolicy policy = fast_policy(2);
    policy.idle_timeout = 150ms;
    policy.total_timeout = 5s;

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), policy);

    REQUIRE(result.failed_with(ErrorCode::Timeout));
    REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("idle"));
    REQUIRE(f.http->stream_count() == 3);
}

TEST_CASE("SseEngine total timeout fires even while heartbeats arrive", "[sse][engine][timeout]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
        stream.push_headers();
        stream.heartbeat_every(20ms);
    });

    CallPolicy policy = fast_policy(0);
    policy.idle_timeout = 150ms;
    policy.total_timeout = 400ms;

    const auto started = std::chrono::steady_clock::now();
    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), policy);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.failed_with(ErrorCode::Timeout));
    REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("total timeout"));
    REQUIRE(elapsed >= 400ms);
    REQUIRE(elapsed < 2s);
}

TEST_CASE("SseEngine stops at once when the call is cancelled", "[sse][engine][cancel]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
        stream.push_headers();
    });

    CallPolicy policy = fast_policy(3);
    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    policy.cancellation = token;

    const CallResult result = f.engine().call(sse_service(), make_request("tools/list"), policy);

    REQUIRE(result.failed_with(ErrorCode::Cancelled));
    REQUIRE(f.http->stream_count() == 1);
    REQUIRE(f.http->last_stream()->closed());
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration Faults
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SseEngine rejects services without a usable url", "[sse][engine][config]") {
    Fixture f;

    SECTION("empty url") {
        const CallResult result = f.engine().call(sse_service(""), make_request("tools/list"), fast_policy());
        REQUIRE(result.failed_with(ErrorCode::MissingUrl));
    }

    SECTION("non-http scheme") {
        const CallResult result = f.engine().call(sse_service("ftp://example.com/x"), make_request("tools/list"), fast_policy());
        REQUIRE(result.failed_with(ErrorCode::MissingUrl));
    }

    REQUIRE(f.http->request_count() == 0);
}

TEST_CASE("SseEngine refuses services of another transport", "[sse][engine][config]") {
    Fixture f;
    ServiceConfig service;
    service.name = "local";
    service.transport = StdioCommand{"echo", {}, {}};

    const CallResult result = f.engine().call(service, make_request("tools/list"), fast_policy());

    REQUIRE(result.failed_with(ErrorCode::TransportUnsupported));
}

// ═══════════════════════════════════════════════════════════════════════════
// Legacy (GET + endpoint) Handshake
// ═══════════════════════════════════════════════════════════════════════════

namespace {

// Answers initialize and the envelope on the open stream, like a legacy server
void serve_legacy(MockHttpClient& http, bool reject_initialize = false) {
    http.set_stream_handler([](const HttpRequest&, MockStream& stream) {
        stream.push_headers();
        stream.push_data(": welcome\n\n");
        stream.push_event("/messages?sessionId=abc", std::string("endpoint"));
    });

    http.set_send_handler([&http, reject_initialize](const HttpRequest& request) {
        const auto message = nlohmann::json::parse(request.body.value_or("{}"));
        const std::string method = message.value("method", "");
        auto stream = http.last_stream();

        if (method == "initialize") {
            if (reject_initialize) {
                stream->push_json({{"jsonrpc", "2.0"}, {"id", message["id"]},
                                   {"error", {{"code", -32602}, {"message", "unsupported protocol version"}}}});
            } else {
                stream->push_json(result_for(message["id"], {{"protocolVersion", "2024-11-05"},
                                                             {"capabilities", nlohmann::json::object()}}));
            }
        } else if (method == "notifications/initialized") {
            // no reply
        } else {
            stream->push_event(result_for(message["id"], {{"echo", method}}).dump(), std::string("message"));
        }
        return accepted();
    });
}

}  // namespace

TEST_CASE("SseEngine runs the legacy endpoint handshake", "[sse][engine][legacy]") {
    Fixture f;
    serve_legacy(*f.http);

    const CallResult result = f.engine().call(legacy_service(), make_request("tools/call"), fast_policy());

    REQUIRE(result.success);
    REQUIRE(result.data["echo"] == "tools/call");

    const auto requests = f.http->requests();
    REQUIRE(requests.size() == 4);
    REQUIRE(requests[0].method == HttpMethod::Get);
    REQUIRE(requests[0].streaming);
    REQUIRE(requests[0].body.empty());

    REQUIRE(requests[1].json_body()["method"] == "initialize");
    REQUIRE(requests[1].json_body()["params"]["protocolVersion"] == "2024-11-05");
    REQUIRE(requests[2].json_body()["method"] == "notifications/initialized");
    REQUIRE(requests[2].json_body().contains("id") == false);
    REQUIRE(requests[3].json_body()["method"] == "tools/call");

    for (std::size_t i = 1; i < requests.size(); ++i) {
        REQUIRE(requests[i].method == HttpMethod::Post);
        REQUIRE(requests[i].url == "http://localhost:9000/messages?sessionId=abc");
    }

    REQUIRE(f.trace->stage("endpoint").size() == 1);
    REQUIRE(f.trace->stage("handshake").size() == 2);
}

TEST_CASE("SseEngine accepts a legacy reply on the POST body", "[sse][engine][legacy]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
        stream.push_headers();
        stream.push_event("http://localhost:9000/rpc", std::string("endpoint"));
    });
    f.http->set_send_handler([](const HttpRequest& request) -> HttpClientResult<HttpClientResponse> {
        const auto message = nlohmann::json::parse(request.body.value_or("{}"));
        if (message.contains("id") == false) {
            return accepted();
        }
        HeaderMap headers;
        headers["Content-Type"] = "application/json";
        return HttpClientResponse{200, headers, result_for(message["id"], {{"method", message["method"]}}).dump()};
    });

    const CallResult result = f.engine().call(legacy_service(), make_request("tools/list"), fast_policy());

    REQUIRE(result.success);
    REQUIRE(result.data["method"] == "tools/list");
    REQUIRE(f.http->requests().back().url == "http://localhost:9000/rpc");
}

TEST_CASE("SseEngine fails the handshake when initialize is rejected", "[sse][engine][legacy]") {
    Fixture f;
    serve_legacy(*f.http, true);

    const CallResult result = f.engine().call(legacy_service(), make_request("tools/call"), fast_policy(1));

    REQUIRE(result.failed_with(ErrorCode::RemoteError));
    REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("initialize rejected"));
    REQUIRE(f.http->stream_count() == 1);
    REQUIRE(f.http->send_count() == 1);
}

TEST_CASE("SseEngine retries legacy POSTs before giving up", "[sse][engine][legacy]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
        stream.push_headers();
        stream.push_event("/messages", std::string("endpoint"));
    });
    f.http->set_send_handler([](const HttpRequest&) -> HttpClientResult<HttpClientResponse> {
        return HttpClientResponse{500, {}, "boom"};
    });

    const CallResult result = f.engine().call(legacy_service(), make_request("tools/call"), fast_policy(0));

    REQUIRE(result.failed_with(ErrorCode::BadStatus));
    REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("initialize"));
    REQUIRE(f.http->send_count() == 3);
}

TEST_CASE("SseEngine restarts the handshake on every new connection", "[sse][engine][legacy]") {
    Fixture f;
    std::atomic<int> opened{0};
    f.http->set_stream_handler([&opened](const HttpRequest&, MockStream& stream) {
        stream.push_headers();
        const int index = opened.fetch_add(1);
        stream.push_event("/messages?sessionId=" + std::to_string(index), std::string("endpoint"));
        if (index == 0) {
            stream.push_end();
        }
    });
    f.http->set_send_handler([&f](const HttpRequest& request) {
        const auto message = nlohmann::json::parse(request.body.value_or("{}"));
        if (message.contains("id")) {
            f.http->last_stream()->push_json(result_for(message["id"], {{"url", request.url}}));
        }
        return accepted();
    });

    const CallResult result = f.engine().call(legacy_service(), make_request("tools/call"), fast_policy(1));

    REQUIRE(result.success);
    REQUIRE(f.http->stream_count() == 2);

    std::size_t initializes = 0;
    for (const auto& request : f.http->requests()) {
        if (request.streaming == false && request.json_body().value("method", "") == "initialize") {
            ++initializes;
        }
    }
    REQUIRE(initializes == 2);
    REQUIRE(result.data["url"] == "http://localhost:9000/messages?sessionId=1");
}

TEST_CASE("SseEngine keeps replies that arrive while a legacy POST blocks", "[sse][engine][legacy][timeout]") {
    Fixture f;
    f.http->set_stream_handler([](const HttpRequest&, MockStream& stream) {
        stream.push_headers();
        stream.push_event("/messages?sessionId=slow", std::string("endpoint"));
    });
    // Every POST outlives the idle timeout, with its reply already on the stream
    f.http->set_send_handler([&f](const HttpRequest& request) {
        const auto message = nlohmann::json::parse(request.body.value_or("{}"));
        if (message.contains("id")) {
            f.http->last_stream()->push_json(result_for(message["id"], {{"method", message["method"]}}));
        }
        std::this_thread::sleep_for(300ms);
        return accepted();
    });

    CallPolicy policy = fast_policy();
    policy.idle_timeout = 200ms;
    policy.total_timeout = 5s;

    const CallResult result = f.engine().call(legacy_service(), make_request("tools/call"), policy);

    REQUIRE(result.success);
    REQUIRE(result.data["method"] == "tools/call");
    REQUIRE(f.http->send_count() == 3);
}
