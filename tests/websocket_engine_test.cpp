#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include "mcpcall/transport/websocket_engine.hpp"
#include "mocks/mock_websocket_client.hpp"

using namespace mcpcall;
using namespace mcpcall::testing;
using Catch::Matchers::ContainsSubstring;
using namespace std::chrono_literals;

namespace {

ServiceConfig ws_service(const std::string& url = "ws://localhost:9100/mcp") {
    ServiceConfig service;
    service.name = "realtime";
    service.transport = WebSocketEndpoint{url, {}};
    return service;
}

CallPolicy quick_policy(Millis timeout = 2s) {
    CallPolicy policy;
    policy.timeout = timeout;
    policy.poll_interval = 5ms;
    return policy;
}

// Answer every request frame with `result`, echoing its id
void answer_with(MockWebSocket& socket, nlohmann::json result) {
    socket.on_send([result](const std::string& frame, MockWebSocket& self) {
        const auto request = nlohmann::json::parse(frame);
        self.queue_json({{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", result}});
    });
}

}  // namespace

TEST_CASE("WebSocketEngine sends the envelope and returns the matching reply", "[websocket][engine]") {
    auto connector = std::make_shared<MockWebSocketConnector>();
    answer_with(*connector->socket(), {{"tools", nlohmann::json::array()}});

    WebSocketEngine engine(connector);
    const CallResult result = engine.call(ws_service(), make_request("tools/list"), quick_policy());

    REQUIRE(result.success);
    REQUIRE(result.service == "realtime");
    REQUIRE(result.transport == "websocket");
    REQUIRE(result.data["tools"].is_array());

    const auto sent = connector->socket()->sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(nlohmann::json::parse(sent[0])["method"] == "tools/list");
    REQUIRE(connector->connected_urls() == std::vector<std::string>{"ws://localhost:9100/mcp"});
    REQUIRE(connector->socket()->closed());
}

TEST_CASE("WebSocketEngine skips notifications and replies to other ids", "[websocket][engine]") {
    auto connector = std::make_shared<MockWebSocketConnector>();
    connector->socket()->on_send([](const std::string& frame, MockWebSocket& self) {
        const auto request = nlohmann::json::parse(frame);
        self.queue_json({{"jsonrpc", "2.0"}, {"method", "notifications/message"}});
        self.queue_json({{"jsonrpc", "2.0"}, {"id", "someone-else"}, {"result", "wrong"}});
        self.queue_json({{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", "right"}});
    });

    WebSocketEngine engine(connector);
    const CallResult result = engine.call(ws_service(), make_request("tools/list"), quick_policy());

    REQUIRE(result.success);
    REQUIRE(result.data == "right");
}

TEST_CASE("WebSocketEngine reports WEBSOCKET_INVALID_JSON for a non-JSON frame", "[websocket][engine][errors]") {
    auto connector = std::make_shared<MockWebSocketConnector>();
    connector->socket()->queue_frame("not json");

    WebSocketEngine engine(connector);
    const CallResult result = engine.call(ws_service(), make_request("tools/list"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::WebSocketInvalidJson));
    REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("not json"));
}

TEST_CASE("WebSocketEngine reports WEBSOCKET_INVALID_JSON for a truncated document", "[websocket][engine][errors]") {
    auto connector = std::make_shared<MockWebSocketConnector>();
    connector->socket()->queue_frame(R"({"jsonrpc":"2.0","result":)");

    WebSocketEngine engine(connector);
    const CallResult result = engine.call(ws_service(), make_request("tools/list"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::WebSocketInvalidJson));
}

TEST_CASE("WebSocketEngine reports REMOTE_ERROR for an error reply", "[websocket][engine][errors]") {
    auto connector = std::make_shared<MockWebSocketConnector>();
    connector->socket()->on_send([](const std::string& frame, MockWebSocket& self) {
        const auto request = nlohmann::json::parse(frame);
        self.queue_json({{"jsonrpc", "2.0"}, {"id", request["id"]},
                         {"error", {{"code", -32602}, {"message", "bad arguments"}}}});
    });

    WebSocketEngine engine(connector);
    const CallResult result = engine.call(ws_service(), make_request("tools/call"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::RemoteError));
    REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("bad arguments"));
}

TEST_CASE("WebSocketEngine reports connection faults", "[websocket][engine][errors]") {
    auto connector = std::make_shared<MockWebSocketConnector>();
    WebSocketEngine engine(connector);

    SECTION("connect refused") {
        connector->refuse("connection refused");
        const CallResult result = engine.call(ws_service(), make_request("tools/list"), quick_policy());
        REQUIRE(result.failed_with(ErrorCode::WebSocketConnectFailed));
        REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("refused"));
    }

    SECTION("send fails") {
        connector->socket()->fail_sends("socket is closing");
        const CallResult result = engine.call(ws_service(), make_request("tools/list"), quick_policy());
        REQUIRE(result.failed_with(ErrorCode::WebSocketClosed));
    }

    SECTION("peer closes before replying") {
        connector->socket()->queue_close();
        const CallResult result = engine.call(ws_service(), make_request("tools/list"), quick_policy());
        REQUIRE(result.failed_with(ErrorCode::WebSocketClosed));
    }
}

TEST_CASE("WebSocketEngine times out when no reply arrives", "[websocket][engine][timeout]") {
    auto connector = std::make_shared<MockWebSocketConnector>();

    WebSocketEngine engine(connector);
    const CallResult result = engine.call(ws_service(), make_request("tools/list"), quick_policy(100ms));

    REQUIRE(result.failed_with(ErrorCode::Timeout));
    REQUIRE(connector->socket()->closed());
}

TEST_CASE("WebSocketEngine honours cancellation", "[websocket][engine][cancel]") {
    auto connector = std::make_shared<MockWebSocketConnector>();
    CallPolicy policy = quick_policy();
    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    policy.cancellation = token;

    WebSocketEngine engine(connector);
    const CallResult result = engine.call(ws_service(), make_request("tools/list"), policy);

    REQUIRE(result.failed_with(ErrorCode::Cancelled));
}

TEST_CASE("WebSocketEngine reports MISSING_URL without connecting", "[websocket][engine][config]") {
    auto connector = std::make_shared<MockWebSocketConnector>();

    WebSocketEngine engine(connector);
    const CallResult result = engine.call(ws_service(""), make_request("tools/list"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::MissingUrl));
    REQUIRE(connector->connected_urls().empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Handshake Options
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("WebSocketEngine hands headers and the call timeout to the connector", "[websocket][engine][headers]") {
    auto connector = std::make_shared<MockWebSocketConnector>();
    answer_with(*connector->socket(), {{"ok", true}});

    ServiceConfig service = ws_service();
    service.transport = WebSocketEndpoint{"ws://localhost:9100/mcp",
                                          HeaderMap{{"Origin", "https://app.example"}, {"Authorization", "Bearer t"}}};

    WebSocketEngine engine(connector);
    const CallResult result = engine.call(service, make_request("tools/list"), quick_policy(3s));

    REQUIRE(result.success);
    REQUIRE(get_header(connector->last_headers(), "authorization") == "Bearer t");
    REQUIRE(get_header(connector->last_headers(), "origin") == "https://app.example");
    REQUIRE(connector->last_connect_timeout() == 3s);
}

TEST_CASE("WebSocketEngine reports WEBSOCKET_UNSUPPORTED from the connector", "[websocket][engine][errors]") {
    auto connector = std::make_shared<MockWebSocketConnector>();
    connector->refuse_unsupported("secure WebSocket (wss://) is not supported");

    WebSocketEngine engine(connector);
    const CallResult result = engine.call(ws_service("wss://localhost/mcp"), make_request("tools/list"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::WebSocketUnsupported));
    REQUIRE(is_retryable(ErrorCode::WebSocketUnsupported) == false);
    REQUIRE(connector->socket()->sent().empty());
}

TEST_CASE("unsupported_websocket_feature names what the client cannot send", "[websocket][client]") {
    REQUIRE(unsupported_websocket_feature("ws://localhost:9100/mcp", {}).has_value() == false);
    REQUIRE(unsupported_websocket_feature("ws://localhost:9100/mcp", HeaderMap{{"origin", "https://a"}}).has_value() == false);

    const auto secure = unsupported_websocket_feature("wss://example.com/mcp", {});
    REQUIRE(secure.has_value());
    REQUIRE_THAT(*secure, ContainsSubstring("wss://"));

    const auto headers = unsupported_websocket_feature("ws://localhost/mcp",
        HeaderMap{{"Origin", "https://a"}, {"Authorization", "Bearer t"}, {"X-Api-Key", "k"}});
    REQUIRE(headers.has_value());
    REQUIRE_THAT(*headers, ContainsSubstring("Authorization"));
    REQUIRE_THAT(*headers, ContainsSubstring("X-Api-Key"));
    REQUIRE_THAT(*headers, !ContainsSubstring("Origin,"));
}

TEST_CASE("easywsclient connector refuses wss and extra headers without connecting", "[websocket][client]") {
    WebSocketEngine engine(make_websocket_connector());

    SECTION("secure url") {
        const CallResult result = engine.call(ws_service("wss://example.invalid/mcp"), make_request("tools/list"),
                                              quick_policy());
        REQUIRE(result.failed_with(ErrorCode::WebSocketUnsupported));
    }

    SECTION("authorization header") {
        ServiceConfig service = ws_service();
        service.transport = WebSocketEndpoint{"ws://example.invalid/mcp", HeaderMap{{"Authorization", "Bearer t"}}};
        const CallResult result = engine.call(service, make_request("tools/list"), quick_policy());
        REQUIRE(result.failed_with(ErrorCode::WebSocketUnsupported));
        REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("Authorization"));
    }
}
