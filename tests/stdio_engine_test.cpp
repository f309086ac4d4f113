// ─────────────────────────────────────────────────────────────────────────────
// StdioEngine Tests
// ─────────────────────────────────────────────────────────────────────────────
// These spawn real child processes through /bin/sh, so they exercise the
// fork/exec path, the pipe plumbing and the exit-status classification.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include "mcpcall/transport/stdio_engine.hpp"
#include "mocks/recording_trace_sink.hpp"

#include <chrono>
#include <string>

#include <pthread.h>
#include <signal.h>

using namespace mcpcall;
using Catch::Matchers::ContainsSubstring;
using namespace std::chrono_literals;

namespace {

ServiceConfig shell_service(const std::string& script,
                            std::vector<std::pair<std::string, std::string>> env = {}) {
    ServiceConfig service;
    service.name = "local";
    service.transport = StdioCommand{"/bin/sh", {"-c", script}, std::move(env)};
    return service;
}

CallPolicy quick_policy(Millis timeout = 5s) {
    CallPolicy policy;
    policy.timeout = timeout;
    policy.idle_timeout = timeout;
    policy.total_timeout = timeout;
    policy.poll_interval = 20ms;
    return policy;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Replies
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("StdioEngine picks the output line that answers the envelope", "[stdio][engine]") {
    // Echo the request id back between unrelated lines
    const std::string script = R"sh(read line; id=$(printf '%s' "$line" | sed 's/.*"id":"\([^"]*\)".*/\1/'); printf '{"jsonrpc":"2.0","method":"notifications/message"}\n{"jsonrpc":"2.0","id":"other","result":1}\n{"jsonrpc":"2.0","id":"%s","result":{"echo":true}}\n{"jsonrpc":"2.0","id":"late","result":3}\n' "$id")sh";

    StdioEngine engine;
    const CallResult result = engine.call(shell_service(script), make_request("tools/list"), quick_policy());

    REQUIRE(result.success);
    REQUIRE(result.service == "local");
    REQUIRE(result.transport == "stdio");
    REQUIRE(result.data["echo"] == true);
}

TEST_CASE("StdioEngine writes the envelope as one line on stdin", "[stdio][engine]") {
    // Reply with the received line itself as the result
    const std::string script = R"sh(read line; printf '{"result":%s}\n' "$line")sh";

    StdioEngine engine;
    const auto envelope = make_request("tools/call", nlohmann::json{{"name", "echo"}, {"arguments", {{"x", 1}}}});
    const CallResult result = engine.call(shell_service(script), envelope, quick_policy());

    REQUIRE(result.success);
    REQUIRE(result.data["jsonrpc"] == "2.0");
    REQUIRE(result.data["method"] == "tools/call");
    REQUIRE(result.data["id"] == envelope.id().to_string());
    REQUIRE(result.data["params"]["arguments"]["x"] == 1);
}

TEST_CASE("StdioEngine falls back to the last JSON line", "[stdio][engine]") {
    const std::string script = R"sh(echo 'starting up'; echo '{"result":"first"}'; echo '{"result":"second"}')sh";

    StdioEngine engine;
    const CallResult result = engine.call(shell_service(script), make_request("tools/list"), quick_policy());

    REQUIRE(result.success);
    REQUIRE(result.data == "second");
}

TEST_CASE("StdioEngine ignores lines answering another id", "[stdio][engine]") {
    SECTION("id-less line wins over a later stale reply") {
        const std::string script = R"sh(echo '{"result":"mine"}'; echo '{"jsonrpc":"2.0","id":"stale-1","result":"old"}')sh";

        StdioEngine engine;
        const CallResult result = engine.call(shell_service(script), make_request("tools/list"), quick_policy());

        REQUIRE(result.success);
        REQUIRE(result.data == "mine");
    }

    SECTION("only a stale reply") {
        const std::string script = R"sh(echo '{"jsonrpc":"2.0","id":"stale-1","result":"old"}')sh";

        StdioEngine engine;
        const CallResult result = engine.call(shell_service(script), make_request("tools/list"), quick_policy());

        REQUIRE(result.failed_with(ErrorCode::StdioInvalidJson));
    }
}

TEST_CASE("StdioEngine parses a reply spread over several lines", "[stdio][engine]") {
    const std::string script = R"sh(printf '{\n  "jsonrpc": "2.0",\n  "result": {"a": 1}\n}\n')sh";

    StdioEngine engine;
    const CallResult result = engine.call(shell_service(script), make_request("tools/list"), quick_policy());

    REQUIRE(result.success);
    REQUIRE(result.data["a"] == 1);
}

TEST_CASE("StdioEngine applies configured environment overrides", "[stdio][engine]") {
    const std::string script = R"sh(printf '{"result":"%s"}\n' "$MCPCALL_TEST_VALUE")sh";

    StdioEngine engine;
    const CallResult result = engine.call(
        shell_service(script, {{"MCPCALL_TEST_VALUE", "from-config"}}),
        make_request("tools/list"),
        quick_policy());

    REQUIRE(result.success);
    REQUIRE(result.data == "from-config");
}

TEST_CASE("StdioEngine accepts a reply from a non-zero exit without stderr", "[stdio][engine]") {
    const std::string script = R"sh(echo '{"result":1}'; exit 3)sh";

    StdioEngine engine;
    const CallResult result = engine.call(shell_service(script), make_request("tools/list"), quick_policy());

    REQUIRE(result.success);
    REQUIRE(result.data == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("StdioEngine reports a failing process with its stderr", "[stdio][engine][errors]") {
    auto trace = std::make_shared<testing::RecordingTraceSink>();
    StdioEngine engine(StdioEngineConfig{}, trace);

    const CallResult result = engine.call(shell_service("echo boom >&2; exit 1"), make_request("tools/list"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::StdioProcessFailed));
    REQUIRE(result.error.value_or("") == "process exited with code 1: boom");

    const auto results = trace->stage("result");
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].metadata["exitCode"] == 1);
}

TEST_CASE("StdioEngine reports STDIO_NO_OUTPUT for a silent process", "[stdio][engine][errors]") {
    StdioEngine engine;
    const CallResult result = engine.call(shell_service("cat > /dev/null"), make_request("tools/list"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::StdioNoOutput));
}

TEST_CASE("StdioEngine reports STDIO_INVALID_JSON for plain text output", "[stdio][engine][errors]") {
    StdioEngine engine;
    const CallResult result = engine.call(shell_service("echo 'hello world'"), make_request("tools/list"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::StdioInvalidJson));
}

TEST_CASE("StdioEngine reports SCHEMA_INVALID for JSON without result or error", "[stdio][engine][errors]") {
    StdioEngine engine;
    const CallResult result = engine.call(shell_service(R"sh(echo '{"jsonrpc":"2.0","id":"x"}')sh"),
                                          make_request("tools/list"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::SchemaInvalid));
}

TEST_CASE("StdioEngine reports REMOTE_ERROR for an error reply", "[stdio][engine][errors]") {
    StdioEngine engine;
    const CallResult result = engine.call(
        shell_service(R"sh(echo '{"jsonrpc":"2.0","error":{"code":-32000,"message":"tool exploded"}}')sh"),
        make_request("tools/call"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::RemoteError));
    REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("tool exploded"));
}

TEST_CASE("StdioEngine reports STDIO_SPAWN_FAILED for a missing executable", "[stdio][engine][errors]") {
    ServiceConfig service;
    service.name = "ghost";
    service.transport = StdioCommand{"/nonexistent/mcpcall-test-binary", {}, {}};

    StdioEngine engine;
    const CallResult result = engine.call(service, make_request("tools/list"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::StdioSpawnFailed));
    REQUIRE_THAT(result.error.value_or(""), ContainsSubstring("/nonexistent/mcpcall-test-binary"));
}

TEST_CASE("StdioEngine reports MISSING_COMMAND for an empty command", "[stdio][engine][config]") {
    ServiceConfig service;
    service.name = "empty";
    service.transport = StdioCommand{};

    StdioEngine engine;
    const CallResult result = engine.call(service, make_request("tools/list"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::MissingCommand));
}

TEST_CASE("StdioEngine stops output beyond the size limit", "[stdio][engine][limits]") {
    StdioEngineConfig config;
    config.max_output_bytes = 1024;
    StdioEngine engine(config);

    const CallResult result = engine.call(shell_service("yes x | head -c 100000"), make_request("tools/list"), quick_policy());

    REQUIRE(result.failed_with(ErrorCode::ResponseTooLarge));
}

TEST_CASE("StdioEngine terminates a process that outlives the timeout", "[stdio][engine][timeout]") {
    ServiceConfig service;
    service.name = "sleepy";
    service.transport = StdioCommand{"sleep", {"5"}, {}};

    StdioEngine engine;
    const auto started = std::chrono::steady_clock::now();
    const CallResult result = engine.call(service, make_request("tools/list"), quick_policy(300ms));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.failed_with(ErrorCode::Timeout));
    REQUIRE(elapsed < 3s);
}

TEST_CASE("StdioEngine stops a process when the call is cancelled", "[stdio][engine][cancel]") {
    ServiceConfig service;
    service.name = "sleepy";
    service.transport = StdioCommand{"sleep", {"5"}, {}};

    CallPolicy policy = quick_policy();
    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    policy.cancellation = token;

    StdioEngine engine;
    const auto started = std::chrono::steady_clock::now();
    const CallResult result = engine.call(service, make_request("tools/list"), policy);

    REQUIRE(result.failed_with(ErrorCode::Cancelled));
    REQUIRE(std::chrono::steady_clock::now() - started < 3s);
}

// ═══════════════════════════════════════════════════════════════════════════
// Broken Pipes
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("StdioEngine survives a child that never reads stdin", "[stdio][engine][signals]") {
    struct sigaction before{};
    REQUIRE(sigaction(SIGPIPE, nullptr, &before) == 0);
    sigset_t mask_before;
    REQUIRE(pthread_sigmask(SIG_SETMASK, nullptr, &mask_before) == 0);

    // Larger than a pipe buffer, so the write is still blocked when the
    // child closes its stdin and fails with EPIPE
    const Json params{{"blob", std::string(512 * 1024, 'x')}};
    const std::string script = R"sh(exec 0<&-; printf '{"jsonrpc":"2.0","result":{"read":false}}\n')sh";

    StdioEngine engine;
    const CallResult result = engine.call(shell_service(script), make_request("tools/call", params), quick_policy());

    REQUIRE(result.success);
    REQUIRE(result.data["read"] == false);

    struct sigaction after{};
    REQUIRE(sigaction(SIGPIPE, nullptr, &after) == 0);
    REQUIRE(after.sa_handler == before.sa_handler);

    sigset_t mask_after;
    REQUIRE(pthread_sigmask(SIG_SETMASK, nullptr, &mask_after) == 0);
    REQUIRE(sigismember(&mask_after, SIGPIPE) == sigismember(&mask_before, SIGPIPE));

    sigset_t pending;
    REQUIRE(sigpending(&pending) == 0);
    REQUIRE(sigismember(&pending, SIGPIPE) == 0);
}
