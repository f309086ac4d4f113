#pragma once

#include "mcpcall/client/call_result.hpp"
#include "mcpcall/config/service_registry.hpp"
#include "mcpcall/trace/trace_sink.hpp"
#include "mcpcall/transport/backoff_policy.hpp"
#include "mcpcall/transport/call_policy.hpp"
#include "mcpcall/transport/transport_engine.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// CallOptions - per-call overrides
// ─────────────────────────────────────────────────────────────────────────────
// Unset fields fall back to the service's configuration, then to the
// built-in defaults (timeout 30s, one attempt, one reconnect).

struct CallOptions {
    std::string service;  // empty selects the default service
    std::optional<std::chrono::seconds> timeout;
    std::optional<std::chrono::seconds> idle_timeout;
    std::optional<std::chrono::seconds> total_timeout;
    std::optional<std::size_t> retry_count;
    std::optional<std::size_t> max_reconnects;

    // Watch the terminal for ESC / Ctrl-C unless `cancellation` is given
    bool enable_cancellation{false};
    std::shared_ptr<ICancellationSource> cancellation;
};

using EngineMap = std::map<TransportKind, std::shared_ptr<ITransportEngine>>;

struct DispatcherConfig {
    std::size_t default_max_reconnects{1};
    Millis poll_interval{100};
};

// ─────────────────────────────────────────────────────────────────────────────
// RequestDispatcher
// ─────────────────────────────────────────────────────────────────────────────
// Resolves the service, merges the effective policy, and runs up to
// retry_count attempts on the engine for the service's transport. Every
// attempt carries a freshly generated envelope id.
//
// Never throws. Configuration faults (unknown service, missing url/command,
// unsupported transport) and definitive answers (REMOTE_ERROR, CANCELLED)
// end the call without further attempts.
//
// Thread safety: invoke() may be called concurrently; the registry and the
// engines are shared read-only.

class RequestDispatcher {
public:
    /// Default engines: cpr for SSE and HTTP, easywsclient for WebSocket,
    /// fork/exec for stdio.
    explicit RequestDispatcher(
        std::shared_ptr<const ServiceRegistry> registry,
        std::shared_ptr<ITraceSink> trace = nullptr
    );

    RequestDispatcher(
        std::shared_ptr<const ServiceRegistry> registry,
        EngineMap engines,
        std::shared_ptr<ITraceSink> trace = nullptr,
        std::shared_ptr<IBackoffPolicy> backoff = nullptr,
        DispatcherConfig config = {}
    );

    [[nodiscard]] CallResult invoke(
        const std::string& method,
        std::optional<Json> params = std::nullopt,
        const CallOptions& options = {}
    );

    /// method "tools/call", params {name, arguments}
    [[nodiscard]] CallResult call_tool(
        const std::string& name,
        Json arguments = Json::object(),
        const CallOptions& options = {}
    );

    [[nodiscard]] CallResult list_tools(const std::string& service = {});
    [[nodiscard]] CallResult list_resources(const std::string& service = {});
    [[nodiscard]] CallResult list_prompts(const std::string& service = {});

    /// Effective limits for `service` under `options`
    [[nodiscard]] CallPolicy resolve_policy(const ServiceConfig& service, const CallOptions& options) const;

    [[nodiscard]] std::size_t resolve_retry_count(const ServiceConfig& service, const CallOptions& options) const;

    [[nodiscard]] const ServiceRegistry& registry() const noexcept { return *registry_; }

private:
    std::shared_ptr<const ServiceRegistry> registry_;
    EngineMap engines_;
    std::shared_ptr<ITraceSink> trace_;
    std::shared_ptr<IBackoffPolicy> backoff_;
    DispatcherConfig config_;

    [[nodiscard]] CallResult dispatch(
        const std::string& method,
        const std::optional<Json>& params,
        const CallOptions& options
    );

    [[nodiscard]] CallResult list(const std::string& method, const std::string& service);

    [[nodiscard]] CallResult run_attempt(
        ITransportEngine& engine,
        const ServiceConfig& service,
        const JsonRpcRequest& envelope,
        const CallPolicy& policy
    );
};

}  // namespace mcpcall
