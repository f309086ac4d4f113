#include "mcpcall/client/request_dispatcher.hpp"
#include "mcpcall/log/logger.hpp"
#include "mcpcall/protocol/json_rpc.hpp"
#include "mcpcall/transport/http_client.hpp"
#include "mcpcall/transport/http_engine.hpp"
#include "mcpcall/transport/retry_policy.hpp"
#include "mcpcall/transport/sse_engine.hpp"
#include "mcpcall/transport/stdio_engine.hpp"
#include "mcpcall/transport/websocket_client.hpp"
#include "mcpcall/transport/websocket_engine.hpp"

#include <algorithm>
#include <format>

namespace mcpcall {

namespace {

// Call-site overrides are taken as given, within [1s, kMaxTimeout]
std::chrono::seconds clamp_override(std::chrono::seconds value) {
    return std::clamp(value, std::chrono::seconds{1}, limits::kMaxTimeout);
}

EngineMap make_default_engines(const std::shared_ptr<ITraceSink>& trace) {
    std::shared_ptr<IHttpClient> http = make_http_client();
    std::shared_ptr<IWebSocketConnector> websocket = make_websocket_connector();

    EngineMap engines;
    engines[TransportKind::Sse] = std::make_shared<SseEngine>(http, SseEngineConfig{}, trace);
    engines[TransportKind::WebSocket] = std::make_shared<WebSocketEngine>(websocket, trace);
    engines[TransportKind::Stdio] = std::make_shared<StdioEngine>(StdioEngineConfig{}, trace);
    engines[TransportKind::Http] = std::make_shared<HttpEngine>(http, HttpEngineConfig{}, trace);
    return engines;
}

std::shared_ptr<ITraceSink> or_null_sink(std::shared_ptr<ITraceSink> trace) {
    if (trace == nullptr) {
        return std::make_shared<NullTraceSink>();
    }
    return trace;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

RequestDispatcher::RequestDispatcher(
    std::shared_ptr<const ServiceRegistry> registry,
    std::shared_ptr<ITraceSink> trace
)
    : RequestDispatcher(
          std::move(registry),
          make_default_engines(or_null_sink(trace)),
          trace)
{}

RequestDispatcher::RequestDispatcher(
    std::shared_ptr<const ServiceRegistry> registry,
    EngineMap engines,
    std::shared_ptr<ITraceSink> trace,
    std::shared_ptr<IBackoffPolicy> backoff,
    DispatcherConfig config
)
    : registry_(std::move(registry))
    , engines_(std::move(engines))
    , trace_(or_null_sink(std::move(trace)))
    , backoff_(std::move(backoff))
    , config_(config)
{
    if (registry_ == nullptr) {
        registry_ = std::make_shared<const ServiceRegistry>();
    }
    if (backoff_ == nullptr) {
        backoff_ = std::make_shared<ExponentialBackoff>();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Policy Resolution
// ─────────────────────────────────────────────────────────────────────────────

CallPolicy RequestDispatcher::resolve_policy(const ServiceConfig& service, const CallOptions& options) const {
    const std::chrono::seconds timeout = options.timeout.has_value()
        ? clamp_override(*options.timeout)
        : service.timeout;

    std::chrono::seconds idle = timeout;
    if (options.idle_timeout.has_value()) {
        idle = clamp_override(*options.idle_timeout);
    } else if (service.idle_timeout.has_value()) {
        idle = *service.idle_timeout;
    }

    std::chrono::seconds total = std::max(timeout, idle);
    if (options.total_timeout.has_value()) {
        total = clamp_override(*options.total_timeout);
    } else if (service.total_timeout.has_value()) {
        total = *service.total_timeout;
    }

    CallPolicy policy;
    policy.timeout = timeout;
    policy.idle_timeout = idle;
    policy.total_timeout = total;
    policy.reconnect.max_reconnects = options.max_reconnects.value_or(config_.default_max_reconnects);
    policy.poll_interval = config_.poll_interval;
    return policy;
}

std::size_t RequestDispatcher::resolve_retry_count(const ServiceConfig& service, const CallOptions& options) const {
    if (options.retry_count.has_value()) {
        return std::clamp<std::size_t>(*options.retry_count, 1, limits::kMaxRetry);
    }
    return std::max<std::size_t>(1, service.retry_count);
}

// ─────────────────────────────────────────────────────────────────────────────
// Invoke
// ─────────────────────────────────────────────────────────────────────────────

CallResult RequestDispatcher::invoke(
    const std::string& method,
    std::optional<Json> params,
    const CallOptions& options
) {
    try {
        return dispatch(method, params, options);
    } catch (const std::exception& e) {
        MCPCALL_LOG_ERROR(std::format("dispatch of {} failed internally: {}", method, e.what()));
        return CallResult::failure(ErrorCode::InternalError, e.what(), options.service);
    }
}

CallResult RequestDispatcher::dispatch(
    const std::string& method,
    const std::optional<Json>& params,
    const CallOptions& options
) {
    const ServiceConfig* service = registry_->resolve(options.service);
    if (service == nullptr) {
        const std::string message = options.service.empty()
            ? std::string("no service specified and no default service configured")
            : std::format("service '{}' is not configured", options.service);
        MCPCALL_LOG_WARN(message);
        trace_->trace(options.service, "", "result", message,
                      Json{{"errorCode", std::string(to_string(ErrorCode::ServiceNotFound))}});
        return CallResult::failure(ErrorCode::ServiceNotFound, message, options.service);
    }

    const std::string transport{service->transport_name()};
    const auto engine_it = engines_.find(service->kind());
    if ((engine_it == engines_.end()) || (engine_it->second == nullptr)) {
        return CallResult::failure(ErrorCode::TransportUnsupported,
            std::format("no engine for transport '{}'", transport), service->name, transport);
    }
    ITransportEngine& engine = *engine_it->second;

    CallPolicy policy = resolve_policy(*service, options);
    const RetryPolicy retry(resolve_retry_count(*service, options));

    // The keyboard monitor owns the terminal mode for the duration of the call
    if (options.cancellation != nullptr) {
        policy.cancellation = options.cancellation;
    } else if (options.enable_cancellation) {
        policy.cancellation = std::make_shared<KeyboardCancelMonitor>();
    }

    trace_->trace(service->name, transport, "dispatch", method,
        Json{{"timeoutSec", std::chrono::duration_cast<std::chrono::seconds>(policy.timeout).count()},
             {"idleTimeoutSec", std::chrono::duration_cast<std::chrono::seconds>(policy.idle_timeout).count()},
             {"totalTimeoutSec", std::chrono::duration_cast<std::chrono::seconds>(policy.total_timeout).count()},
             {"retryCount", retry.max_attempts()},
             {"maxReconnects", policy.reconnect.max_reconnects}});

    std::optional<CallResult> last_failure;
    for (std::size_t attempt = 1; attempt <= retry.max_attempts(); ++attempt) {
        const JsonRpcRequest envelope = make_request(method, params.value_or(Json()));

        trace_->trace(service->name, transport, "attempt", method,
                      Json{{"attempt", attempt}, {"id", envelope.id().to_string()}});

        CallResult result = run_attempt(engine, *service, envelope, policy);
        if (result.success) {
            trace_->trace(service->name, transport, "result", "success", Json{{"attempt", attempt}});
            return result;
        }

        const ErrorCode code = result.error_code.value_or(ErrorCode::Unknown);
        MCPCALL_LOG_DEBUG(std::format("[{}] {} attempt {}/{} failed: {} {}", service->name, method,
            attempt, retry.max_attempts(), to_string(code), result.error.value_or("")));
        last_failure = std::move(result);

        if (retry.should_retry(code, attempt) == false) {
            break;
        }

        const auto delay = backoff_->next_delay(attempt - 1);
        MCPCALL_LOG_INFO(std::format("[{}] retrying {} in {}ms (attempt {}/{})", service->name, method,
                                     delay.count(), attempt + 1, retry.max_attempts()));
        const bool waited = wait_unless_cancelled(policy, delay);
        if (waited == false) {
            last_failure = CallResult::failure(ErrorCode::Cancelled, "cancelled by user", service->name, transport);
            break;
        }
    }

    if (last_failure.has_value() == false) {
        return CallResult::failure(ErrorCode::Unknown, "no attempt was made", service->name, transport);
    }

    trace_->trace(service->name, transport, "result", last_failure->error.value_or(""),
                  Json{{"errorCode", std::string(last_failure->error_key())}});
    return std::move(*last_failure);
}

CallResult RequestDispatcher::run_attempt(
    ITransportEngine& engine,
    const ServiceConfig& service,
    const JsonRpcRequest& envelope,
    const CallPolicy& policy
) {
    const std::string transport{service.transport_name()};
    try {
        CallResult result = engine.call(service, envelope, policy);
        if (result.service.empty()) {
            result.service = service.name;
        }
        if (result.transport.empty()) {
            result.transport = transport;
        }
        return result;
    } catch (const std::exception& e) {
        MCPCALL_LOG_ERROR(std::format("[{}] engine raised: {}", service.name, e.what()));
        return CallResult::failure(ErrorCode::InternalError, e.what(), service.name, transport);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Wrappers
// ─────────────────────────────────────────────────────────────────────────────

CallResult RequestDispatcher::call_tool(
    const std::string& name,
    Json arguments,
    const CallOptions& options
) {
    if (arguments.is_null()) {
        arguments = Json::object();
    }
    Json params = {
        {"name", name},
        {"arguments", std::move(arguments)}
    };
    return invoke("tools/call", std::move(params), options);
}

CallResult RequestDispatcher::list(const std::string& method, const std::string& service) {
    CallOptions options;
    options.service = service;
    options.retry_count = 1;
    return invoke(method, std::nullopt, options);
}

CallResult RequestDispatcher::list_tools(const std::string& service) {
    return list("tools/list", service);
}

CallResult RequestDispatcher::list_resources(const std::string& service) {
    return list("resources/list", service);
}

CallResult RequestDispatcher::list_prompts(const std::string& service) {
    return list("prompts/list", service);
}

}  // namespace mcpcall
