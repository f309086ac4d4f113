#include "mcpcall/config/service_registry.hpp"
#include "mcpcall/json/fast_json.hpp"
#include "mcpcall/log/logger.hpp"
#include "mcpcall/client/call_error.hpp"
#include "mcpcall/transport/websocket_client.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpcall {

namespace {

std::string describe(const Json& node) {
    return node.dump(-1, ' ', false, Json::error_handler_t::replace);
}

// Numbers and numeric strings ("30", " 12.5 ") are accepted
std::optional<double> read_number(const Json& node) {
    if (node.is_number()) {
        const double value = node.get<double>();
        return std::isfinite(value) ? std::optional<double>(value) : std::nullopt;
    }
    if (node.is_string()) {
        const std::string text(trim_ascii(node.get_ref<const std::string&>()));
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        const double value = std::strtod(text.c_str(), &end);
        const bool fully_parsed = (end == text.c_str() + text.size());
        if (fully_parsed && std::isfinite(value)) {
            return value;
        }
    }
    return std::nullopt;
}

std::string read_string(const Json& object, std::string_view key) {
    const auto it = object.find(key);
    const bool present = (it != object.end()) && it->is_string();
    if (present) {
        return it->get<std::string>();
    }
    return {};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────────────────────────────────────

void ServiceRegistry::warn(std::string message) {
    get_logger().logf(LogLevel::Warn, "service config: {}", message);
    warnings_.push_back(std::move(message));
}

ServiceRegistry ServiceRegistry::load(const Json& document) {
    ServiceRegistry registry;

    if (document.is_object() == false) {
        registry.warn("document is not an object; no services loaded");
        return registry;
    }

    if (const auto it = document.find("enabled"); it != document.end()) {
        if (it->is_boolean()) {
            registry.enabled_ = it->get<bool>();
        } else {
            registry.warn(std::format("'enabled' must be a boolean, got {}; assuming true", describe(*it)));
        }
    }
    if (registry.enabled_ == false) {
        MCPCALL_LOG_INFO("Tool services disabled by configuration");
        return registry;
    }

    const auto services_it = document.find("services");
    if (services_it == document.end()) {
        registry.warn("no 'services' entry");
    } else if (services_it->is_array()) {
        for (const auto& entry : *services_it) {
            registry.add_entry(entry, {});
        }
    } else if (services_it->is_object()) {
        for (const auto& [key, entry] : services_it->items()) {
            registry.add_entry(entry, key);
        }
    } else {
        registry.warn("'services' must be an array or an object");
    }

    const std::string requested_default = read_string(document, "defaultService");
    if (requested_default.empty() == false) {
        const bool exists = (registry.resolve(requested_default) != nullptr);
        if (exists) {
            registry.default_name_ = requested_default;
        } else {
            registry.warn(std::format("defaultService '{}' does not name a loaded service; cleared",
                                      requested_default));
        }
    } else if (registry.services_.size() == 1) {
        registry.default_name_ = registry.services_.front().name;
    }

    get_logger().logf(LogLevel::Debug, "Loaded {} service(s), default: {}",
                           registry.services_.size(),
                           registry.default_name_.value_or("<none>"));
    return registry;
}

void ServiceRegistry::add_entry(const Json& entry, std::string fallback_name) {
    if (entry.is_object() == false) {
        warn(std::format("skipping non-object service entry {}", describe(entry)));
        return;
    }

    ServiceConfig config;
    config.name = read_string(entry, "name");
    if (config.name.empty()) {
        config.name = std::move(fallback_name);
    }
    if (config.name.empty()) {
        warn("skipping service without a name");
        return;
    }
    if (resolve(config.name) != nullptr) {
        warn(std::format("skipping duplicate service '{}'", config.name));
        return;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Transport
    // ─────────────────────────────────────────────────────────────────────────

    const auto transport_it = entry.find("transport");
    const Json transport = ((transport_it != entry.end()) && transport_it->is_object())
        ? *transport_it
        : Json::object();

    std::string type = read_string(transport, "type");
    if (trim_ascii(type).empty()) {
        type = "sse";
    }
    const auto kind = parse_transport_kind(trim_ascii(type));
    if (kind.has_value() == false) {
        warn(std::format("skipping service '{}': unsupported transport type '{}'", config.name, type));
        return;
    }

    HeaderMap headers;
    if (const auto it = transport.find("headers"); (it != transport.end()) && it->is_object()) {
        for (const auto& [name, value] : it->items()) {
            if (value.is_string()) {
                headers[name] = value.get<std::string>();
            } else {
                warn(std::format("service '{}': header '{}' is not a string; ignored", config.name, name));
            }
        }
    }

    HttpMethod method = HttpMethod::Post;
    const std::string method_text = read_string(transport, "method");
    if (method_text.empty() == false) {
        const auto parsed = parse_http_method(method_text);
        if (parsed.has_value()) {
            method = *parsed;
        } else {
            warn(std::format("service '{}': unsupported method '{}'; using POST", config.name, method_text));
        }
    }

    const std::string url = read_string(transport, "url");

    switch (*kind) {
        case TransportKind::Sse: {
            SseEndpoint sse;
            sse.url = url;
            sse.method = method;
            sse.headers = std::move(headers);
            if (const auto it = transport.find("debug"); (it != transport.end()) && it->is_boolean()) {
                sse.debug = it->get<bool>();
            }
            config.transport = std::move(sse);
            break;
        }
        case TransportKind::WebSocket:
            if (auto missing = unsupported_websocket_feature(url, headers)) {
                warn(std::format("service '{}': {}; calls will fail with {}", config.name, *missing,
                                 to_string(ErrorCode::WebSocketUnsupported)));
            }
            config.transport = WebSocketEndpoint{url, std::move(headers)};
            break;
        case TransportKind::Http:
            config.transport = HttpEndpoint{url, method, std::move(headers)};
            break;
        case TransportKind::Stdio: {
            StdioCommand stdio;
            stdio.command = read_string(transport, "command");
            if (const auto it = transport.find("args"); (it != transport.end()) && it->is_array()) {
                for (const auto& arg : *it) {
                    stdio.args.push_back(arg.is_string() ? arg.get<std::string>() : describe(arg));
                }
            }
            if (const auto it = transport.find("env"); (it != transport.end()) && it->is_object()) {
                for (const auto& [name, value] : it->items()) {
                    stdio.env.emplace_back(name, value.is_string() ? value.get<std::string>() : describe(value));
                }
            }
            config.transport = std::move(stdio);
            break;
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Policy (clamped to floors; unparsable values fall back to defaults)
    // ─────────────────────────────────────────────────────────────────────────

    const auto read_seconds = [&](std::string_view key, std::chrono::seconds floor)
        -> std::optional<std::chrono::seconds> {
        const auto it = entry.find(key);
        if ((it == entry.end()) || it->is_null()) {
            return std::nullopt;
        }
        const auto value = read_number(*it);
        if (value.has_value() == false) {
            warn(std::format("service '{}': {} is not a number ({}); using default",
                             config.name, key, describe(*it)));
            return std::nullopt;
        }
        if (*value > static_cast<double>(limits::kMaxTimeout.count())) {
            warn(std::format("service '{}': {} lowered from {}s to {}s",
                             config.name, key, describe(*it), limits::kMaxTimeout.count()));
            return limits::kMaxTimeout;
        }
        const auto seconds = std::chrono::seconds{static_cast<std::int64_t>(std::llround(*value))};
        if (seconds < floor) {
            warn(std::format("service '{}': {} raised from {}s to {}s",
                             config.name, key, seconds.count(), floor.count()));
            return floor;
        }
        return seconds;
    };

    config.timeout = read_seconds("timeoutSec", limits::kMinTimeout).value_or(limits::kDefaultTimeout);
    config.idle_timeout = read_seconds("idleTimeoutSec", limits::kMinIdleTimeout);
    config.total_timeout = read_seconds("totalTimeoutSec", limits::kMinTotalTimeout);

    const auto retry_it = entry.contains("retry") ? entry.find("retry") : entry.find("retryCount");
    if ((retry_it != entry.end()) && (retry_it->is_null() == false)) {
        const auto value = read_number(*retry_it);
        if (value.has_value() == false) {
            warn(std::format("service '{}': retry is not a number ({}); using {}",
                             config.name, describe(*retry_it), limits::kDefaultRetry));
        } else if (*value > static_cast<double>(limits::kMaxRetry)) {
            warn(std::format("service '{}': retry lowered from {} to {}",
                             config.name, describe(*retry_it), limits::kMaxRetry));
            config.retry_count = limits::kMaxRetry;
        } else {
            const auto rounded = std::llround(*value);
            config.retry_count = (rounded < static_cast<long long>(limits::kMinRetry))
                ? limits::kMinRetry
                : static_cast<std::size_t>(rounded);
        }
    }

    get_logger().logf(LogLevel::Debug, "service '{}' -> {} {}", config.name, config.transport_name(), config.target());
    services_.push_back(std::move(config));
}

ConfigResult<ServiceRegistry> ServiceRegistry::load_string(std::string_view text) {
    auto parsed = fast_parse(text);
    if (!parsed) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::ParseFailed,
            "Invalid service configuration JSON: " + parsed.error().message});
    }
    return load(*parsed);
}

ConfigResult<ServiceRegistry> ServiceRegistry::load_file(const std::string& path) {
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if ((exists == false) || ec) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::FileNotFound,
            "Service configuration not found: " + path});
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::ReadFailed,
            "Cannot open service configuration: " + path});
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    if (input.bad()) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::ReadFailed,
            "Error reading service configuration: " + path});
    }

    auto loaded = load_string(contents.str());
    if (!loaded) {
        loaded.error().message += " (" + path + ")";
    }
    return loaded;
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

const ServiceConfig* ServiceRegistry::resolve(std::string_view name) const noexcept {
    if (enabled_ == false) {
        return nullptr;
    }

    std::string_view wanted = name;
    if (wanted.empty()) {
        if (default_name_.has_value() == false) {
            return nullptr;
        }
        wanted = *default_name_;
    }

    const auto it = std::ranges::find_if(services_,
        [wanted](const ServiceConfig& service) { return service.name == wanted; });
    if (it == services_.end()) {
        return nullptr;
    }
    return &*it;
}

std::string ServiceRegistry::summarize() const {
    if (enabled_ == false) {
        return "Tool services are disabled.";
    }
    if (services_.empty()) {
        return "No tool services configured.";
    }

    std::string summary = std::format("{} tool service{} configured",
                                      services_.size(),
                                      services_.size() == 1 ? "" : "s");
    if (default_name_.has_value()) {
        summary += std::format(" (default: {})", *default_name_);
    }
    summary += ":\n";

    for (const auto& service : services_) {
        const std::string target = service.target();
        summary += std::format("- {} [{}] {}; timeout {}s, idle {}s, total {}s, retry {}",
                               service.name,
                               service.transport_name(),
                               target.empty() ? "<not configured>" : target,
                               service.timeout.count(),
                               service.effective_idle_timeout().count(),
                               service.effective_total_timeout().count(),
                               service.retry_count);
        if (const auto* sse = std::get_if<SseEndpoint>(&service.transport)) {
            if (sse->method == HttpMethod::Get) {
                summary += ", legacy handshake";
            }
        }
        summary += '\n';
    }
    return summary;
}

}  // namespace mcpcall
