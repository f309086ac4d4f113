// ─────────────────────────────────────────────────────────────────────────────
// mcpcall-cli - call configured tool services from the shell
// ─────────────────────────────────────────────────────────────────────────────
// Loads a service configuration and performs one call through the
// RequestDispatcher.
//
// Usage:
//   mcpcall-cli --config services.json --summary
//   mcpcall-cli --config services.json --service search --list-tools
//   mcpcall-cli --config services.json --call-tool web_search \
//               --tool-args '{"query":"asio coroutines"}'
//   mcpcall-cli --config services.json --method resources/read \
//               --params '{"uri":"file:///tmp/a.txt"}' --json
//
// Exit status: 0 success, 1 the call failed, 2 usage or configuration error.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcpcall/client/request_dispatcher.hpp"
#include "mcpcall/config/service_registry.hpp"
#include "mcpcall/json/fast_json.hpp"
#include "mcpcall/log/logger.hpp"
#include "mcpcall/log/spdlog_logger.hpp"
#include "mcpcall/trace/trace_sink.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace mcpcall;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitCallFailed = 1;
constexpr int kExitUsage = 2;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_warning(const std::string& msg) {
    std::cerr << color::c(color::yellow) << "Warning: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j, bool compact = false) {
    if (compact) {
        std::cout << j.dump(-1, ' ', false, Json::error_handler_t::replace) << "\n";
    } else {
        std::cout << j.dump(2, ' ', false, Json::error_handler_t::replace) << "\n";
    }
}

std::string get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? value : "";
}

/// Named entries of result.data[key] ("tools", "resources", "prompts")
void print_listing(const CallResult& result, const std::string& key, const std::string& title) {
    print_header(title);
    const bool has_items = result.data.is_object() && result.data.contains(key) && result.data[key].is_array();
    if ((has_items == false) || result.data[key].empty()) {
        std::cout << color::c(color::dim) << "(none)" << color::c(color::reset) << "\n";
        return;
    }
    for (const auto& item : result.data[key]) {
        const std::string name = item.is_object()
            ? item.value("name", item.value("uri", std::string("?")))
            : item.dump();
        std::cout << color::c(color::bold) << color::c(color::yellow) << "• " << name << color::c(color::reset);
        if (item.is_object() && item.contains("description") && item["description"].is_string()) {
            std::cout << "\n  " << color::c(color::dim) << item["description"].get<std::string>()
                      << color::c(color::reset);
        }
        std::cout << "\n";
    }
}

int report(const CallResult& result, bool json_output, const std::optional<std::string>& listing_key,
           const std::string& title) {
    if (json_output) {
        print_json(result.to_json());
        return result.success ? kExitSuccess : kExitCallFailed;
    }

    if (result.success == false) {
        print_error(std::string(result.error_key()) + ": " + result.error.value_or(""));
        std::cerr << color::c(color::dim) << "service " << result.service << " (" << result.transport << ")"
                  << color::c(color::reset) << "\n";
        return kExitCallFailed;
    }

    if (listing_key.has_value()) {
        print_listing(result, *listing_key, title);
    } else {
        print_header(title);
        print_json(result.data);
    }
    return kExitSuccess;
}

std::optional<Json> parse_json_argument(const std::string& option, const std::string& text) {
    auto parsed = fast_parse(text);
    if (parsed.has_value() == false) {
        print_error("--" + option + " is not a JSON object or array: " + parsed.error().message);
        return std::nullopt;
    }
    return std::move(*parsed);
}

bool configure_logging(const cxxopts::ParseResult& result) {
    std::string level_text = result["log-level"].as<std::string>();
    if (result.count("log-level") == 0) {
        const std::string from_env = get_env("MCPCALL_LOG_LEVEL");
        if (from_env.empty() == false) {
            level_text = from_env;
        }
    }

    const auto level = parse_log_level(level_text);
    if (level.has_value() == false) {
        print_warning("unknown log level '" + level_text + "', using warn");
    }

    LogSettings settings;
    settings.level = level.value_or(LogLevel::Warn);
    settings.color = color::enabled;
    if (result.count("log-file")) {
        settings.file = result["log-file"].as<std::string>();
    }

    auto logger = make_spdlog_logger(settings);
    if (!logger) {
        print_error("cannot open log file: " + logger.error());
        return false;
    }
    set_logger(std::move(*logger));
    return true;
}

std::optional<std::chrono::seconds> seconds_option(const cxxopts::ParseResult& result, const std::string& name) {
    if (result.count(name) == 0) {
        return std::nullopt;
    }
    return std::chrono::seconds{result[name].as<int>()};
}

std::optional<std::size_t> count_option(const cxxopts::ParseResult& result, const std::string& name) {
    if (result.count(name) == 0) {
        return std::nullopt;
    }
    const int value = result[name].as<int>();
    return static_cast<std::size_t>(value < 0 ? 0 : value);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpcall-cli", "Call tool services over SSE, WebSocket, stdio or HTTP");

    options.add_options()
        ("c,config", "Service configuration file (or MCPCALL_CONFIG)", cxxopts::value<std::string>())
        ("s,service", "Service name (default: the configured default service)", cxxopts::value<std::string>())

        // Commands
        ("summary", "Describe the configured services without connecting")
        ("list-tools", "List the service's tools")
        ("list-resources", "List the service's resources")
        ("list-prompts", "List the service's prompts")
        ("call-tool", "Call a tool by name", cxxopts::value<std::string>())
        ("tool-args", "JSON arguments for --call-tool", cxxopts::value<std::string>()->default_value("{}"))
        ("m,method", "Invoke a raw JSON-RPC method", cxxopts::value<std::string>())
        ("params", "JSON params for --method", cxxopts::value<std::string>())

        // Policy overrides
        ("timeout", "Timeout in seconds", cxxopts::value<int>())
        ("idle-timeout", "SSE idle timeout in seconds", cxxopts::value<int>())
        ("total-timeout", "SSE total timeout in seconds", cxxopts::value<int>())
        ("retry", "Number of full attempts", cxxopts::value<int>())
        ("max-reconnects", "SSE reconnects per attempt", cxxopts::value<int>())
        ("cancel", "Allow ESC or Ctrl-C to cancel the call")

        // Output and diagnostics
        ("trace-file", "Append JSON-lines trace records to this file", cxxopts::value<std::string>())
        ("log-level", "trace, debug, info, warn, error, fatal or off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("j,json", "Print the raw result object as JSON")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    mcpcall-cli -c services.json --summary\n";
            std::cout << "    mcpcall-cli -c services.json -s search --list-tools\n";
            std::cout << "    mcpcall-cli -c services.json --call-tool web_search --tool-args '{\"query\":\"x\"}'\n";
            std::cout << "    mcpcall-cli -c services.json -m prompts/get --params '{\"name\":\"review\"}' --json\n";
            return kExitSuccess;
        }

        color::enabled = (result.count("no-color") == 0);
        const bool json_output = result.count("json") > 0;
        if (configure_logging(result) == false) {
            return kExitUsage;
        }

        const std::string config_path = result.count("config")
            ? result["config"].as<std::string>()
            : get_env("MCPCALL_CONFIG");
        if (config_path.empty()) {
            print_error("no configuration: pass --config or set MCPCALL_CONFIG");
            return kExitUsage;
        }

        auto loaded = ServiceRegistry::load_file(config_path);
        if (loaded.has_value() == false) {
            print_error(loaded.error().message);
            return kExitUsage;
        }
        auto registry = std::make_shared<const ServiceRegistry>(std::move(*loaded));

        if (result.count("summary")) {
            if (json_output) {
                print_json(Json{{"available", registry->is_any_service_available()},
                                {"summary", registry->summarize()}});
            } else {
                std::cout << registry->summarize() << "\n";
            }
            return kExitSuccess;
        }

        std::shared_ptr<ITraceSink> trace;
        if (result.count("trace-file")) {
            auto sink = make_jsonl_trace_sink(result["trace-file"].as<std::string>());
            if (sink.has_value() == false) {
                print_error("cannot open trace file: " + sink.error());
                return kExitUsage;
            }
            trace = *sink;
        }

        CallOptions call_options;
        call_options.service = result.count("service") ? result["service"].as<std::string>() : std::string{};
        call_options.timeout = seconds_option(result, "timeout");
        call_options.idle_timeout = seconds_option(result, "idle-timeout");
        call_options.total_timeout = seconds_option(result, "total-timeout");
        call_options.retry_count = count_option(result, "retry");
        call_options.max_reconnects = count_option(result, "max-reconnects");
        call_options.enable_cancellation = result.count("cancel") > 0;

        if (call_options.enable_cancellation && (json_output == false)) {
            std::cerr << color::c(color::dim) << "Press ESC or Ctrl-C to cancel" << color::c(color::reset) << "\n";
        }

        RequestDispatcher dispatcher(registry, trace);

        if (result.count("list-tools") || result.count("list-resources") || result.count("list-prompts")) {
            // Listings go through the dispatcher's single-attempt wrappers
            // unless policy overrides were given
            const bool has_overrides =
                call_options.timeout || call_options.idle_timeout || call_options.total_timeout ||
                call_options.retry_count || call_options.max_reconnects || call_options.enable_cancellation;

            std::string method = "tools/list";
            std::string key = "tools";
            std::string title = "Tools";
            if (result.count("list-resources")) {
                method = "resources/list";
                key = "resources";
                title = "Resources";
            } else if (result.count("list-prompts")) {
                method = "prompts/list";
                key = "prompts";
                title = "Prompts";
            }

            CallResult listed = CallResult::failure(ErrorCode::Unknown, "not run");
            if (has_overrides) {
                listed = dispatcher.invoke(method, std::nullopt, call_options);
            } else if (key == "tools") {
                listed = dispatcher.list_tools(call_options.service);
            } else if (key == "resources") {
                listed = dispatcher.list_resources(call_options.service);
            } else {
                listed = dispatcher.list_prompts(call_options.service);
            }
            return report(listed, json_output, key, title);
        }

        if (result.count("call-tool")) {
            auto arguments = parse_json_argument("tool-args", result["tool-args"].as<std::string>());
            if (arguments.has_value() == false) {
                return kExitUsage;
            }
            const std::string tool = result["call-tool"].as<std::string>();
            auto called = dispatcher.call_tool(tool, std::move(*arguments), call_options);
            return report(called, json_output, std::nullopt, "Tool " + tool);
        }

        if (result.count("method")) {
            std::optional<Json> params;
            if (result.count("params")) {
                params = parse_json_argument("params", result["params"].as<std::string>());
                if (params.has_value() == false) {
                    return kExitUsage;
                }
            }
            const std::string method = result["method"].as<std::string>();
            auto invoked = dispatcher.invoke(method, std::move(params), call_options);
            return report(invoked, json_output, std::nullopt, method);
        }

        print_error("nothing to do: pass --summary, --list-tools, --call-tool or --method");
        std::cout << "\n" << options.help() << "\n";
        return kExitUsage;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return kExitUsage;
    } catch (const std::exception& e) {
        print_error(e.what());
        return kExitUsage;
    }
}
