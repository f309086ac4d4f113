#pragma once

#include "mcpcall/config/service_config.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// Configuration Errors
// ─────────────────────────────────────────────────────────────────────────────
// Only whole-document faults are errors. Problems with individual entries are
// skipped, logged, and listed in ServiceRegistry::warnings().

struct ConfigError {
    enum class Code {
        FileNotFound,
        ReadFailed,
        ParseFailed
    };

    Code code{Code::ParseFailed};
    std::string message;
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

// ─────────────────────────────────────────────────────────────────────────────
// Policy Limits
// ─────────────────────────────────────────────────────────────────────────────

namespace limits {
inline constexpr std::chrono::seconds kDefaultTimeout{30};
inline constexpr std::chrono::seconds kMinTimeout{10};
inline constexpr std::chrono::seconds kMinIdleTimeout{5};
inline constexpr std::chrono::seconds kMinTotalTimeout{10};
inline constexpr std::size_t kDefaultRetry{1};
inline constexpr std::size_t kMinRetry{1};
// Ceilings keep every policy duration representable in milliseconds
inline constexpr std::chrono::seconds kMaxTimeout{24 * 60 * 60};
inline constexpr std::size_t kMaxRetry{100};
}  // namespace limits

// ─────────────────────────────────────────────────────────────────────────────
// ServiceRegistry
// ─────────────────────────────────────────────────────────────────────────────
// Immutable after load. Lookups are const and may run concurrently.
//
// Document shape:
//   { "enabled": true, "defaultService": "search",
//     "services": [ { "name": "search",
//                     "transport": { "type": "sse", "url": "...", "method": "POST",
//                                    "headers": {...} },
//                     "timeoutSec": 30, "idleTimeoutSec": 20,
//                     "totalTimeoutSec": 120, "retry": 2 } ] }
//
// "services" may also be an object keyed by service name.

class ServiceRegistry {
public:
    ServiceRegistry() = default;

    [[nodiscard]] static ServiceRegistry load(const Json& document);

    /// Parse text, then load(). Fails only if the text is not a JSON document.
    [[nodiscard]] static ConfigResult<ServiceRegistry> load_string(std::string_view text);

    [[nodiscard]] static ConfigResult<ServiceRegistry> load_file(const std::string& path);

    /// The named service; the default service when name is empty; else nullptr.
    [[nodiscard]] const ServiceConfig* resolve(std::string_view name = {}) const noexcept;

    [[nodiscard]] bool is_any_service_available() const noexcept {
        return (enabled_ == true) && (services_.empty() == false);
    }

    /// Human-readable overview built from configuration alone.
    [[nodiscard]] std::string summarize() const;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] const std::vector<ServiceConfig>& services() const noexcept { return services_; }
    [[nodiscard]] const std::optional<std::string>& default_service_name() const noexcept { return default_name_; }
    [[nodiscard]] const std::vector<std::string>& warnings() const noexcept { return warnings_; }

private:
    std::vector<ServiceConfig> services_;  // config order
    std::optional<std::string> default_name_;
    bool enabled_{true};
    std::vector<std::string> warnings_;

    void warn(std::string message);
    void add_entry(const Json& entry, std::string fallback_name);
};

}  // namespace mcpcall
