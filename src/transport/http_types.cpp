#include "mcpcall/transport/http_types.hpp"

#include <ada.h>

#include <algorithm>
#include <cctype>

namespace mcpcall {

std::optional<HttpMethod> parse_http_method(std::string_view text) {
    std::string upper(text);
    std::ranges::transform(upper, upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "GET") return HttpMethod::Get;
    if (upper == "POST") return HttpMethod::Post;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Resolution
// ─────────────────────────────────────────────────────────────────────────────
// ada implements the WHATWG URL standard, which is also what browsers use to
// resolve the relative endpoint a legacy SSE server announces.

std::optional<std::string> resolve_url(const std::string& base, const std::string& reference) {
    auto base_url = ada::parse<ada::url>(base);
    if (!base_url) {
        return std::nullopt;
    }

    auto resolved = ada::parse<ada::url>(reference, &base_url.value());
    if (!resolved) {
        return std::nullopt;
    }
    return std::string(resolved->get_href());
}

bool has_scheme(const std::string& url, std::initializer_list<std::string_view> allowed_schemes) {
    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return false;
    }

    // ada reports the protocol with its trailing colon ("https:")
    std::string protocol = std::string(parsed->get_protocol());
    const bool has_colon = (protocol.empty() == false) && (protocol.back() == ':');
    if (has_colon) {
        protocol.pop_back();
    }
    return std::ranges::find(allowed_schemes, std::string_view(protocol)) != allowed_schemes.end();
}

}  // namespace mcpcall
