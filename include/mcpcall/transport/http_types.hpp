#pragma once

#include "mcpcall/transport.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

[[nodiscard]] inline bool is_event_stream(const HeaderMap& headers) {
    const auto content_type = get_header(headers, "Content-Type");
    return content_type.has_value() && (content_type->find("text/event-stream") != std::string::npos);
}

[[nodiscard]] inline bool is_json_content(const HeaderMap& headers) {
    const auto content_type = get_header(headers, "Content-Type");
    return content_type.has_value() && (content_type->find("application/json") != std::string::npos);
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Post
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
    }
    return "UNKNOWN";
}

/// "GET" / "POST", case-insensitive
[[nodiscard]] std::optional<HttpMethod> parse_http_method(std::string_view text);

// ─────────────────────────────────────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────────────────────────────────────

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;  // absolute
    HeaderMap headers;
    std::optional<std::string> body;

    HttpRequest& with_header(const std::string& name, const std::string& value) {
        headers.insert_or_assign(name, value);
        return *this;
    }

    HttpRequest& with_body(std::string content) {
        body = std::move(content);
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// URL Handling (ada-url)
// ─────────────────────────────────────────────────────────────────────────────

/// Resolve reference (absolute, or relative such as "/messages?sessionId=x")
/// against base. nullopt when either does not parse.
[[nodiscard]] std::optional<std::string> resolve_url(const std::string& base, const std::string& reference);

/// True for a parsable URL whose scheme is one of allowed_schemes (e.g. "http", "https").
[[nodiscard]] bool has_scheme(const std::string& url, std::initializer_list<std::string_view> allowed_schemes);

}  // namespace mcpcall
