#include "mcpcall/config/service_config.hpp"

#include <cctype>

namespace mcpcall {

std::optional<TransportKind> parse_transport_kind(std::string_view text) {
    std::string lowered(text);
    std::ranges::transform(lowered, lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "sse") return TransportKind::Sse;
    if ((lowered == "websocket") || (lowered == "ws")) return TransportKind::WebSocket;
    if (lowered == "stdio") return TransportKind::Stdio;
    if ((lowered == "streamablehttp") || (lowered == "streamable-http") || (lowered == "http")) {
        return TransportKind::Http;
    }
    return std::nullopt;
}

TransportKind kind_of(const TransportSpec& spec) noexcept {
    switch (spec.index()) {
        case 0: return TransportKind::Sse;
        case 1: return TransportKind::WebSocket;
        case 2: return TransportKind::Stdio;
        default: return TransportKind::Http;
    }
}

std::string ServiceConfig::target() const {
    struct TargetVisitor {
        std::string operator()(const SseEndpoint& sse) const { return sse.url; }
        std::string operator()(const WebSocketEndpoint& ws) const { return ws.url; }
        std::string operator()(const HttpEndpoint& http) const { return http.url; }
        std::string operator()(const StdioCommand& stdio) const {
            std::string line = stdio.command;
            for (const auto& arg : stdio.args) {
                line += ' ';
                line += arg;
            }
            return line;
        }
    };
    return std::visit(TargetVisitor{}, transport);
}

}  // namespace mcpcall
