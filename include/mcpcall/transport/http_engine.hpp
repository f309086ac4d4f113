#pragma once

#include "mcpcall/trace/trace_sink.hpp"
#include "mcpcall/transport/http_client.hpp"
#include "mcpcall/transport/transport_engine.hpp"

#include <cstddef>
#include <memory>

namespace mcpcall {

struct HttpEngineConfig {
    // Bodies larger than this fail with RESPONSE_TOO_LARGE
    std::size_t max_body_bytes{4 * 1024 * 1024};
};

/// Single request/response ("streamableHttp"). The reply may be a JSON body
/// or a short text/event-stream body; in the latter case the event that
/// answers the envelope id is taken.
class HttpEngine final : public ITransportEngine {
public:
    explicit HttpEngine(
        std::shared_ptr<IHttpClient> http,
        HttpEngineConfig config = {},
        std::shared_ptr<ITraceSink> trace = nullptr
    );

    [[nodiscard]] CallResult call(
        const ServiceConfig& service,
        const JsonRpcRequest& envelope,
        const CallPolicy& policy
    ) override;

private:
    std::shared_ptr<IHttpClient> http_;
    HttpEngineConfig config_;
    std::shared_ptr<ITraceSink> trace_;
};

}  // namespace mcpcall
