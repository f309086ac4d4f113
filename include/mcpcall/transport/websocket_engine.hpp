#pragma once

#include "mcpcall/trace/trace_sink.hpp"
#include "mcpcall/transport/transport_engine.hpp"
#include "mcpcall/transport/websocket_client.hpp"

#include <memory>

namespace mcpcall {

/// One connection per call: connect, send the envelope as a text frame, wait
/// for the frame that answers it. Server notifications and replies to other
/// ids are skipped. No reconnection.
class WebSocketEngine final : public ITransportEngine {
public:
    explicit WebSocketEngine(
        std::shared_ptr<IWebSocketConnector> connector,
        std::shared_ptr<ITraceSink> trace = nullptr
    );

    [[nodiscard]] CallResult call(
        const ServiceConfig& service,
        const JsonRpcRequest& envelope,
        const CallPolicy& policy
    ) override;

private:
    std::shared_ptr<IWebSocketConnector> connector_;
    std::shared_ptr<ITraceSink> trace_;
};

}  // namespace mcpcall
