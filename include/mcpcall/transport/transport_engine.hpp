#pragma once

#include "mcpcall/client/call_result.hpp"
#include "mcpcall/config/service_config.hpp"
#include "mcpcall/protocol/json_rpc.hpp"
#include "mcpcall/transport/call_policy.hpp"

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// ITransportEngine
// ─────────────────────────────────────────────────────────────────────────────
// Carries one envelope to a service and classifies what comes back.
//
// Contract:
// - Never throws; every outcome, including internal faults, is a CallResult.
// - Owns nothing between calls: each call opens and releases its own
//   connection, process or socket, so one engine serves concurrent calls.
// - The result's service and transport fields are filled in.

class ITransportEngine {
public:
    virtual ~ITransportEngine() = default;

    [[nodiscard]] virtual CallResult call(
        const ServiceConfig& service,
        const JsonRpcRequest& envelope,
        const CallPolicy& policy
    ) = 0;
};

}  // namespace mcpcall
