#pragma once

#include "mcpcall/transport.hpp"
#include "mcpcall/transport/cancellation.hpp"
#include "mcpcall/transport/retry_policy.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// CallPolicy
// ─────────────────────────────────────────────────────────────────────────────
// The effective limits for one attempt, after the dispatcher has merged
// call-site overrides with the service's configuration.
//
//   timeout        single-shot engines: whole request/response
//   idle_timeout   SSE: longest gap between two received lines
//   total_timeout  SSE: longest lifetime of one connection
//   poll_interval  upper bound on how long any wait blocks before the
//                  cancellation source and timers are checked again

struct CallPolicy {
    Millis timeout{std::chrono::seconds{30}};
    Millis idle_timeout{std::chrono::seconds{30}};
    Millis total_timeout{std::chrono::seconds{30}};
    ReconnectPolicy reconnect{};
    Millis poll_interval{100};
    std::shared_ptr<ICancellationSource> cancellation;

    [[nodiscard]] bool cancel_requested() const {
        return (cancellation != nullptr) && cancellation->cancel_requested();
    }
};

/// Sleep for `delay` in poll_interval slices. Returns false if the policy's
/// cancellation source fired first.
[[nodiscard]] inline bool wait_unless_cancelled(const CallPolicy& policy, Millis delay) {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (true) {
        if (policy.cancel_requested()) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<Millis>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, policy.poll_interval));
    }
}

}  // namespace mcpcall
