#ifndef MCPCALL_TRANSPORT_RETRY_POLICY_HPP
#define MCPCALL_TRANSPORT_RETRY_POLICY_HPP

#include "mcpcall/client/call_error.hpp"

#include <algorithm>
#include <cstddef>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// Two nested loops bound every call:
//
//   RetryPolicy        RequestDispatcher: whole call, fresh envelope id each time
//     ReconnectPolicy  SseEngine: new connection within one attempt, same id
//
// Each loop consumes one attempt's outcome: a terminal result is returned as
// is, anything else is a reason to go around again while budget remains.
// ─────────────────────────────────────────────────────────────────────────────

class RetryPolicy {
public:
    explicit RetryPolicy(std::size_t max_attempts = 1)
        : max_attempts_(std::max<std::size_t>(1, max_attempts))
    {}

    RetryPolicy& with_max_attempts(std::size_t attempts) {
        max_attempts_ = std::max<std::size_t>(1, attempts);
        return *this;
    }

    [[nodiscard]] std::size_t max_attempts() const noexcept {
        return max_attempts_;
    }

    /// attempts_made: attempts already run, including the failed one
    [[nodiscard]] bool should_retry(ErrorCode code, std::size_t attempts_made) const noexcept {
        const bool within_limit = (attempts_made < max_attempts_);
        if (within_limit == false) {
            return false;
        }
        return is_retryable(code);
    }

private:
    std::size_t max_attempts_;
};

struct ReconnectPolicy {
    std::size_t max_reconnects{1};

    /// reconnects_done: fresh connections opened after the first one
    [[nodiscard]] bool allows(std::size_t reconnects_done) const noexcept {
        return reconnects_done < max_reconnects;
    }

    /// Connection-level failures and timeouts without a matched reply
    [[nodiscard]] static constexpr bool warrants_reconnect(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::RequestFailed:
            case ErrorCode::BadStatus:
            case ErrorCode::StreamInitFailed:
            case ErrorCode::StreamClosed:
            case ErrorCode::Timeout:
                return true;
            default:
                return false;
        }
    }
};

}  // namespace mcpcall

#endif  // MCPCALL_TRANSPORT_RETRY_POLICY_HPP
