#ifndef MCPCALL_TRANSPORT_BACKOFF_POLICY_HPP
#define MCPCALL_TRANSPORT_BACKOFF_POLICY_HPP

#include <chrono>
#include <cstddef>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// Wait between attempts
// ─────────────────────────────────────────────────────────────────────────────
// The dispatcher asks for a delay before each retry of a whole call, the SSE
// engine before each reconnect. `failures` counts the failures so far, minus
// one: the wait after the first failure is next_delay(0).
//
// One policy object is shared by concurrent calls.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    virtual std::chrono::milliseconds next_delay(std::size_t failures) = 0;
};

// base * multiplier^failures, capped at `max`, then spread by +/- jitter.
// With base=500ms, multiplier=2 and max=5s: 500ms, 1s, 2s, 4s, 5s, 5s...
class ExponentialBackoff final : public IBackoffPolicy {
public:
    ExponentialBackoff();
    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max,
        double jitter  // fraction of the delay; 0 disables
    );

    std::chrono::milliseconds next_delay(std::size_t failures) override;

    [[nodiscard]] std::chrono::milliseconds ceiling() const noexcept { return max_; }

private:
    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_;
};

class ConstantBackoff final : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay) : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t) override { return delay_; }

private:
    std::chrono::milliseconds delay_;
};

// Retry immediately. Tests use it to keep retry loops fast.
class NoBackoff final : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t) override { return std::chrono::milliseconds::zero(); }
};

}  // namespace mcpcall

#endif  // MCPCALL_TRANSPORT_BACKOFF_POLICY_HPP
