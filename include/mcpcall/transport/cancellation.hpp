#pragma once

#include <atomic>
#include <memory>

#include <termios.h>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// ICancellationSource
// ─────────────────────────────────────────────────────────────────────────────
// Polled by the engines between reads, at most one poll interval apart. A
// source belongs to a single call; cancelling it never affects other calls.

class ICancellationSource {
public:
    virtual ~ICancellationSource() = default;

    [[nodiscard]] virtual bool cancel_requested() = 0;
};

/// Programmatic cancellation (another thread calls cancel()).
class CancellationToken final : public ICancellationSource {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool cancel_requested() override {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// KeyboardCancelMonitor
// ─────────────────────────────────────────────────────────────────────────────
// Watches an interactive terminal for ESC or Ctrl-C while a call is in flight.
// The terminal is switched to non-canonical mode with signal generation off,
// so Ctrl-C arrives as a byte instead of killing the process; the previous
// settings are restored on destruction.
//
// Inactive (never cancels) when the descriptor is not a terminal.

class KeyboardCancelMonitor final : public ICancellationSource {
public:
    explicit KeyboardCancelMonitor(int fd = 0);
    ~KeyboardCancelMonitor() override;

    KeyboardCancelMonitor(const KeyboardCancelMonitor&) = delete;
    KeyboardCancelMonitor& operator=(const KeyboardCancelMonitor&) = delete;

    [[nodiscard]] bool active() const noexcept { return active_; }

    [[nodiscard]] bool cancel_requested() override;

    static constexpr unsigned char kEscape = 0x1b;
    static constexpr unsigned char kInterrupt = 0x03;

private:
    int fd_;
    bool active_{false};
    bool cancelled_{false};
    termios saved_{};
};

}  // namespace mcpcall
