#include "mcpcall/transport/cancellation.hpp"
#include "mcpcall/log/logger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

#include <poll.h>
#include <unistd.h>

namespace mcpcall {

KeyboardCancelMonitor::KeyboardCancelMonitor(int fd)
    : fd_(fd)
{
    if (::isatty(fd_) == 0) {
        return;
    }
    if (::tcgetattr(fd_, &saved_) != 0) {
        MCPCALL_LOG_WARN("Cancellation disabled: tcgetattr failed: " + std::string(std::strerror(errno)));
        return;
    }

    termios raw = saved_;
    raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO | ISIG));
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(fd_, TCSANOW, &raw) != 0) {
        MCPCALL_LOG_WARN("Cancellation disabled: tcsetattr failed: " + std::string(std::strerror(errno)));
        return;
    }
    active_ = true;
}

KeyboardCancelMonitor::~KeyboardCancelMonitor() {
    if (active_) {
        ::tcsetattr(fd_, TCSANOW, &saved_);
    }
}

bool KeyboardCancelMonitor::cancel_requested() {
    if ((active_ == false) || cancelled_) {
        return cancelled_;
    }

    pollfd pfd{fd_, POLLIN, 0};
    while (::poll(&pfd, 1, 0) > 0) {
        const bool readable = (pfd.revents & POLLIN) != 0;
        if (readable == false) {
            break;
        }

        std::array<unsigned char, 64> buffer{};
        const ssize_t n = ::read(fd_, buffer.data(), buffer.size());
        if (n <= 0) {
            break;
        }
        for (ssize_t i = 0; i < n; ++i) {
            const unsigned char byte = buffer[static_cast<std::size_t>(i)];
            if ((byte == kEscape) || (byte == kInterrupt)) {
                cancelled_ = true;
                MCPCALL_LOG_INFO("Cancellation requested from keyboard");
                return true;
            }
        }
    }
    return false;
}

}  // namespace mcpcall
