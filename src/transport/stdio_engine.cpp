#include "mcpcall/transport/stdio_engine.hpp"
#include "mcpcall/json/fast_json.hpp"
#include "mcpcall/log/logger.hpp"
#include "mcpcall/transport/reply.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <tl/expected.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <ctime>
#include <format>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcpcall {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::string_view kTransportName = "stdio";

// ─────────────────────────────────────────────────────────────────────────────
// SIGPIPE
// ─────────────────────────────────────────────────────────────────────────────
// Writing to a child that exited without reading stdin raises SIGPIPE on the
// writing thread. The signal stays blocked on this thread for the duration of
// a call, so the write fails with EPIPE instead; a SIGPIPE left pending by the
// call is consumed before the previous mask returns. The process-wide
// disposition is never touched.

class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigemptyset(&sigpipe_);
        sigaddset(&sigpipe_, SIGPIPE);

        sigset_t pending;
        already_pending_ = (sigpending(&pending) == 0) && (sigismember(&pending, SIGPIPE) == 1);
        blocked_ = (pthread_sigmask(SIG_BLOCK, &sigpipe_, &previous_) == 0);
    }

    ~ScopedSigpipeBlock() {
        if (blocked_ == false) {
            return;
        }
        sigset_t pending;
        const bool raised = (already_pending_ == false) && (sigpending(&pending) == 0) &&
                            (sigismember(&pending, SIGPIPE) == 1);
        if (raised) {
            const timespec no_wait{0, 0};
            sigtimedwait(&sigpipe_, nullptr, &no_wait);
        }
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

private:
    sigset_t sigpipe_{};
    sigset_t previous_{};
    bool already_pending_{false};
    bool blocked_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Spawning
// ─────────────────────────────────────────────────────────────────────────────

struct ChildProcess {
    pid_t pid{-1};
    int stdin_fd{-1};
    int stdout_fd{-1};
    int stderr_fd{-1};
};

void close_pair(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }
}

/// Inherited environment with the configured entries replacing or adding
std::vector<std::string> build_environment(const StdioCommand& command) {
    std::vector<std::string> entries;
    for (char** it = environ; (it != nullptr) && (*it != nullptr); ++it) {
        const std::string_view entry{*it};
        const auto name = entry.substr(0, entry.find('='));
        const bool overridden = std::ranges::any_of(command.env, [&](const auto& kv) {
            return kv.first == name;
        });
        if (overridden == false) {
            entries.emplace_back(entry);
        }
    }
    for (const auto& [name, value] : command.env) {
        entries.push_back(name + "=" + value);
    }
    return entries;
}

tl::expected<ChildProcess, std::string> spawn_child(const StdioCommand& command) {
    // Everything the child touches is allocated before fork(): only the
    // forking thread survives in the child, and malloc may be locked.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(command.args.size() + 1);
    argv_storage.push_back(command.command);
    argv_storage.insert(argv_storage.end(), command.args.begin(), command.args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(command);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& str : env_storage) {
        envp.push_back(str.data());
    }
    envp.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};  // carries errno if exec fails; closed by a successful exec

    const bool pipes_ok =
        (::pipe2(stdin_pipe, O_CLOEXEC) == 0) &&
        (::pipe2(stdout_pipe, O_CLOEXEC) == 0) &&
        (::pipe2(stderr_pipe, O_CLOEXEC) == 0) &&
        (::pipe2(status_pipe, O_CLOEXEC) == 0);
    if (pipes_ok == false) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return tl::unexpected("failed to create pipes: " + reason);
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return tl::unexpected("failed to fork: " + reason);
    }

    if (pid == 0) {
        // Child: no allocations from here on. dup2 clears close-on-exec on
        // the standard descriptors; every other pipe end closes at exec.
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);

        ::execvpe(argv[0], argv.data(), envp.data());

        const int exec_errno = errno;
        const ssize_t written = ::write(status_pipe[1], &exec_errno, sizeof(exec_errno));
        ::_exit(written == static_cast<ssize_t>(sizeof(exec_errno)) ? 127 : 126);
    }

    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);
    ::close(status_pipe[1]);

    int exec_errno = 0;
    ssize_t received = 0;
    do {
        received = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while ((received == -1) && (errno == EINTR));
    ::close(status_pipe[0]);

    const bool exec_failed = (received == static_cast<ssize_t>(sizeof(exec_errno)));
    if (exec_failed) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::close(stderr_pipe[0]);
        return tl::unexpected(std::format("cannot execute '{}': {}", command.command, std::strerror(exec_errno)));
    }

    return ChildProcess{pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]};
}

int decode_exit_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

/// Non-blocking reap. nullopt while the child is still running.
std::optional<int> try_reap(pid_t pid) {
    int status = 0;
    const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
    if (reaped == pid) {
        return decode_exit_status(status);
    }
    if ((reaped == -1) && (errno == ECHILD)) {
        return -1;
    }
    return std::nullopt;
}

/// SIGTERM, then SIGKILL once the grace period is over. Always reaps.
void terminate_child(pid_t pid, Millis grace) {
    ::kill(pid, SIGTERM);
    const auto deadline = Clock::now() + grace;
    while (Clock::now() < deadline) {
        if (try_reap(pid).has_value()) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    MCPCALL_LOG_DEBUG(std::format("child {} ignored SIGTERM, sending SIGKILL", pid));
    ::kill(pid, SIGKILL);
    int status = 0;
    ::waitpid(pid, &status, 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Pipe I/O (asio coroutines)
// ─────────────────────────────────────────────────────────────────────────────

struct Capture {
    std::string data;
    std::size_t limit{0};
    bool overflow{false};
    bool done{false};
};

asio::awaitable<void> write_input(asio::posix::stream_descriptor& pipe, std::string line) {
    try {
        co_await asio::async_write(pipe, asio::buffer(line), asio::use_awaitable);
    } catch (const std::system_error& e) {
        // The child may exit or close stdin without reading it
        if (e.code() != asio::error::broken_pipe) {
            MCPCALL_LOG_DEBUG(std::string("stdin write failed: ") + e.what());
        }
    }
    asio::error_code ec;
    pipe.close(ec);
}

asio::awaitable<void> drain(asio::posix::stream_descriptor& pipe, Capture& capture, bool stop_at_limit) {
    std::array<char, 4096> buffer;
    while (true) {
        try {
            const std::size_t n = co_await pipe.async_read_some(asio::buffer(buffer), asio::use_awaitable);
            if (n == 0) {
                break;
            }
            const std::size_t room = (capture.data.size() < capture.limit)
                ? capture.limit - capture.data.size()
                : 0;
            capture.data.append(buffer.data(), std::min(n, room));
            if (n > room) {
                capture.overflow = true;
                if (stop_at_limit) {
                    break;
                }
            }
        } catch (const std::system_error& e) {
            if (e.code() != asio::error::eof) {
                MCPCALL_LOG_DEBUG(std::string("pipe read failed: ") + e.what());
            }
            break;
        }
    }
    capture.done = true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Output Classification
// ─────────────────────────────────────────────────────────────────────────────

/// Reply line correlated by id, else the last JSON line without an id of its
/// own, else the whole output as one document (pretty-printed replies).
std::optional<Json> pick_reply(const std::string& output, const JsonRpcId& id) {
    std::optional<Json> last_json;

    std::size_t start = 0;
    while (start <= output.size()) {
        const auto end = output.find('\n', start);
        const auto line = trim_ascii(std::string_view(output).substr(
            start, (end == std::string::npos ? output.size() : end) - start));
        start = (end == std::string::npos) ? output.size() + 1 : end + 1;

        if (looks_like_json(line) == false) {
            continue;
        }
        auto parsed = fast_parse(line);
        if ((parsed.has_value() == false) || is_server_message(*parsed)) {
            continue;
        }
        const bool correlated = parsed->is_object() && parsed->contains("id") && id.matches((*parsed)["id"]);
        if (correlated) {
            return std::move(*parsed);
        }
        if (answers_other_request(*parsed, id) == false) {
            last_json = std::move(*parsed);
        }
    }

    if (last_json.has_value()) {
        return last_json;
    }

    if (looks_like_json(output)) {
        auto whole = fast_parse(output);
        if (whole.has_value() && (answers_other_request(*whole, id) == false)) {
            return std::move(*whole);
        }
    }
    return std::nullopt;
}

std::string describe_command(const StdioCommand& command) {
    std::string text = command.command;
    for (const auto& arg : command.args) {
        text += ' ';
        text += arg;
    }
    return text;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// StdioEngine
// ─────────────────────────────────────────────────────────────────────────────

StdioEngine::StdioEngine(StdioEngineConfig config, std::shared_ptr<ITraceSink> trace)
    : config_(config)
    , trace_(std::move(trace))
{
    if (trace_ == nullptr) {
        trace_ = std::make_shared<NullTraceSink>();
    }
}

CallResult StdioEngine::call(
    const ServiceConfig& service,
    const JsonRpcRequest& envelope,
    const CallPolicy& policy
) {
    const std::string transport{kTransportName};

    const auto* command = std::get_if<StdioCommand>(&service.transport);
    if (command == nullptr) {
        return CallResult::failure(ErrorCode::TransportUnsupported,
            std::format("service '{}' is not a stdio service", service.name),
            service.name, std::string(service.transport_name()));
    }
    if (command->command.empty()) {
        return CallResult::failure(ErrorCode::MissingCommand,
            std::format("stdio service '{}' has no command", service.name),
            service.name, transport);
    }

    auto fail = [&](ErrorCode code, std::string message) {
        return CallResult::failure(code, std::move(message), service.name, transport);
    };

    trace_->trace(service.name, transport, "connect", describe_command(*command));
    auto spawned = spawn_child(*command);
    if (spawned.has_value() == false) {
        return fail(ErrorCode::StdioSpawnFailed, spawned.error());
    }
    // After the fork, so the child starts with the caller's signal mask
    const ScopedSigpipeBlock sigpipe_block;
    const ChildProcess child = *spawned;
    MCPCALL_LOG_DEBUG(std::format("[{}] spawned '{}' as pid {}", service.name, command->command, child.pid));

    try {
        asio::io_context io;
        asio::posix::stream_descriptor child_stdin(io, child.stdin_fd);
        asio::posix::stream_descriptor child_stdout(io, child.stdout_fd);
        asio::posix::stream_descriptor child_stderr(io, child.stderr_fd);

        Capture out;
        out.limit = config_.max_output_bytes;
        Capture err;
        err.limit = config_.max_stderr_bytes;

        trace_->trace(service.name, transport, "request", envelope.method(),
                      Json{{"id", envelope.id().to_string()}, {"pid", child.pid}});

        asio::co_spawn(io, write_input(child_stdin, envelope.to_json().dump() + "\n"), asio::detached);
        asio::co_spawn(io, drain(child_stdout, out, true), asio::detached);
        asio::co_spawn(io, drain(child_stderr, err, false), asio::detached);

        const auto deadline = Clock::now() + policy.timeout;
        std::optional<int> exit_code;

        while (exit_code.has_value() == false) {
            if (policy.cancel_requested()) {
                terminate_child(child.pid, config_.terminate_grace);
                return fail(ErrorCode::Cancelled, "cancelled by user");
            }

            const auto now = Clock::now();
            if (now >= deadline) {
                MCPCALL_LOG_WARN(std::format("[{}] '{}' timed out, terminating pid {}",
                                             service.name, command->command, child.pid));
                terminate_child(child.pid, config_.terminate_grace);
                return fail(ErrorCode::Timeout, std::format("process produced no reply within {}s",
                    std::chrono::duration_cast<std::chrono::seconds>(policy.timeout).count()));
            }

            const auto slice = std::min(std::chrono::duration_cast<Millis>(deadline - now), policy.poll_interval);
            const bool pipes_open = (out.done == false) || (err.done == false);
            if (pipes_open) {
                io.run_for(slice);
                if (io.stopped()) {
                    io.restart();
                }
            } else {
                std::this_thread::sleep_for(std::min(slice, Millis{10}));
            }

            if (out.overflow) {
                terminate_child(child.pid, config_.terminate_grace);
                return fail(ErrorCode::ResponseTooLarge,
                            std::format("process output exceeds the {} byte limit", config_.max_output_bytes));
            }

            if ((out.done == false) || (err.done == false)) {
                continue;
            }
            exit_code = try_reap(child.pid);
        }

        const int code = *exit_code;
        const std::string stderr_text{trim_ascii(err.data)};
        const std::string_view stdout_text = trim_ascii(out.data);

        trace_->trace(service.name, transport, "result", std::format("exit {}", code),
                      Json{{"exitCode", code}, {"stdoutBytes", out.data.size()}, {"stderrBytes", err.data.size()}});

        if ((code != 0) && (stderr_text.empty() == false)) {
            return fail(ErrorCode::StdioProcessFailed,
                        std::format("process exited with code {}: {}", code, stderr_text));
        }
        if (stdout_text.empty()) {
            return fail(ErrorCode::StdioNoOutput, std::format("process exited with code {} without output", code));
        }

        auto reply = pick_reply(out.data, envelope.id());
        if (reply.has_value() == false) {
            return fail(ErrorCode::StdioInvalidJson, "process output holds no JSON reply to this request");
        }
        return result_from_reply(*reply, service.name, transport);
    } catch (const std::exception& e) {
        if (try_reap(child.pid).has_value() == false) {
            terminate_child(child.pid, config_.terminate_grace);
        }
        MCPCALL_LOG_ERROR(std::format("[{}] stdio call failed internally: {}", service.name, e.what()));
        return fail(ErrorCode::InternalError, e.what());
    }
}

}  // namespace mcpcall
