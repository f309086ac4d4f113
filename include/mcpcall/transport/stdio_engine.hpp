#pragma once

#include "mcpcall/trace/trace_sink.hpp"
#include "mcpcall/transport/transport_engine.hpp"

#include <cstddef>
#include <memory>

namespace mcpcall {

struct StdioEngineConfig {
    // stdout beyond this kills the child and fails with RESPONSE_TOO_LARGE
    std::size_t max_output_bytes{1024 * 1024};

    // stderr is kept up to this size for error messages; the rest is drained
    std::size_t max_stderr_bytes{64 * 1024};

    // Between SIGTERM and SIGKILL when a child has to be stopped
    Millis terminate_grace{500};
};

// ─────────────────────────────────────────────────────────────────────────────
// StdioEngine
// ─────────────────────────────────────────────────────────────────────────────
// One child process per call. The envelope is written to the child's stdin
// as a single line and stdin is closed; stdout and stderr are drained until
// the child exits or the timeout fires, in which case it is terminated.
//
// stdout is read as newline-delimited JSON: the line whose id matches the
// envelope is the reply, otherwise the last JSON line that has no id. A line
// answering another id is never taken as the reply.
//
// SIGPIPE is blocked on the calling thread while a call runs, so a child that
// exits without reading stdin shows up as EPIPE on the write. The process
// signal disposition is left as the application set it.

class StdioEngine final : public ITransportEngine {
public:
    explicit StdioEngine(StdioEngineConfig config = {}, std::shared_ptr<ITraceSink> trace = nullptr);

    [[nodiscard]] CallResult call(
        const ServiceConfig& service,
        const JsonRpcRequest& envelope,
        const CallPolicy& policy
    ) override;

private:
    StdioEngineConfig config_;
    std::shared_ptr<ITraceSink> trace_;
};

}  // namespace mcpcall
