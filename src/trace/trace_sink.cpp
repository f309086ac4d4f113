#include "mcpcall/trace/trace_sink.hpp"
#include "mcpcall/client/call_result.hpp"
#include "mcpcall/log/logger.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <atomic>
#include <exception>

namespace mcpcall {

Json TraceRecord::to_json() const {
    Json line = Json::object();
    line["timestamp"] = format_utc_timestamp(timestamp);
    line["service"] = service;
    line["transport"] = transport;
    line["stage"] = stage;
    line["message"] = message;
    line["metadata"] = metadata.is_null() ? Json::object() : metadata;
    return line;
}

void ITraceSink::trace(std::string service,
                       std::string transport,
                       std::string stage,
                       std::string message,
                       Json metadata) noexcept {
    TraceRecord record;
    record.service = std::move(service);
    record.transport = std::move(transport);
    record.stage = std::move(stage);
    record.message = std::move(message);
    record.metadata = std::move(metadata);
    trace(record);
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonlTraceSink
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::string next_trace_logger_name() {
    static std::atomic<std::uint64_t> counter{0};
    return "mcpcall_trace_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

}  // namespace

JsonlTraceSink::JsonlTraceSink(spdlog::sink_ptr sink)
    : logger_(std::make_shared<spdlog::logger>(next_trace_logger_name(), std::move(sink)))
{
    logger_->set_pattern("%v");
    logger_->set_level(spdlog::level::info);
    logger_->flush_on(spdlog::level::info);
    logger_->set_error_handler([](const std::string& message) {
        MCPCALL_LOG_WARN("trace sink write failed: " + message);
    });
}

void JsonlTraceSink::trace(const TraceRecord& record) noexcept {
    try {
        // replace: payload text from services is not guaranteed to be UTF-8
        const std::string line = record.to_json().dump(-1, ' ', false, Json::error_handler_t::replace);
        logger_->info("{}", line);
    } catch (const std::exception& e) {
        get_logger().logf(LogLevel::Warn, "trace record dropped: {}", e.what());
    }
}

void JsonlTraceSink::flush() noexcept {
    try {
        logger_->flush();
    } catch (const std::exception& e) {
        get_logger().logf(LogLevel::Warn, "trace flush failed: {}", e.what());
    }
}

tl::expected<std::shared_ptr<JsonlTraceSink>, std::string> make_jsonl_trace_sink(const std::string& path) {
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        return std::make_shared<JsonlTraceSink>(std::move(sink));
    } catch (const spdlog::spdlog_ex& e) {
        return tl::unexpected(std::string(e.what()));
    }
}

}  // namespace mcpcall
