#include "toolpipe/pipeline/timeout.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace toolpipe::pipeline {

namespace detail {

Error error_from_exception(std::exception_ptr error, const std::string& tool_call_id) {
    Error result{ErrorCode::ToolExecutionFailed};
    result.source = tool_call_id;

    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        result.message = e.what();
        result.context = exception_kind(e);
    } catch (...) {
        result.message = "Tool raised a non-standard exception";
        result.context = "unknown";
    }

    return result;
}

std::shared_ptr<spdlog::logger> late_completion_logger() {
    return spdlog::default_logger();
}

void log_late_completion(const std::shared_ptr<spdlog::logger>& logger,
                         const std::string& tool_call_id, bool failed) {
    if (!logger) {
        return;
    }
    logger->warn("Discarding late {} from timed-out tool call {}",
                 failed ? "failure" : "result", tool_call_id);
}

}  // namespace detail

std::string TimeoutIsolator::describe_success(const Json& value) {
    if (value.is_null()) {
        return "Success (no output)";
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_object()) {
        return "Success: " + std::to_string(value.size()) + " fields returned";
    }
    if (value.is_array()) {
        return "Success: " + std::to_string(value.size()) + " items returned";
    }
    return std::string("Success: ") + value.type_name();
}

ToolExecutionResult TimeoutIsolator::safe_execute(std::function<Json()> fn,
                                                  const std::string& tool_call_id,
                                                  Duration timeout,
                                                  const std::string& tool_name) {
    auto start = std::chrono::steady_clock::now();
    auto outcome = execute_with_timeout<Json>(std::move(fn), tool_call_id, timeout);
    auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);

    if (outcome.is_ok()) {
        auto result = ToolExecutionResult::make_success(tool_call_id, tool_name,
                                                        describe_success(outcome.value()));
        return result.with_duration(elapsed.count());
    }

    const Error& error = outcome.error();
    if (error.code == ErrorCode::ToolTimeout) {
        spdlog::warn("Tool {} ({}) timed out after {}ms", tool_name, tool_call_id, timeout.count());
        return ToolExecutionResult::make_timeout(tool_call_id, tool_name, timeout.count())
            .with_duration(elapsed.count());
    }

    spdlog::error("Tool {} ({}) failed: {}", tool_name, tool_call_id, error.full_message());
    return ToolExecutionResult::from_error(tool_call_id, tool_name, error)
        .with_duration(elapsed.count());
}

}  // namespace toolpipe::pipeline
