#pragma once

#include "toolpipe/core/result.hpp"
#include "toolpipe/core/types.hpp"
#include "tool_result.hpp"

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace spdlog {
class logger;
}

namespace toolpipe::pipeline {

using namespace toolpipe::core;

namespace detail {

// Shared between the caller and the worker; outlives whichever finishes first
template<typename T>
struct TimeoutState {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<T> value;
    std::exception_ptr error;
    bool done = false;
    bool abandoned = false;
};

Error error_from_exception(std::exception_ptr error, const std::string& tool_call_id);

// Workers hold their own reference so late reports survive logger teardown
std::shared_ptr<spdlog::logger> late_completion_logger();
void log_late_completion(const std::shared_ptr<spdlog::logger>& logger,
                         const std::string& tool_call_id, bool failed);

}  // namespace detail

// Bounded-time execution of tool functions.
//
// The function runs on its own detached thread. When the deadline passes
// the caller gets ErrorCode::ToolTimeout and moves on; the worker is not
// interrupted and may still finish (and cause side effects) later. Its late
// result is logged and discarded.
class TimeoutIsolator {
public:
    template<typename T>
    static Result<T, Error> execute_with_timeout(std::function<T()> fn,
                                                 const std::string& tool_call_id,
                                                 Duration timeout);

    // Never throws: timeouts and exceptions become error results
    static ToolExecutionResult safe_execute(std::function<Json()> fn,
                                            const std::string& tool_call_id,
                                            Duration timeout,
                                            const std::string& tool_name = "unknown");

    // Observation used by safe_execute for successful calls
    static std::string describe_success(const Json& value);
};

template<typename T>
Result<T, Error> TimeoutIsolator::execute_with_timeout(std::function<T()> fn,
                                                       const std::string& tool_call_id,
                                                       Duration timeout) {
    auto state = std::make_shared<detail::TimeoutState<T>>();

    try {
        std::thread worker([state, fn = std::move(fn), tool_call_id,
                            logger = detail::late_completion_logger()]() {
            std::optional<T> value;
            std::exception_ptr error;
            try {
                value.emplace(fn());
            } catch (...) {
                error = std::current_exception();
            }

            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->abandoned) {
                detail::log_late_completion(logger, tool_call_id, error != nullptr);
                return;
            }
            state->value = std::move(value);
            state->error = error;
            state->done = true;
            state->cv.notify_one();
        });
        worker.detach();
    } catch (const std::system_error& e) {
        return Result<T, Error>::err(
            ErrorCode::InternalError,
            std::string("Failed to start tool worker: ") + e.what(),
            tool_call_id
        );
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    if (!state->cv.wait_for(lock, timeout, [&state] { return state->done; })) {
        state->abandoned = true;
        return Result<T, Error>::err(
            ErrorCode::ToolTimeout,
            "Tool execution timed out after " + std::to_string(timeout.count()) + "ms",
            tool_call_id
        );
    }

    if (state->error) {
        return Result<T, Error>::err(detail::error_from_exception(state->error, tool_call_id));
    }

    if (!state->value) {
        return Result<T, Error>::err(
            ErrorCode::ToolExecutionFailed,
            "Tool finished without producing a result",
            tool_call_id
        );
    }

    return Result<T, Error>::ok(std::move(*state->value));
}

}  // namespace toolpipe::pipeline
