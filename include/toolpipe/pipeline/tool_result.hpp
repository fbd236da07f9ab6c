#pragma once

#include "toolpipe/core/errors.hpp"
#include "toolpipe/core/types.hpp"
#include "cache_policy.hpp"
#include "output_level.hpp"

#include <optional>
#include <string>

namespace toolpipe::pipeline {

using namespace toolpipe::core;

// Outcome of one tool invocation. Only `observation` is ever shown to the LLM.
struct ToolExecutionResult {
    std::string tool_call_id;
    std::string tool_name;
    std::string observation;
    OutputLevel output_level = OutputLevel::Standard;

    // Set when the payload was offloaded; the store keeps the real path
    std::optional<std::string> artifact_id;

    size_t data_size_bytes = 0;
    std::string data_hash;
    std::optional<std::string> data_summary;

    int64_t duration_ms = 0;
    int retry_count = 0;
    std::optional<std::string> last_error;

    bool success = true;
    std::optional<std::string> error_code;
    std::optional<std::string> error_type;
    std::optional<std::string> error_message;

    CachePolicy cache_policy = CachePolicy::NoCache;
    std::string idempotency_key;
    double created_at = 0.0;
    double expires_at = 0.0;  // 0: never

    Json metadata = Json::object();

    // Factories
    static ToolExecutionResult make_success(std::string tool_call_id, std::string tool_name,
                                            std::string observation,
                                            OutputLevel level = OutputLevel::Standard);

    static ToolExecutionResult make_error(std::string tool_call_id, std::string tool_name,
                                          const std::string& message,
                                          std::string error_type,
                                          std::optional<std::string> error_code = std::nullopt);

    static ToolExecutionResult make_timeout(std::string tool_call_id, std::string tool_name,
                                            int64_t timeout_ms);

    // Error result from a pipeline error value
    static ToolExecutionResult from_error(std::string tool_call_id, std::string tool_name,
                                          const Error& error);

    bool is_expired(double now) const {
        return expires_at > 0.0 && now > expires_at;
    }

    double cache_age_seconds(double now) const { return now - created_at; }

    bool cache_hit() const { return metadata.value("cache_hit", false); }

    // Copies with one aspect changed
    ToolExecutionResult with_retry(const std::string& error) const;
    ToolExecutionResult with_duration(int64_t ms) const;

    // Reply message for the LLM, correlated by tool_call_id
    ToolMessage to_tool_message() const;

    Json to_json() const;
    static ToolExecutionResult from_json(const Json& j);
};

}  // namespace toolpipe::pipeline
