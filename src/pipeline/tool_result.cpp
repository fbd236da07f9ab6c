#include "toolpipe/pipeline/tool_result.hpp"

namespace toolpipe::pipeline {

ToolExecutionResult ToolExecutionResult::make_success(std::string tool_call_id,
                                                      std::string tool_name,
                                                      std::string observation,
                                                      OutputLevel level) {
    ToolExecutionResult result;
    result.tool_call_id = std::move(tool_call_id);
    result.tool_name = std::move(tool_name);
    result.observation = std::move(observation);
    result.output_level = level;
    result.success = true;
    result.created_at = unix_now();
    return result;
}

ToolExecutionResult ToolExecutionResult::make_error(std::string tool_call_id,
                                                    std::string tool_name,
                                                    const std::string& message,
                                                    std::string error_type,
                                                    std::optional<std::string> error_code) {
    ToolExecutionResult result;
    result.tool_call_id = std::move(tool_call_id);
    result.tool_name = std::move(tool_name);
    result.observation = "Error: " + message;
    result.output_level = OutputLevel::Brief;
    result.success = false;
    result.error_message = message;
    result.error_type = std::move(error_type);
    result.error_code = std::move(error_code);
    result.last_error = message;
    result.created_at = unix_now();
    return result;
}

ToolExecutionResult ToolExecutionResult::make_timeout(std::string tool_call_id,
                                                      std::string tool_name,
                                                      int64_t timeout_ms) {
    return make_error(std::move(tool_call_id), std::move(tool_name),
                      "Tool execution timed out after " + std::to_string(timeout_ms) + "ms",
                      "timeout", "TIMEOUT");
}

ToolExecutionResult ToolExecutionResult::from_error(std::string tool_call_id,
                                                    std::string tool_name,
                                                    const Error& error) {
    return make_error(std::move(tool_call_id), std::move(tool_name), error.message,
                      error_type_for(error), std::to_string(static_cast<int>(error.code)));
}

ToolExecutionResult ToolExecutionResult::with_retry(const std::string& error) const {
    ToolExecutionResult copy = *this;
    copy.retry_count = retry_count + 1;
    copy.last_error = error;
    return copy;
}

ToolExecutionResult ToolExecutionResult::with_duration(int64_t ms) const {
    ToolExecutionResult copy = *this;
    copy.duration_ms = ms;
    return copy;
}

ToolMessage ToolExecutionResult::to_tool_message() const {
    return ToolMessage{
        .tool_call_id = tool_call_id,
        .content = observation,
        .is_error = !success
    };
}

Json ToolExecutionResult::to_json() const {
    Json j{
        {"tool_call_id", tool_call_id},
        {"tool_name", tool_name},
        {"observation", observation},
        {"output_level", std::string(output_level_to_string(output_level))},
        {"data_size_bytes", data_size_bytes},
        {"data_hash", data_hash},
        {"duration_ms", duration_ms},
        {"retry_count", retry_count},
        {"success", success},
        {"cache_policy", std::string(cache_policy_to_string(cache_policy))},
        {"idempotency_key", idempotency_key},
        {"created_at", created_at},
        {"expires_at", expires_at},
        {"metadata", metadata}
    };

    if (artifact_id) j["artifact_id"] = *artifact_id;
    if (data_summary) j["data_summary"] = *data_summary;
    if (last_error) j["last_error"] = *last_error;
    if (error_code) j["error_code"] = *error_code;
    if (error_type) j["error_type"] = *error_type;
    if (error_message) j["error_message"] = *error_message;

    return j;
}

ToolExecutionResult ToolExecutionResult::from_json(const Json& j) {
    ToolExecutionResult result;
    result.tool_call_id = j.value("tool_call_id", "");
    result.tool_name = j.value("tool_name", "");
    result.observation = j.value("observation", "");
    result.output_level = output_level_from_string(j.value("output_level", "standard"))
                              .value_or(OutputLevel::Standard);
    result.data_size_bytes = j.value("data_size_bytes", size_t{0});
    result.data_hash = j.value("data_hash", "");
    result.duration_ms = j.value("duration_ms", int64_t{0});
    result.retry_count = j.value("retry_count", 0);
    result.success = j.value("success", true);
    auto policy = cache_policy_from_string(j.value("cache_policy", "no_cache"));
    result.cache_policy = policy.unwrap_or(CachePolicy::NoCache);
    result.idempotency_key = j.value("idempotency_key", "");
    result.created_at = j.value("created_at", 0.0);
    result.expires_at = j.value("expires_at", 0.0);
    result.metadata = j.value("metadata", Json::object());

    if (j.contains("artifact_id")) result.artifact_id = j["artifact_id"].get<std::string>();
    if (j.contains("data_summary")) result.data_summary = j["data_summary"].get<std::string>();
    if (j.contains("last_error")) result.last_error = j["last_error"].get<std::string>();
    if (j.contains("error_code")) result.error_code = j["error_code"].get<std::string>();
    if (j.contains("error_type")) result.error_type = j["error_type"].get<std::string>();
    if (j.contains("error_message")) result.error_message = j["error_message"].get<std::string>();

    return result;
}

}  // namespace toolpipe::pipeline
