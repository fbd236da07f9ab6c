#include "toolpipe/pipeline/tool_request.hpp"

#include "toolpipe/core/digest.hpp"
#include "toolpipe/core/uuid.hpp"

#include <algorithm>
#include <cctype>

namespace toolpipe::pipeline {

std::string compute_idempotency_key(std::string_view tool_name,
                                    std::string_view tool_version,
                                    const Json& parameters,
                                    std::string_view caller_id,
                                    std::string_view permission_level) {
    // Json objects are key-ordered, so dump() is already canonical
    std::string material;
    material.append(tool_name).append(":");
    material.append(tool_version).append(":");
    material.append(parameters.dump(-1, ' ', false, Json::error_handler_t::replace)).append(":");
    material.append(caller_id).append(":");
    material.append(permission_level);
    return md5_hex(material);
}

ToolInvocationRequest ToolInvocationRequest::from_tool_call(const ToolCall& call,
                                                            const PipelineConfig& config,
                                                            CachePolicy policy) {
    ToolInvocationRequest request;
    request.tool_call_id = call.id;
    request.tool_name = call.tool_name;
    request.tool_version = config.default_tool_version;
    request.parameters = call.arguments.is_null() ? Json::object() : call.arguments;
    request.timeout_ms = config.default_timeout_ms;
    request.retry_on_timeout = config.retry_on_timeout;
    request.max_retries = config.max_retries;
    request.cache_policy = policy;
    request.caller_id = config.caller_id;
    request.permission_level = config.permission_level;
    return request;
}

Result<void, Error> ToolInvocationRequest::validate() const {
    bool blank = std::all_of(tool_call_id.begin(), tool_call_id.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (tool_call_id.empty() || blank) {
        return Result<void, Error>::err(
            ErrorCode::InvalidToolCallId,
            "tool_call_id must be a non-empty string",
            tool_name
        );
    }

    if (tool_name.empty()) {
        return Result<void, Error>::err(
            ErrorCode::ValidationFailed,
            "tool_name must not be empty",
            tool_call_id
        );
    }

    if (timeout_ms < kMinTimeoutMs || timeout_ms > kMaxTimeoutMs) {
        return Result<void, Error>::err(
            ErrorCode::InvalidTimeout,
            "timeout_ms must be between 100 and 600000, got " + std::to_string(timeout_ms),
            tool_name
        );
    }

    if (!parameters.is_object()) {
        return Result<void, Error>::err(
            ErrorCode::InvalidParameters,
            "parameters must be a JSON object",
            tool_name
        );
    }

    if (max_retries < 0) {
        return Result<void, Error>::err(
            ErrorCode::ValidationFailed,
            "max_retries must not be negative",
            tool_name
        );
    }

    return Result<void, Error>::ok();
}

std::string ToolInvocationRequest::idempotency_key() const {
    if (idempotency_key_override) {
        return *idempotency_key_override;
    }

    if (!is_cacheable(cache_policy)) {
        return "uncacheable:" + UUID::generate().to_string();
    }

    return compute_idempotency_key(tool_name, tool_version, parameters,
                                   caller_id, permission_level);
}

OutputLevel ToolInvocationRequest::resolve_output_level(size_t data_size_bytes) const {
    if (output_level) {
        return *output_level;
    }
    return output_level_from_size(data_size_bytes);
}

bool ToolInvocationRequest::should_retry(int current_retry, std::string_view error_type) const {
    return current_retry < max_retries
        && error_type == "timeout"
        && retry_on_timeout;
}

Json ToolInvocationRequest::to_debug_json() const {
    Json j{
        {"tool_call_id", tool_call_id},
        {"tool_name", tool_name},
        {"tool_version", tool_version},
        {"parameters", parameters},
        {"timeout_ms", timeout_ms},
        {"retry_on_timeout", retry_on_timeout},
        {"max_retries", max_retries},
        {"cache_policy", std::string(cache_policy_to_string(cache_policy))},
        {"caller_id", caller_id},
        {"permission_level", permission_level}
    };
    if (output_level) {
        j["output_level"] = std::string(output_level_to_string(*output_level));
    }
    if (storage_dir) {
        j["storage_dir"] = storage_dir->string();
    }
    return j;
}

}  // namespace toolpipe::pipeline
