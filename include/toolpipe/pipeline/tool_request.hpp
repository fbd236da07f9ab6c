#pragma once

#include "toolpipe/core/config.hpp"
#include "toolpipe/core/result.hpp"
#include "toolpipe/core/types.hpp"
#include "cache_policy.hpp"
#include "output_level.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace toolpipe::pipeline {

using namespace toolpipe::core;

namespace fs = std::filesystem;

inline constexpr int kMinTimeoutMs = 100;
inline constexpr int kMaxTimeoutMs = 600000;

// md5(tool:version:params:caller:permission), params serialized with sorted keys
std::string compute_idempotency_key(std::string_view tool_name,
                                    std::string_view tool_version,
                                    const Json& parameters,
                                    std::string_view caller_id,
                                    std::string_view permission_level);

// One tool invocation as requested by the agent loop
struct ToolInvocationRequest {
    std::string tool_call_id;  // from the LLM tool-call event
    std::string tool_name;
    std::string tool_version = "1.0.0";
    Json parameters = Json::object();
    std::optional<OutputLevel> output_level;  // nullopt: pick from data size
    int timeout_ms = 30000;
    bool retry_on_timeout = true;
    int max_retries = 3;
    std::optional<fs::path> storage_dir;
    CachePolicy cache_policy = CachePolicy::NoCache;
    std::string caller_id = "agent";
    std::string permission_level = "default";
    std::optional<std::string> idempotency_key_override;

    // Build from an LLM tool call using configured defaults
    static ToolInvocationRequest from_tool_call(const ToolCall& call,
                                                const PipelineConfig& config,
                                                CachePolicy policy);

    Result<void, Error> validate() const;

    // Cache key for this request; the tool_call_id never contributes.
    // Uncacheable requests get a unique key so they can never collide.
    std::string idempotency_key() const;

    Duration timeout() const { return Duration{timeout_ms}; }

    OutputLevel resolve_output_level(size_t data_size_bytes) const;

    // Retries are only for timeouts and only while attempts remain
    bool should_retry(int current_retry, std::string_view error_type) const;

    Json to_debug_json() const;
};

}  // namespace toolpipe::pipeline
