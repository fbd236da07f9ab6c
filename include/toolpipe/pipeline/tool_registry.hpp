#pragma once

#include "toolpipe/core/result.hpp"
#include "toolpipe/core/types.hpp"
#include "cache_policy.hpp"
#include "output_level.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolpipe::pipeline {

using namespace toolpipe::core;

// Underlying tool implementation: parameters in, raw value out.
// Failures are reported by throwing.
using ToolFunction = std::function<Json(const Json& parameters)>;

// Static description of a tool
struct ToolSpec {
    std::string name;
    std::string version = "1.0.0";
    std::string description;
    std::optional<CachePolicy> cache_policy;  // nullopt: policy table decides
    int timeout_ms = 30000;
    std::optional<OutputLevel> output_level;

    Json to_json() const;
};

struct RegisteredTool {
    ToolSpec spec;
    ToolFunction handler;
    bool enabled = true;
};

// Name -> tool table supplied by the skills layer
class ToolRegistry {
public:
    ToolRegistry() = default;
    explicit ToolRegistry(CachePolicyTable policies);

    Result<void, Error> register_tool(const ToolSpec& spec, ToolFunction handler);
    Result<void, Error> unregister_tool(const ToolId& id);

    bool has_tool(const ToolId& id) const;
    std::optional<ToolSpec> get_spec(const ToolId& id) const;

    // ToolNotFound or ToolDisabled when the tool cannot run
    Result<ToolFunction, Error> get_handler(const ToolId& id) const;

    Result<void, Error> enable_tool(const ToolId& id);
    Result<void, Error> disable_tool(const ToolId& id);
    bool is_enabled(const ToolId& id) const;

    // ToolSpec policy if set, else the policy table
    CachePolicy cache_policy_for(const ToolId& id) const;

    std::vector<std::string> names() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ToolId, RegisteredTool> tools_;
    CachePolicyTable policies_;
};

}  // namespace toolpipe::pipeline
