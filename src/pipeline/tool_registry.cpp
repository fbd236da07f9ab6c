#include "toolpipe/pipeline/tool_registry.hpp"

#include <algorithm>

namespace toolpipe::pipeline {

Json ToolSpec::to_json() const {
    Json j{
        {"name", name},
        {"version", version},
        {"description", description},
        {"timeout_ms", timeout_ms}
    };
    if (cache_policy) {
        j["cache_policy"] = std::string(cache_policy_to_string(*cache_policy));
    }
    if (output_level) {
        j["output_level"] = std::string(output_level_to_string(*output_level));
    }
    return j;
}

ToolRegistry::ToolRegistry(CachePolicyTable policies)
    : policies_(std::move(policies))
{
}

Result<void, Error> ToolRegistry::register_tool(const ToolSpec& spec, ToolFunction handler) {
    if (spec.name.empty() || !handler) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Tool needs a name and a handler",
            spec.name
        );
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (tools_.count(spec.name)) {
        return Result<void, Error>::err(
            ErrorCode::AlreadyExists,
            "Tool already registered",
            spec.name
        );
    }

    tools_[spec.name] = RegisteredTool{
        .spec = spec,
        .handler = std::move(handler),
        .enabled = true
    };
    return Result<void, Error>::ok();
}

Result<void, Error> ToolRegistry::unregister_tool(const ToolId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!tools_.count(id)) {
        return Result<void, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
    }

    tools_.erase(id);
    return Result<void, Error>::ok();
}

bool ToolRegistry::has_tool(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(id) > 0;
}

std::optional<ToolSpec> ToolRegistry::get_spec(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return std::nullopt;
    }
    return it->second.spec;
}

Result<ToolFunction, Error> ToolRegistry::get_handler(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return Result<ToolFunction, Error>::err(ErrorCode::ToolNotFound, "Tool not found: " + id, id);
    }
    if (!it->second.enabled) {
        return Result<ToolFunction, Error>::err(ErrorCode::ToolDisabled, "Tool is disabled: " + id, id);
    }
    return Result<ToolFunction, Error>::ok(it->second.handler);
}

Result<void, Error> ToolRegistry::enable_tool(const ToolId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return Result<void, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
    }

    it->second.enabled = true;
    return Result<void, Error>::ok();
}

Result<void, Error> ToolRegistry::disable_tool(const ToolId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return Result<void, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
    }

    it->second.enabled = false;
    return Result<void, Error>::ok();
}

bool ToolRegistry::is_enabled(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    return it != tools_.end() && it->second.enabled;
}

CachePolicy ToolRegistry::cache_policy_for(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it != tools_.end() && it->second.spec.cache_policy) {
        return *it->second.spec.cache_policy;
    }
    return policies_.lookup(id);
}

std::vector<std::string> ToolRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    result.reserve(tools_.size());
    for (const auto& [id, tool] : tools_) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

}  // namespace toolpipe::pipeline
