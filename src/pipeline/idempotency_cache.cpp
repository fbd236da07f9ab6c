#include "toolpipe/pipeline/idempotency_cache.hpp"

#include "toolpipe/pipeline/tool_request.hpp"

#include <spdlog/spdlog.h>

namespace toolpipe::pipeline {

IdempotencyCache::IdempotencyCache(size_t max_size, int default_ttl_seconds, ClockFn clock)
    : TTLCache<ToolExecutionResult>(max_size, default_ttl_seconds, std::move(clock))
{
}

std::string IdempotencyCache::make_key(const std::string& tool_name,
                                       const std::string& tool_version,
                                       const Json& parameters,
                                       const std::string& caller_id,
                                       const std::string& permission_level) {
    return compute_idempotency_key(tool_name, tool_version, parameters, caller_id, permission_level);
}

ToolExecutionResult IdempotencyCache::get_or_compute(const std::string& tool_name,
                                                     const std::string& tool_version,
                                                     const Json& parameters,
                                                     const ComputeFn& compute_fn,
                                                     CachePolicy policy,
                                                     const std::string& caller_id,
                                                     const std::string& permission_level) {
    if (!is_cacheable(policy)) {
        ToolExecutionResult result = compute_fn();
        result.cache_policy = policy;
        result.metadata["cache_hit"] = false;
        return result;
    }

    std::string key = make_key(tool_name, tool_version, parameters, caller_id, permission_level);

    if (auto cached = get(key)) {
        // The stored entry stays as it was; only the copy is annotated
        ToolExecutionResult hit = std::move(*cached);
        hit.metadata["cache_hit"] = true;
        hit.metadata["cached_at"] = now();
        spdlog::debug("Cache hit for {} ({})", tool_name, key);
        return hit;
    }

    ToolExecutionResult result = compute_fn();
    result.cache_policy = policy;
    result.idempotency_key = key;
    result.expires_at = expiration_timestamp(policy, now());
    result.metadata["cache_hit"] = false;

    if (result.success) {
        try {
            // TTL 0 for Cacheable keeps the entry until evicted
            set(key, result, ttl_seconds(policy));
        } catch (const std::exception& e) {
            spdlog::warn("Failed to cache result for {}: {}", tool_name, e.what());
        }
    }

    return result;
}

bool IdempotencyCache::invalidate(const std::string& tool_name,
                                  const std::string& tool_version,
                                  const Json& parameters,
                                  const std::string& caller_id,
                                  const std::string& permission_level) {
    return remove(make_key(tool_name, tool_version, parameters, caller_id, permission_level));
}

size_t IdempotencyCache::invalidate_tool(const std::string& tool_name) {
    size_t removed = remove_if([&](const CacheEntry<ToolExecutionResult>& entry) {
        return entry.value.tool_name == tool_name;
    });
    if (removed > 0) {
        spdlog::info("Invalidated {} cached results for {}", removed, tool_name);
    }
    return removed;
}

}  // namespace toolpipe::pipeline
