#include "toolpipe/pipeline/cache_policy.hpp"

#include <spdlog/spdlog.h>

namespace toolpipe::pipeline {

namespace {

struct PolicyPreset {
    std::string_view tool;
    CachePolicy policy;
};

constexpr PolicyPreset kPresets[] = {
    // Read-only lookups
    {"web_search", CachePolicy::TtlMedium},
    {"query_database", CachePolicy::TtlShort},
    {"file_reader", CachePolicy::Cacheable},
    {"vector_search", CachePolicy::TtlShort},
    {"api_get", CachePolicy::TtlMedium},

    // Side effects
    {"file_write", CachePolicy::NoCache},
    {"execute_command", CachePolicy::NoCache},
    {"database_write", CachePolicy::NoCache},
    {"api_post", CachePolicy::NoCache},
    {"api_delete", CachePolicy::NoCache},

    // Derived data that goes stale quickly
    {"analyze_data", CachePolicy::TtlShort},
    {"generate_report", CachePolicy::TtlShort},
};

}  // namespace

Result<CachePolicy, Error> cache_policy_from_string(std::string_view name) {
    if (name == "no_cache") return Result<CachePolicy, Error>::ok(CachePolicy::NoCache);
    if (name == "cacheable") return Result<CachePolicy, Error>::ok(CachePolicy::Cacheable);
    if (name == "ttl_short") return Result<CachePolicy, Error>::ok(CachePolicy::TtlShort);
    if (name == "ttl_medium") return Result<CachePolicy, Error>::ok(CachePolicy::TtlMedium);
    if (name == "ttl_long") return Result<CachePolicy, Error>::ok(CachePolicy::TtlLong);

    return Result<CachePolicy, Error>::err(
        ErrorCode::InvalidArgument,
        "Unknown cache policy",
        std::string(name)
    );
}

std::string_view cache_policy_description(CachePolicy policy) {
    switch (policy) {
        case CachePolicy::NoCache: return "Not cached (side effects or non-deterministic)";
        case CachePolicy::Cacheable: return "Cached indefinitely (deterministic)";
        case CachePolicy::TtlShort: return "Cached for 5 minutes";
        case CachePolicy::TtlMedium: return "Cached for 1 hour";
        case CachePolicy::TtlLong: return "Cached for 24 hours";
    }
    return "Unknown";
}

CachePolicy default_cache_policy(std::string_view tool_name) {
    for (const auto& preset : kPresets) {
        if (preset.tool == tool_name) {
            return preset.policy;
        }
    }
    return CachePolicy::NoCache;
}

CachePolicyTable::CachePolicyTable(const CacheConfig& config) {
    for (const auto& [tool, name] : config.policies) {
        auto policy = cache_policy_from_string(name);
        if (policy.is_err()) {
            spdlog::warn("Ignoring cache policy '{}' for tool {}", name, tool);
            continue;
        }
        overrides_[tool] = policy.value();
    }
}

CachePolicy CachePolicyTable::lookup(std::string_view tool_name) const {
    auto it = overrides_.find(tool_name);
    if (it != overrides_.end()) {
        return it->second;
    }
    return default_cache_policy(tool_name);
}

void CachePolicyTable::set(const std::string& tool_name, CachePolicy policy) {
    overrides_[tool_name] = policy;
}

}  // namespace toolpipe::pipeline
