#pragma once

#include "toolpipe/core/config.hpp"
#include "toolpipe/core/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace toolpipe::pipeline {

using namespace toolpipe::core;

// How long a tool result may be reused
enum class CachePolicy {
    NoCache,    // side effects or non-deterministic output
    Cacheable,  // deterministic, kept until evicted
    TtlShort,   // 5 minutes
    TtlMedium,  // 1 hour
    TtlLong     // 24 hours
};

inline std::string_view cache_policy_to_string(CachePolicy policy) {
    switch (policy) {
        case CachePolicy::NoCache: return "no_cache";
        case CachePolicy::Cacheable: return "cacheable";
        case CachePolicy::TtlShort: return "ttl_short";
        case CachePolicy::TtlMedium: return "ttl_medium";
        case CachePolicy::TtlLong: return "ttl_long";
    }
    return "no_cache";
}

Result<CachePolicy, Error> cache_policy_from_string(std::string_view name);

inline bool is_cacheable(CachePolicy policy) {
    return policy != CachePolicy::NoCache;
}

// 0 means "never expires" for Cacheable and "never stored" for NoCache
inline int ttl_seconds(CachePolicy policy) {
    switch (policy) {
        case CachePolicy::TtlShort: return 300;
        case CachePolicy::TtlMedium: return 3600;
        case CachePolicy::TtlLong: return 86400;
        case CachePolicy::NoCache:
        case CachePolicy::Cacheable:
            return 0;
    }
    return 0;
}

std::string_view cache_policy_description(CachePolicy policy);

// Unix time at which an entry created at created_at expires, 0 for never
inline double expiration_timestamp(CachePolicy policy, double created_at) {
    int ttl = ttl_seconds(policy);
    return ttl > 0 ? created_at + ttl : 0.0;
}

inline bool is_expired(CachePolicy policy, double created_at, double now) {
    int ttl = ttl_seconds(policy);
    return ttl > 0 && now > created_at + ttl;
}

// Built-in policy for well-known tool names; NoCache for anything else
CachePolicy default_cache_policy(std::string_view tool_name);

// Built-in presets plus per-tool overrides from configuration
class CachePolicyTable {
public:
    CachePolicyTable() = default;
    explicit CachePolicyTable(const CacheConfig& config);

    CachePolicy lookup(std::string_view tool_name) const;
    void set(const std::string& tool_name, CachePolicy policy);

    size_t override_count() const { return overrides_.size(); }

private:
    std::map<std::string, CachePolicy, std::less<>> overrides_;
};

}  // namespace toolpipe::pipeline
