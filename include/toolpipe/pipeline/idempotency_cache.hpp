#pragma once

#include "toolpipe/core/types.hpp"
#include "cache_policy.hpp"
#include "tool_result.hpp"

#include <algorithm>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolpipe::pipeline {

using namespace toolpipe::core;

template<typename V>
struct CacheEntry {
    std::string key;
    V value;
    double created_at = 0.0;
    double expires_at = 0.0;  // 0: never
    int hit_count = 0;

    bool is_expired(double now) const {
        return expires_at > 0.0 && now > expires_at;
    }
};

struct CacheStats {
    size_t size = 0;
    size_t max_size = 0;
    int64_t total_hits = 0;
    size_t expired_count = 0;
    Json entries = Json::array();  // newest 10

    Json to_json() const {
        return Json{
            {"size", size},
            {"max_size", max_size},
            {"total_hits", total_hits},
            {"expired_count", expired_count},
            {"entries", entries}
        };
    }
};

// Bounded key/value cache with per-entry TTL.
// Expired entries are dropped lazily on get; when full, inserting a new key
// evicts the entry created first.
template<typename V>
class TTLCache {
public:
    explicit TTLCache(size_t max_size = 1000, int default_ttl_seconds = 3600,
                      ClockFn clock = unix_now)
        : max_size_(max_size)
        , default_ttl_(default_ttl_seconds)
        , clock_(std::move(clock))
    {
    }

    virtual ~TTLCache() = default;

    std::optional<V> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }

        if (it->second.is_expired(clock_())) {
            entries_.erase(it);
            return std::nullopt;
        }

        it->second.hit_count++;
        return it->second.value;
    }

    // ttl_seconds 0 keeps the entry until evicted; nullopt uses the default TTL
    void set(const std::string& key, V value, std::optional<int> ttl_seconds = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);

        double now = clock_();
        int ttl = ttl_seconds.value_or(default_ttl_);

        double expires_at = ttl > 0 ? now + ttl : 0.0;

        // Updates keep the original creation time and hit count
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.value = std::move(value);
            it->second.expires_at = expires_at;
            return;
        }

        if (entries_.size() >= max_size_) {
            evict_oldest_locked();
        }

        entries_.emplace(key, CacheEntry<V>{
            .key = key,
            .value = std::move(value),
            .created_at = now,
            .expires_at = expires_at,
            .hit_count = 0
        });
    }

    bool remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(key) > 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    size_t cleanup_expired() {
        std::lock_guard<std::mutex> lock(mutex_);

        double now = clock_();
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.is_expired(now)) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t max_size() const { return max_size_; }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(key) > 0;
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);

        double now = clock_();
        CacheStats s;
        s.size = entries_.size();
        s.max_size = max_size_;

        std::vector<const CacheEntry<V>*> ordered;
        for (const auto& [key, entry] : entries_) {
            s.total_hits += entry.hit_count;
            if (entry.is_expired(now)) {
                s.expired_count++;
            }
            ordered.push_back(&entry);
        }

        std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
            return a->created_at > b->created_at;
        });

        for (size_t i = 0; i < ordered.size() && i < 10; ++i) {
            const auto* entry = ordered[i];
            s.entries.push_back(Json{
                {"key", entry->key.size() > 16 ? entry->key.substr(0, 16) + "..." : entry->key},
                {"age_seconds", now - entry->created_at},
                {"hit_count", entry->hit_count},
                {"expires_at", entry->expires_at}
            });
        }

        return s;
    }

protected:
    double now() const { return clock_(); }

    // Remove every entry matching pred, returns count
    template<typename Pred>
    size_t remove_if(Pred pred) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (pred(it->second)) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

private:
    size_t max_size_;
    int default_ttl_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry<V>> entries_;

    void evict_oldest_locked() {
        if (entries_.empty()) {
            return;
        }
        auto oldest = std::min_element(entries_.begin(), entries_.end(),
            [](const auto& a, const auto& b) {
                return a.second.created_at < b.second.created_at;
            });
        entries_.erase(oldest);
    }
};

// Produces a fresh result on a cache miss
using ComputeFn = std::function<ToolExecutionResult()>;

// Cache of tool results keyed by request identity (never by tool_call_id)
class IdempotencyCache : public TTLCache<ToolExecutionResult> {
public:
    explicit IdempotencyCache(size_t max_size = 1000, int default_ttl_seconds = 3600,
                              ClockFn clock = unix_now);

    static std::string make_key(const std::string& tool_name,
                                const std::string& tool_version,
                                const Json& parameters,
                                const std::string& caller_id = "agent",
                                const std::string& permission_level = "default");

    // Cached copy annotated cache_hit=true, or the computed result annotated
    // cache_hit=false. NoCache always computes and never stores; only
    // successful results are stored.
    ToolExecutionResult get_or_compute(const std::string& tool_name,
                                       const std::string& tool_version,
                                       const Json& parameters,
                                       const ComputeFn& compute_fn,
                                       CachePolicy policy = CachePolicy::NoCache,
                                       const std::string& caller_id = "agent",
                                       const std::string& permission_level = "default");

    bool invalidate(const std::string& tool_name,
                    const std::string& tool_version,
                    const Json& parameters,
                    const std::string& caller_id = "agent",
                    const std::string& permission_level = "default");

    // Drop every cached result of one tool
    size_t invalidate_tool(const std::string& tool_name);
};

}  // namespace toolpipe::pipeline
