#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace toolpipe::core {

namespace fs = std::filesystem;

// Request defaults and execution limits for the tool pipeline
struct PipelineConfig {
    int default_timeout_ms = 30000;
    int max_retries = 3;
    bool retry_on_timeout = true;
    std::string default_tool_version = "1.0.0";
    std::string caller_id = "agent";
    std::string permission_level = "default";
    size_t artifact_threshold_bytes = 1000000;
    int thread_pool_size = 4;
    int max_parallel_tools = 4;
    bool trace_tool_calls = true;
};

// Idempotency cache configuration
struct CacheConfig {
    bool enabled = true;
    size_t max_size = 1000;
    int default_ttl_seconds = 3600;
    std::map<std::string, std::string> policies;  // tool name -> policy name
};

// Artifact storage configuration
struct StorageConfig {
    fs::path artifacts_dir;  // empty: resolved from environment
    int max_age_hours = 24;
    int max_size_mb = 1000;
};

// Trace and metrics persistence
struct MonitoringConfig {
    bool enabled = true;
    fs::path trace_dir = "~/.toolpipe/traces";
    fs::path metrics_dir = "~/.toolpipe/metrics";
    int trace_ttl_days = 7;
    int metrics_ttl_days = 30;
};

// USD per million tokens
struct ModelPricing {
    double input = 1.0;
    double output = 2.0;
};

// Observability configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // debug, info, warn, error
    fs::path log_path = "~/.toolpipe/logs";
    bool log_to_file = false;
};

// Main configuration
struct Config {
    PipelineConfig pipeline;
    CacheConfig cache;
    StorageConfig storage;
    MonitoringConfig monitoring;
    std::map<std::string, ModelPricing> pricing;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // Get default config path
    static fs::path default_path();

    // Expand ~ and environment variables in all paths
    void expand_paths();

    // Apply TOOLPIPE_* environment overrides
    void apply_env_overrides();

    // Validate configuration
    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);
fs::path expand_path(const fs::path& path);

// Artifact directory: $TOOLPIPE_STORAGE_DIR/artifacts, $XDG_DATA_HOME/toolpipe/artifacts,
// or ~/.local/share/toolpipe/artifacts
fs::path default_artifacts_dir();

}  // namespace toolpipe::core
