#include "toolpipe/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace toolpipe::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    // Expand $VAR patterns (without braces)
    std::regex env_regex2(R"(\$([A-Za-z_][A-Za-z0-9_]*))");
    while (std::regex_search(result, match, env_regex2)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path expand_path(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

fs::path default_artifacts_dir() {
    if (const char* dir = std::getenv("TOOLPIPE_STORAGE_DIR"); dir && *dir) {
        return fs::path(dir) / "artifacts";
    }
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "toolpipe" / "artifacts";
    }
    return expand_path(fs::path("~/.local/share/toolpipe/artifacts"));
}

fs::path Config::default_path() {
    return fs::path(expand_path(std::string("~/.toolpipe/config.yaml")));
}

void Config::expand_paths() {
    if (storage.artifacts_dir.empty()) {
        storage.artifacts_dir = default_artifacts_dir();
    } else {
        storage.artifacts_dir = expand_path(storage.artifacts_dir);
    }
    monitoring.trace_dir = expand_path(monitoring.trace_dir);
    monitoring.metrics_dir = expand_path(monitoring.metrics_dir);
    observability.log_path = expand_path(observability.log_path);
}

void Config::apply_env_overrides() {
    if (const char* dir = std::getenv("TOOLPIPE_STORAGE_DIR"); dir && *dir) {
        storage.artifacts_dir = fs::path(dir) / "artifacts";
    }
    if (const char* level = std::getenv("TOOLPIPE_LOG_LEVEL"); level && *level) {
        observability.log_level = level;
    }
}

Result<void, Error> Config::validate() const {
    if (pipeline.default_timeout_ms < 100 || pipeline.default_timeout_ms > 600000) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "pipeline.default_timeout_ms must be between 100 and 600000"
        );
    }

    if (pipeline.max_retries < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "pipeline.max_retries must not be negative"
        );
    }

    if (pipeline.thread_pool_size < 1 || pipeline.max_parallel_tools < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "pipeline.thread_pool_size and max_parallel_tools must be at least 1"
        );
    }

    if (cache.max_size == 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "cache.max_size must be positive"
        );
    }

    if (storage.max_age_hours <= 0 || storage.max_size_mb <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "storage.max_age_hours and storage.max_size_mb must be positive"
        );
    }

    if (monitoring.trace_ttl_days <= 0 || monitoring.metrics_ttl_days <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "monitoring ttl values must be positive"
        );
    }

    for (const auto& [model, price] : pricing) {
        if (price.input < 0.0 || price.output < 0.0) {
            return Result<void, Error>::err(
                ErrorCode::ConfigValidationFailed,
                "pricing must not be negative",
                model
            );
        }
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        // Parse pipeline config
        if (auto node = root["pipeline"]) {
            auto& p = config.pipeline;
            p.default_timeout_ms = node["default_timeout_ms"].as<int>(p.default_timeout_ms);
            p.max_retries = node["max_retries"].as<int>(p.max_retries);
            p.retry_on_timeout = node["retry_on_timeout"].as<bool>(p.retry_on_timeout);
            p.default_tool_version = node["default_tool_version"].as<std::string>(p.default_tool_version);
            p.caller_id = node["caller_id"].as<std::string>(p.caller_id);
            p.permission_level = node["permission_level"].as<std::string>(p.permission_level);
            p.artifact_threshold_bytes = node["artifact_threshold_bytes"].as<size_t>(p.artifact_threshold_bytes);
            p.thread_pool_size = node["thread_pool_size"].as<int>(p.thread_pool_size);
            p.max_parallel_tools = node["max_parallel_tools"].as<int>(p.max_parallel_tools);
            p.trace_tool_calls = node["trace_tool_calls"].as<bool>(p.trace_tool_calls);
        }

        // Parse cache config
        if (auto node = root["cache"]) {
            config.cache.enabled = node["enabled"].as<bool>(config.cache.enabled);
            config.cache.max_size = node["max_size"].as<size_t>(config.cache.max_size);
            config.cache.default_ttl_seconds = node["default_ttl_seconds"].as<int>(config.cache.default_ttl_seconds);

            if (auto policies = node["policies"]) {
                for (const auto& entry : policies) {
                    config.cache.policies[entry.first.as<std::string>()] = entry.second.as<std::string>();
                }
            }
        }

        // Parse storage config
        if (auto node = root["storage"]) {
            config.storage.artifacts_dir = node["artifacts_dir"].as<std::string>(config.storage.artifacts_dir.string());
            config.storage.max_age_hours = node["max_age_hours"].as<int>(config.storage.max_age_hours);
            config.storage.max_size_mb = node["max_size_mb"].as<int>(config.storage.max_size_mb);
        }

        // Parse monitoring config
        if (auto node = root["monitoring"]) {
            auto& m = config.monitoring;
            m.enabled = node["enabled"].as<bool>(m.enabled);
            m.trace_dir = node["trace_dir"].as<std::string>(m.trace_dir.string());
            m.metrics_dir = node["metrics_dir"].as<std::string>(m.metrics_dir.string());
            m.trace_ttl_days = node["trace_ttl_days"].as<int>(m.trace_ttl_days);
            m.metrics_ttl_days = node["metrics_ttl_days"].as<int>(m.metrics_ttl_days);
        }

        // Parse pricing overrides
        if (auto node = root["pricing"]) {
            for (const auto& entry : node) {
                ModelPricing price;
                if (entry.second.IsMap()) {
                    price.input = entry.second["input"].as<double>(price.input);
                    price.output = entry.second["output"].as<double>(price.output);
                }
                config.pricing[entry.first.as<std::string>()] = price;
            }
        }

        // Parse observability config
        if (auto node = root["observability"]) {
            config.observability.log_level = node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path = node["log_path"].as<std::string>(config.observability.log_path.string());
            config.observability.log_to_file = node["log_to_file"].as<bool>(config.observability.log_to_file);
        }

        config.apply_env_overrides();
        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.apply_env_overrides();
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = expand_path(path);

        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "pipeline" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "default_timeout_ms" << YAML::Value << pipeline.default_timeout_ms;
        out << YAML::Key << "max_retries" << YAML::Value << pipeline.max_retries;
        out << YAML::Key << "retry_on_timeout" << YAML::Value << pipeline.retry_on_timeout;
        out << YAML::Key << "default_tool_version" << YAML::Value << pipeline.default_tool_version;
        out << YAML::Key << "caller_id" << YAML::Value << pipeline.caller_id;
        out << YAML::Key << "permission_level" << YAML::Value << pipeline.permission_level;
        out << YAML::Key << "artifact_threshold_bytes" << YAML::Value << pipeline.artifact_threshold_bytes;
        out << YAML::Key << "thread_pool_size" << YAML::Value << pipeline.thread_pool_size;
        out << YAML::Key << "max_parallel_tools" << YAML::Value << pipeline.max_parallel_tools;
        out << YAML::Key << "trace_tool_calls" << YAML::Value << pipeline.trace_tool_calls;
        out << YAML::EndMap;

        out << YAML::Key << "cache" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << cache.enabled;
        out << YAML::Key << "max_size" << YAML::Value << cache.max_size;
        out << YAML::Key << "default_ttl_seconds" << YAML::Value << cache.default_ttl_seconds;
        if (!cache.policies.empty()) {
            out << YAML::Key << "policies" << YAML::Value << YAML::BeginMap;
            for (const auto& [tool, policy] : cache.policies) {
                out << YAML::Key << tool << YAML::Value << policy;
            }
            out << YAML::EndMap;
        }
        out << YAML::EndMap;

        out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "artifacts_dir" << YAML::Value << storage.artifacts_dir.string();
        out << YAML::Key << "max_age_hours" << YAML::Value << storage.max_age_hours;
        out << YAML::Key << "max_size_mb" << YAML::Value << storage.max_size_mb;
        out << YAML::EndMap;

        out << YAML::Key << "monitoring" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << monitoring.enabled;
        out << YAML::Key << "trace_dir" << YAML::Value << monitoring.trace_dir.string();
        out << YAML::Key << "metrics_dir" << YAML::Value << monitoring.metrics_dir.string();
        out << YAML::Key << "trace_ttl_days" << YAML::Value << monitoring.trace_ttl_days;
        out << YAML::Key << "metrics_ttl_days" << YAML::Value << monitoring.metrics_ttl_days;
        out << YAML::EndMap;

        if (!pricing.empty()) {
            out << YAML::Key << "pricing" << YAML::Value << YAML::BeginMap;
            for (const auto& [model, price] : pricing) {
                out << YAML::Key << model << YAML::Value << YAML::BeginMap;
                out << YAML::Key << "input" << YAML::Value << price.input;
                out << YAML::Key << "output" << YAML::Value << price.output;
                out << YAML::EndMap;
            }
            out << YAML::EndMap;
        }

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
        out << YAML::Key << "log_to_file" << YAML::Value << observability.log_to_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace toolpipe::core
