#pragma once

#include "toolpipe/core/config.hpp"
#include "toolpipe/core/types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolpipe::monitoring {

using namespace toolpipe::core;

// USD per million tokens, by model name
class PricingTable {
public:
    // Built-in prices only
    PricingTable();

    // Built-in prices with overrides; a "default" entry replaces the fallback
    explicit PricingTable(const std::map<std::string, ModelPricing>& overrides);

    ModelPricing price_for(const std::string& model) const;
    void set_price(const std::string& model, ModelPricing pricing);
    bool has_price(const std::string& model) const;

    // Cost of the given billed token counts
    double cost(const std::string& model, int64_t input_tokens, int64_t output_tokens) const;

private:
    std::map<std::string, ModelPricing> prices_;
    ModelPricing fallback_;
};

// Per-tool counters
struct ToolCallStats {
    std::string tool_name;
    int call_count = 0;
    int success_count = 0;
    int error_count = 0;
    double total_duration_ms = 0.0;
    int64_t total_input_tokens = 0;
    int64_t total_output_tokens = 0;

    double avg_duration_ms() const {
        return call_count > 0 ? total_duration_ms / call_count : 0.0;
    }

    double success_rate() const {
        return call_count > 0 ? static_cast<double>(success_count) / call_count : 0.0;
    }

    Json to_json() const;
    static ToolCallStats from_json(const Json& j);
};

// Token usage for one model. Cached calls count in calls but are not billed.
struct ModelUsage {
    int64_t input = 0;
    int64_t output = 0;
    int calls = 0;
};

// Aggregate metrics for one conversation turn
struct AgentMetrics {
    ConversationId conversation_id;
    SessionId session_id = "default";
    double timestamp = 0.0;

    int64_t total_input_tokens = 0;
    int64_t total_output_tokens = 0;
    int64_t total_tokens = 0;
    std::map<std::string, ModelUsage> tokens_by_model;

    double total_duration_ms = 0.0;
    double llm_duration_ms = 0.0;
    double tool_duration_ms = 0.0;
    double other_duration_ms = 0.0;

    int tool_calls_count = 0;
    int tool_errors = 0;
    std::map<std::string, ToolCallStats> tool_calls_by_name;

    double estimated_cost_usd = 0.0;

    std::optional<std::string> primary_model;
    std::vector<std::string> models_used;

    // memory_flushes and errors event lists
    Json metadata = Json::object();

    // Sum over models of billed tokens times price; stores and returns the total
    double calculate_cost(const PricingTable& pricing);

    Json to_json() const;
    static AgentMetrics from_json(const Json& j);
};

// Accumulates metrics during a turn. Thread-safe.
class MetricsCollector {
public:
    MetricsCollector(ConversationId conversation_id,
                     SessionId session_id = "default",
                     bool enabled = true,
                     PricingTable pricing = PricingTable(),
                     ClockFn clock = unix_now);

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    void record_llm_call(const std::string& model,
                         int64_t input_tokens,
                         int64_t output_tokens,
                         double duration_ms,
                         bool cached = false);

    void record_tool_call(const std::string& tool_name,
                          double duration_ms,
                          bool success = true,
                          int64_t input_tokens = 0,
                          int64_t output_tokens = 0);

    void record_memory_flush(int64_t tokens_before, int64_t tokens_after, double duration_ms);

    void record_error(const std::string& error_type,
                      const std::string& message,
                      Json context = Json::object());

    // Compute total/other durations and cost; returns the final snapshot
    AgentMetrics finalize();

    // Snapshot without finalizing
    AgentMetrics snapshot() const;

    Json to_json();

    bool enabled() const { return enabled_; }
    double start_time() const { return start_time_; }

private:
    bool enabled_;
    PricingTable pricing_;
    ClockFn clock_;
    double start_time_;

    mutable std::mutex mutex_;
    AgentMetrics metrics_;
};

}  // namespace toolpipe::monitoring
