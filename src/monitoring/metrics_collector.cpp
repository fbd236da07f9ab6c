#include "toolpipe/monitoring/metrics_collector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace toolpipe::monitoring {

namespace {

const std::map<std::string, ModelPricing>& builtin_prices() {
    static const std::map<std::string, ModelPricing> prices = {
        // Claude models
        {"claude-sonnet-4-5-20250929", {3.0, 15.0}},
        {"claude-haiku-4-5-20250929", {0.8, 4.0}},
        {"claude-opus-4-20250514", {15.0, 75.0}},
        {"claude-sonnet-4-20250514", {3.0, 15.0}},
        // GPT models
        {"gpt-4.1", {2.5, 10.0}},
        {"gpt-4o", {5.0, 15.0}},
        {"gpt-4o-mini", {0.15, 0.60}},
        {"gpt-3.5-turbo", {0.5, 1.5}},
    };
    return prices;
}

}  // namespace

PricingTable::PricingTable()
    : prices_(builtin_prices())
{
}

PricingTable::PricingTable(const std::map<std::string, ModelPricing>& overrides)
    : PricingTable()
{
    for (const auto& [model, pricing] : overrides) {
        set_price(model, pricing);
    }
}

ModelPricing PricingTable::price_for(const std::string& model) const {
    auto it = prices_.find(model);
    if (it != prices_.end()) {
        return it->second;
    }
    return fallback_;
}

void PricingTable::set_price(const std::string& model, ModelPricing pricing) {
    if (model == "default") {
        fallback_ = pricing;
        return;
    }
    prices_[model] = pricing;
}

bool PricingTable::has_price(const std::string& model) const {
    return prices_.count(model) > 0;
}

double PricingTable::cost(const std::string& model, int64_t input_tokens,
                          int64_t output_tokens) const {
    ModelPricing pricing = price_for(model);
    double input_cost = (static_cast<double>(input_tokens) / 1'000'000.0) * pricing.input;
    double output_cost = (static_cast<double>(output_tokens) / 1'000'000.0) * pricing.output;
    return input_cost + output_cost;
}

// ToolCallStats

Json ToolCallStats::to_json() const {
    return Json{
        {"tool_name", tool_name},
        {"call_count", call_count},
        {"success_count", success_count},
        {"error_count", error_count},
        {"total_duration_ms", total_duration_ms},
        {"total_input_tokens", total_input_tokens},
        {"total_output_tokens", total_output_tokens},
        {"avg_duration_ms", avg_duration_ms()},
        {"success_rate", success_rate()}
    };
}

ToolCallStats ToolCallStats::from_json(const Json& j) {
    ToolCallStats stats;
    stats.tool_name = j.value("tool_name", "");
    stats.call_count = j.value("call_count", 0);
    stats.success_count = j.value("success_count", 0);
    stats.error_count = j.value("error_count", 0);
    stats.total_input_tokens = j.value("total_input_tokens", int64_t{0});
    stats.total_output_tokens = j.value("total_output_tokens", int64_t{0});
    // Older records only carry the average
    if (j.contains("total_duration_ms")) {
        stats.total_duration_ms = j.value("total_duration_ms", 0.0);
    } else {
        stats.total_duration_ms = j.value("avg_duration_ms", 0.0) * stats.call_count;
    }
    return stats;
}

// AgentMetrics

double AgentMetrics::calculate_cost(const PricingTable& pricing) {
    double total = 0.0;
    for (const auto& [model, usage] : tokens_by_model) {
        total += pricing.cost(model, usage.input, usage.output);
    }
    estimated_cost_usd = total;
    return total;
}

Json AgentMetrics::to_json() const {
    Json by_model = Json::object();
    for (const auto& [model, usage] : tokens_by_model) {
        by_model[model] = Json{
            {"input", usage.input},
            {"output", usage.output},
            {"calls", usage.calls}
        };
    }

    Json by_tool = Json::object();
    for (const auto& [name, stats] : tool_calls_by_name) {
        by_tool[name] = stats.to_json();
    }

    return Json{
        {"conversation_id", conversation_id},
        {"session_id", session_id},
        {"timestamp", timestamp},
        {"total_input_tokens", total_input_tokens},
        {"total_output_tokens", total_output_tokens},
        {"total_tokens", total_tokens},
        {"tokens_by_model", by_model},
        {"total_duration_ms", total_duration_ms},
        {"llm_duration_ms", llm_duration_ms},
        {"tool_duration_ms", tool_duration_ms},
        {"other_duration_ms", other_duration_ms},
        {"tool_calls_count", tool_calls_count},
        {"tool_errors", tool_errors},
        {"tool_calls_by_name", by_tool},
        {"estimated_cost_usd", estimated_cost_usd},
        {"primary_model", primary_model ? Json(*primary_model) : Json(nullptr)},
        {"models_used", models_used},
        {"metadata", metadata}
    };
}

AgentMetrics AgentMetrics::from_json(const Json& j) {
    AgentMetrics m;
    m.conversation_id = j.value("conversation_id", "");
    m.session_id = j.value("session_id", "default");
    m.timestamp = j.value("timestamp", 0.0);
    m.total_input_tokens = j.value("total_input_tokens", int64_t{0});
    m.total_output_tokens = j.value("total_output_tokens", int64_t{0});
    m.total_tokens = j.value("total_tokens", int64_t{0});
    m.total_duration_ms = j.value("total_duration_ms", 0.0);
    m.llm_duration_ms = j.value("llm_duration_ms", 0.0);
    m.tool_duration_ms = j.value("tool_duration_ms", 0.0);
    m.other_duration_ms = j.value("other_duration_ms", 0.0);
    m.tool_calls_count = j.value("tool_calls_count", 0);
    m.tool_errors = j.value("tool_errors", 0);
    m.estimated_cost_usd = j.value("estimated_cost_usd", 0.0);

    if (j.contains("tokens_by_model") && j["tokens_by_model"].is_object()) {
        for (const auto& [model, usage] : j["tokens_by_model"].items()) {
            m.tokens_by_model[model] = ModelUsage{
                .input = usage.value("input", int64_t{0}),
                .output = usage.value("output", int64_t{0}),
                .calls = usage.value("calls", 0)
            };
        }
    }

    if (j.contains("tool_calls_by_name") && j["tool_calls_by_name"].is_object()) {
        for (const auto& [name, stats] : j["tool_calls_by_name"].items()) {
            m.tool_calls_by_name[name] = ToolCallStats::from_json(stats);
        }
    }

    if (j.contains("primary_model") && j["primary_model"].is_string()) {
        m.primary_model = j["primary_model"].get<std::string>();
    }
    if (j.contains("models_used") && j["models_used"].is_array()) {
        m.models_used = j["models_used"].get<std::vector<std::string>>();
    }
    if (j.contains("metadata") && j["metadata"].is_object()) {
        m.metadata = j["metadata"];
    }
    return m;
}

// MetricsCollector

MetricsCollector::MetricsCollector(ConversationId conversation_id,
                                   SessionId session_id,
                                   bool enabled,
                                   PricingTable pricing,
                                   ClockFn clock)
    : enabled_(enabled)
    , pricing_(std::move(pricing))
    , clock_(std::move(clock))
    , start_time_(clock_())
{
    metrics_.conversation_id = std::move(conversation_id);
    metrics_.session_id = session_id.empty() ? "default" : std::move(session_id);
    metrics_.timestamp = start_time_;
}

void MetricsCollector::record_llm_call(const std::string& model,
                                       int64_t input_tokens,
                                       int64_t output_tokens,
                                       double duration_ms,
                                       bool cached) {
    if (!enabled_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    metrics_.total_input_tokens += input_tokens;
    metrics_.total_output_tokens += output_tokens;
    metrics_.total_tokens += input_tokens + output_tokens;

    auto [it, inserted] = metrics_.tokens_by_model.try_emplace(model);
    if (inserted) {
        metrics_.models_used.push_back(model);
    }

    if (!cached) {
        it->second.input += input_tokens;
        it->second.output += output_tokens;
    }
    it->second.calls += 1;

    metrics_.llm_duration_ms += duration_ms;

    if (!metrics_.primary_model) {
        metrics_.primary_model = model;
    }
}

void MetricsCollector::record_tool_call(const std::string& tool_name,
                                        double duration_ms,
                                        bool success,
                                        int64_t input_tokens,
                                        int64_t output_tokens) {
    if (!enabled_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    metrics_.tool_calls_count += 1;
    if (!success) {
        metrics_.tool_errors += 1;
    }

    auto [it, inserted] = metrics_.tool_calls_by_name.try_emplace(tool_name);
    ToolCallStats& stats = it->second;
    if (inserted) {
        stats.tool_name = tool_name;
    }

    stats.call_count += 1;
    if (success) {
        stats.success_count += 1;
    } else {
        stats.error_count += 1;
    }
    stats.total_duration_ms += duration_ms;
    stats.total_input_tokens += input_tokens;
    stats.total_output_tokens += output_tokens;

    metrics_.tool_duration_ms += duration_ms;
}

void MetricsCollector::record_memory_flush(int64_t tokens_before, int64_t tokens_after,
                                           double duration_ms) {
    if (!enabled_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    metrics_.other_duration_ms += duration_ms;

    if (!metrics_.metadata.contains("memory_flushes")) {
        metrics_.metadata["memory_flushes"] = Json::array();
    }
    metrics_.metadata["memory_flushes"].push_back(Json{
        {"tokens_before", tokens_before},
        {"tokens_after", tokens_after},
        {"tokens_saved", tokens_before - tokens_after},
        {"duration_ms", duration_ms},
        {"timestamp", clock_()}
    });
}

void MetricsCollector::record_error(const std::string& error_type,
                                    const std::string& message,
                                    Json context) {
    if (!enabled_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!metrics_.metadata.contains("errors")) {
        metrics_.metadata["errors"] = Json::array();
    }
    metrics_.metadata["errors"].push_back(Json{
        {"type", error_type},
        {"message", message},
        {"context", context.is_null() ? Json::object() : std::move(context)},
        {"timestamp", clock_()}
    });
}

AgentMetrics MetricsCollector::finalize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!enabled_) {
        return metrics_;
    }

    metrics_.total_duration_ms = (clock_() - start_time_) * 1000.0;

    double accounted = metrics_.llm_duration_ms + metrics_.tool_duration_ms;
    metrics_.other_duration_ms = std::max(0.0, metrics_.total_duration_ms - accounted);

    metrics_.calculate_cost(pricing_);

    spdlog::debug("Metrics finalized for {}: {} tokens, {} tool calls, ${:.4f}",
                  metrics_.conversation_id, metrics_.total_tokens,
                  metrics_.tool_calls_count, metrics_.estimated_cost_usd);
    return metrics_;
}

AgentMetrics MetricsCollector::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

Json MetricsCollector::to_json() {
    return finalize().to_json();
}

}  // namespace toolpipe::monitoring
