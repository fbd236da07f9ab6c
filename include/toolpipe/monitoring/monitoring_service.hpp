#pragma once

#include "toolpipe/core/errors.hpp"
#include "toolpipe/core/result.hpp"
#include "toolpipe/core/types.hpp"
#include "trace_store.hpp"
#include "turn_context.hpp"

#include <optional>
#include <string>
#include <vector>

namespace toolpipe::monitoring {

using namespace toolpipe::core;

// Where the time of one turn went
struct PerformanceSummary {
    ConversationId conversation_id;
    double total_duration_ms = 0.0;
    double llm_duration_ms = 0.0;
    double tool_duration_ms = 0.0;
    double other_duration_ms = 0.0;
    double llm_percentage = 0.0;
    double tool_percentage = 0.0;
    double other_percentage = 0.0;
    int64_t total_tokens = 0;
    int tool_calls_count = 0;
    double estimated_cost_usd = 0.0;

    Json to_json() const;

    // Built from a saved trace document
    static PerformanceSummary from_trace(const ConversationId& conversation_id, const Json& trace);
};

// Read side over the trace and metrics stores, plus turn persistence.
// Lookups return nullopt when nothing was recorded for the conversation.
class MonitoringService {
public:
    static constexpr size_t kMaxListLimit = 1000;
    static constexpr int kMaxRecentHours = 168;
    static constexpr size_t kMaxRecentTraces = 100;

    MonitoringService(TraceStore& traces, MetricsStore& metrics, ClockFn clock = unix_now);

    Result<std::vector<ConversationSummary>, Error> list_conversations(
        const std::optional<SessionId>& session_id = std::nullopt,
        size_t limit = 100);

    Result<std::optional<Json>, Error> load_trace(const ConversationId& conversation_id);

    // Per-conversation metrics when a conversation is given, else an aggregate summary
    Result<Json, Error> get_metrics(const std::optional<ConversationId>& conversation_id = std::nullopt,
                                    const std::optional<SessionId>& session_id = std::nullopt,
                                    std::optional<double> start_time = std::nullopt,
                                    std::optional<double> end_time = std::nullopt);

    Result<std::optional<PerformanceSummary>, Error> get_performance_summary(
        const ConversationId& conversation_id);

    // format is "mermaid" or "json"
    Result<std::optional<Json>, Error> visualize_trace(const ConversationId& conversation_id,
                                                       const std::string& format = "mermaid");

    Result<std::optional<Json>, Error> get_spans(const ConversationId& conversation_id);

    // Traces started in the last N hours (1-168), at most 100 listed
    Result<Json, Error> recent_activity(int hours = 24);

    // Close the turn's trace, finalize its metrics and save both. Metrics
    // are saved even without a trace; a turn traced with tracing off
    // returns the metrics file, one with tracing on but no root span fails
    // with InvalidState.
    Result<fs::path, Error> persist_turn(TurnContext& turn);

private:
    TraceStore& traces_;
    MetricsStore& metrics_;
    ClockFn clock_;
};

}  // namespace toolpipe::monitoring
