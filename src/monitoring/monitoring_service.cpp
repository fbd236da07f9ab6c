#include "toolpipe/monitoring/monitoring_service.hpp"

#include "toolpipe/monitoring/trace_render.hpp"

#include <spdlog/spdlog.h>

namespace toolpipe::monitoring {

namespace {

double percentage(double part, double total) {
    return total > 0.0 ? part / total * 100.0 : 0.0;
}

}  // namespace

Json PerformanceSummary::to_json() const {
    return Json{
        {"conversation_id", conversation_id},
        {"total_duration_ms", total_duration_ms},
        {"llm_duration_ms", llm_duration_ms},
        {"tool_duration_ms", tool_duration_ms},
        {"other_duration_ms", other_duration_ms},
        {"llm_percentage", llm_percentage},
        {"tool_percentage", tool_percentage},
        {"other_percentage", other_percentage},
        {"total_tokens", total_tokens},
        {"tool_calls_count", tool_calls_count},
        {"estimated_cost_usd", estimated_cost_usd}
    };
}

PerformanceSummary PerformanceSummary::from_trace(const ConversationId& conversation_id,
                                                  const Json& trace) {
    Json metrics = trace.contains("metrics") && trace["metrics"].is_object()
        ? trace["metrics"]
        : Json::object();

    double trace_duration = 0.0;
    if (trace.contains("total_duration_ms") && trace["total_duration_ms"].is_number()) {
        trace_duration = trace["total_duration_ms"].get<double>();
    }

    PerformanceSummary summary;
    summary.conversation_id = conversation_id;
    summary.total_duration_ms = metrics.value("total_duration_ms", trace_duration);
    summary.llm_duration_ms = metrics.value("llm_duration_ms", 0.0);
    summary.tool_duration_ms = metrics.value("tool_duration_ms", 0.0);
    summary.other_duration_ms = metrics.value("other_duration_ms", 0.0);
    summary.llm_percentage = percentage(summary.llm_duration_ms, summary.total_duration_ms);
    summary.tool_percentage = percentage(summary.tool_duration_ms, summary.total_duration_ms);
    summary.other_percentage = percentage(summary.other_duration_ms, summary.total_duration_ms);
    summary.total_tokens = metrics.value("total_tokens", int64_t{0});
    summary.tool_calls_count = metrics.value("tool_calls_count", 0);
    summary.estimated_cost_usd = metrics.value("estimated_cost_usd", 0.0);
    return summary;
}

MonitoringService::MonitoringService(TraceStore& traces, MetricsStore& metrics, ClockFn clock)
    : traces_(traces)
    , metrics_(metrics)
    , clock_(std::move(clock))
{
}

Result<std::vector<ConversationSummary>, Error> MonitoringService::list_conversations(
    const std::optional<SessionId>& session_id,
    size_t limit) {
    if (limit < 1 || limit > kMaxListLimit) {
        return Error{ErrorCode::InvalidArgument, "limit must be between 1 and 1000"};
    }

    auto conversations = traces_.list_conversations(session_id, limit);
    if (conversations.is_err()) {
        spdlog::error("Failed to list conversations: {}", conversations.error().message);
    }
    return conversations;
}

Result<std::optional<Json>, Error> MonitoringService::load_trace(const ConversationId& conversation_id) {
    auto trace = traces_.load_trace(conversation_id);
    if (trace.is_err()) {
        spdlog::error("Failed to load trace for {}: {}", conversation_id, trace.error().message);
    }
    return trace;
}

Result<Json, Error> MonitoringService::get_metrics(const std::optional<ConversationId>& conversation_id,
                                                   const std::optional<SessionId>& session_id,
                                                   std::optional<double> start_time,
                                                   std::optional<double> end_time) {
    if (conversation_id) {
        auto metrics = metrics_.get_metrics(*conversation_id, start_time, end_time);
        if (metrics.is_err()) {
            spdlog::error("Failed to get metrics for {}: {}", *conversation_id, metrics.error().message);
            return metrics.error();
        }
        return Json{
            {"conversation_id", *conversation_id},
            {"metrics", metrics.value()}
        };
    }

    auto aggregated = metrics_.get_aggregated_metrics(session_id, start_time, end_time);
    if (aggregated.is_err()) {
        spdlog::error("Failed to aggregate metrics: {}", aggregated.error().message);
        return aggregated.error();
    }
    return aggregated.value().to_json();
}

Result<std::optional<PerformanceSummary>, Error> MonitoringService::get_performance_summary(
    const ConversationId& conversation_id) {
    auto trace = load_trace(conversation_id);
    if (trace.is_err()) {
        return trace.error();
    }
    if (!trace.value()) {
        return std::optional<PerformanceSummary>{};
    }
    return std::optional<PerformanceSummary>{
        PerformanceSummary::from_trace(conversation_id, *trace.value())};
}

Result<std::optional<Json>, Error> MonitoringService::visualize_trace(const ConversationId& conversation_id,
                                                                      const std::string& format) {
    if (format != "mermaid" && format != "json") {
        return Error{ErrorCode::InvalidArgument, "format must be mermaid or json", format};
    }

    auto trace = load_trace(conversation_id);
    if (trace.is_err()) {
        return trace.error();
    }
    if (!trace.value()) {
        return std::optional<Json>{};
    }

    const Json& doc = *trace.value();
    if (format == "mermaid") {
        Json root = doc.contains("root_span") ? doc["root_span"] : Json::object();
        return std::optional<Json>{Json{
            {"format", "mermaid"},
            {"conversation_id", conversation_id},
            {"mermaid", render_mermaid(root)}
        }};
    }

    return std::optional<Json>{Json{
        {"format", "json"},
        {"conversation_id", conversation_id},
        {"trace", doc}
    }};
}

Result<std::optional<Json>, Error> MonitoringService::get_spans(const ConversationId& conversation_id) {
    auto trace = load_trace(conversation_id);
    if (trace.is_err()) {
        return trace.error();
    }
    if (!trace.value()) {
        return std::optional<Json>{};
    }

    const Json& doc = *trace.value();
    Json spans = flatten_spans(doc.contains("root_span") ? doc["root_span"] : Json::object());
    size_t total = spans.size();
    return std::optional<Json>{Json{
        {"conversation_id", conversation_id},
        {"spans", std::move(spans)},
        {"total_spans", total}
    }};
}

Result<Json, Error> MonitoringService::recent_activity(int hours) {
    if (hours < 1 || hours > kMaxRecentHours) {
        return Error{ErrorCode::InvalidArgument, "hours must be between 1 and 168"};
    }

    double end_time = clock_();
    double start_time = end_time - hours * 3600.0;

    auto records = traces_.query_time_range(start_time, end_time);
    if (records.is_err()) {
        spdlog::error("Failed to get recent activity: {}", records.error().message);
        return records.error();
    }

    Json traces = Json::array();
    for (const auto& record : records.value()) {
        if (traces.size() >= kMaxRecentTraces) {
            break;
        }
        traces.push_back(record.to_json());
    }

    return Json{
        {"hours", hours},
        {"start_time", start_time},
        {"end_time", end_time},
        {"trace_count", records.value().size()},
        {"traces", std::move(traces)}
    };
}

Result<fs::path, Error> MonitoringService::persist_turn(TurnContext& turn) {
    ExecutionTracer& tracer = turn.tracer;
    Span* root = tracer.root_span();

    if (root) {
        // Spans still open under the root were never finished by their owners
        while (tracer.active_depth() > 1) {
            tracer.end_active_span(SpanStatus::Cancelled);
        }
        if (root->is_open()) {
            tracer.end_span(root, SpanStatus::Success);
        }
    }

    AgentMetrics metrics = turn.collector.finalize();

    // Metrics are kept even when the turn produced no trace
    std::optional<fs::path> metrics_path;
    if (turn.collector.enabled()) {
        auto appended = metrics_.save_metrics(metrics);
        if (appended.is_ok()) {
            metrics_path = appended.value();
        } else {
            spdlog::warn("Failed to save metrics for {}: {}", turn.conversation_id,
                         appended.error().message);
        }
    }

    if (!root) {
        if (!tracer.enabled() && metrics_path) {
            return *metrics_path;
        }
        return Error{ErrorCode::InvalidState, "Turn has no root span", turn.conversation_id};
    }

    auto trace = tracer.get_trace();
    if (!trace) {
        return Error{ErrorCode::InvalidState, "Turn has no trace", turn.conversation_id};
    }
    trace->metrics = metrics.to_json();

    auto saved = traces_.save_trace(*trace, &metrics);
    if (saved.is_err()) {
        spdlog::error("Failed to save trace for {}: {}", turn.conversation_id, saved.error().message);
    }
    return saved;
}

}  // namespace toolpipe::monitoring
