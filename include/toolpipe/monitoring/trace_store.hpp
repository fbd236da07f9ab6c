#pragma once

#include "toolpipe/core/errors.hpp"
#include "toolpipe/core/result.hpp"
#include "toolpipe/core/types.hpp"
#include "metrics_collector.hpp"
#include "span.hpp"
#include "trace_index.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolpipe::monitoring {

using namespace toolpipe::core;
namespace fs = std::filesystem;

// One row of list_conversations
struct ConversationSummary {
    ConversationId conversation_id;
    SessionId session_id;
    double start_time = 0.0;
    double total_duration_ms = 0.0;
    int trace_count = 0;
    int64_t total_tokens = 0;
    int tool_calls = 0;

    Json to_json() const;
};

// Totals across stored metrics lines
struct MetricsSummary {
    size_t total_conversations = 0;
    int64_t total_tokens = 0;
    double total_duration_ms = 0.0;
    int64_t total_tool_calls = 0;
    double total_cost_usd = 0.0;
    double avg_tokens_per_conv = 0.0;
    double avg_duration_ms_per_conv = 0.0;

    Json to_json() const;
};

// Replace anything outside [A-Za-z0-9_-] so ids are safe in file names
std::string sanitize_file_component(const std::string& id);

// Trace documents, one JSON file per turn, indexed in trace_index.db
class TraceStore {
public:
    static constexpr int kDefaultTtlDays = 7;

    static Result<std::unique_ptr<TraceStore>, Error> open(const fs::path& storage_dir,
                                                           int ttl_days = kDefaultTtlDays,
                                                           ClockFn clock = unix_now);

    // Writes trace_<conversation>_<YYYYMMDD_HHMMSS>.json; metrics replace the trace's own
    Result<fs::path, Error> save_trace(const Trace& trace, const AgentMetrics* metrics = nullptr);

    // Most recent trace of a conversation
    Result<std::optional<Json>, Error> load_trace(const ConversationId& conversation_id);

    Result<std::vector<ConversationSummary>, Error> list_conversations(
        const std::optional<SessionId>& session_id = std::nullopt,
        size_t limit = 100);

    Result<std::vector<TraceRecord>, Error> query_time_range(double start_time, double end_time);
    Result<std::vector<TraceRecord>, Error> recent(size_t limit = 100);

    // Drops index rows and files older than the TTL, then stray trace files
    Result<size_t, Error> cleanup_old_traces(std::optional<int> days = std::nullopt);

    const fs::path& storage_dir() const { return storage_dir_; }
    int ttl_days() const { return ttl_days_; }
    TraceIndex& index() { return *index_; }

private:
    TraceStore(fs::path storage_dir, int ttl_days, ClockFn clock,
               std::unique_ptr<TraceIndex> index);

    fs::path trace_file_path(const Trace& trace);

    fs::path storage_dir_;
    int ttl_days_;
    ClockFn clock_;
    std::unique_ptr<TraceIndex> index_;
    std::mutex write_mutex_;
};

// Metrics lines appended to metrics_<session>_<YYYYMMDD>.jsonl, indexed in metrics_index.db
class MetricsStore {
public:
    static constexpr int kDefaultTtlDays = 30;

    static Result<std::unique_ptr<MetricsStore>, Error> open(const fs::path& storage_dir,
                                                             int ttl_days = kDefaultTtlDays,
                                                             ClockFn clock = unix_now);

    Result<fs::path, Error> save_metrics(const AgentMetrics& metrics);

    // Stored metrics of one conversation, newest first
    Result<std::vector<Json>, Error> get_metrics(const ConversationId& conversation_id,
                                                 std::optional<double> start_time = std::nullopt,
                                                 std::optional<double> end_time = std::nullopt);

    Result<MetricsSummary, Error> get_aggregated_metrics(
        const std::optional<SessionId>& session_id = std::nullopt,
        std::optional<double> start_time = std::nullopt,
        std::optional<double> end_time = std::nullopt);

    // Drops index rows older than the TTL and files no row points at
    Result<size_t, Error> cleanup_old_metrics(std::optional<int> days = std::nullopt);

    const fs::path& storage_dir() const { return storage_dir_; }
    int ttl_days() const { return ttl_days_; }
    MetricsIndex& index() { return *index_; }

private:
    MetricsStore(fs::path storage_dir, int ttl_days, ClockFn clock,
                 std::unique_ptr<MetricsIndex> index);

    fs::path storage_dir_;
    int ttl_days_;
    ClockFn clock_;
    std::unique_ptr<MetricsIndex> index_;
    std::mutex write_mutex_;
};

}  // namespace toolpipe::monitoring
