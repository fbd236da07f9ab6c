#pragma once

#include "toolpipe/core/config.hpp"
#include "toolpipe/core/types.hpp"
#include "toolpipe/monitoring/turn_context.hpp"
#include "artifact_store.hpp"
#include "idempotency_cache.hpp"
#include "tool_registry.hpp"
#include "tool_request.hpp"
#include "tool_result.hpp"
#include "worker_pool.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace toolpipe::pipeline {

using namespace toolpipe::core;
using monitoring::TurnContext;

// Counters over every invocation since construction or reset
struct PipelineStats {
    size_t total_calls = 0;
    size_t successful_calls = 0;
    size_t failed_calls = 0;
    size_t rejected_calls = 0;
    size_t timeouts = 0;
    size_t cache_hits = 0;
    size_t retries = 0;
    int64_t total_duration_ms = 0;

    Json to_json() const;
};

// One entry of a batch
struct BatchItem {
    ToolInvocationRequest request;
    ToolFunction fn;
};

// Runs tool calls end to end: validation, idempotency cache, timeout
// isolation with retries, result shaping, artifact offload, and recording
// into the caller's turn (tool_call span plus metrics). Never throws; every
// path ends in a ToolExecutionResult.
class ToolPipeline {
public:
    ToolPipeline(const Config& config,
                 IdempotencyCache& cache,
                 ArtifactStore* artifacts = nullptr,
                 ClockFn clock = unix_now);
    ~ToolPipeline();

    ToolPipeline(const ToolPipeline&) = delete;
    ToolPipeline& operator=(const ToolPipeline&) = delete;

    ToolExecutionResult invoke(const ToolInvocationRequest& request,
                               const ToolFunction& fn,
                               TurnContext* turn = nullptr);

    // Request built from the registered ToolSpec and the configured defaults
    ToolExecutionResult invoke_call(const ToolCall& call,
                                    const ToolRegistry& registry,
                                    TurnContext* turn = nullptr);

    // Independent calls on the worker pool, at most max_parallel_tools at
    // once; results keep input order
    std::vector<ToolExecutionResult> invoke_batch(const std::vector<BatchItem>& items,
                                                  TurnContext* turn = nullptr);

    PipelineStats stats() const;
    void reset_stats();

    const PipelineConfig& config() const { return config_; }

private:
    // Wall-clock bounds of one untraced execution
    struct Execution {
        ToolExecutionResult result;
        double start_time = 0.0;
        double end_time = 0.0;
    };

    // Validation, cache and execution; safe to run on any thread
    Execution run(const ToolInvocationRequest& request, const ToolFunction& fn);

    // Timeout-isolated attempts with retry on timeout, then shaping
    ToolExecutionResult execute(const ToolInvocationRequest& request, const ToolFunction& fn);

    ArtifactStore* store_for(const ToolInvocationRequest& request);

    void record_stats(const ToolExecutionResult& result, bool rejected);
    static void record_metrics(TurnContext* turn, const ToolExecutionResult& result);
    static Json span_attributes(const ToolInvocationRequest& request);
    static void annotate_span(monitoring::Span* span, const ToolExecutionResult& result,
                              monitoring::ExecutionTracer& tracer);

    PipelineConfig config_;
    bool cache_enabled_;
    IdempotencyCache& cache_;
    ArtifactStore* artifacts_;
    ClockFn clock_;

    // Stores for requests that name their own storage directory
    std::mutex stores_mutex_;
    std::map<fs::path, std::unique_ptr<ArtifactStore>> request_stores_;
    int store_max_age_hours_;
    int store_max_size_mb_;

    mutable std::mutex stats_mutex_;
    PipelineStats stats_;

    std::unique_ptr<WorkerPool> pool_;
};

}  // namespace toolpipe::pipeline
