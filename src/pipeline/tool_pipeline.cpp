#include "toolpipe/pipeline/tool_pipeline.hpp"

#include "toolpipe/monitoring/execution_tracer.hpp"
#include "toolpipe/pipeline/result_shaper.hpp"
#include "toolpipe/pipeline/timeout.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace toolpipe::pipeline {

using monitoring::ExecutionTracer;
using monitoring::ScopedSpan;
using monitoring::Span;
using monitoring::SpanStatus;
using monitoring::SpanType;

Json PipelineStats::to_json() const {
    return Json{
        {"total_calls", total_calls},
        {"successful_calls", successful_calls},
        {"failed_calls", failed_calls},
        {"rejected_calls", rejected_calls},
        {"timeouts", timeouts},
        {"cache_hits", cache_hits},
        {"retries", retries},
        {"total_duration_ms", total_duration_ms},
        {"success_rate", total_calls > 0
            ? static_cast<double>(successful_calls) / static_cast<double>(total_calls)
            : 0.0}
    };
}

ToolPipeline::ToolPipeline(const Config& config,
                           IdempotencyCache& cache,
                           ArtifactStore* artifacts,
                           ClockFn clock)
    : config_(config.pipeline)
    , cache_enabled_(config.cache.enabled)
    , cache_(cache)
    , artifacts_(artifacts)
    , clock_(std::move(clock))
    , store_max_age_hours_(config.storage.max_age_hours)
    , store_max_size_mb_(config.storage.max_size_mb)
    , pool_(std::make_unique<WorkerPool>(
          static_cast<size_t>(std::max(1, config.pipeline.thread_pool_size))))
{
    spdlog::debug("Tool pipeline ready: {} workers, cache {}",
                  pool_->size(), cache_enabled_ ? "on" : "off");
}

ToolPipeline::~ToolPipeline() {
    pool_->shutdown();
}

ToolExecutionResult ToolPipeline::invoke(const ToolInvocationRequest& request,
                                         const ToolFunction& fn,
                                         TurnContext* turn) {
    if (!turn || !config_.trace_tool_calls) {
        Execution execution = run(request, fn);
        record_metrics(turn, execution.result);
        return std::move(execution.result);
    }

    ScopedSpan span(&turn->tracer, request.tool_name.empty() ? "tool" : request.tool_name,
                    SpanType::ToolCall, span_attributes(request));

    Execution execution = run(request, fn);

    annotate_span(span.get(), execution.result, turn->tracer);
    span.set_status(execution.result.success ? SpanStatus::Success : SpanStatus::Error);
    span.end();

    record_metrics(turn, execution.result);
    return std::move(execution.result);
}

ToolExecutionResult ToolPipeline::invoke_call(const ToolCall& call,
                                              const ToolRegistry& registry,
                                              TurnContext* turn) {
    auto handler = registry.get_handler(call.tool_name);
    if (handler.is_err()) {
        spdlog::warn("Cannot run tool {}: {}", call.tool_name, handler.error().message);

        ToolExecutionResult result =
            ToolExecutionResult::from_error(call.id, call.tool_name, handler.error());
        record_stats(result, true);

        if (turn && config_.trace_tool_calls) {
            double now = turn->tracer.now();
            Json attributes{{"tool_call_id", call.id}, {"error_type", result.error_type.value_or("")}};
            turn->tracer.record_completed_span(call.tool_name, SpanType::ToolCall, now, now,
                                               SpanStatus::Error, std::move(attributes));
        }
        record_metrics(turn, result);
        return result;
    }

    auto request = ToolInvocationRequest::from_tool_call(call, config_,
                                                         registry.cache_policy_for(call.tool_name));
    if (auto spec = registry.get_spec(call.tool_name)) {
        request.tool_version = spec->version;
        request.timeout_ms = spec->timeout_ms;
        request.output_level = spec->output_level;
    }

    return invoke(request, handler.value(), turn);
}

std::vector<ToolExecutionResult> ToolPipeline::invoke_batch(const std::vector<BatchItem>& items,
                                                            TurnContext* turn) {
    std::vector<ToolExecutionResult> results;
    if (items.empty()) {
        return results;
    }

    bool traced = turn && config_.trace_tool_calls;
    Span* batch_span = nullptr;
    if (traced) {
        batch_span = turn->tracer.create_span("tool_batch", SpanType::Custom, nullptr,
                                              Json{{"size", items.size()}});
    }

    std::vector<Execution> executions(items.size());
    size_t window = static_cast<size_t>(std::max(1, config_.max_parallel_tools));

    auto errors = pool_->run_batch(items.size(), window, [this, &items, &executions](size_t i) {
        executions[i] = run(items[i].request, items[i].fn);
    });

    for (size_t i = 0; i < errors.size(); ++i) {
        if (!errors[i]) {
            continue;
        }
        const auto& request = items[i].request;
        Error error = detail::error_from_exception(errors[i], request.tool_call_id);
        spdlog::error("Batch call {} to {} failed: {}", request.tool_call_id, request.tool_name,
                      error.message);
        executions[i].result = ToolExecutionResult::from_error(request.tool_call_id,
                                                               request.tool_name, error);
        executions[i].start_time = clock_();
        executions[i].end_time = executions[i].start_time;
    }

    // Spans are only touched from this thread
    size_t failures = 0;
    results.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        Execution& execution = executions[i];
        if (!execution.result.success) {
            ++failures;
        }

        if (traced) {
            Span* span = turn->tracer.record_completed_span(
                items[i].request.tool_name.empty() ? "tool" : items[i].request.tool_name,
                SpanType::ToolCall,
                execution.start_time,
                execution.end_time,
                execution.result.success ? SpanStatus::Success : SpanStatus::Error,
                span_attributes(items[i].request));
            annotate_span(span, execution.result, turn->tracer);
        }

        record_metrics(turn, execution.result);
        results.push_back(std::move(execution.result));
    }

    if (batch_span) {
        batch_span->attributes["failures"] = failures;
        turn->tracer.end_span(batch_span, failures == 0 ? SpanStatus::Success : SpanStatus::Error);
    }

    return results;
}

ToolPipeline::Execution ToolPipeline::run(const ToolInvocationRequest& request,
                                          const ToolFunction& fn) {
    Execution execution;
    execution.start_time = clock_();
    auto started = std::chrono::steady_clock::now();

    auto validation = request.validate();
    if (validation.is_err()) {
        spdlog::warn("Rejected call {} to {}: {}", request.tool_call_id, request.tool_name,
                     validation.error().message);
        execution.result = ToolExecutionResult::from_error(request.tool_call_id, request.tool_name,
                                                           validation.error());
        execution.result.cache_policy = request.cache_policy;
        execution.end_time = clock_();
        record_stats(execution.result, true);
        return execution;
    }

    spdlog::debug("Invoking {}: {}", request.tool_name, request.to_debug_json().dump());

    try {
        if (cache_enabled_ && is_cacheable(request.cache_policy)) {
            execution.result = cache_.get_or_compute(
                request.tool_name,
                request.tool_version,
                request.parameters,
                [this, &request, &fn]() { return execute(request, fn); },
                request.cache_policy,
                request.caller_id,
                request.permission_level);

            // Cached results carry the id of the call that produced them
            if (execution.result.cache_hit()) {
                execution.result.tool_call_id = request.tool_call_id;
            }
        } else {
            execution.result = execute(request, fn);
            execution.result.cache_policy = request.cache_policy;
            execution.result.metadata["cache_hit"] = false;
        }

        if (execution.result.idempotency_key.empty()) {
            execution.result.idempotency_key = request.idempotency_key();
        }
    } catch (const std::exception& e) {
        spdlog::error("Tool pipeline failure for {}: {}", request.tool_name, e.what());
        execution.result = ToolExecutionResult::from_error(request.tool_call_id, request.tool_name,
                                                           Error::from_exception(e));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    execution.result.duration_ms = elapsed.count();
    execution.end_time = clock_();

    record_stats(execution.result, false);
    return execution;
}

ToolExecutionResult ToolPipeline::execute(const ToolInvocationRequest& request,
                                          const ToolFunction& fn) {
    ResultShaper shaper(store_for(request), config_.artifact_threshold_bytes);

    int retry = 0;
    std::optional<std::string> last_error;

    while (true) {
        // The worker may outlive this call, so it owns copies
        ToolFunction task = fn;
        Json parameters = request.parameters;
        auto outcome = TimeoutIsolator::execute_with_timeout<Json>(
            [task, parameters]() { return task(parameters); },
            request.tool_call_id,
            request.timeout());

        if (outcome.is_ok()) {
            ToolExecutionResult result;
            try {
                result = shaper.shape(request.tool_call_id, request.tool_name,
                                      outcome.value(), request.output_level);
            } catch (const std::exception& e) {
                result = ToolExecutionResult::from_error(
                    request.tool_call_id, request.tool_name,
                    Error{ErrorCode::InternalError,
                          std::string("Result shaping failed: ") + e.what(),
                          exception_kind(e)});
            }
            result.retry_count = retry;
            result.last_error = last_error;
            return result;
        }

        const Error& error = outcome.error();
        ToolExecutionResult failed = error.code == ErrorCode::ToolTimeout
            ? ToolExecutionResult::make_timeout(request.tool_call_id, request.tool_name,
                                                request.timeout_ms)
            : ToolExecutionResult::from_error(request.tool_call_id, request.tool_name, error);

        std::string error_type = failed.error_type.value_or("unknown");
        if (request.should_retry(retry, error_type)) {
            ++retry;
            last_error = failed.error_message;
            spdlog::warn("Tool {} timed out after {}ms, retry {}/{}",
                         request.tool_name, request.timeout_ms, retry, request.max_retries);
            continue;
        }

        spdlog::warn("Tool {} failed ({}): {}", request.tool_name, error_type, error.message);
        failed.retry_count = retry;
        if (last_error) {
            failed.last_error = last_error;
        }
        return failed;
    }
}

ArtifactStore* ToolPipeline::store_for(const ToolInvocationRequest& request) {
    if (artifacts_) {
        return artifacts_;
    }
    if (!request.storage_dir) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(stores_mutex_);
    fs::path dir = request.storage_dir->lexically_normal();
    auto it = request_stores_.find(dir);
    if (it != request_stores_.end()) {
        return it->second.get();
    }

    try {
        auto store = std::make_unique<ArtifactStore>(dir, store_max_age_hours_, store_max_size_mb_,
                                                     clock_);
        ArtifactStore* raw = store.get();
        request_stores_.emplace(dir, std::move(store));
        return raw;
    } catch (const std::exception& e) {
        spdlog::warn("Cannot open artifact store at {}: {}", dir.string(), e.what());
        return nullptr;
    }
}

void ToolPipeline::record_stats(const ToolExecutionResult& result, bool rejected) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.total_calls += 1;
    if (rejected) {
        stats_.rejected_calls += 1;
    }
    if (result.success) {
        stats_.successful_calls += 1;
    } else {
        stats_.failed_calls += 1;
    }
    if (result.error_type && *result.error_type == "timeout") {
        stats_.timeouts += 1;
    }
    if (result.cache_hit()) {
        stats_.cache_hits += 1;
    }
    stats_.retries += static_cast<size_t>(result.retry_count);
    stats_.total_duration_ms += result.duration_ms;
}

PipelineStats ToolPipeline::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void ToolPipeline::reset_stats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = PipelineStats{};
}

void ToolPipeline::record_metrics(TurnContext* turn, const ToolExecutionResult& result) {
    if (!turn) {
        return;
    }

    turn->collector.record_tool_call(result.tool_name, static_cast<double>(result.duration_ms),
                                     result.success);
    if (!result.success) {
        turn->collector.record_error("ToolError", result.error_message.value_or(""), Json{
            {"tool_name", result.tool_name},
            {"tool_call_id", result.tool_call_id},
            {"error_type", result.error_type.value_or("unknown")}
        });
    }
}

Json ToolPipeline::span_attributes(const ToolInvocationRequest& request) {
    return Json{
        {"tool_call_id", request.tool_call_id},
        {"tool_name", request.tool_name},
        {"tool_version", request.tool_version},
        {"cache_policy", std::string(cache_policy_to_string(request.cache_policy))},
        {"timeout_ms", request.timeout_ms}
    };
}

void ToolPipeline::annotate_span(Span* span, const ToolExecutionResult& result,
                                 ExecutionTracer& tracer) {
    if (!span) {
        return;
    }

    span->attributes["success"] = result.success;
    span->attributes["cache_hit"] = result.cache_hit();
    span->attributes["retry_count"] = result.retry_count;
    span->attributes["data_size_bytes"] = result.data_size_bytes;
    span->attributes["output_level"] = std::string(output_level_to_string(result.output_level));
    if (result.error_type) {
        span->attributes["error_type"] = *result.error_type;
        span->attributes["error_message"] = result.error_message.value_or("");
    }

    if (result.cache_hit()) {
        tracer.add_event("cache_hit", Json{{"idempotency_key", result.idempotency_key}}, span);
    }
    if (result.artifact_id) {
        tracer.add_event("artifact", Json{
            {"artifact_id", *result.artifact_id},
            {"data_size_bytes", result.data_size_bytes}
        }, span);
    }
    if (result.retry_count > 0) {
        tracer.add_event("retried", Json{
            {"retry_count", result.retry_count},
            {"last_error", result.last_error.value_or("")}
        }, span);
    }
}

}  // namespace toolpipe::pipeline
