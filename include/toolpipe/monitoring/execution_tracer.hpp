#pragma once

#include "toolpipe/core/types.hpp"
#include "span.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolpipe::monitoring {

using namespace toolpipe::core;

// Builds the span tree for one conversation turn.
//
// Spans are owned by the tracer and handed out as raw pointers that stay
// valid for the tracer's lifetime. Not thread-safe: drive it from the
// thread that runs the turn. A disabled tracer returns nullptr everywhere.
class ExecutionTracer {
public:
    explicit ExecutionTracer(ConversationId conversation_id,
                             SessionId session_id = "default",
                             bool enabled = true,
                             ClockFn clock = unix_now);

    ExecutionTracer(const ExecutionTracer&) = delete;
    ExecutionTracer& operator=(const ExecutionTracer&) = delete;

    // Replaces any previous root and resets the active stack to it. The old
    // tree is retired, not freed: its spans can still be ended but no longer
    // appear in the trace.
    Span* create_root_span(const std::string& name,
                           SpanType type = SpanType::AgentInvoke,
                           Json attributes = Json::object());

    // Parent defaults to the active span; nullptr when no root exists
    Span* create_span(const std::string& name,
                      SpanType type,
                      Span* parent = nullptr,
                      Json attributes = Json::object());

    // Pops the span only if it is the active one
    void end_span(Span* span, SpanStatus status = SpanStatus::Success);

    // Pops and ends the active span
    Span* end_active_span(SpanStatus status = SpanStatus::Success);

    // Event on the given span, else the active one
    void add_event(const std::string& name, Json attributes = Json::object(), Span* span = nullptr);

    // Attach an already finished span under the active span
    Span* record_completed_span(const std::string& name,
                                SpanType type,
                                double start_time,
                                double end_time,
                                SpanStatus status,
                                Json attributes = Json::object());

    void set_trace_attribute(const std::string& key, Json value);

    Span* current_span() const;
    Span* root_span() const { return root_.get(); }
    Span* find_span(const SpanId& span_id) const;
    size_t active_depth() const { return stack_.size(); }

    std::vector<const Span*> all_spans() const;
    std::vector<const Span*> spans_breadth_first() const;
    std::vector<const Span*> spans_depth_first() const;

    // nullopt until a root span exists
    std::optional<Trace> get_trace() const;
    std::optional<Json> to_json() const;
    std::optional<std::string> to_mermaid() const;

    bool enabled() const { return enabled_; }
    void set_enabled(bool enabled) { enabled_ = enabled; }
    const TraceId& trace_id() const { return trace_id_; }
    const ConversationId& conversation_id() const { return conversation_id_; }
    const SessionId& session_id() const { return session_id_; }
    double now() const { return clock_(); }

private:
    ConversationId conversation_id_;
    SessionId session_id_;
    bool enabled_;
    ClockFn clock_;
    TraceId trace_id_;

    std::unique_ptr<Span> root_;
    std::vector<std::unique_ptr<Span>> retired_;
    std::vector<Span*> stack_;
    Json attributes_ = Json::object();
};

// Ends its span when leaving scope
class ScopedSpan {
public:
    ScopedSpan(ExecutionTracer* tracer, const std::string& name, SpanType type,
               Json attributes = Json::object());
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    Span* get() const { return span_; }
    void set_status(SpanStatus status) { status_ = status; }
    void add_event(const std::string& name, Json attributes = Json::object());
    void set_attribute(const std::string& key, Json value);

    // End now instead of at scope exit
    void end();

private:
    ExecutionTracer* tracer_;
    Span* span_ = nullptr;
    SpanStatus status_ = SpanStatus::Success;
};

}  // namespace toolpipe::monitoring
