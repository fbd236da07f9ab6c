#include "toolpipe/monitoring/execution_tracer.hpp"

#include "toolpipe/core/uuid.hpp"
#include "toolpipe/monitoring/trace_render.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>

namespace toolpipe::monitoring {

ExecutionTracer::ExecutionTracer(ConversationId conversation_id,
                                 SessionId session_id,
                                 bool enabled,
                                 ClockFn clock)
    : conversation_id_(std::move(conversation_id))
    , session_id_(session_id.empty() ? "default" : std::move(session_id))
    , enabled_(enabled)
    , clock_(std::move(clock))
    , trace_id_(generate_trace_id())
{
}

Span* ExecutionTracer::create_root_span(const std::string& name, SpanType type, Json attributes) {
    if (!enabled_) {
        return nullptr;
    }

    auto root = std::make_unique<Span>();
    root->trace_id = trace_id_;
    root->span_id = root_span_id(trace_id_);
    root->name = name;
    root->span_type = type;
    root->start_time = clock_();
    root->attributes = attributes.is_null() ? Json::object() : std::move(attributes);
    root->attributes["conversation_id"] = conversation_id_;
    root->attributes["session_id"] = session_id_;

    if (root_) {
        spdlog::debug("Trace {} root {} replaced by {}", trace_id_, root_->name, name);
        retired_.push_back(std::move(root_));
    }
    root_ = std::move(root);
    stack_.clear();
    stack_.push_back(root_.get());

    spdlog::debug("Trace {} started for conversation {}", trace_id_, conversation_id_);
    return root_.get();
}

Span* ExecutionTracer::create_span(const std::string& name, SpanType type, Span* parent,
                                   Json attributes) {
    if (!enabled_ || !root_) {
        return nullptr;
    }

    if (!parent) {
        parent = stack_.empty() ? root_.get() : stack_.back();
    }

    auto span = std::make_unique<Span>();
    span->trace_id = trace_id_;
    span->span_id = generate_span_id(span_type_to_string(type));
    span->parent_span_id = parent->span_id;
    span->name = name;
    span->span_type = type;
    span->start_time = clock_();
    span->attributes = attributes.is_null() ? Json::object() : std::move(attributes);

    Span* raw = parent->add_child(std::move(span));
    stack_.push_back(raw);
    return raw;
}

void ExecutionTracer::end_span(Span* span, SpanStatus status) {
    if (!enabled_ || !span) {
        return;
    }

    if (!span->is_open()) {
        spdlog::debug("Span {} already ended", span->span_id);
        return;
    }

    span->end(status, clock_());

    if (!stack_.empty() && stack_.back() == span) {
        stack_.pop_back();
    }
}

Span* ExecutionTracer::end_active_span(SpanStatus status) {
    if (!enabled_ || stack_.empty()) {
        return nullptr;
    }

    Span* span = stack_.back();
    stack_.pop_back();
    if (span->is_open()) {
        span->end(status, clock_());
    }
    return span;
}

void ExecutionTracer::add_event(const std::string& name, Json attributes, Span* span) {
    if (!enabled_) {
        return;
    }

    Span* target = span ? span : current_span();
    if (!target) {
        return;
    }
    target->add_event(name, std::move(attributes), clock_());
}

Span* ExecutionTracer::record_completed_span(const std::string& name,
                                             SpanType type,
                                             double start_time,
                                             double end_time,
                                             SpanStatus status,
                                             Json attributes) {
    if (!enabled_ || !root_) {
        return nullptr;
    }

    Span* parent = stack_.empty() ? root_.get() : stack_.back();

    auto span = std::make_unique<Span>();
    span->trace_id = trace_id_;
    span->span_id = generate_span_id(span_type_to_string(type));
    span->parent_span_id = parent->span_id;
    span->name = name;
    span->span_type = type;
    span->start_time = start_time;
    span->attributes = attributes.is_null() ? Json::object() : std::move(attributes);
    span->end(status, end_time);

    return parent->add_child(std::move(span));
}

void ExecutionTracer::set_trace_attribute(const std::string& key, Json value) {
    attributes_[key] = std::move(value);
}

Span* ExecutionTracer::current_span() const {
    if (!stack_.empty()) {
        return stack_.back();
    }
    return root_.get();
}

Span* ExecutionTracer::find_span(const SpanId& span_id) const {
    if (!root_) {
        return nullptr;
    }
    return root_->find_span_by_id(span_id);
}

std::vector<const Span*> ExecutionTracer::all_spans() const {
    if (!root_) {
        return {};
    }
    return root_->all_spans();
}

std::vector<const Span*> ExecutionTracer::spans_breadth_first() const {
    std::vector<const Span*> result;
    if (!root_) {
        return result;
    }

    std::deque<const Span*> queue{root_.get()};
    while (!queue.empty()) {
        const Span* span = queue.front();
        queue.pop_front();
        result.push_back(span);
        for (const auto& child : span->children) {
            queue.push_back(child.get());
        }
    }
    return result;
}

std::vector<const Span*> ExecutionTracer::spans_depth_first() const {
    std::vector<const Span*> result;
    if (!root_) {
        return result;
    }

    std::vector<const Span*> pending{root_.get()};
    while (!pending.empty()) {
        const Span* span = pending.back();
        pending.pop_back();
        result.push_back(span);
        for (auto it = span->children.rbegin(); it != span->children.rend(); ++it) {
            pending.push_back(it->get());
        }
    }
    return result;
}

std::optional<Trace> ExecutionTracer::get_trace() const {
    if (!root_) {
        return std::nullopt;
    }

    Trace trace;
    trace.trace_id = trace_id_;
    trace.conversation_id = conversation_id_;
    trace.session_id = session_id_;
    trace.root_span = *root_;
    trace.start_time = root_->start_time;
    trace.end_time = root_->end_time;
    trace.total_duration_ms = root_->duration_ms;
    trace.attributes = attributes_;
    return trace;
}

std::optional<Json> ExecutionTracer::to_json() const {
    auto trace = get_trace();
    if (!trace) {
        return std::nullopt;
    }
    return trace->to_json();
}

std::optional<std::string> ExecutionTracer::to_mermaid() const {
    if (!root_) {
        return std::nullopt;
    }
    return render_mermaid(*root_);
}

ScopedSpan::ScopedSpan(ExecutionTracer* tracer, const std::string& name, SpanType type,
                       Json attributes)
    : tracer_(tracer)
{
    if (tracer_) {
        span_ = tracer_->create_span(name, type, nullptr, std::move(attributes));
    }
}

ScopedSpan::~ScopedSpan() {
    end();
}

void ScopedSpan::add_event(const std::string& name, Json attributes) {
    if (tracer_ && span_) {
        tracer_->add_event(name, std::move(attributes), span_);
    }
}

void ScopedSpan::set_attribute(const std::string& key, Json value) {
    if (span_) {
        span_->attributes[key] = std::move(value);
    }
}

void ScopedSpan::end() {
    if (tracer_ && span_ && span_->is_open()) {
        tracer_->end_span(span_, status_);
    }
}

}  // namespace toolpipe::monitoring
