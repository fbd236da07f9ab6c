#pragma once

#include "toolpipe/core/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolpipe::monitoring {

using namespace toolpipe::core;

enum class SpanType {
    AgentInvoke,
    LlmCall,
    ToolCall,
    MemoryFlush,
    SkillActivation,
    ContextCompression,
    Error,
    Custom
};

inline std::string_view span_type_to_string(SpanType type) {
    switch (type) {
        case SpanType::AgentInvoke: return "agent_invoke";
        case SpanType::LlmCall: return "llm_call";
        case SpanType::ToolCall: return "tool_call";
        case SpanType::MemoryFlush: return "memory_flush";
        case SpanType::SkillActivation: return "skill_activation";
        case SpanType::ContextCompression: return "context_compression";
        case SpanType::Error: return "error";
        case SpanType::Custom: return "custom";
    }
    return "custom";
}

inline SpanType span_type_from_string(std::string_view str) {
    if (str == "agent_invoke") return SpanType::AgentInvoke;
    if (str == "llm_call") return SpanType::LlmCall;
    if (str == "tool_call") return SpanType::ToolCall;
    if (str == "memory_flush") return SpanType::MemoryFlush;
    if (str == "skill_activation") return SpanType::SkillActivation;
    if (str == "context_compression") return SpanType::ContextCompression;
    if (str == "error") return SpanType::Error;
    return SpanType::Custom;
}

enum class SpanStatus {
    Success,
    Error,
    Cancelled,
    Unknown
};

inline std::string_view span_status_to_string(SpanStatus status) {
    switch (status) {
        case SpanStatus::Success: return "success";
        case SpanStatus::Error: return "error";
        case SpanStatus::Cancelled: return "cancelled";
        case SpanStatus::Unknown: return "unknown";
    }
    return "unknown";
}

inline SpanStatus span_status_from_string(std::string_view str) {
    if (str == "success") return SpanStatus::Success;
    if (str == "error") return SpanStatus::Error;
    if (str == "cancelled") return SpanStatus::Cancelled;
    return SpanStatus::Unknown;
}

// Point-in-time occurrence inside a span
struct SpanEvent {
    double timestamp = 0.0;
    std::string name;
    Json attributes = Json::object();

    Json to_json() const {
        return Json{
            {"timestamp", timestamp},
            {"name", name},
            {"attributes", attributes}
        };
    }

    static SpanEvent from_json(const Json& j) {
        return SpanEvent{
            .timestamp = j.value("timestamp", 0.0),
            .name = j.value("name", ""),
            .attributes = j.value("attributes", Json::object())
        };
    }
};

// Timed unit of work. A span is open until end_time is set.
// Children are owned by their parent; copying a span copies its subtree.
struct Span {
    TraceId trace_id;
    SpanId span_id;
    std::optional<SpanId> parent_span_id;
    std::string name;
    SpanType span_type = SpanType::Custom;
    double start_time = 0.0;
    std::optional<double> end_time;
    std::optional<double> duration_ms;
    SpanStatus status = SpanStatus::Unknown;
    std::vector<SpanEvent> events;
    Json attributes = Json::object();
    std::vector<std::unique_ptr<Span>> children;

    Span() = default;
    Span(const Span& other);
    Span& operator=(const Span& other);
    Span(Span&&) = default;
    Span& operator=(Span&&) = default;

    bool is_open() const { return !end_time.has_value(); }

    void end(SpanStatus final_status, double now);
    void add_event(std::string event_name, Json event_attributes, double now);

    Span* add_child(std::unique_ptr<Span> child);

    Span* find_span_by_id(const SpanId& id);
    const Span* find_span_by_id(const SpanId& id) const;

    // Pre-order walk of this subtree
    std::vector<const Span*> all_spans() const;

    Json to_json(bool recursive = true) const;
    static Span from_json(const Json& j);
};

// Finished record of one conversation turn
struct Trace {
    TraceId trace_id;
    ConversationId conversation_id;
    SessionId session_id = "default";
    Span root_span;
    double start_time = 0.0;
    std::optional<double> end_time;
    std::optional<double> total_duration_ms;
    Json metrics = Json::object();
    Json attributes = Json::object();

    Json to_json() const;
    static Trace from_json(const Json& j);
};

}  // namespace toolpipe::monitoring
