#include <catch2/catch_test_macros.hpp>
#include "toolpipe/monitoring/execution_tracer.hpp"
#include "toolpipe/monitoring/trace_render.hpp"

#include <memory>

using namespace toolpipe::monitoring;

namespace {

struct ManualClock {
    std::shared_ptr<double> now = std::make_shared<double>(100.0);

    ClockFn fn() const {
        auto t = now;
        return [t] { return *t; };
    }
};

}  // namespace

TEST_CASE("Root span carries conversation identity", "[tracer]") {
    ExecutionTracer tracer("conv-1", "sess-1");
    Span* root = tracer.create_root_span("turn");

    REQUIRE(root != nullptr);
    REQUIRE(root->span_id == "span_root_" + tracer.trace_id());
    REQUIRE(root->attributes["conversation_id"] == "conv-1");
    REQUIRE(root->attributes["session_id"] == "sess-1");
    REQUIRE(root->span_type == SpanType::AgentInvoke);
    REQUIRE(tracer.current_span() == root);
}

TEST_CASE("Spans nest under the active span", "[tracer]") {
    ExecutionTracer tracer("conv-1");
    Span* root = tracer.create_root_span("turn");
    Span* llm = tracer.create_span("claude", SpanType::LlmCall);
    Span* tool = tracer.create_span("search", SpanType::ToolCall);

    REQUIRE(llm->parent_span_id == root->span_id);
    REQUIRE(tool->parent_span_id == llm->span_id);
    REQUIRE(tracer.active_depth() == 3);
    REQUIRE(tool->span_id.rfind("span_tool_call_", 0) == 0);

    tracer.end_span(tool);
    REQUIRE(tracer.current_span() == llm);
    tracer.end_span(llm, SpanStatus::Error);
    REQUIRE(tracer.current_span() == root);
    REQUIRE(llm->status == SpanStatus::Error);
}

TEST_CASE("Explicit parent overrides the stack", "[tracer]") {
    ExecutionTracer tracer("conv-1");
    Span* root = tracer.create_root_span("turn");
    tracer.create_span("outer", SpanType::Custom);
    Span* sibling = tracer.create_span("sibling", SpanType::Custom, root);

    REQUIRE(sibling->parent_span_id == root->span_id);
    REQUIRE(root->children.size() == 2);
}

TEST_CASE("Ending a span twice keeps the first end", "[tracer]") {
    ManualClock clock;
    ExecutionTracer tracer("conv-1", "default", true, clock.fn());
    tracer.create_root_span("turn");
    Span* span = tracer.create_span("step", SpanType::Custom);

    *clock.now = 100.25;
    tracer.end_span(span, SpanStatus::Success);
    *clock.now = 105.0;
    tracer.end_span(span, SpanStatus::Error);

    REQUIRE(span->status == SpanStatus::Success);
    REQUIRE(*span->end_time == 100.25);
    REQUIRE(*span->duration_ms == 250.0);
}

TEST_CASE("Ending a span that is not on top leaves the stack alone", "[tracer]") {
    ExecutionTracer tracer("conv-1");
    tracer.create_root_span("turn");
    Span* outer = tracer.create_span("outer", SpanType::Custom);
    Span* inner = tracer.create_span("inner", SpanType::Custom);

    tracer.end_span(outer);
    REQUIRE_FALSE(outer->is_open());
    REQUIRE(tracer.current_span() == inner);
    REQUIRE(tracer.active_depth() == 3);
}

TEST_CASE("Spans from a replaced root can still be ended", "[tracer]") {
    ManualClock clock;
    ExecutionTracer tracer("conv-1", "default", true, clock.fn());
    Span* first = tracer.create_root_span("turn1");
    Span* tool = tracer.create_span("tool", SpanType::ToolCall);

    Span* second = tracer.create_root_span("turn2");
    REQUIRE(second != first);
    REQUIRE(tracer.root_span() == second);
    REQUIRE(tracer.active_depth() == 1);

    *clock.now = 100.5;
    tracer.end_span(tool, SpanStatus::Cancelled);

    REQUIRE_FALSE(tool->is_open());
    REQUIRE(tool->status == SpanStatus::Cancelled);
    REQUIRE(*tool->duration_ms == 500.0);
    REQUIRE(first->name == "turn1");
    REQUIRE(tracer.current_span() == second);
    REQUIRE(tracer.all_spans().size() == 1);
    REQUIRE(tracer.find_span(tool->span_id) == nullptr);
}

TEST_CASE("Scoped span outlives a root replacement", "[tracer]") {
    ExecutionTracer tracer("conv-1");
    tracer.create_root_span("turn1");
    {
        ScopedSpan scoped(&tracer, "tool", SpanType::ToolCall);
        tracer.create_root_span("turn2");
        scoped.add_event("late");
    }
    REQUIRE(tracer.active_depth() == 1);
    REQUIRE(tracer.root_span()->children.empty());
}

TEST_CASE("Disabled tracer records nothing", "[tracer]") {
    ExecutionTracer tracer("conv-1", "default", false);

    REQUIRE(tracer.create_root_span("turn") == nullptr);
    REQUIRE(tracer.create_span("x", SpanType::Custom) == nullptr);
    tracer.add_event("ignored");
    REQUIRE_FALSE(tracer.get_trace().has_value());
}

TEST_CASE("Spans need a root", "[tracer]") {
    ExecutionTracer tracer("conv-1");
    REQUIRE(tracer.create_span("orphan", SpanType::Custom) == nullptr);
    REQUIRE_FALSE(tracer.to_mermaid().has_value());
}

TEST_CASE("Events land on the active span", "[tracer]") {
    ExecutionTracer tracer("conv-1");
    Span* root = tracer.create_root_span("turn");
    Span* step = tracer.create_span("step", SpanType::Custom);

    tracer.add_event("checkpoint", Json{{"n", 1}});
    tracer.add_event("on_root", Json::object(), root);

    REQUIRE(step->events.size() == 1);
    REQUIRE(step->events[0].attributes["n"] == 1);
    REQUIRE(root->events.size() == 1);
}

TEST_CASE("Completed spans attach with their own times", "[tracer]") {
    ExecutionTracer tracer("conv-1");
    Span* root = tracer.create_root_span("turn");

    Span* done = tracer.record_completed_span("search", SpanType::ToolCall, 10.0, 10.5, SpanStatus::Success);
    REQUIRE(done->parent_span_id == root->span_id);
    REQUIRE(*done->duration_ms == 500.0);
    REQUIRE(tracer.current_span() == root);
}

TEST_CASE("Scoped span ends on scope exit", "[tracer]") {
    ExecutionTracer tracer("conv-1");
    tracer.create_root_span("turn");
    Span* captured = nullptr;
    {
        ScopedSpan span(&tracer, "scoped", SpanType::SkillActivation);
        span.set_attribute("skill", "pdf");
        span.set_status(SpanStatus::Error);
        captured = span.get();
        REQUIRE(captured->is_open());
    }
    REQUIRE_FALSE(captured->is_open());
    REQUIRE(captured->status == SpanStatus::Error);
    REQUIRE(captured->attributes["skill"] == "pdf");
    REQUIRE(tracer.active_depth() == 1);
}

TEST_CASE("Traversal orders", "[tracer]") {
    ExecutionTracer tracer("conv-1");
    tracer.create_root_span("root");
    Span* a = tracer.create_span("a", SpanType::Custom);
    tracer.create_span("a1", SpanType::Custom);
    tracer.end_active_span();
    tracer.end_span(a);
    tracer.create_span("b", SpanType::Custom);

    auto names = [](const std::vector<const Span*>& spans) {
        std::vector<std::string> out;
        for (const auto* span : spans) {
            out.push_back(span->name);
        }
        return out;
    };

    REQUIRE(names(tracer.spans_breadth_first()) == std::vector<std::string>{"root", "a", "b", "a1"});
    REQUIRE(names(tracer.spans_depth_first()) == std::vector<std::string>{"root", "a", "a1", "b"});
    REQUIRE(names(tracer.all_spans()) == std::vector<std::string>{"root", "a", "a1", "b"});
    REQUIRE(tracer.find_span(a->span_id) == a);
    REQUIRE(tracer.find_span("missing") == nullptr);
}

TEST_CASE("Trace export is a deep copy", "[tracer]") {
    ExecutionTracer tracer("conv-1", "s");
    tracer.create_root_span("turn");
    tracer.create_span("child", SpanType::LlmCall);
    tracer.set_trace_attribute("user", "alice");

    auto trace = tracer.get_trace();
    REQUIRE(trace.has_value());
    REQUIRE(trace->conversation_id == "conv-1");
    REQUIRE(trace->session_id == "s");
    REQUIRE(trace->root_span.children.size() == 1);
    REQUIRE(trace->attributes["user"] == "alice");

    tracer.create_span("later", SpanType::Custom);
    REQUIRE(trace->root_span.children.size() == 1);

    auto json = tracer.to_json();
    REQUIRE((*json)["root_span"]["children"][0]["span_type"] == "llm_call");
}

TEST_CASE("Span JSON round trip keeps the tree", "[tracer]") {
    ExecutionTracer tracer("conv-1");
    tracer.create_root_span("turn");
    tracer.create_span("child", SpanType::MemoryFlush);
    tracer.add_event("flushed");
    tracer.end_active_span(SpanStatus::Cancelled);

    Span copy = Span::from_json(tracer.root_span()->to_json());
    REQUIRE(copy.children.size() == 1);
    REQUIRE(copy.children[0]->span_type == SpanType::MemoryFlush);
    REQUIRE(copy.children[0]->status == SpanStatus::Cancelled);
    REQUIRE(copy.children[0]->events.size() == 1);
    REQUIRE(copy.is_open());
}

TEST_CASE("Mermaid rendering", "[tracer]") {
    Json root{
        {"span_id", "span_root_trace-1"},
        {"name", "turn"},
        {"span_type", "agent_invoke"},
        {"status", "success"},
        {"duration_ms", 1500.4},
        {"children", Json::array({
            Json{{"span_id", "span_tool_call_ab"}, {"name", "say \"hi\""}, {"span_type", "tool_call"},
                 {"status", "error"}, {"duration_ms", 20.0}, {"children", Json::array()}},
            Json{{"span_id", "span_llm_call_cd"}, {"name", "claude"}, {"span_type", "llm_call"},
                 {"status", "unknown"}, {"duration_ms", nullptr}}
        })}
    };

    std::string expected =
        "graph TD\n"
        "    span_root_trace_1[\"turn\\n1500ms ✓\"]\n"
        "    span_root_trace_1 --> span_tool_call_ab\n"
        "    span_root_trace_1 --> span_llm_call_cd\n"
        "    span_tool_call_ab[\"tool_call: say #quot;hi#quot;\\n20ms ✗\"]\n"
        "    span_llm_call_cd[\"llm_call: claude\\nrunning ○\"]\n";

    REQUIRE(render_mermaid(root) == expected);
}

TEST_CASE("Flattened spans carry depth", "[tracer]") {
    ExecutionTracer tracer("conv-1");
    tracer.create_root_span("turn");
    tracer.create_span("child", SpanType::Custom);
    tracer.add_event("e1");
    tracer.add_event("e2");

    Json flat = flatten_spans(tracer.root_span()->to_json());
    REQUIRE(flat.size() == 2);
    REQUIRE(flat[0]["depth"] == 0);
    REQUIRE(flat[1]["depth"] == 1);
    REQUIRE(flat[1]["event_count"] == 2);
    REQUIRE_FALSE(flat[0].contains("children"));
}
