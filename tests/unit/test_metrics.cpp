#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "toolpipe/monitoring/metrics_collector.hpp"
#include "toolpipe/monitoring/turn_context.hpp"

#include <memory>

using namespace toolpipe::monitoring;
using Catch::Matchers::WithinAbs;

namespace {

struct ManualClock {
    std::shared_ptr<double> now = std::make_shared<double>(1000.0);

    ClockFn fn() const {
        auto t = now;
        return [t] { return *t; };
    }
};

}  // namespace

TEST_CASE("Built-in model prices", "[metrics]") {
    PricingTable pricing;

    REQUIRE_THAT(pricing.cost("claude-sonnet-4-5-20250929", 1'000'000, 1'000'000), WithinAbs(18.0, 1e-9));
    REQUIRE_THAT(pricing.cost("gpt-4o-mini", 1'000'000, 0), WithinAbs(0.15, 1e-9));
    REQUIRE(pricing.has_price("gpt-4.1"));
}

TEST_CASE("Unknown models use the fallback price", "[metrics]") {
    PricingTable pricing;
    REQUIRE_FALSE(pricing.has_price("mystery"));
    REQUIRE_THAT(pricing.cost("mystery", 1'000'000, 1'000'000), WithinAbs(3.0, 1e-9));

    PricingTable custom({{"default", ModelPricing{0.5, 0.5}}, {"mystery", ModelPricing{10.0, 20.0}}});
    REQUIRE_THAT(custom.cost("other", 2'000'000, 0), WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(custom.cost("mystery", 100'000, 100'000), WithinAbs(3.0, 1e-9));
}

TEST_CASE("LLM calls accumulate tokens per model", "[metrics]") {
    MetricsCollector collector("conv-1");
    collector.record_llm_call("claude-sonnet-4-5-20250929", 1000, 200, 450.0);
    collector.record_llm_call("gpt-4o", 500, 100, 300.0);
    collector.record_llm_call("claude-sonnet-4-5-20250929", 10, 5, 50.0);

    auto metrics = collector.snapshot();
    REQUIRE(metrics.total_input_tokens == 1510);
    REQUIRE(metrics.total_output_tokens == 305);
    REQUIRE(metrics.total_tokens == 1815);
    REQUIRE(metrics.tokens_by_model["claude-sonnet-4-5-20250929"].calls == 2);
    REQUIRE(metrics.models_used == std::vector<std::string>{"claude-sonnet-4-5-20250929", "gpt-4o"});
    REQUIRE(metrics.primary_model == "claude-sonnet-4-5-20250929");
    REQUIRE(metrics.llm_duration_ms == 800.0);
}

TEST_CASE("Cached LLM calls are counted but not billed", "[metrics]") {
    MetricsCollector collector("conv-1");
    collector.record_llm_call("gpt-4o", 1'000'000, 0, 10.0, true);

    auto metrics = collector.finalize();
    REQUIRE(metrics.total_tokens == 1'000'000);
    REQUIRE(metrics.tokens_by_model["gpt-4o"].calls == 1);
    REQUIRE(metrics.tokens_by_model["gpt-4o"].input == 0);
    REQUIRE(metrics.estimated_cost_usd == 0.0);
}

TEST_CASE("Tool calls are tracked per tool", "[metrics]") {
    MetricsCollector collector("conv-1");
    collector.record_tool_call("search", 100.0);
    collector.record_tool_call("search", 300.0, false);
    collector.record_tool_call("reader", 50.0);

    auto metrics = collector.snapshot();
    REQUIRE(metrics.tool_calls_count == 3);
    REQUIRE(metrics.tool_errors == 1);
    REQUIRE(metrics.tool_duration_ms == 450.0);

    const auto& search = metrics.tool_calls_by_name.at("search");
    REQUIRE(search.call_count == 2);
    REQUIRE(search.error_count == 1);
    REQUIRE(search.avg_duration_ms() == 200.0);
    REQUIRE(search.success_rate() == 0.5);
}

TEST_CASE("Finalize fills durations and cost", "[metrics]") {
    ManualClock clock;
    MetricsCollector collector("conv-1", "sess", true, PricingTable(), clock.fn());
    collector.record_llm_call("claude-sonnet-4-5-20250929", 1'000'000, 1'000'000, 1200.0);
    collector.record_tool_call("search", 300.0);

    *clock.now += 2.0;
    auto metrics = collector.finalize();

    REQUIRE(metrics.total_duration_ms == 2000.0);
    REQUIRE(metrics.other_duration_ms == 500.0);
    REQUIRE_THAT(metrics.estimated_cost_usd, WithinAbs(18.0, 1e-9));
    REQUIRE(metrics.session_id == "sess");
    REQUIRE(metrics.timestamp == 1000.0);
}

TEST_CASE("Other duration never goes negative", "[metrics]") {
    ManualClock clock;
    MetricsCollector collector("conv-1", "default", true, PricingTable(), clock.fn());
    collector.record_tool_call("parallel", 5000.0);

    *clock.now += 1.0;
    REQUIRE(collector.finalize().other_duration_ms == 0.0);
}

TEST_CASE("Errors and memory flushes go to metadata", "[metrics]") {
    MetricsCollector collector("conv-1");
    collector.record_error("ToolError", "boom", Json{{"tool_name", "search"}});
    collector.record_memory_flush(9000, 4000, 25.0);

    auto metrics = collector.snapshot();
    REQUIRE(metrics.metadata["errors"].size() == 1);
    REQUIRE(metrics.metadata["errors"][0]["context"]["tool_name"] == "search");
    REQUIRE(metrics.metadata["memory_flushes"][0]["tokens_saved"] == 5000);
}

TEST_CASE("Disabled collector stays empty", "[metrics]") {
    MetricsCollector collector("conv-1", "default", false);
    collector.record_llm_call("gpt-4o", 10, 10, 1.0);
    collector.record_tool_call("search", 1.0);
    collector.record_error("X", "y");

    auto metrics = collector.finalize();
    REQUIRE(metrics.total_tokens == 0);
    REQUIRE(metrics.tool_calls_count == 0);
    REQUIRE(metrics.metadata.empty());
}

TEST_CASE("Metrics JSON round trip", "[metrics]") {
    MetricsCollector collector("conv-1", "sess");
    collector.record_llm_call("gpt-4o", 100, 50, 10.0);
    collector.record_tool_call("search", 40.0, true, 3, 4);
    auto metrics = collector.finalize();

    auto restored = AgentMetrics::from_json(metrics.to_json());
    REQUIRE(restored.conversation_id == "conv-1");
    REQUIRE(restored.total_tokens == 150);
    REQUIRE(restored.tokens_by_model["gpt-4o"].output == 50);
    REQUIRE(restored.tool_calls_by_name["search"].total_input_tokens == 3);
    REQUIRE(restored.primary_model == "gpt-4o");
}

TEST_CASE("Tool stats read the average-only form", "[metrics]") {
    auto stats = ToolCallStats::from_json(Json{{"tool_name", "s"}, {"call_count", 4}, {"avg_duration_ms", 25.0}});
    REQUIRE(stats.total_duration_ms == 100.0);
}

TEST_CASE("Turn registry tracks live turns", "[metrics]") {
    TurnRegistry registry;
    auto turn = registry.begin("conv-1", "sess");

    REQUIRE(turn->tracer.conversation_id() == "conv-1");
    REQUIRE(turn->collector.enabled());
    REQUIRE(registry.find("conv-1", "sess") == turn);
    REQUIRE(registry.find("conv-1") == nullptr);

    auto replaced = registry.begin("conv-1", "sess");
    REQUIRE(replaced != turn);
    REQUIRE(registry.size() == 1);

    REQUIRE(registry.end("conv-1", "sess") == replaced);
    REQUIRE(registry.end("conv-1", "sess") == nullptr);
    REQUIRE(registry.size() == 0);
}
