#include <catch2/catch_test_macros.hpp>
#include "toolpipe/pipeline/tool_result.hpp"

using namespace toolpipe::pipeline;

TEST_CASE("Success and error factories", "[tool_result]") {
    auto ok = ToolExecutionResult::make_success("call_1", "search", "3 hits");
    REQUIRE(ok.success);
    REQUIRE(ok.observation == "3 hits");
    REQUIRE_FALSE(ok.error_type.has_value());
    REQUIRE(ok.created_at > 0.0);

    auto failed = ToolExecutionResult::make_error("call_2", "search", "backend down", "runtime_error");
    REQUIRE_FALSE(failed.success);
    REQUIRE(failed.observation == "Error: backend down");
    REQUIRE(failed.output_level == OutputLevel::Brief);
    REQUIRE(failed.error_type == "runtime_error");
    REQUIRE(failed.last_error == "backend down");
}

TEST_CASE("Timeout and pipeline errors map onto error types", "[tool_result]") {
    auto timeout = ToolExecutionResult::make_timeout("call_1", "slow_tool", 250);
    REQUIRE(timeout.error_type == "timeout");
    REQUIRE(timeout.error_code == "TIMEOUT");
    REQUIRE(timeout.observation == "Error: Tool execution timed out after 250ms");

    auto missing = ToolExecutionResult::from_error("call_2", "nope",
                                                   Error{ErrorCode::ToolNotFound, "Tool not found: nope"});
    REQUIRE(missing.error_type == "tool_not_found");
    REQUIRE(missing.error_code == std::to_string(static_cast<int>(ErrorCode::ToolNotFound)));

    auto rejected = ToolExecutionResult::from_error("call_3", "read_artifact",
                                                    Error{ErrorCode::InvalidArtifactId, "bad id"});
    REQUIRE(rejected.error_type == "security");
}

TEST_CASE("Copies with retry and duration", "[tool_result]") {
    auto base = ToolExecutionResult::make_success("call_1", "search", "ok");

    auto retried = base.with_retry("timed out").with_retry("timed out again");
    REQUIRE(retried.retry_count == 2);
    REQUIRE(retried.last_error == "timed out again");
    REQUIRE(base.retry_count == 0);

    auto timed = base.with_duration(42);
    REQUIRE(timed.duration_ms == 42);
    REQUIRE(base.duration_ms == 0);
}

TEST_CASE("Expiry and cache age", "[tool_result]") {
    ToolExecutionResult result;
    result.created_at = 1000.0;
    REQUIRE_FALSE(result.is_expired(1e12));

    result.expires_at = 1300.0;
    REQUIRE_FALSE(result.is_expired(1300.0));
    REQUIRE(result.is_expired(1300.5));
    REQUIRE(result.cache_age_seconds(1060.0) == 60.0);
}

TEST_CASE("Tool message mirrors the observation", "[tool_result]") {
    auto ok = ToolExecutionResult::make_success("call_1", "search", "3 hits");
    auto message = ok.to_tool_message();
    REQUIRE(message.tool_call_id == "call_1");
    REQUIRE(message.content == "3 hits");
    REQUIRE_FALSE(message.is_error);

    REQUIRE(ToolExecutionResult::make_error("call_2", "search", "x", "exception")
                .to_tool_message().is_error);
}

TEST_CASE("JSON form keeps optional fields only when set", "[tool_result]") {
    auto result = ToolExecutionResult::make_success("call_1", "query_database", "Data stored as artifact: a");
    result.artifact_id = "artifact_0123456789abcdef";
    result.data_summary = "List with 200 items";
    result.cache_policy = CachePolicy::TtlShort;
    result.metadata["cache_hit"] = true;

    Json j = result.to_json();
    REQUIRE(j["artifact_id"] == "artifact_0123456789abcdef");
    REQUIRE(j["cache_policy"] == "ttl_short");
    REQUIRE_FALSE(j.contains("error_type"));
    REQUIRE_FALSE(j.contains("storage_dir"));

    auto back = ToolExecutionResult::from_json(j);
    REQUIRE(back.artifact_id == result.artifact_id);
    REQUIRE(back.data_summary == result.data_summary);
    REQUIRE(back.cache_policy == CachePolicy::TtlShort);
    REQUIRE(back.cache_hit());

    auto sparse = ToolExecutionResult::from_json(Json{{"tool_call_id", "c"}, {"cache_policy", "bogus"}});
    REQUIRE(sparse.cache_policy == CachePolicy::NoCache);
    REQUIRE(sparse.success);
    REQUIRE(sparse.output_level == OutputLevel::Standard);
}
