#include <catch2/catch_test_macros.hpp>
#include "toolpipe/core/uuid.hpp"

#include <set>

using namespace toolpipe::core;

TEST_CASE("UUID generation", "[uuid]") {
    auto uuid1 = UUID::generate();
    auto uuid2 = UUID::generate();

    REQUIRE(uuid1.to_string() != uuid2.to_string());
    REQUIRE(uuid1.to_string().length() == 36);  // Standard UUID format
    REQUIRE(uuid1.to_string()[14] == '4');       // Version nibble
    REQUIRE(uuid1.to_hex().length() == 32);
}

TEST_CASE("UUID uniqueness", "[uuid]") {
    std::set<std::string> uuids;

    for (int i = 0; i < 1000; ++i) {
        uuids.insert(UUID::generate().to_string());
    }

    REQUIRE(uuids.size() == 1000);
}

TEST_CASE("Default UUID is invalid", "[uuid]") {
    UUID uuid;

    REQUIRE_FALSE(uuid.is_valid());
    REQUIRE(UUID::generate().is_valid());
}

TEST_CASE("Trace and span ids", "[uuid]") {
    auto trace_id = generate_trace_id();
    REQUIRE(trace_id.rfind("trace_", 0) == 0);
    REQUIRE(trace_id.size() > 6 + 16 + 1);
    REQUIRE(trace_id[22] == '_');

    auto span_id = generate_span_id("tool_call");
    REQUIRE(span_id.rfind("span_tool_call_", 0) == 0);
    REQUIRE(span_id.size() == std::string("span_tool_call_").size() + 8);
    REQUIRE(generate_span_id("llm_call") != generate_span_id("llm_call"));

    REQUIRE(root_span_id(trace_id) == "span_root_" + trace_id);
}
