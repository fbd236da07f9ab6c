#include <catch2/catch_test_macros.hpp>
#include "toolpipe/pipeline/tool_registry.hpp"

using namespace toolpipe::pipeline;

namespace {

Json echo(const Json& params) {
    return params;
}

}  // namespace

TEST_CASE("Register and look up a tool", "[registry]") {
    ToolRegistry registry;
    ToolSpec spec{.name = "echo", .version = "2.1.0", .timeout_ms = 500};

    REQUIRE(registry.register_tool(spec, echo).is_ok());
    REQUIRE(registry.has_tool("echo"));
    REQUIRE(registry.size() == 1);

    auto found = registry.get_spec("echo");
    REQUIRE(found.has_value());
    REQUIRE(found->version == "2.1.0");

    auto handler = registry.get_handler("echo");
    REQUIRE(handler.is_ok());
    REQUIRE(handler.value()(Json{{"x", 1}}) == Json{{"x", 1}});
}

TEST_CASE("Registration errors", "[registry]") {
    ToolRegistry registry;
    REQUIRE(registry.register_tool(ToolSpec{.name = "echo"}, echo).is_ok());

    auto duplicate = registry.register_tool(ToolSpec{.name = "echo"}, echo);
    REQUIRE(duplicate.is_err());
    REQUIRE(duplicate.error().code == ErrorCode::AlreadyExists);

    auto unnamed = registry.register_tool(ToolSpec{}, echo);
    REQUIRE(unnamed.error().code == ErrorCode::InvalidArgument);

    auto missing = registry.get_handler("nope");
    REQUIRE(missing.error().code == ErrorCode::ToolNotFound);
}

TEST_CASE("Disabled tools cannot run", "[registry]") {
    ToolRegistry registry;
    registry.register_tool(ToolSpec{.name = "echo"}, echo);

    REQUIRE(registry.disable_tool("echo").is_ok());
    REQUIRE_FALSE(registry.is_enabled("echo"));
    REQUIRE(registry.get_handler("echo").error().code == ErrorCode::ToolDisabled);

    REQUIRE(registry.enable_tool("echo").is_ok());
    REQUIRE(registry.get_handler("echo").is_ok());

    REQUIRE(registry.unregister_tool("echo").is_ok());
    REQUIRE(registry.disable_tool("echo").error().code == ErrorCode::ToolNotFound);
}

TEST_CASE("Declared tool policy overrides the policy table", "[registry]") {
    CachePolicyTable table;
    table.set("search", CachePolicy::TtlShort);
    ToolRegistry registry(table);

    registry.register_tool(ToolSpec{.name = "search"}, echo);
    registry.register_tool(ToolSpec{.name = "pinned", .cache_policy = CachePolicy::TtlLong}, echo);

    REQUIRE(registry.cache_policy_for("search") == CachePolicy::TtlShort);
    REQUIRE(registry.cache_policy_for("pinned") == CachePolicy::TtlLong);
    REQUIRE(registry.cache_policy_for("web_search") == CachePolicy::TtlMedium);
    REQUIRE(registry.cache_policy_for("unknown") == CachePolicy::NoCache);
}

TEST_CASE("Names are sorted", "[registry]") {
    ToolRegistry registry;
    registry.register_tool(ToolSpec{.name = "b"}, echo);
    registry.register_tool(ToolSpec{.name = "a"}, echo);

    REQUIRE(registry.names() == std::vector<std::string>{"a", "b"});
}
