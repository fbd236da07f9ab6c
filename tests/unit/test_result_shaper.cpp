#include <catch2/catch_test_macros.hpp>
#include "toolpipe/core/uuid.hpp"
#include "toolpipe/pipeline/result_shaper.hpp"

using namespace toolpipe::pipeline;

TEST_CASE("Brief formatting", "[result_shaper]") {
    REQUIRE(ResultShaper::format_brief(Json{{"success", true}}) == "Success");
    REQUIRE(ResultShaper::format_brief(Json{{"success", false}, {"error", "denied"}}) == "Error: denied");
    REQUIRE(ResultShaper::format_brief(Json{{"success", false}}) == "Error: Unknown");
    REQUIRE(ResultShaper::format_brief(Json{{"count", 12}, {"rows", Json::array()}}) == "Found 12 items");
    REQUIRE(ResultShaper::format_brief(Json{{"a", 1}, {"b", "x"}}) == "Result: a=1, b=x");
    REQUIRE(ResultShaper::format_brief(Json{{"a", 1}, {"b", 2}, {"c", 3}, {"d", 4}}) == "Result with 4 fields");
    REQUIRE(ResultShaper::format_brief(Json::array({1, 2, 3})) == "List of 3 items");
    REQUIRE(ResultShaper::format_brief(nullptr) == "No data");
    REQUIRE(ResultShaper::format_brief(Json(std::string(150, 'x'))).size() == 100);
}

TEST_CASE("Standard formatting", "[result_shaper]") {
    auto map = ResultShaper::format_standard(Json{{"name", "report"}, {"pages", 3}});
    REQUIRE(map == "Result (2 fields):\n  name: report\n  pages: 3");

    Json wide = Json::object();
    for (int i = 0; i < 12; ++i) {
        wide["k" + std::to_string(10 + i)] = i;
    }
    auto shown = ResultShaper::format_standard(wide);
    REQUIRE(shown.find("... and 2 more fields") != std::string::npos);

    REQUIRE(ResultShaper::format_standard(Json::array()) == "Empty list");
    REQUIRE(ResultShaper::format_standard(Json::array({Json{{"id", 1}}, 2})) ==
            "List of 2 items\nFirst item: {\"id\":1}");
}

TEST_CASE("Truncation counts characters, not bytes", "[result_shaper]") {
    std::string text = "\xc3\xa9\xc3\xa9\xc3\xa9";  // three two-byte characters
    REQUIRE(truncate_chars(text, 2) == "\xc3\xa9\xc3\xa9");
    REQUIRE(truncate_chars(text, 5) == text);
}

TEST_CASE("Shaping picks the level from size", "[result_shaper]") {
    ResultShaper shaper;
    auto result = shaper.shape("call_1", "lookup", Json{{"value", 42}});

    REQUIRE(result.success);
    REQUIRE(result.output_level == OutputLevel::Full);
    REQUIRE(result.data_size_bytes == std::string(R"({"value":42})").size());
    REQUIRE(result.data_hash.size() == 32);
    REQUIRE(result.observation == Json{{"value", 42}}.dump(2));
    REQUIRE_FALSE(result.artifact_id.has_value());
}

TEST_CASE("Explicit level wins over size", "[result_shaper]") {
    ResultShaper shaper;
    auto result = shaper.shape("call_1", "lookup", Json::array({1, 2}), OutputLevel::Brief);

    REQUIRE(result.output_level == OutputLevel::Brief);
    REQUIRE(result.observation == "List of 2 items");
}

TEST_CASE("Large full payloads are offloaded", "[result_shaper]") {
    fs::path dir = fs::temp_directory_path() / ("toolpipe_shaper_" + UUID::generate().to_hex().substr(0, 8));
    ArtifactStore store(dir);
    ResultShaper shaper(&store, 1024);

    Json big = Json::array();
    for (int i = 0; i < 200; ++i) {
        big.push_back(Json{{"row", i}, {"text", "some repeated payload"}});
    }

    auto result = shaper.shape("call_9", "query_database", big, OutputLevel::Full);
    REQUIRE(result.success);
    REQUIRE(result.artifact_id.has_value());
    REQUIRE(ArtifactStore::is_valid_artifact_id(*result.artifact_id));
    REQUIRE(result.observation.find("Data stored as artifact: " + *result.artifact_id) != std::string::npos);
    REQUIRE(result.observation.find(dir.string()) == std::string::npos);
    REQUIRE(result.metadata.value("artifact", false));
    REQUIRE(result.data_summary == "List with 200 items");

    auto stored = store.retrieve(*result.artifact_id);
    REQUIRE(stored.is_ok());
    REQUIRE(stored.value().has_value());
    REQUIRE(*stored.value() == big);

    fs::remove_all(dir);
}

TEST_CASE("Without a store large payloads stay inline", "[result_shaper]") {
    ResultShaper shaper(nullptr, 10);
    auto result = shaper.shape("call_1", "tool", Json{{"a", "long enough value"}}, OutputLevel::Full);

    REQUIRE_FALSE(result.artifact_id.has_value());
    REQUIRE(result.observation.find("long enough value") != std::string::npos);
}
