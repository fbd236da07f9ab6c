#include <catch2/catch_test_macros.hpp>
#include "toolpipe/core/uuid.hpp"
#include "toolpipe/pipeline/artifact_store.hpp"

#include <memory>

using namespace toolpipe::pipeline;

namespace {

struct TempDir {
    fs::path path = fs::temp_directory_path() / ("toolpipe_artifacts_" + UUID::generate().to_hex().substr(0, 8));
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

}  // namespace

TEST_CASE("Artifact id validation", "[artifact_store]") {
    REQUIRE(ArtifactStore::is_valid_artifact_id("artifact_0123456789abcdef"));
    REQUIRE_FALSE(ArtifactStore::is_valid_artifact_id("artifact_0123456789ABCDEF"));
    REQUIRE_FALSE(ArtifactStore::is_valid_artifact_id("artifact_0123456789abcde"));
    REQUIRE_FALSE(ArtifactStore::is_valid_artifact_id("artefact_0123456789abcdef"));
    REQUIRE_FALSE(ArtifactStore::is_valid_artifact_id("artifact_../../etc/passw"));
    REQUIRE_FALSE(ArtifactStore::is_valid_artifact_id("artifact_0123456789abc/ef"));
    REQUIRE_FALSE(ArtifactStore::is_valid_artifact_id(""));
}

TEST_CASE("Store and retrieve", "[artifact_store]") {
    TempDir dir;
    ArtifactStore store(dir.path);
    Json data{{"rows", Json::array({1, 2, 3})}, {"source", "db"}};

    auto stored = store.store(data, "query_database");
    REQUIRE(stored.is_ok());

    const auto& artifact = stored.value();
    REQUIRE(artifact.artifact_id == ArtifactStore::make_artifact_id(data));
    REQUIRE(artifact.metadata.summary == "Dict with 2 keys");
    REQUIRE(artifact.metadata.tool_name == "query_database");
    REQUIRE(artifact.observation.find(dir.path.string()) == std::string::npos);
    REQUIRE(fs::exists(dir.path / "artifacts" / (artifact.artifact_id + ".json")));
    REQUIRE(fs::exists(dir.path / "metadata.json"));

    auto loaded = store.retrieve(artifact.artifact_id);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().has_value());
    REQUIRE(*loaded.value() == data);
}

TEST_CASE("Identical payloads share one artifact", "[artifact_store]") {
    TempDir dir;
    ArtifactStore store(dir.path);

    auto first = store.store(Json::array({1, 2}), "a");
    auto second = store.store(Json::array({1, 2}), "b");

    REQUIRE(first.value().artifact_id == second.value().artifact_id);
    REQUIRE(store.stats().artifact_count == 1);
    REQUIRE(second.value().metadata.tool_name == "a");
}

TEST_CASE("Malformed ids are rejected before any lookup", "[artifact_store]") {
    TempDir dir;
    ArtifactStore store(dir.path);

    auto result = store.retrieve("../metadata");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::SecurityViolation);
    REQUIRE_FALSE(store.remove("../metadata"));
}

TEST_CASE("Unknown ids retrieve nothing", "[artifact_store]") {
    TempDir dir;
    ArtifactStore store(dir.path);

    auto result = store.retrieve("artifact_0000000000000000");
    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.value().has_value());
}

TEST_CASE("Missing payload file drops the metadata", "[artifact_store]") {
    TempDir dir;
    ArtifactStore store(dir.path);

    auto stored = store.store(Json{{"x", 1}}, "t");
    auto id = stored.value().artifact_id;
    fs::remove(dir.path / "artifacts" / (id + ".json"));

    auto result = store.retrieve(id);
    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.value().has_value());
    REQUIRE_FALSE(store.get_metadata(id).has_value());
}

TEST_CASE("Metadata survives reopening", "[artifact_store]") {
    TempDir dir;
    std::string id;
    {
        ArtifactStore store(dir.path);
        id = store.store(Json{{"persist", true}}, "t").value().artifact_id;
    }

    ArtifactStore reopened(dir.path);
    REQUIRE(reopened.get_metadata(id).has_value());
    REQUIRE(reopened.retrieve(id).value().has_value());
}

TEST_CASE("Cleanup removes artifacts past their age", "[artifact_store]") {
    TempDir dir;
    auto now = std::make_shared<double>(1'000'000.0);
    ArtifactStore store(dir.path, 24, 1000, [now] { return *now; });

    auto old_id = store.store(Json{{"n", 1}}, "t").value().artifact_id;
    *now += 20 * 3600.0;
    auto new_id = store.store(Json{{"n", 2}}, "t").value().artifact_id;
    *now += 5 * 3600.0;

    REQUIRE(store.cleanup() == 1);
    REQUIRE_FALSE(store.get_metadata(old_id).has_value());
    REQUIRE(store.get_metadata(new_id).has_value());
    REQUIRE(store.cleanup(1) == 1);
    REQUIRE(store.stats().artifact_count == 0);
}

TEST_CASE("Listing is newest first and filterable", "[artifact_store]") {
    TempDir dir;
    auto now = std::make_shared<double>(500.0);
    ArtifactStore store(dir.path, 24, 1000, [now] { return *now; });

    store.store(Json{{"n", 1}}, "reader");
    *now += 1;
    store.store(Json{{"n", 2}}, "search");
    *now += 1;
    store.store(Json{{"n", 3}}, "reader");

    auto all = store.list();
    REQUIRE(all.size() == 3);
    REQUIRE(all.front().created_at == 502.0);

    auto readers = store.list(std::string("reader"));
    REQUIRE(readers.size() == 2);

    auto stats = store.stats();
    REQUIRE(stats.oldest_created_at == 500.0);
    REQUIRE(stats.newest_created_at == 502.0);
}
