#pragma once

#include "toolpipe/core/result.hpp"
#include "toolpipe/core/types.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolpipe::pipeline {

using namespace toolpipe::core;

namespace fs = std::filesystem;

inline constexpr std::string_view kArtifactPrefix = "artifact_";
inline constexpr size_t kArtifactIdLength = 25;  // prefix + 16 hex

// Bookkeeping for one stored payload
struct ArtifactMetadata {
    ArtifactId artifact_id;
    std::string filename;
    double created_at = 0.0;
    size_t size_bytes = 0;
    std::string hash;
    std::string tool_name;
    std::string summary;

    Json to_json() const;
    static ArtifactMetadata from_json(const Json& j);
};

// Returned to the caller after a successful store
struct StoredArtifact {
    ArtifactId artifact_id;
    std::string observation;  // safe to show to the LLM
    ArtifactMetadata metadata;
};

struct ArtifactStats {
    size_t artifact_count = 0;
    size_t total_size_bytes = 0;
    std::optional<double> oldest_created_at;
    std::optional<double> newest_created_at;
    std::string storage_dir;

    Json to_json() const;
};

// Content-addressed store for payloads too large to inline.
//
// Layout:
//   <storage_dir>/artifacts/<artifact_id>.json
//   <storage_dir>/metadata.json
//
// Artifact ids are validated before any filesystem access; real paths
// never leave this class.
class ArtifactStore {
public:
    explicit ArtifactStore(fs::path storage_dir, int max_age_hours = 24, int max_size_mb = 1000,
                           ClockFn clock = unix_now);

    ArtifactStore(const ArtifactStore&) = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;

    // Store a payload. Identical payloads map to the same id and are written once.
    Result<StoredArtifact, Error> store(const Json& data, const std::string& tool_name,
                                        std::optional<std::string> summary = std::nullopt);

    // SecurityViolation for malformed ids; nullopt when unknown or gone
    Result<std::optional<Json>, Error> retrieve(const std::string& artifact_id);

    // False for malformed or unknown ids
    bool remove(const std::string& artifact_id);

    // Drop artifacts older than max_age_hours, then the oldest ones while the
    // store exceeds its size budget. Returns the number removed.
    size_t cleanup(std::optional<int> max_age_hours = std::nullopt);

    // Newest first, optionally filtered by tool
    std::vector<ArtifactMetadata> list(const std::optional<std::string>& tool_name = std::nullopt,
                                       size_t limit = 100) const;

    std::optional<ArtifactMetadata> get_metadata(const std::string& artifact_id) const;

    ArtifactStats stats() const;

    const fs::path& storage_dir() const { return storage_dir_; }

    // Format check only: prefix, length, lowercase hex, no separators or ".."
    static bool is_valid_artifact_id(std::string_view artifact_id);

    static ArtifactId make_artifact_id(const Json& data);

    // Short description of a payload's shape
    static std::string summarize(const Json& data);

    static std::string artifact_observation(const ArtifactId& artifact_id,
                                            const std::string& summary,
                                            size_t size_bytes);

private:
    fs::path storage_dir_;
    fs::path artifacts_dir_;
    fs::path metadata_file_;
    int max_age_hours_;
    size_t max_size_bytes_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<ArtifactId, ArtifactMetadata> metadata_;

    void load_metadata();
    Result<void, Error> save_metadata() const;

    // Resolved payload path, only if it stays inside artifacts_dir_
    std::optional<fs::path> resolve_path(const ArtifactId& artifact_id) const;

    bool remove_locked(const ArtifactId& artifact_id);
};

}  // namespace toolpipe::pipeline
