#include "toolpipe/pipeline/artifact_store.hpp"

#include "toolpipe/core/digest.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace toolpipe::pipeline {

namespace {

std::string with_thousands(size_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            out.push_back(',');
        }
        out.push_back(*it);
        ++count;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

// True when `path` lies strictly below `root`, compared component-wise
bool is_within(const fs::path& root, const fs::path& path) {
    auto p = path.begin();
    for (const auto& part : root) {
        if (part.empty()) continue;
        if (p == path.end() || *p != part) {
            return false;
        }
        ++p;
    }
    return p != path.end();
}

std::string dump_compact(const Json& data) {
    return data.dump(-1, ' ', false, Json::error_handler_t::replace);
}

}  // namespace

Json ArtifactMetadata::to_json() const {
    return Json{
        {"artifact_id", artifact_id},
        {"filename", filename},
        {"created_at", created_at},
        {"size_bytes", size_bytes},
        {"hash", hash},
        {"tool_name", tool_name},
        {"summary", summary}
    };
}

ArtifactMetadata ArtifactMetadata::from_json(const Json& j) {
    ArtifactMetadata meta;
    meta.artifact_id = j.value("artifact_id", "");
    meta.filename = j.value("filename", "");
    meta.created_at = j.value("created_at", 0.0);
    meta.size_bytes = j.value("size_bytes", size_t{0});
    meta.hash = j.value("hash", "");
    meta.tool_name = j.value("tool_name", "");
    meta.summary = j.value("summary", "");
    return meta;
}

Json ArtifactStats::to_json() const {
    Json j{
        {"artifact_count", artifact_count},
        {"total_size_bytes", total_size_bytes},
        {"total_size_mb", static_cast<double>(total_size_bytes) / (1024.0 * 1024.0)},
        {"storage_dir", storage_dir}
    };
    j["oldest_artifact"] = oldest_created_at ? Json(*oldest_created_at) : Json(nullptr);
    j["newest_artifact"] = newest_created_at ? Json(*newest_created_at) : Json(nullptr);
    return j;
}

ArtifactStore::ArtifactStore(fs::path storage_dir, int max_age_hours, int max_size_mb,
                             ClockFn clock)
    : storage_dir_(storage_dir.lexically_normal())
    , artifacts_dir_(storage_dir_ / "artifacts")
    , metadata_file_(storage_dir_ / "metadata.json")
    , max_age_hours_(max_age_hours)
    , max_size_bytes_(static_cast<size_t>(max_size_mb) * 1024 * 1024)
    , clock_(std::move(clock))
{
    std::error_code ec;
    fs::create_directories(artifacts_dir_, ec);
    if (ec) {
        spdlog::error("Cannot create artifact directory {}: {}", artifacts_dir_.string(), ec.message());
    }

    load_metadata();
}

bool ArtifactStore::is_valid_artifact_id(std::string_view artifact_id) {
    if (artifact_id.size() != kArtifactIdLength) {
        return false;
    }
    if (artifact_id.substr(0, kArtifactPrefix.size()) != kArtifactPrefix) {
        return false;
    }
    if (artifact_id.find('/') != std::string_view::npos ||
        artifact_id.find('\\') != std::string_view::npos ||
        artifact_id.find("..") != std::string_view::npos) {
        return false;
    }

    auto suffix = artifact_id.substr(kArtifactPrefix.size());
    return std::all_of(suffix.begin(), suffix.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

ArtifactId ArtifactStore::make_artifact_id(const Json& data) {
    return std::string(kArtifactPrefix) + md5_hex(dump_compact(data)).substr(0, 16);
}

std::string ArtifactStore::summarize(const Json& data) {
    if (data.is_object()) {
        return "Dict with " + std::to_string(data.size()) + " keys";
    }
    if (data.is_array()) {
        return "List with " + std::to_string(data.size()) + " items";
    }
    if (data.is_string()) {
        return "String (" + std::to_string(data.get_ref<const std::string&>().size()) + " chars)";
    }
    return data.type_name();
}

std::string ArtifactStore::artifact_observation(const ArtifactId& artifact_id,
                                                const std::string& summary,
                                                size_t size_bytes) {
    std::ostringstream out;
    out << "Data stored as artifact: " << artifact_id << "\n\n"
        << "Large dataset available for subsequent tool access.\n\n"
        << "To access this data, reference the artifact_id in your next tool call.\n"
        << "The system will securely retrieve the data for you.\n\n"
        << "Data summary: " << summary << "\n"
        << "Size: " << with_thousands(size_bytes) << " bytes";
    return out.str();
}

void ArtifactStore::load_metadata() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!fs::exists(metadata_file_)) {
        return;
    }

    try {
        std::ifstream file(metadata_file_);
        if (!file) {
            spdlog::warn("Cannot open artifact metadata {}", metadata_file_.string());
            return;
        }

        Json j = Json::parse(file);
        for (const auto& [id, entry] : j.items()) {
            if (!is_valid_artifact_id(id)) {
                spdlog::warn("Skipping malformed artifact id in metadata: {}", id);
                continue;
            }
            metadata_[id] = ArtifactMetadata::from_json(entry);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Discarding unreadable artifact metadata {}: {}", metadata_file_.string(), e.what());
        metadata_.clear();
    }
}

Result<void, Error> ArtifactStore::save_metadata() const {
    try {
        Json j = Json::object();
        for (const auto& [id, meta] : metadata_) {
            j[id] = meta.to_json();
        }

        fs::path tmp = metadata_file_;
        tmp += ".tmp";

        {
            std::ofstream file(tmp, std::ios::trunc);
            if (!file) {
                return Result<void, Error>::err(
                    ErrorCode::FileWriteFailed,
                    "Failed to open artifact metadata for writing"
                );
            }
            file << j.dump(2);
            if (!file) {
                return Result<void, Error>::err(
                    ErrorCode::FileWriteFailed,
                    "Failed to write artifact metadata"
                );
            }
        }

        fs::rename(tmp, metadata_file_);
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(ErrorCode::FileWriteFailed, e.what());
    }
}

std::optional<fs::path> ArtifactStore::resolve_path(const ArtifactId& artifact_id) const {
    std::error_code ec;
    fs::path root = fs::weakly_canonical(artifacts_dir_, ec);
    if (ec) {
        return std::nullopt;
    }

    fs::path resolved = fs::weakly_canonical(artifacts_dir_ / (artifact_id + ".json"), ec);
    if (ec || !is_within(root, resolved)) {
        return std::nullopt;
    }
    return resolved;
}

Result<StoredArtifact, Error> ArtifactStore::store(const Json& data, const std::string& tool_name,
                                                   std::optional<std::string> summary) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        ArtifactId artifact_id = make_artifact_id(data);

        auto path = resolve_path(artifact_id);
        if (!path) {
            return Result<StoredArtifact, Error>::err(
                ErrorCode::SecurityViolation,
                "Artifact path escapes storage directory",
                artifact_id
            );
        }

        // Same content already stored
        auto existing = metadata_.find(artifact_id);
        if (existing != metadata_.end() && fs::exists(*path)) {
            const auto& meta = existing->second;
            return Result<StoredArtifact, Error>::ok(StoredArtifact{
                .artifact_id = artifact_id,
                .observation = artifact_observation(artifact_id, meta.summary, meta.size_bytes),
                .metadata = meta
            });
        }

        std::string payload = data.dump(2, ' ', false, Json::error_handler_t::replace);

        std::ofstream file(*path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Result<StoredArtifact, Error>::err(
                ErrorCode::ArtifactStoreFailed,
                "Failed to open artifact file for writing",
                artifact_id
            );
        }
        file << payload;
        file.close();
        if (!file) {
            return Result<StoredArtifact, Error>::err(
                ErrorCode::ArtifactStoreFailed,
                "Failed to write artifact file",
                artifact_id
            );
        }

        ArtifactMetadata meta;
        meta.artifact_id = artifact_id;
        meta.filename = artifact_id + ".json";
        meta.created_at = clock_();
        meta.size_bytes = payload.size();
        meta.hash = md5_hex(payload);
        meta.tool_name = tool_name;
        meta.summary = summary ? *summary : summarize(data);

        metadata_[artifact_id] = meta;

        auto saved = save_metadata();
        if (saved.is_err()) {
            spdlog::warn("Artifact {} stored but metadata not persisted: {}",
                         artifact_id, saved.error().full_message());
        }

        spdlog::debug("Stored artifact {} ({} bytes) for {}", artifact_id, meta.size_bytes, tool_name);

        return Result<StoredArtifact, Error>::ok(StoredArtifact{
            .artifact_id = artifact_id,
            .observation = artifact_observation(artifact_id, meta.summary, meta.size_bytes),
            .metadata = meta
        });

    } catch (const std::exception& e) {
        return Result<StoredArtifact, Error>::err(
            ErrorCode::ArtifactStoreFailed,
            e.what(),
            tool_name
        );
    }
}

Result<std::optional<Json>, Error> ArtifactStore::retrieve(const std::string& artifact_id) {
    if (!is_valid_artifact_id(artifact_id)) {
        return Result<std::optional<Json>, Error>::err(
            ErrorCode::SecurityViolation,
            "Invalid artifact ID format"
        );
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!metadata_.count(artifact_id)) {
        return Result<std::optional<Json>, Error>::ok(std::nullopt);
    }

    auto path = resolve_path(artifact_id);
    if (!path) {
        return Result<std::optional<Json>, Error>::err(
            ErrorCode::SecurityViolation,
            "Artifact path escapes storage directory"
        );
    }

    if (!fs::exists(*path)) {
        spdlog::warn("Artifact {} missing on disk, dropping metadata", artifact_id);
        metadata_.erase(artifact_id);
        auto saved = save_metadata();
        if (saved.is_err()) {
            spdlog::warn("Failed to persist artifact metadata: {}", saved.error().full_message());
        }
        return Result<std::optional<Json>, Error>::ok(std::nullopt);
    }

    try {
        std::ifstream file(*path);
        if (!file) {
            return Result<std::optional<Json>, Error>::err(
                ErrorCode::FileReadFailed,
                "Failed to open artifact",
                artifact_id
            );
        }
        return Result<std::optional<Json>, Error>::ok(Json::parse(file));

    } catch (const std::exception& e) {
        return Result<std::optional<Json>, Error>::err(
            ErrorCode::ArtifactCorrupted,
            e.what(),
            artifact_id
        );
    }
}

bool ArtifactStore::remove_locked(const ArtifactId& artifact_id) {
    auto it = metadata_.find(artifact_id);
    if (it == metadata_.end()) {
        return false;
    }

    if (auto path = resolve_path(artifact_id)) {
        std::error_code ec;
        fs::remove(*path, ec);
        if (ec) {
            spdlog::warn("Failed to delete artifact file for {}: {}", artifact_id, ec.message());
        }
    }

    metadata_.erase(it);
    return true;
}

bool ArtifactStore::remove(const std::string& artifact_id) {
    if (!is_valid_artifact_id(artifact_id)) {
        spdlog::warn("Rejected delete of malformed artifact id");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!remove_locked(artifact_id)) {
        return false;
    }

    auto saved = save_metadata();
    if (saved.is_err()) {
        spdlog::warn("Failed to persist artifact metadata: {}", saved.error().full_message());
    }
    return true;
}

size_t ArtifactStore::cleanup(std::optional<int> max_age_hours) {
    std::lock_guard<std::mutex> lock(mutex_);

    double cutoff = clock_() - static_cast<double>(max_age_hours.value_or(max_age_hours_)) * 3600.0;

    std::vector<ArtifactId> expired;
    for (const auto& [id, meta] : metadata_) {
        if (meta.created_at < cutoff) {
            expired.push_back(id);
        }
    }

    size_t removed = 0;
    for (const auto& id : expired) {
        if (remove_locked(id)) {
            ++removed;
        }
    }

    // Size budget: evict oldest first
    size_t total = 0;
    for (const auto& [id, meta] : metadata_) {
        total += meta.size_bytes;
    }
    while (total > max_size_bytes_ && !metadata_.empty()) {
        auto oldest = std::min_element(metadata_.begin(), metadata_.end(),
            [](const auto& a, const auto& b) {
                return a.second.created_at < b.second.created_at;
            });
        total -= oldest->second.size_bytes;
        ArtifactId id = oldest->first;
        if (remove_locked(id)) {
            ++removed;
        }
    }

    if (removed > 0) {
        auto saved = save_metadata();
        if (saved.is_err()) {
            spdlog::warn("Failed to persist artifact metadata: {}", saved.error().full_message());
        }
        spdlog::info("Artifact cleanup removed {} artifacts", removed);
    }

    return removed;
}

std::vector<ArtifactMetadata> ArtifactStore::list(const std::optional<std::string>& tool_name,
                                                  size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ArtifactMetadata> entries;
    for (const auto& [id, meta] : metadata_) {
        if (tool_name && meta.tool_name != *tool_name) {
            continue;
        }
        entries.push_back(meta);
    }

    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.created_at > b.created_at;
    });

    if (entries.size() > limit) {
        entries.resize(limit);
    }
    return entries;
}

std::optional<ArtifactMetadata> ArtifactStore::get_metadata(const std::string& artifact_id) const {
    if (!is_valid_artifact_id(artifact_id)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metadata_.find(artifact_id);
    if (it == metadata_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ArtifactStats ArtifactStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ArtifactStats s;
    s.artifact_count = metadata_.size();
    s.storage_dir = storage_dir_.string();

    for (const auto& [id, meta] : metadata_) {
        s.total_size_bytes += meta.size_bytes;
        if (!s.oldest_created_at || meta.created_at < *s.oldest_created_at) {
            s.oldest_created_at = meta.created_at;
        }
        if (!s.newest_created_at || meta.created_at > *s.newest_created_at) {
            s.newest_created_at = meta.created_at;
        }
    }

    return s;
}

}  // namespace toolpipe::pipeline
