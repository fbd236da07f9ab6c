#include "toolpipe/pipeline/result_shaper.hpp"

#include "toolpipe/core/digest.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace toolpipe::pipeline {

namespace {

std::string dump(const Json& value, int indent = -1) {
    return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

// Strings render bare, everything else as compact JSON
std::string render(const Json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return dump(value);
}

bool is_truthy(const Json& value) {
    switch (classify(value)) {
        case ShapeKind::Null: return false;
        case ShapeKind::Map:
        case ShapeKind::Sequence:
            return !value.empty();
        case ShapeKind::Text:
            return !value.get_ref<const std::string&>().empty();
        case ShapeKind::Scalar:
            if (value.is_boolean()) return value.get<bool>();
            return value.get<double>() != 0.0;
    }
    return false;
}

}  // namespace

ShapeKind classify(const Json& value) {
    if (value.is_null()) return ShapeKind::Null;
    if (value.is_object()) return ShapeKind::Map;
    if (value.is_array()) return ShapeKind::Sequence;
    if (value.is_string()) return ShapeKind::Text;
    return ShapeKind::Scalar;
}

std::string truncate_chars(std::string_view text, size_t max_chars) {
    size_t chars = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (chars == max_chars) {
            return std::string(text.substr(0, i));
        }
        auto lead = static_cast<unsigned char>(text[i]);
        size_t width = 1;
        if (lead >= 0xF0) width = 4;
        else if (lead >= 0xE0) width = 3;
        else if (lead >= 0xC0) width = 2;
        i += width;
        ++chars;
    }
    return std::string(text);
}

ResultShaper::ResultShaper(ArtifactStore* storage, size_t artifact_threshold)
    : storage_(storage)
    , artifact_threshold_(artifact_threshold)
{
}

std::string ResultShaper::format_brief(const Json& raw) {
    switch (classify(raw)) {
        case ShapeKind::Map: {
            if (raw.contains("success")) {
                if (is_truthy(raw["success"])) {
                    return "Success";
                }
                return "Error: " + (raw.contains("error") ? render(raw["error"]) : std::string("Unknown"));
            }
            if (raw.contains("count")) {
                return "Found " + render(raw["count"]) + " items";
            }
            if (raw.size() <= 3) {
                std::string out = "Result: ";
                bool first = true;
                for (const auto& [key, value] : raw.items()) {
                    if (!first) out += ", ";
                    out += key + "=" + render(value);
                    first = false;
                }
                return out;
            }
            return "Result with " + std::to_string(raw.size()) + " fields";
        }
        case ShapeKind::Sequence:
            return "List of " + std::to_string(raw.size()) + " items";
        case ShapeKind::Text:
            return truncate_chars(raw.get_ref<const std::string&>(), 100);
        case ShapeKind::Null:
            return "No data";
        case ShapeKind::Scalar:
            return truncate_chars(dump(raw), 100);
    }
    return "No data";
}

std::string ResultShaper::format_standard(const Json& raw) {
    switch (classify(raw)) {
        case ShapeKind::Map: {
            std::ostringstream out;
            out << "Result (" << raw.size() << " fields):";
            size_t shown = 0;
            for (const auto& [key, value] : raw.items()) {
                if (shown == 10) break;
                out << "\n  " << key << ": " << truncate_chars(render(value), 100);
                ++shown;
            }
            if (raw.size() > 10) {
                out << "\n  ... and " << (raw.size() - 10) << " more fields";
            }
            return out.str();
        }
        case ShapeKind::Sequence:
            if (raw.empty()) {
                return "Empty list";
            }
            return "List of " + std::to_string(raw.size()) + " items\nFirst item: "
                + truncate_chars(dump(raw.front()), 200);
        case ShapeKind::Text:
            return truncate_chars(raw.get_ref<const std::string&>(), 1000);
        case ShapeKind::Null:
        case ShapeKind::Scalar:
            return truncate_chars(dump(raw), 1000);
    }
    return "";
}

std::string ResultShaper::format_full(const Json& raw) {
    return dump(raw, 2);
}

ToolExecutionResult ResultShaper::shape(const std::string& tool_call_id,
                                        const std::string& tool_name,
                                        const Json& raw,
                                        std::optional<OutputLevel> level) const {
    std::string compact = dump(raw);
    size_t size = compact.size();
    OutputLevel resolved = level ? *level : output_level_from_size(size);

    ToolExecutionResult result = ToolExecutionResult::make_success(tool_call_id, tool_name, "", resolved);
    result.data_size_bytes = size;
    result.data_hash = md5_hex(compact);

    switch (resolved) {
        case OutputLevel::Brief:
            result.observation = format_brief(raw);
            return result;
        case OutputLevel::Standard:
            result.observation = format_standard(raw);
            return result;
        case OutputLevel::Full:
            break;
    }

    if (storage_ && should_use_artifact(resolved, size, artifact_threshold_)) {
        auto stored = storage_->store(raw, tool_name);
        if (stored.is_ok()) {
            const auto& artifact = stored.value();
            result.artifact_id = artifact.artifact_id;
            result.data_summary = artifact.metadata.summary;
            result.observation = artifact.observation;
            result.metadata["artifact"] = true;
            return result;
        }
        spdlog::warn("Artifact offload failed for {} ({}), inlining {} bytes",
                     tool_name, stored.error().full_message(), size);
    }

    result.observation = format_full(raw);
    return result;
}

ToolExecutionResult from_raw_data(const std::string& tool_call_id,
                                  const std::string& tool_name,
                                  const Json& raw,
                                  std::optional<OutputLevel> level,
                                  ArtifactStore* storage,
                                  size_t artifact_threshold) {
    return ResultShaper(storage, artifact_threshold).shape(tool_call_id, tool_name, raw, level);
}

}  // namespace toolpipe::pipeline
