#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace toolpipe::pipeline {

// Detail level of the observation handed back to the LLM
enum class OutputLevel {
    Brief,     // one-line summary
    Standard,  // key fields
    Full       // complete payload, inline or as an artifact
};

inline std::string_view output_level_to_string(OutputLevel level) {
    switch (level) {
        case OutputLevel::Brief: return "brief";
        case OutputLevel::Standard: return "standard";
        case OutputLevel::Full: return "full";
    }
    return "standard";
}

inline std::optional<OutputLevel> output_level_from_string(std::string_view name) {
    if (name == "brief") return OutputLevel::Brief;
    if (name == "standard") return OutputLevel::Standard;
    if (name == "full") return OutputLevel::Full;
    return std::nullopt;
}

// Approximate token ceiling for each level
inline int max_tokens(OutputLevel level) {
    switch (level) {
        case OutputLevel::Brief: return 50;
        case OutputLevel::Standard: return 500;
        case OutputLevel::Full: return 200000;
    }
    return 500;
}

// Small payloads are shown in full, medium ones summarized, large ones
// go full so they can be offloaded
inline OutputLevel output_level_from_size(size_t data_size_bytes) {
    if (data_size_bytes < 10000) {
        return OutputLevel::Full;
    }
    if (data_size_bytes < 1000000) {
        return OutputLevel::Standard;
    }
    return OutputLevel::Full;
}

inline bool should_use_artifact(OutputLevel level, size_t data_size_bytes,
                                size_t threshold_bytes = 1000000) {
    return level == OutputLevel::Full && data_size_bytes >= threshold_bytes;
}

}  // namespace toolpipe::pipeline
