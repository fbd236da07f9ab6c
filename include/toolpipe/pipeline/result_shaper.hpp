#pragma once

#include "toolpipe/core/types.hpp"
#include "artifact_store.hpp"
#include "output_level.hpp"
#include "tool_result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace toolpipe::pipeline {

using namespace toolpipe::core;

// Shape of a raw tool value, decides how it is rendered
enum class ShapeKind {
    Null,
    Map,
    Sequence,
    Text,
    Scalar  // number or boolean
};

ShapeKind classify(const Json& value);

// First max_chars UTF-8 code points of text
std::string truncate_chars(std::string_view text, size_t max_chars);

// Turns raw tool output into a ToolExecutionResult sized for the LLM.
// Payloads of at least artifact_threshold bytes at FULL level are offloaded
// to the artifact store when one is configured.
class ResultShaper {
public:
    explicit ResultShaper(ArtifactStore* storage = nullptr,
                          size_t artifact_threshold = 1000000);

    ToolExecutionResult shape(const std::string& tool_call_id,
                              const std::string& tool_name,
                              const Json& raw,
                              std::optional<OutputLevel> level = std::nullopt) const;

    static std::string format_brief(const Json& raw);
    static std::string format_standard(const Json& raw);
    static std::string format_full(const Json& raw);

private:
    ArtifactStore* storage_;
    size_t artifact_threshold_;
};

// Shape with an explicit store; storage may be null
ToolExecutionResult from_raw_data(const std::string& tool_call_id,
                                  const std::string& tool_name,
                                  const Json& raw,
                                  std::optional<OutputLevel> level,
                                  ArtifactStore* storage,
                                  size_t artifact_threshold = 1000000);

}  // namespace toolpipe::pipeline
