#pragma once

#include "toolpipe/core/types.hpp"
#include "span.hpp"

#include <string>

namespace toolpipe::monitoring {

using namespace toolpipe::core;

// Mermaid flowchart of a span tree ("graph TD", breadth-first)
std::string render_mermaid(const Span& root);

// Same, from a serialized root span
std::string render_mermaid(const Json& root_span);

// Depth-first list of spans without children, annotated with depth and event_count
Json flatten_spans(const Json& root_span);

// Status glyph used in visualizations
const char* status_icon(const std::string& status);

}  // namespace toolpipe::monitoring
