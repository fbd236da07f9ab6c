#pragma once

#include "config.hpp"

#include <spdlog/spdlog.h>

namespace toolpipe::core {

// Parse a configured level name; unknown names fall back to info
spdlog::level::level_enum parse_log_level(const std::string& level);

// Install the "toolpipe" logger as spdlog's default logger.
// Console output goes to stderr; a rotating file sink is added when
// log_to_file is set.
void setup_logging(const ObservabilityConfig& config);

}  // namespace toolpipe::core
