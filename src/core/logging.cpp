#include "toolpipe/core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace toolpipe::core {

spdlog::level::level_enum parse_log_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void setup_logging(const ObservabilityConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (config.log_to_file) {
        std::error_code ec;
        fs::create_directories(config.log_path, ec);
        if (ec) {
            spdlog::warn("Cannot create log directory {}: {}", config.log_path.string(), ec.message());
        } else {
            auto file = (config.log_path / "toolpipe.log").string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file, 10 * 1024 * 1024, 3));
        }
    }

    spdlog::drop("toolpipe");
    auto logger = std::make_shared<spdlog::logger>("toolpipe", sinks.begin(), sinks.end());
    logger->set_level(parse_log_level(config.log_level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

}  // namespace toolpipe::core
