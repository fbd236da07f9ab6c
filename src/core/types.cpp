#include "toolpipe/core/types.hpp"

#include <ctime>

namespace toolpipe::core {

std::string format_time(double unix_seconds, const char* format) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buffer[64];
    size_t n = std::strftime(buffer, sizeof(buffer), format, &tm);
    return std::string(buffer, n);
}

}  // namespace toolpipe::core
