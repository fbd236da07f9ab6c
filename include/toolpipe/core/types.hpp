#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolpipe::core {

// JSON alias (object keys are kept sorted)
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Wall clock in unix seconds, injectable for tests
using ClockFn = std::function<double()>;

// Common type aliases
using ConversationId = std::string;
using SessionId = std::string;
using TraceId = std::string;
using SpanId = std::string;
using ArtifactId = std::string;
using ToolId = std::string;

// Current time as fractional unix seconds
inline double unix_now() {
    return std::chrono::duration<double>(Clock::now().time_since_epoch()).count();
}

inline double to_unix_seconds(TimePoint tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

inline TimePoint from_unix_seconds(double seconds) {
    return TimePoint{std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(seconds))};
}

// Format a unix timestamp with strftime, local time
std::string format_time(double unix_seconds, const char* format);

// ISO-8601 form used in logs and JSON exports
inline std::string to_iso8601(double unix_seconds) {
    return format_time(unix_seconds, "%Y-%m-%dT%H:%M:%S");
}

// Tool call as emitted by the LLM
struct ToolCall {
    std::string id;
    ToolId tool_name;
    Json arguments;

    Json to_json() const {
        return Json{
            {"id", id},
            {"name", tool_name},
            {"arguments", arguments}
        };
    }

    static ToolCall from_json(const Json& j) {
        return ToolCall{
            .id = j.value("id", ""),
            .tool_name = j.value("name", ""),
            .arguments = j.value("arguments", Json::object())
        };
    }
};

// Reply to the LLM for one tool call
struct ToolMessage {
    std::string tool_call_id;
    std::string content;
    bool is_error = false;

    Json to_json() const {
        return Json{
            {"role", "tool"},
            {"tool_call_id", tool_call_id},
            {"content", content},
            {"is_error", is_error}
        };
    }
};

}  // namespace toolpipe::core
