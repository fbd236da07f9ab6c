#include "toolpipe/core/errors.hpp"

#include <new>
#include <system_error>

#include <nlohmann/json.hpp>

namespace toolpipe::core {

std::string exception_kind(const std::exception& e) {
    if (auto* tool_error = dynamic_cast<const ToolException*>(&e)) {
        return tool_error->kind();
    }
    if (dynamic_cast<const nlohmann::json::exception*>(&e)) return "json_error";
    if (dynamic_cast<const std::invalid_argument*>(&e)) return "invalid_argument";
    if (dynamic_cast<const std::out_of_range*>(&e)) return "out_of_range";
    if (dynamic_cast<const std::domain_error*>(&e)) return "domain_error";
    if (dynamic_cast<const std::logic_error*>(&e)) return "logic_error";
    if (dynamic_cast<const std::system_error*>(&e)) return "system_error";
    if (dynamic_cast<const std::range_error*>(&e)) return "range_error";
    if (dynamic_cast<const std::overflow_error*>(&e)) return "overflow_error";
    if (dynamic_cast<const std::runtime_error*>(&e)) return "runtime_error";
    if (dynamic_cast<const std::bad_alloc*>(&e)) return "bad_alloc";
    return "exception";
}

std::string error_type_for(const Error& error) {
    switch (error.code) {
        case ErrorCode::ToolTimeout:
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::ValidationFailed:
        case ErrorCode::InvalidToolCallId:
        case ErrorCode::InvalidTimeout:
        case ErrorCode::InvalidParameters:
            return "validation";
        case ErrorCode::SecurityViolation:
        case ErrorCode::InvalidArtifactId:
        case ErrorCode::PathNotAllowed:
            return "security";
        case ErrorCode::ToolNotFound:
            return "tool_not_found";
        case ErrorCode::ToolDisabled:
            return "tool_disabled";
        case ErrorCode::ToolExecutionFailed:
            return error.context.value_or("exception");
        default:
            return "internal";
    }
}

}  // namespace toolpipe::core
