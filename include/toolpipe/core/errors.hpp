#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace toolpipe::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    AlreadyExists = 4,
    Timeout = 5,
    Cancelled = 6,
    InternalError = 7,
    InvalidState = 8,

    // Request errors (100-199)
    ValidationFailed = 100,
    InvalidToolCallId = 101,
    InvalidTimeout = 102,
    InvalidParameters = 103,

    // Tool errors (200-299)
    ToolNotFound = 200,
    ToolExecutionFailed = 201,
    ToolTimeout = 202,
    ToolDisabled = 203,

    // Security errors (300-399)
    SecurityViolation = 300,
    InvalidArtifactId = 301,
    PathNotAllowed = 302,

    // Artifact errors (400-499)
    ArtifactNotFound = 400,
    ArtifactStoreFailed = 401,
    ArtifactCorrupted = 402,

    // Index and persistence errors (500-599)
    IndexOpenFailed = 500,
    IndexQueryFailed = 501,
    TraceSaveFailed = 502,
    MetricsSaveFailed = 503,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // File system errors (700-799)
    FileNotFound = 700,
    FileReadFailed = 701,
    FileWriteFailed = 702,
    DirectoryNotFound = 703,
};

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";

        case ErrorCode::ValidationFailed: return "Request validation failed";
        case ErrorCode::InvalidToolCallId: return "tool_call_id must be a non-empty string";
        case ErrorCode::InvalidTimeout: return "timeout_ms out of range";
        case ErrorCode::InvalidParameters: return "parameters must be a JSON object";

        case ErrorCode::ToolNotFound: return "Tool not found";
        case ErrorCode::ToolExecutionFailed: return "Tool execution failed";
        case ErrorCode::ToolTimeout: return "Tool execution timed out";
        case ErrorCode::ToolDisabled: return "Tool is disabled";

        case ErrorCode::SecurityViolation: return "Security violation";
        case ErrorCode::InvalidArtifactId: return "Invalid artifact id";
        case ErrorCode::PathNotAllowed: return "Path not allowed";

        case ErrorCode::ArtifactNotFound: return "Artifact not found";
        case ErrorCode::ArtifactStoreFailed: return "Failed to store artifact";
        case ErrorCode::ArtifactCorrupted: return "Artifact data corrupted";

        case ErrorCode::IndexOpenFailed: return "Failed to open index database";
        case ErrorCode::IndexQueryFailed: return "Index query failed";
        case ErrorCode::TraceSaveFailed: return "Failed to save trace";
        case ErrorCode::MetricsSaveFailed: return "Failed to save metrics";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";

        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadFailed: return "Failed to read file";
        case ErrorCode::FileWriteFailed: return "Failed to write file";
        case ErrorCode::DirectoryNotFound: return "Directory not found";
    }
    return "Unknown error code";
}

// Check if error is retriable
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::ToolTimeout:
        case ErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

// Validation and security rejections happen before any execution
inline bool is_rejection(ErrorCode code) {
    int value = static_cast<int>(code);
    return (value >= 100 && value < 200) || (value >= 300 && value < 400);
}

// Exception a tool may throw to report a named failure kind
class ToolException : public std::runtime_error {
public:
    ToolException(std::string kind, const std::string& message)
        : std::runtime_error(message), kind_(std::move(kind)) {}

    const std::string& kind() const { return kind_; }

private:
    std::string kind_;
};

// Short name for the dynamic type of an exception
std::string exception_kind(const std::exception& e);

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Tool name, artifact id, exception kind, ...
    std::optional<std::string> source;   // Component that raised it

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what(), exception_kind(e)};
    }

    // Predicates
    bool is_retriable() const { return toolpipe::core::is_retriable(code); }
    bool is_rejection() const { return toolpipe::core::is_rejection(code); }
    bool is_ok() const { return code == ErrorCode::Ok; }

    // Get full error message
    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        if (source) {
            result += " at " + *source;
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

// Map an error onto the error_type reported in tool results
// (timeout, validation, security, or the exception kind of a tool failure)
std::string error_type_for(const Error& error);

}  // namespace toolpipe::core
