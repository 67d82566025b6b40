#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace codebox::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    AlreadyExists = 4,
    PermissionDenied = 5,
    Timeout = 6,
    Cancelled = 7,
    InternalError = 9,
    InvalidState = 10,

    // Tool errors (300-399)
    ToolNotFound = 300,
    ToolExecutionFailed = 301,
    ToolValidationFailed = 302,
    ToolTimeout = 303,
    ToolDisabled = 307,
    CommandNotAllowed = 308,
    UnsupportedLanguage = 309,

    // Process errors (400-499)
    PipeFailed = 400,
    ProcessStartFailed = 401,
    ProcessWaitFailed = 402,
    StreamReadFailed = 403,

    // Container errors (500-599)
    RuntimeUnavailable = 500,
    ImagePullFailed = 501,
    ContainerCreateFailed = 502,
    ContainerStartFailed = 503,
    ContainerWaitFailed = 504,
    ContainerLogsFailed = 505,
    ContainerRemoveFailed = 506,
    DeadlineExceeded = 507,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // File system errors (700-799)
    FileNotFound = 700,
    FileReadFailed = 701,
    FileWriteFailed = 702,
};

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";

        case ErrorCode::ToolNotFound: return "Tool not found";
        case ErrorCode::ToolExecutionFailed: return "Tool execution failed";
        case ErrorCode::ToolValidationFailed: return "Tool parameter validation failed";
        case ErrorCode::ToolTimeout: return "Tool execution timed out";
        case ErrorCode::ToolDisabled: return "Tool is disabled";
        case ErrorCode::CommandNotAllowed: return "Command not allowed by policy";
        case ErrorCode::UnsupportedLanguage: return "Unsupported language";

        case ErrorCode::PipeFailed: return "Failed to create pipe";
        case ErrorCode::ProcessStartFailed: return "Failed to start process";
        case ErrorCode::ProcessWaitFailed: return "Failed waiting for process";
        case ErrorCode::StreamReadFailed: return "Failed to read stream";

        case ErrorCode::RuntimeUnavailable: return "Container runtime unavailable";
        case ErrorCode::ImagePullFailed: return "Failed to pull image";
        case ErrorCode::ContainerCreateFailed: return "Failed to create container";
        case ErrorCode::ContainerStartFailed: return "Failed to start container";
        case ErrorCode::ContainerWaitFailed: return "Failed to wait for container";
        case ErrorCode::ContainerLogsFailed: return "Failed to retrieve logs";
        case ErrorCode::ContainerRemoveFailed: return "Failed to remove container";
        case ErrorCode::DeadlineExceeded: return "Deadline exceeded";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";

        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadFailed: return "Failed to read file";
        case ErrorCode::FileWriteFailed: return "Failed to write file";
    }
    return "Unknown error code";
}

// Validation errors: the caller can fix its input and resubmit
inline bool is_validation_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::ToolValidationFailed:
        case ErrorCode::CommandNotAllowed:
        case ErrorCode::UnsupportedLanguage:
            return true;
        default:
            return false;
    }
}

// Check if error is retriable
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::RuntimeUnavailable:
        case ErrorCode::ImagePullFailed:
        case ErrorCode::DeadlineExceeded:
        case ErrorCode::ToolTimeout:
        case ErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Additional context (tool name, container id, ...)
    std::optional<std::string> source;   // Component that produced the error

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    bool is_validation() const { return is_validation_error(code); }
    bool is_retriable() const { return codebox::core::is_retriable(code); }
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

// Prefix the message with the stage that failed; the code is preserved
inline Error wrap_error(Error error, std::string_view stage) {
    error.message = std::string(stage) + ": " + error.message;
    return error;
}

}  // namespace codebox::core
