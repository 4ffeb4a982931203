#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace goapagent::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    AlreadyExists = 4,
    Timeout = 6,
    Cancelled = 7,
    NotImplemented = 8,
    InternalError = 9,
    InvalidState = 10,

    // Agent definition errors (100-199)
    InvalidBinding = 100,
    AgentNotFound = 101,
    AgentAlreadyDeployed = 102,
    AgentHasNoGoals = 103,
    DuplicateActionName = 104,

    // Process errors (200-299)
    ProcessNotFound = 200,
    ProcessAlreadyTerminal = 201,
    GoalChangeNotAllowed = 202,
    ProcessStuck = 203,
    EarlyTermination = 204,

    // Action execution errors (300-399)
    ActionNotFound = 300,
    ActionFailed = 301,
    ActionRetriesExhausted = 302,
    ActionTimeout = 303,
    AmbiguousAction = 304,
    TransientActionFailure = 305,

    // Planning errors (400-499)
    NoPlanFound = 400,
    PlanningFailed = 401,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,
    ConfigKeyMissing = 603,

    // File system errors (700-799)
    FileNotFound = 700,
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
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::NotImplemented: return "Not implemented";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";

        case ErrorCode::InvalidBinding: return "Invalid binding";
        case ErrorCode::AgentNotFound: return "Agent not found";
        case ErrorCode::AgentAlreadyDeployed: return "Agent already deployed";
        case ErrorCode::AgentHasNoGoals: return "Agent has no goals";
        case ErrorCode::DuplicateActionName: return "Duplicate action name";

        case ErrorCode::ProcessNotFound: return "Agent process not found";
        case ErrorCode::ProcessAlreadyTerminal: return "Agent process already finished";
        case ErrorCode::GoalChangeNotAllowed: return "Goal change not allowed";
        case ErrorCode::ProcessStuck: return "Agent process stuck";
        case ErrorCode::EarlyTermination: return "Agent process terminated early";

        case ErrorCode::ActionNotFound: return "Action not found";
        case ErrorCode::ActionFailed: return "Action failed";
        case ErrorCode::ActionRetriesExhausted: return "Action retries exhausted";
        case ErrorCode::ActionTimeout: return "Action timed out";
        case ErrorCode::AmbiguousAction: return "More than one action with the same name";
        case ErrorCode::TransientActionFailure: return "Transient action failure";

        case ErrorCode::NoPlanFound: return "No plan found";
        case ErrorCode::PlanningFailed: return "Planning failed";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";
        case ErrorCode::ConfigKeyMissing: return "Required configuration key missing";

        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileWriteFailed: return "Failed to write file";
    }
    return "Unknown error code";
}

// Check if error is retriable
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::Timeout:
        case ErrorCode::ActionTimeout:
        case ErrorCode::TransientActionFailure:
            return true;
        default:
            return false;
    }
}

// Check if error is fatal (no recovery possible)
inline bool is_fatal(ErrorCode code) {
    switch (code) {
        case ErrorCode::AgentHasNoGoals:
        case ErrorCode::GoalChangeNotAllowed:
        case ErrorCode::AmbiguousAction:
        case ErrorCode::ConfigParseFailed:
        case ErrorCode::ConfigValidationFailed:
            return true;
        default:
            return false;
    }
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Process id, action name, file path...
    std::optional<std::string> source;   // Component that raised it

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error from_code(ErrorCode code) {
        return Error{code};
    }

    static Error from_code(ErrorCode code, std::string context) {
        Error e{code};
        e.context = std::move(context);
        return e;
    }

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::ActionFailed, e.what()};
    }

    bool is_retriable() const { return goapagent::core::is_retriable(code); }
    bool is_fatal() const { return goapagent::core::is_fatal(code); }
    bool is_ok() const { return code == ErrorCode::Ok; }

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

// Thrown when the platform is used incorrectly: a run without goals,
// a forbidden goal switch, a malformed binding.
class UsageError : public std::logic_error {
public:
    explicit UsageError(Error error)
        : std::logic_error(error.full_message()), error_(std::move(error)) {}

    UsageError(ErrorCode code, std::string message)
        : UsageError(Error{code, std::move(message)}) {}

    const Error& error() const { return error_; }

private:
    Error error_;
};

}  // namespace goapagent::core
