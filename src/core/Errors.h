#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Category of a failed server-configuration check.
 *
 * Carried by ConfigValidationError so callers can explain why a definition
 * was refused.
 */
enum class ValidationRule {
    None,
    MissingField,
    InvalidType,
    InvalidEndpoint,
    CommandNotAllowed,
    ShellMetacharacters,
    DirectoryTraversal,
    DangerousFlag,
    ArgumentTooLong,
    TimeoutOutOfRange,
    RetryCountOutOfRange
};

inline const char* validationRuleName(ValidationRule rule) {
    switch (rule) {
        case ValidationRule::None: return "none";
        case ValidationRule::MissingField: return "missing_field";
        case ValidationRule::InvalidType: return "invalid_type";
        case ValidationRule::InvalidEndpoint: return "invalid_endpoint";
        case ValidationRule::CommandNotAllowed: return "command_not_allowed";
        case ValidationRule::ShellMetacharacters: return "shell_metacharacters";
        case ValidationRule::DirectoryTraversal: return "directory_traversal";
        case ValidationRule::DangerousFlag: return "dangerous_flag";
        case ValidationRule::ArgumentTooLong: return "argument_too_long";
        case ValidationRule::TimeoutOutOfRange: return "timeout_out_of_range";
        case ValidationRule::RetryCountOutOfRange: return "retry_count_out_of_range";
    }
    return "unknown";
}

class ConfigValidationError : public std::runtime_error {
public:
    ConfigValidationError(ValidationRule rule, const std::string& message)
        : std::runtime_error(message), rule(rule) {}

    ValidationRule getRule() const { return rule; }

private:
    ValidationRule rule;
};

// Spawn, handshake, write/read, timeout, HTTP status or JSON-RPC error object.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

class ToolNotFoundError : public std::runtime_error {
public:
    explicit ToolNotFoundError(const std::string& toolName)
        : std::runtime_error("Tool '" + toolName + "' not found or no healthy servers available"),
          toolName(toolName) {}

    const std::string& getToolName() const { return toolName; }

private:
    std::string toolName;
};

class ModelProviderError : public std::runtime_error {
public:
    explicit ModelProviderError(const std::string& message) : std::runtime_error(message) {}
};
