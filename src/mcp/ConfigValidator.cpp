#include "mcp/ConfigValidator.h"
#include <algorithm>

namespace {
const std::string kShellMetacharacters = ";|&$`()<>";

std::string joined(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}
} // namespace

const std::vector<std::string>& ConfigValidator::allowedCommands() {
    static const std::vector<std::string> commands = {"npx", "node"};
    return commands;
}

const std::vector<std::string>& ConfigValidator::dangerousFlags() {
    static const std::vector<std::string> flags = {
        "-e", "--eval",
        "-p", "--print",
        "-r", "--require",
        "--import",
        "--inspect", "--inspect-brk", "--inspect-port", "--inspect-wait",
        "--debug", "--debug-brk",
        "--experimental-loader", "--loader",
        "-c", "--call"
    };
    return flags;
}

bool ConfigValidator::hasShellMetacharacters(const std::string& value) {
    return value.find_first_of(kShellMetacharacters) != std::string::npos;
}

bool ConfigValidator::hasTraversal(const std::string& value) {
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find_first_of("/\\", start);
        if (end == std::string::npos) end = value.size();
        if (value.compare(start, end - start, "..") == 0) return true;
        start = end + 1;
    }
    return false;
}

bool ConfigValidator::isDangerousFlag(const std::string& arg) {
    // --flag=value counts as --flag
    std::string flag = arg.substr(0, arg.find('='));
    const auto& flags = dangerousFlags();
    return std::find(flags.begin(), flags.end(), flag) != flags.end();
}

ConfigValidator::ValidationResult ConfigValidator::checkCommand(const std::string& command) {
    const auto& allowed = allowedCommands();
    if (std::find(allowed.begin(), allowed.end(), command) == allowed.end()) {
        return fail(ValidationRule::CommandNotAllowed,
                    "Command '" + command + "' is not allowed. Allowed commands: " + joined(allowed) +
                    ". To use other programs, wrap them in a Node.js script and launch it with node.");
    }
    return ok();
}

ConfigValidator::ValidationResult ConfigValidator::checkArguments(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        if (hasShellMetacharacters(arg)) {
            return fail(ValidationRule::ShellMetacharacters,
                        "Shell metacharacters detected in argument: " + arg);
        }
    }
    for (const auto& arg : args) {
        if (hasTraversal(arg)) {
            return fail(ValidationRule::DirectoryTraversal,
                        "Directory traversal detected in argument: " + arg);
        }
    }
    for (const auto& arg : args) {
        if (isDangerousFlag(arg)) {
            return fail(ValidationRule::DangerousFlag, "Dangerous flag detected: " + arg);
        }
    }
    for (const auto& arg : args) {
        if (arg.size() > kMaxArgumentLength) {
            return fail(ValidationRule::ArgumentTooLong,
                        "Argument too long (max " + std::to_string(kMaxArgumentLength) + " characters)");
        }
    }
    return ok();
}

ConfigValidator::ValidationResult ConfigValidator::checkEnvironment(const std::map<std::string, std::string>& env) {
    for (const auto& [key, value] : env) {
        if (hasShellMetacharacters(key) || hasShellMetacharacters(value)) {
            return fail(ValidationRule::ShellMetacharacters,
                        "Shell metacharacters detected in environment variable: " + key);
        }
        if (hasTraversal(key) || hasTraversal(value)) {
            return fail(ValidationRule::DirectoryTraversal,
                        "Directory traversal detected in environment variable: " + key);
        }
    }
    return ok();
}

ConfigValidator::ValidationResult ConfigValidator::checkLimits(int timeoutMs, int retryCount) {
    if (timeoutMs < kMinTimeoutMs || timeoutMs > kMaxTimeoutMs) {
        return fail(ValidationRule::TimeoutOutOfRange,
                    "Timeout must be between " + std::to_string(kMinTimeoutMs) + " and " +
                    std::to_string(kMaxTimeoutMs) + " ms");
    }
    if (retryCount < kMinRetryCount || retryCount > kMaxRetryCount) {
        return fail(ValidationRule::RetryCountOutOfRange,
                    "Retry count must be between " + std::to_string(kMinRetryCount) + " and " +
                    std::to_string(kMaxRetryCount));
    }
    return ok();
}

ConfigValidator::ValidationResult ConfigValidator::checkEndpoint(const std::string& endpoint) {
    if (endpoint.rfind("http://", 0) != 0 && endpoint.rfind("https://", 0) != 0) {
        return fail(ValidationRule::InvalidEndpoint,
                    "Endpoint must be an http:// or https:// URL: " + endpoint);
    }
    return ok();
}

ConfigValidator::ValidationResult ConfigValidator::check(const ServerDefinition& def) {
    if (def.name.empty()) {
        return fail(ValidationRule::MissingField, "Server name is required");
    }

    ValidationResult result = ok();
    if (def.transportKind == TransportKind::RemoteHttp) {
        result = checkEndpoint(def.endpoint);
    } else {
        result = checkCommand(def.command);
        if (result.valid) result = checkArguments(def.args);
        if (result.valid) result = checkEnvironment(def.env);
    }
    if (!result.valid) return result;

    return checkLimits(def.timeoutMs, def.retryCount);
}

ConfigValidator::ValidationResult ConfigValidator::check(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        return fail(ValidationRule::InvalidType, "Server entry must be an object");
    }
    if (!raw.contains("name") || !raw["name"].is_string() || raw["name"].get<std::string>().empty()) {
        return fail(ValidationRule::MissingField, "Server name is required");
    }

    std::string transport = "stdio";
    if (raw.contains("transport")) {
        if (!raw["transport"].is_string()) {
            return fail(ValidationRule::InvalidType, "Transport must be a string");
        }
        transport = raw["transport"].get<std::string>();
        if (transport != "stdio" && transport != "http") {
            return fail(ValidationRule::InvalidType, "Transport must be 'stdio' or 'http'");
        }
    }

    if (transport == "http") {
        if (!raw.contains("endpoint") || !raw["endpoint"].is_string()) {
            return fail(ValidationRule::MissingField, "Endpoint is required for http servers");
        }
        if (raw.contains("api_key") && !raw["api_key"].is_string()) {
            return fail(ValidationRule::InvalidType, "api_key must be a string");
        }
    } else {
        if (!raw.contains("command") || !raw["command"].is_string()) {
            return fail(ValidationRule::MissingField, "Command is required and must be a string");
        }
        if (raw.contains("args")) {
            if (!raw["args"].is_array()) {
                return fail(ValidationRule::InvalidType, "Arguments must be an array");
            }
            for (const auto& arg : raw["args"]) {
                if (!arg.is_string()) {
                    return fail(ValidationRule::InvalidType, "Arguments must be strings");
                }
            }
        }
        if (raw.contains("env")) {
            if (!raw["env"].is_object()) {
                return fail(ValidationRule::InvalidType, "Environment must be an object");
            }
            // JSON object keys are always strings, numeric ones included.
            for (const auto& item : raw["env"].items()) {
                if (!item.value().is_string()) {
                    return fail(ValidationRule::InvalidType, "Environment variable values must be strings");
                }
            }
        }
    }

    for (const char* key : {"priority", "timeout_ms", "retry_count"}) {
        if (raw.contains(key) && !raw[key].is_number_integer()) {
            return fail(ValidationRule::InvalidType, std::string(key) + " must be an integer");
        }
    }
    if (raw.contains("enabled") && !raw["enabled"].is_boolean()) {
        return fail(ValidationRule::InvalidType, "enabled must be a boolean");
    }
    if (raw.contains("description") && !raw["description"].is_string()) {
        return fail(ValidationRule::InvalidType, "description must be a string");
    }

    return check(ServerDefinition::fromJson(raw));
}

void ConfigValidator::validate(const nlohmann::json& raw) {
    auto result = check(raw);
    if (!result.valid) {
        throw ConfigValidationError(result.rule, result.error);
    }
}

void ConfigValidator::validate(const ServerDefinition& def) {
    auto result = check(def);
    if (!result.valid) {
        throw ConfigValidationError(result.rule, result.error);
    }
}
