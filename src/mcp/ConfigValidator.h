#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "core/Errors.h"
#include "mcp/ServerDefinition.h"

/**
 * @brief Security gate for tool-server launch configuration.
 *
 * Runs before any transport is constructed. Violations are hard failures:
 * no process is spawned and no request is sent for a refused definition.
 *
 * Rules, first failure wins:
 *  1. command is one of the vetted launchers
 *  2. no shell metacharacters in any argument
 *  3. no ".." path segment in any argument
 *  4. no interpreter eval / debugger / loader flags
 *  5. every argument at most 1000 characters
 *  6. env keys and values are strings without metacharacters or traversal
 *  7. timeout in [1000, 60000] ms, retry count in [0, 10]
 */
class ConfigValidator {
public:
    struct ValidationResult {
        bool valid;
        std::string error;
        ValidationRule rule;  // Which rule was violated
    };

    static constexpr size_t kMaxArgumentLength = 1000;
    static constexpr int kMinTimeoutMs = 1000;
    static constexpr int kMaxTimeoutMs = 60000;
    static constexpr int kMinRetryCount = 0;
    static constexpr int kMaxRetryCount = 10;

    static const std::vector<std::string>& allowedCommands();
    static const std::vector<std::string>& dangerousFlags();

    /**
     * @brief Checks one raw "mcp_servers" entry.
     *
     * Type rules (non-string args, non-string env values) can only be seen
     * on the raw form, so configuration loading goes through this overload.
     */
    static ValidationResult check(const nlohmann::json& raw);

    static ValidationResult check(const ServerDefinition& def);

    // Same as check() but throws ConfigValidationError on failure.
    static void validate(const nlohmann::json& raw);
    static void validate(const ServerDefinition& def);

    static bool hasShellMetacharacters(const std::string& value);
    static bool hasTraversal(const std::string& value);
    static bool isDangerousFlag(const std::string& arg);

private:
    static ValidationResult checkCommand(const std::string& command);
    static ValidationResult checkArguments(const std::vector<std::string>& args);
    static ValidationResult checkEnvironment(const std::map<std::string, std::string>& env);
    static ValidationResult checkLimits(int timeoutMs, int retryCount);
    static ValidationResult checkEndpoint(const std::string& endpoint);

    static ValidationResult ok() { return {true, "", ValidationRule::None}; }
    static ValidationResult fail(ValidationRule rule, const std::string& error) { return {false, error, rule}; }
};
