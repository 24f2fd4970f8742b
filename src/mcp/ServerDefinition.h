#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

enum class TransportKind {
    LocalProcess,
    RemoteHttp
};

const char* transportKindName(TransportKind kind);

/**
 * @brief Static configuration of one tool server.
 *
 * Immutable once validated. Replacing a definition by name (ServerManager::addServer)
 * resets the server's runtime state.
 */
struct ServerDefinition {
    std::string name;
    TransportKind transportKind = TransportKind::LocalProcess;

    // local-process launch settings
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    // remote-http
    std::string endpoint;
    std::string credential;

    int priority = 100;  // lower is tried first
    bool enabled = true;
    int timeoutMs = 10000;
    int retryCount = 3;
    std::string description;

    /**
     * @brief Builds a definition from one "mcp_servers" entry.
     *
     * Expects the entry to have passed ConfigValidator's type checks; a credential
     * written as ${NAME} is resolved from the process environment.
     */
    static ServerDefinition fromJson(const nlohmann::json& j);

    // Credential is never serialized.
    nlohmann::json toJson() const;
};
