#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/Tool.h"
#include "mcp/ServerDefinition.h"

/**
 * @brief Wire-level connection to one tool server.
 *
 * Two implementations: StdioTransport (owned subprocess, newline-delimited
 * frames) and HttpTransport (one POST per call). The catalog and router only
 * see this interface.
 *
 * Every call except probe() and isConnected() reports failure by throwing
 * TransportError. Implementations must accept concurrent outstanding calls.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual TransportKind kind() const = 0;

    /**
     * @brief Opens the connection (spawns the process for stdio).
     */
    virtual void connect() = 0;

    /**
     * @brief initialize + initialized notification.
     * @return the server's capabilities object
     */
    virtual nlohmann::json handshake(const nlohmann::json& clientInfo) = 0;

    virtual std::vector<Tool> listTools() = 0;

    /**
     * @brief tools/call
     * @return the result's "content" member
     */
    virtual nlohmann::json invoke(const std::string& name, const nlohmann::json& arguments) = 0;

    // Liveness check bounded by the server's timeout; never throws.
    virtual bool probe() = 0;

    virtual bool isConnected() const = 0;

    // Kills the handle and fails anything still waiting on it. Safe to call twice.
    virtual void disconnect() = 0;
};
