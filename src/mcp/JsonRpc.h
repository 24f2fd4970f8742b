#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/Tool.h"

/**
 * @brief JSON-RPC 2.0 frames used for tool discovery and invocation.
 *
 * Shared by the stdio and HTTP transports so both put identical bodies on the wire.
 */
class JsonRpc {
public:
    static constexpr const char* kVersion = "2.0";
    static constexpr const char* kProtocolVersion = "2024-11-05";

    static constexpr const char* kInitialize = "initialize";
    static constexpr const char* kInitialized = "notifications/initialized";
    static constexpr const char* kListTools = "tools/list";
    static constexpr const char* kCallTool = "tools/call";
    static constexpr const char* kPing = "ping";

    static nlohmann::json makeRequest(int id, const std::string& method, const nlohmann::json& params);
    static nlohmann::json makeNotification(const std::string& method, const nlohmann::json& params);

    // {"name": "conduit", "version": "1.0.0"}
    static nlohmann::json defaultClientInfo();
    static nlohmann::json initializeParams(const nlohmann::json& clientInfo);

    // A response carries an integer id plus result or error, and no method.
    static bool isResponse(const nlohmann::json& msg);
    static std::string errorMessage(const nlohmann::json& error);

    // Parses {tools: [...]}; entries without a name are skipped.
    static std::vector<Tool> parseToolList(const nlohmann::json& result);
    // tools/call result -> its "content" member, or the whole result when absent.
    static nlohmann::json extractContent(const nlohmann::json& result);
};
