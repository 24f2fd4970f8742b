#include "mcp/ToolCatalog.h"
#include "core/Errors.h"
#include <algorithm>

ToolCatalog::ToolCatalog(ServerManager& servers, IEventSink& events)
    : servers(servers), events(events) {}

std::vector<Tool> ToolCatalog::listAll() {
    std::vector<Tool> all;
    for (const auto& serverName : servers.routingOrder()) {
        auto transport = servers.transportFor(serverName);
        if (!transport) continue;
        try {
            for (auto& tool : transport->listTools()) {
                tool.serverName = serverName;
                all.push_back(std::move(tool));
            }
        } catch (const std::exception& e) {
            events.warning("Failed to list tools from MCP server '" + serverName + "': " + e.what());
        }
    }
    return all;
}

nlohmann::json ToolCatalog::describe() {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : listAll()) {
        tools.push_back(tool.toJson());
    }
    return tools;
}

ToolResult ToolCatalog::invoke(const std::string& name, const nlohmann::json& arguments,
                               const std::string& preferredServer) {
    for (const auto& serverName : servers.routingOrder(preferredServer)) {
        auto transport = servers.transportFor(serverName);
        if (!transport) continue;

        try {
            auto tools = transport->listTools();
            bool found = std::any_of(tools.begin(), tools.end(),
                                     [&name](const Tool& tool) { return tool.name == name; });
            if (!found) continue;

            events.emit(EventKind::ToolStarted, name,
                        {{"server", serverName}, {"arguments", arguments}});
            auto content = transport->invoke(name, arguments);
            events.emit(EventKind::ToolOutput, name + " completed",
                        {{"server", serverName}, {"content", content}});
            return {serverName, content};
        } catch (const std::exception& e) {
            servers.recordInvocationError(serverName, e.what());
        }
    }
    throw ToolNotFoundError(name);
}
