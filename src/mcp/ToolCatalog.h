#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/Tool.h"
#include "mcp/ServerManager.h"
#include "core/EventSink.h"

struct ToolResult {
    std::string serverName;
    nlohmann::json content;
};

/**
 * @brief Aggregates tools across healthy servers and routes invocations.
 *
 * Candidates are tried strictly one after another, never in parallel, so a
 * non-idempotent tool runs at most once per successful call.
 */
class ToolCatalog {
public:
    ToolCatalog(ServerManager& servers, IEventSink& events);

    // Every tool of every enabled, healthy server, in priority order. A server that
    // fails to list is reported and skipped.
    std::vector<Tool> listAll();

    /**
     * @brief Runs a tool on the first server that has it and succeeds.
     *
     * Order: preferredServer first when given and healthy, then ascending
     * priority. A transport failure is recorded on that server and the next
     * candidate is tried.
     * @throws ToolNotFoundError when no candidate both has the tool and succeeds
     */
    ToolResult invoke(const std::string& name, const nlohmann::json& arguments,
                      const std::string& preferredServer = "");

    // Tool list as JSON for prompts and the /tools command.
    nlohmann::json describe();

private:
    ServerManager& servers;
    IEventSink& events;
};
