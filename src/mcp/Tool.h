#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief A capability discovered on a tool server.
 *
 * Re-fetched on every catalog listing and never persisted. serverName is a
 * back-reference to the ServerDefinition the tool was listed from.
 */
struct Tool {
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
    std::string serverName;

    // Reads one entry of a tools/list result. Throws nlohmann::json::exception on a missing name.
    static Tool fromJson(const nlohmann::json& j) {
        Tool tool;
        tool.name = j.at("name").get<std::string>();
        if (j.contains("description") && j["description"].is_string()) {
            tool.description = j["description"].get<std::string>();
        }
        if (j.contains("inputSchema") && !j["inputSchema"].is_null()) {
            tool.inputSchema = j["inputSchema"];
        }
        return tool;
    }

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"name", name},
            {"description", description},
            {"inputSchema", inputSchema}
        };
        if (!serverName.empty()) {
            j["server_name"] = serverName;
        }
        return j;
    }
};
