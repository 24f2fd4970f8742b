#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/Tool.h"

/**
 * @brief System-prompt section that teaches the model how to call tools.
 */
class ToolPrompt {
public:
    static std::string build(const std::vector<Tool>& tools);

    // {"name": tool, "arguments": {<property>: <placeholder>}} from the input schema.
    static nlohmann::json usageExample(const Tool& tool);

    /**
     * @brief Tool result content as plain text.
     *
     * Arrays of content parts become their "text" members joined by newlines;
     * strings pass through; anything else is serialized.
     */
    static std::string renderContent(const nlohmann::json& content);
};
