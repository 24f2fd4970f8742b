#include "agent/ToolPrompt.h"
#include <sstream>

namespace {
// "type" may be a single name or a list such as ["string", "null"].
std::string schemaType(const nlohmann::json& property) {
    if (!property.is_object() || !property.contains("type")) return "string";
    const auto& type = property["type"];
    if (type.is_string()) return type.get<std::string>();
    if (type.is_array()) {
        for (const auto& entry : type) {
            if (entry.is_string() && entry.get<std::string>() != "null") return entry.get<std::string>();
        }
    }
    return "string";
}
} // namespace

std::string ToolPrompt::build(const std::vector<Tool>& tools) {
    if (tools.empty()) return "";

    std::ostringstream prompt;
    prompt << "TOOLS AVAILABLE:\n";
    prompt << "You can use the following tools to perform actions. "
              "To use a tool, you MUST output a JSON object wrapped in <tool_code> tags.\n";
    prompt << "Format:\n<tool_code>\n{\n  \"name\": \"tool_name\",\n  \"arguments\": {\n"
              "    \"arg_name\": \"value\"\n  }\n}\n</tool_code>\n";
    prompt << "Call at most one tool per reply and wait for its output.\n\n";

    for (const auto& tool : tools) {
        prompt << "- " << tool.name << ": "
               << (tool.description.empty() ? "No description provided" : tool.description) << "\n";
        prompt << "  Usage: " << usageExample(tool).dump() << "\n";
    }

    prompt << "\nExample:\n"
              "User: List files in src\n"
              "Assistant: I will list the files.\n"
              "<tool_code>\n{\n  \"name\": \"list_files\",\n  \"arguments\": {\n    \"path\": \"src\"\n  }\n}\n</tool_code>\n"
              "System: TOOL OUTPUT: [Output of ls]\n"
              "Assistant: I see the files...\n";
    return prompt.str();
}

nlohmann::json ToolPrompt::usageExample(const Tool& tool) {
    nlohmann::json arguments = nlohmann::json::object();
    const auto& schema = tool.inputSchema;
    if (schema.is_object() && schema.contains("properties") && schema["properties"].is_object()) {
        for (const auto& [key, property] : schema["properties"].items()) {
            std::string type = schemaType(property);
            if (type == "integer" || type == "number") {
                arguments[key] = 0;
            } else if (type == "boolean") {
                arguments[key] = false;
            } else if (type == "array") {
                arguments[key] = nlohmann::json::array();
            } else if (type == "object") {
                arguments[key] = nlohmann::json::object();
            } else {
                arguments[key] = "<" + key + ">";
            }
        }
    }
    return {{"name", tool.name}, {"arguments", arguments}};
}

std::string ToolPrompt::renderContent(const nlohmann::json& content) {
    if (content.is_string()) return content.get<std::string>();
    if (content.is_array()) {
        std::string text;
        bool first = true;
        for (const auto& part : content) {
            if (!part.is_object() || !part.contains("text") || !part["text"].is_string()) continue;
            if (!first) text += "\n";
            first = false;
            text += part["text"].get<std::string>();
        }
        return text;
    }
    if (content.is_null()) return "";
    return content.dump();
}
