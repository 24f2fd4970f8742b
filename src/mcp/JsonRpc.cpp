#include "mcp/JsonRpc.h"

nlohmann::json JsonRpc::makeRequest(int id, const std::string& method, const nlohmann::json& params) {
    return {
        {"jsonrpc", kVersion},
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params}
    };
}

nlohmann::json JsonRpc::makeNotification(const std::string& method, const nlohmann::json& params) {
    return {
        {"jsonrpc", kVersion},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params}
    };
}

nlohmann::json JsonRpc::defaultClientInfo() {
    return {{"name", "conduit"}, {"version", "1.0.0"}};
}

nlohmann::json JsonRpc::initializeParams(const nlohmann::json& clientInfo) {
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"clientInfo", clientInfo.is_null() ? defaultClientInfo() : clientInfo}
    };
}

bool JsonRpc::isResponse(const nlohmann::json& msg) {
    if (!msg.is_object()) return false;
    if (msg.contains("method")) return false;
    auto it = msg.find("id");
    if (it == msg.end() || !it->is_number_integer()) return false;
    return msg.contains("result") || msg.contains("error");
}

std::string JsonRpc::errorMessage(const nlohmann::json& error) {
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        std::string message = error["message"].get<std::string>();
        if (error.contains("code") && error["code"].is_number_integer()) {
            message += " (code " + std::to_string(error["code"].get<int>()) + ")";
        }
        return message;
    }
    if (error.is_string()) return error.get<std::string>();
    return error.dump();
}

std::vector<Tool> JsonRpc::parseToolList(const nlohmann::json& result) {
    std::vector<Tool> tools;
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return tools;
    }
    for (const auto& item : result["tools"]) {
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) continue;
        tools.push_back(Tool::fromJson(item));
    }
    return tools;
}

nlohmann::json JsonRpc::extractContent(const nlohmann::json& result) {
    if (result.is_object() && result.contains("content")) {
        return result["content"];
    }
    return result;
}
