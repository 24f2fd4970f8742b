#include "mcp/HttpTransport.h"
#include "mcp/JsonRpc.h"
#include "core/Errors.h"
#include <httplib.h>
#include <sstream>

HttpTransport::HttpTransport(const std::string& endpoint, const std::string& credential, int timeoutMs)
    : endpoint(endpoint), credential(credential), timeoutMs(timeoutMs) {}

void HttpTransport::connect() {
    auto parsed = parseUrl(endpoint);
    if (!parsed) {
        throw TransportError("Invalid endpoint URL: " + endpoint);
    }
    url = *parsed;
    if (url.path.empty()) url.path = "/";
    connected = true;
}

nlohmann::json HttpTransport::parseBody(const std::string& body, const std::string& contentType) {
    // Streamable-HTTP servers may answer with an event stream; the last data line carries the response.
    if (contentType.find("text/event-stream") != std::string::npos) {
        std::istringstream lines(body);
        std::string line;
        std::string lastData;
        while (std::getline(lines, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.rfind("data:", 0) == 0) {
                lastData = line.substr(5);
            }
        }
        return nlohmann::json::parse(lastData);
    }
    return nlohmann::json::parse(body);
}

nlohmann::json HttpTransport::sendRequest(const std::string& method, const nlohmann::json& params) {
    if (!connected) {
        throw TransportError("HTTP server " + endpoint + " not connected");
    }

    httplib::Client cli(url.schemeHostPort());
    cli.set_follow_location(true);
    cli.set_connection_timeout(std::chrono::milliseconds(timeoutMs));
    cli.set_read_timeout(std::chrono::milliseconds(timeoutMs));
    cli.set_write_timeout(std::chrono::milliseconds(timeoutMs));

    httplib::Headers headers = {
        {"Authorization", "Bearer " + credential},
        {"Accept", "application/json, text/event-stream"}
    };
    std::string body = JsonRpc::makeRequest(++requestId, method, params).dump();

    auto res = cli.Post(url.path.c_str(), headers, body, "application/json");
    if (!res) {
        throw TransportError("HTTP MCP request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw TransportError("HTTP MCP request failed: " + std::to_string(res->status));
    }

    nlohmann::json response;
    try {
        response = parseBody(res->body, res->get_header_value("Content-Type"));
    } catch (const nlohmann::json::exception& e) {
        throw TransportError(std::string("Invalid JSON from HTTP MCP server: ") + e.what());
    }

    if (response.is_object() && response.contains("error") && !response["error"].is_null()) {
        throw TransportError("MCP error: " + JsonRpc::errorMessage(response["error"]));
    }
    if (method != JsonRpc::kCallTool) {
        rememberGood(method, params);
    }
    return response.is_object() && response.contains("result") ? response["result"] : nlohmann::json();
}

void HttpTransport::rememberGood(const std::string& method, const nlohmann::json& params) {
    std::lock_guard<std::mutex> lock(mtx);
    lastGoodMethod = method;
    lastGoodParams = params;
}

nlohmann::json HttpTransport::handshake(const nlohmann::json& info) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        clientInfo = info;
    }
    auto result = sendRequest(JsonRpc::kInitialize, JsonRpc::initializeParams(info));
    if (result.is_object() && result.contains("capabilities")) {
        return result["capabilities"];
    }
    return nlohmann::json::object();
}

std::vector<Tool> HttpTransport::listTools() {
    return JsonRpc::parseToolList(sendRequest(JsonRpc::kListTools, nlohmann::json::object()));
}

nlohmann::json HttpTransport::invoke(const std::string& name, const nlohmann::json& arguments) {
    nlohmann::json params = {
        {"name", name},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };
    return JsonRpc::extractContent(sendRequest(JsonRpc::kCallTool, params));
}

bool HttpTransport::probe() {
    if (!connected) return false;

    std::string method;
    nlohmann::json params;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (lastGoodMethod.empty()) {
            method = JsonRpc::kInitialize;
            params = JsonRpc::initializeParams(clientInfo);
        } else {
            method = lastGoodMethod;
            params = lastGoodParams;
        }
    }

    try {
        sendRequest(method, params);
        return true;
    } catch (const TransportError&) {
        return false;
    }
}
