#include "mcp/ServerDefinition.h"
#include <cstdlib>

namespace {
std::string resolveCredential(const std::string& raw) {
    if (raw.size() > 3 && raw.compare(0, 2, "${") == 0 && raw.back() == '}') {
        std::string varName = raw.substr(2, raw.size() - 3);
        const char* value = std::getenv(varName.c_str());
        return value ? std::string(value) : std::string();
    }
    return raw;
}
} // namespace

const char* transportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::LocalProcess: return "stdio";
        case TransportKind::RemoteHttp: return "http";
    }
    return "unknown";
}

ServerDefinition ServerDefinition::fromJson(const nlohmann::json& j) {
    ServerDefinition def;
    def.name = j.value("name", "");

    std::string transport = j.value("transport", "stdio");
    def.transportKind = (transport == "http") ? TransportKind::RemoteHttp : TransportKind::LocalProcess;

    def.command = j.value("command", "");
    if (j.contains("args")) {
        def.args = j["args"].get<std::vector<std::string>>();
    }
    if (j.contains("env")) {
        for (auto& [key, value] : j["env"].items()) {
            def.env[key] = value.get<std::string>();
        }
    }

    def.endpoint = j.value("endpoint", "");
    def.credential = resolveCredential(j.value("api_key", ""));

    def.priority = j.value("priority", 100);
    def.enabled = j.value("enabled", true);
    def.timeoutMs = j.value("timeout_ms", 10000);
    def.retryCount = j.value("retry_count", 3);
    def.description = j.value("description", "");
    return def;
}

nlohmann::json ServerDefinition::toJson() const {
    nlohmann::json j = {
        {"name", name},
        {"transport", transportKindName(transportKind)},
        {"priority", priority},
        {"enabled", enabled},
        {"timeout_ms", timeoutMs},
        {"retry_count", retryCount},
        {"description", description}
    };
    if (transportKind == TransportKind::LocalProcess) {
        j["command"] = command;
        j["args"] = args;
        j["env"] = env;
    } else {
        j["endpoint"] = endpoint;
    }
    return j;
}
