#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "mcp/ConfigValidator.h"
#include "mcp/ServerDefinition.h"

struct Config {
    struct LLM {
        std::string apiKey;
        std::string baseUrl = "https://api.openai.com/v1";
        std::string model = "gpt-4o-mini";
        std::string systemRole;
    } llm;

    struct Agent {
        int maxToolSteps = 5;
        int healthCheckIntervalMs = 30000;
        int restartDelayMs = 1000;
        std::string logFile = "conduit.log";
        bool enableDebug = false;  // 是否启用调试日志
        bool streaming = false;
    } agent;

    // Each entry has passed ConfigValidator.
    std::vector<ServerDefinition> mcpServers;

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j);
    }

    /**
     * @brief Builds a Config from parsed JSON.
     * @throws ConfigValidationError for a refused mcp_servers entry
     * @throws std::runtime_error for a malformed llm/agent section
     */
    static Config fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        Config cfg;
        try {
            if (j.contains("llm")) {
                const auto& llm = j.at("llm");
                cfg.llm.apiKey = llm.value("api_key", "");
                cfg.llm.baseUrl = llm.value("base_url", cfg.llm.baseUrl);
                cfg.llm.model = llm.value("model", cfg.llm.model);
                cfg.llm.systemRole = llm.value("system_role", "");
            }

            if (j.contains("agent")) {
                const auto& agent = j.at("agent");
                cfg.agent.maxToolSteps = agent.value("max_tool_steps", cfg.agent.maxToolSteps);
                cfg.agent.healthCheckIntervalMs = agent.value("health_check_interval_ms", cfg.agent.healthCheckIntervalMs);
                cfg.agent.restartDelayMs = agent.value("restart_delay_ms", cfg.agent.restartDelayMs);
                cfg.agent.logFile = agent.value("log_file", cfg.agent.logFile);
                cfg.agent.enableDebug = agent.value("enable_debug", false);
                cfg.agent.streaming = agent.value("streaming", false);
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid config value: ") + e.what());
        }

        if (cfg.agent.maxToolSteps < 1) {
            throw std::runtime_error("agent.max_tool_steps must be at least 1");
        }
        if (cfg.agent.healthCheckIntervalMs < 1) {
            throw std::runtime_error("agent.health_check_interval_ms must be positive");
        }

        if (j.contains("mcp_servers")) {
            if (!j["mcp_servers"].is_array()) {
                throw std::runtime_error("mcp_servers must be an array");
            }
            for (const auto& item : j["mcp_servers"]) {
                // 先在原始 JSON 上校验,类型错误 (非字符串参数等) 只有这里看得到
                ConfigValidator::validate(item);
                cfg.mcpServers.push_back(ServerDefinition::fromJson(item));
            }
        }
        return cfg;
    }
};
