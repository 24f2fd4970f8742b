#include <iostream>
#include <string>
#include <vector>
#include <sstream>
#include <filesystem>
#include <chrono>
#include "core/ConfigManager.h"
#include "core/LLMClient.h"
#include "core/SessionStore.h"
#include "core/EventSink.h"
#include "core/Errors.h"
#include "mcp/ServerManager.h"
#include "mcp/ToolCatalog.h"
#include "agent/AgentRuntime.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string YELLOW = "\033[38;5;226m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";

void printLogo() {
    std::cout << CYAN << BOLD << "\n  conduit" << RESET << GRAY << "  tool-server client for chat models\n" << RESET << std::endl;
}

void printUsage() {
    std::cout << "Usage: conduit [config.json]\n"
              << "  Without an argument, config.json is looked up in the current directory,\n"
              << "  its parent, and next to the executable." << std::endl;
}

void printHelp() {
    std::cout << GRAY
              << "  /servers          show server status\n"
              << "  /tools            list tools from healthy servers\n"
              << "  /enable <name>    enable and connect a server\n"
              << "  /disable <name>   disconnect and disable a server\n"
              << "  /restart <name>   restart a server now\n"
              << "  /clear            forget the conversation\n"
              << "  /quit             exit"
              << RESET << std::endl;
}

std::string findConfig(int argc, char* argv[]) {
    if (argc >= 2) return argv[1];
    if (fs::exists(fs::u8path("config.json"))) return "config.json";
    if (fs::exists(fs::u8path("../config.json"))) return "../config.json";
    std::error_code ec;
    fs::path exeDir = fs::canonical("/proc/self/exe", ec).parent_path();
    if (!ec && fs::exists(exeDir / "config.json")) {
        return (exeDir / "config.json").u8string();
    }
    return "config.json";
}

void printServers(const ServerManager& servers) {
    auto statuses = servers.status();
    if (statuses.empty()) {
        std::cout << GRAY << "  (no MCP servers configured)" << RESET << std::endl;
        return;
    }
    std::cout << CYAN << "\n--- MCP Servers ---" << RESET << std::endl;
    for (const auto& s : statuses) {
        std::string color = s.healthy ? GREEN : (s.enabled ? RED : GRAY);
        std::cout << "  " << color << (s.healthy ? "●" : "○") << RESET << " " << BOLD << s.name << RESET
                  << GRAY << " [" << transportKindName(s.transportKind) << ", priority " << s.priority
                  << ", " << serverStateName(s.state) << ", attempts " << s.connectionAttempts << "]" << RESET;
        if (s.lastError) {
            std::cout << YELLOW << "  " << *s.lastError << RESET;
        }
        std::cout << std::endl;
    }
}

void printTools(ToolCatalog& catalog) {
    auto tools = catalog.listAll();
    if (tools.empty()) {
        std::cout << GRAY << "  (no tools available)" << RESET << std::endl;
        return;
    }
    std::cout << CYAN << "\n--- Available Tools ---" << RESET << std::endl;
    for (const auto& tool : tools) {
        std::cout << "  " << GREEN << tool.name << RESET << GRAY << " @" << tool.serverName << RESET;
        if (!tool.description.empty()) std::cout << "  " << tool.description;
        std::cout << std::endl;
    }
}

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        printUsage();
        return 0;
    }

    printLogo();

    std::string configPath = findConfig(argc, argv);
    Config cfg;
    try {
        cfg = Config::load(configPath);
        std::cout << GREEN << "✔ Loaded configuration from: " << BOLD << configPath << RESET << std::endl;
    } catch (const ConfigValidationError& e) {
        std::cerr << RED << "✖ Invalid MCP server configuration (" << validationRuleName(e.getRule())
                  << "): " << e.what() << RESET << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        printUsage();
        return 1;
    }

    Logger& logger = Logger::getInstance();
    logger.setLogFile(cfg.agent.logFile);
    logger.setDebugEnabled(cfg.agent.enableDebug);

    LoggerEventSink events;
    ManagerOptions managerOptions;
    managerOptions.restartDelayMs = cfg.agent.restartDelayMs;
    ServerManager servers(events, nullptr, managerOptions);

    try {
        for (const auto& def : cfg.mcpServers) {
            servers.registerServer(def);
        }
    } catch (const ConfigValidationError& e) {
        std::cerr << RED << "✖ " << e.what() << RESET << std::endl;
        return 1;
    }

    if (!cfg.mcpServers.empty()) {
        std::cout << GRAY << "  (Connecting to " << cfg.mcpServers.size() << " MCP server(s)...)" << RESET << std::endl;
        int connected = servers.connectAll();
        std::cout << GRAY << "  (" << connected << " connected)" << RESET << std::endl;
    }
    servers.startHealthMonitor(std::chrono::milliseconds(cfg.agent.healthCheckIntervalMs));

    ToolCatalog catalog(servers, events);
    LLMClient llm(cfg.llm.apiKey, cfg.llm.baseUrl, cfg.llm.model);
    InMemorySessionStore session;

    AgentOptions agentOptions;
    agentOptions.maxSteps = cfg.agent.maxToolSteps;
    agentOptions.streaming = cfg.agent.streaming;
    AgentRuntime agent(llm, catalog, session, events, agentOptions);

    printHelp();

    std::string userInput;
    while (true) {
        std::cout << "\n" << CYAN << BOLD << "❯ " << RESET << std::flush;
        if (!std::getline(std::cin, userInput)) break;
        if (userInput.empty()) continue;

        std::istringstream cmd(userInput);
        std::string command;
        std::string argument;
        cmd >> command >> argument;

        if (command == "/quit" || command == "exit") break;
        if (command == "/help") {
            printHelp();
            continue;
        }
        if (command == "/servers") {
            printServers(servers);
            continue;
        }
        if (command == "/tools") {
            printTools(catalog);
            continue;
        }
        if (command == "/clear") {
            session.clear();
            std::cout << GREEN << "✔ Context cleared." << RESET << std::endl;
            continue;
        }
        if (command == "/enable" || command == "/disable" || command == "/restart") {
            if (argument.empty()) {
                std::cout << YELLOW << "  Usage: " << command << " <server name>" << RESET << std::endl;
                continue;
            }
            if (!servers.hasServer(argument)) {
                std::cout << RED << "✖ Unknown server: " << argument << RESET << std::endl;
                continue;
            }
            bool ok = false;
            if (command == "/enable") ok = servers.enableServer(argument);
            else if (command == "/disable") ok = servers.disableServer(argument);
            else ok = servers.restartServer(argument);
            std::cout << (ok ? GREEN + "✔ " : YELLOW + "⚠ ") << command.substr(1) << " " << argument
                      << (ok ? "" : " did not leave the server healthy") << RESET << std::endl;
            continue;
        }

        // 对话回合: system prompt 每轮重新组装,工具列表随服务器健康状态变化
        std::vector<ConversationTurn> conversation;
        conversation.push_back({"system", agent.assembleSystemPrompt(cfg.llm.systemRole)});
        for (const auto& turn : session.getTurns()) {
            conversation.push_back(turn);
        }
        conversation.push_back({"user", userInput});
        session.addTurn("user", userInput);

        try {
            TurnResult result = agent.runTurn(conversation);
            if (cfg.agent.streaming) {
                std::cout << std::endl;
            } else {
                std::cout << "\n" << result.answer << std::endl;
            }
            if (result.truncated) {
                std::cout << GRAY << "  (stopped after " << result.steps << " steps)" << RESET << std::endl;
            }
        } catch (const ModelProviderError& e) {
            std::cerr << RED << "✖ " << e.what() << RESET << std::endl;
        }
    }

    servers.shutdown();
    return 0;
}
