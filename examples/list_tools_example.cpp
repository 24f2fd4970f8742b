/**
 * @file list_tools_example.cpp
 * @brief 演示不经过模型直接使用 ServerManager + ToolCatalog
 *
 * 读取配置中的 mcp_servers,连接全部启用的服务器,打印状态与工具列表;
 * 如果给出工具名,则按优先级路由调用一次并打印结果。
 *
 *   list_tools_example config.json
 *   list_tools_example config.json read_file '{"path": "README.md"}'
 */

#include "core/ConfigManager.h"
#include "core/EventSink.h"
#include "core/Errors.h"
#include "mcp/ServerManager.h"
#include "mcp/ToolCatalog.h"
#include "agent/ToolPrompt.h"
#include "utils/Logger.h"
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json> [tool_name [json_arguments]]" << std::endl;
        return 1;
    }

    Config cfg;
    try {
        cfg = Config::load(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }
    Logger::getInstance().setLogFile("");

    LoggerEventSink events;
    ServerManager servers(events);
    for (const auto& def : cfg.mcpServers) {
        servers.registerServer(def);
    }
    servers.connectAll();

    // 1. 服务器状态
    for (const auto& status : servers.status()) {
        std::cout << status.toJson().dump() << std::endl;
    }

    // 2. 聚合后的工具列表
    ToolCatalog catalog(servers, events);
    std::cout << catalog.describe().dump(2) << std::endl;

    // 3. 可选: 调用一个工具
    if (argc >= 3) {
        nlohmann::json arguments = nlohmann::json::object();
        if (argc >= 4) {
            try {
                arguments = nlohmann::json::parse(argv[3]);
            } catch (const nlohmann::json::parse_error& e) {
                std::cerr << "Arguments are not valid JSON: " << e.what() << std::endl;
                return 1;
            }
        }
        try {
            auto result = catalog.invoke(argv[2], arguments);
            std::cout << "[" << result.serverName << "] " << ToolPrompt::renderContent(result.content) << std::endl;
        } catch (const ToolNotFoundError& e) {
            std::cerr << e.what() << std::endl;
            servers.shutdown();
            return 2;
        }
    }

    servers.shutdown();
    return 0;
}
