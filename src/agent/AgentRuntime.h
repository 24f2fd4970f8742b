#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "agent/AgentState.h"
#include "agent/ToolCallParser.h"
#include "mcp/ToolCatalog.h"
#include "core/ModelProvider.h"
#include "core/SessionStore.h"
#include "core/EventSink.h"

struct AgentOptions {
    int maxSteps = 5;
    bool streaming = false;
};

struct TurnResult {
    std::string answer;
    int steps = 0;
    bool truncated = false;                  // step limit reached
    std::vector<ConversationTurn> tail;      // turns appended during this turn
};

/**
 * @brief 工具调用主循环 - 驱动一个聊天回合
 *
 * 模型回复 → 解析工具请求 → 通过 ToolCatalog 执行 → 把结果作为 system
 * 消息追加 → 再次请求模型,直到回复里没有工具请求或达到 maxSteps。
 *
 * 达到上限不是错误: 直接返回模型最后一次的输出。
 * 只有模型调用失败 (ModelProviderError) 会让整个回合失败。
 */
class AgentRuntime {
public:
    AgentRuntime(IModelProvider& provider,
                 ToolCatalog& catalog,
                 ISessionStore& session,
                 IEventSink& events,
                 AgentOptions options = {});

    /**
     * @brief 执行一个回合
     * @param conversation 截至用户最新输入的完整对话 (含 system prompt)
     * @throws ModelProviderError
     */
    TurnResult runTurn(std::vector<ConversationTurn> conversation);

    /**
     * @brief 组装系统 Prompt: 角色描述 + 当前可用工具列表
     */
    std::string assembleSystemPrompt(const std::string& systemRole = "");

    /**
     * @brief 设置最大步数 (小于 1 按 1 处理)
     */
    void setMaxSteps(int max) { options.maxSteps = max < 1 ? 1 : max; }
    int getMaxSteps() const { return options.maxSteps; }

    void setStreaming(bool enabled) { options.streaming = enabled; }

    const AgentState& getState() const { return state; }

    // Extra tool-call shapes can be registered here.
    ToolCallParser& getParser() { return parser; }

private:
    std::string requestModel(const std::vector<ConversationTurn>& conversation);
    void executeTool(const ToolCallIntent& intent, std::vector<ConversationTurn>& conversation);
    void appendTurn(std::vector<ConversationTurn>& conversation, const std::string& role,
                    const std::string& content, const nlohmann::json& metadata);

    IModelProvider& provider;
    ToolCatalog& catalog;
    ISessionStore& session;
    IEventSink& events;
    AgentOptions options;

    ToolCallParser parser;
    AgentState state;
};
