#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ModelProvider.h"

enum class AgentPhase {
    AwaitingModel,
    ToolRequested,
    Executing,
    Done
};

/**
 * @brief 单轮对话的编排状态
 *
 * 每个聊天回合开始时创建,回合结束即丢弃。产生的所有消息都交给 SessionStore,
 * 这里不做持久化。
 */
struct AgentState {
    /**
     * @brief 已向模型发起的请求次数,不超过 maxSteps
     */
    int stepCount = 0;

    AgentPhase phase = AgentPhase::AwaitingModel;

    /**
     * @brief 本回合追加的消息 (assistant 工具请求、system 工具输出/错误、最终回答)
     */
    std::vector<ConversationTurn> conversationTail;

    /**
     * @brief 模型最近一次的原始输出
     */
    std::string lastOutput;

    /**
     * @brief 因达到步数上限而提前结束
     */
    bool truncated = false;

    void reset() {
        stepCount = 0;
        phase = AgentPhase::AwaitingModel;
        conversationTail.clear();
        lastOutput.clear();
        truncated = false;
    }
};
