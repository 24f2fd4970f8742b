#include "agent/AgentRuntime.h"
#include "agent/ToolPrompt.h"
#include "core/Errors.h"
#include <sstream>

AgentRuntime::AgentRuntime(
    IModelProvider& provider,
    ToolCatalog& catalog,
    ISessionStore& session,
    IEventSink& events,
    AgentOptions options
) : provider(provider),
    catalog(catalog),
    session(session),
    events(events),
    options(options) {
    setMaxSteps(options.maxSteps);
}

TurnResult AgentRuntime::runTurn(std::vector<ConversationTurn> conversation) {
    state.reset();

    while (true) {
        if (state.stepCount >= options.maxSteps) {
            state.truncated = true;
            events.warning("Maximum tool steps (" + std::to_string(options.maxSteps) +
                           ") reached, returning the last response.");
            break;
        }
        state.stepCount++;

        state.phase = AgentPhase::AwaitingModel;
        std::string response = requestModel(conversation);
        state.lastOutput = response;

        auto intent = parser.parse(response);
        if (!intent) {
            // 没有工具请求,这就是最终回答
            appendTurn(conversation, "assistant", response, {{"provider", provider.getName()}});
            state.phase = AgentPhase::Done;
            return {response, state.stepCount, false, state.conversationTail};
        }

        // 保留原始回复,便于审计工具请求
        state.phase = AgentPhase::ToolRequested;
        appendTurn(conversation, "assistant", response, {
            {"provider", provider.getName()},
            {"toolCall", {{"name", intent->toolName}, {"args", intent->arguments}}}
        });

        state.phase = AgentPhase::Executing;
        executeTool(*intent, conversation);
    }

    state.phase = AgentPhase::Done;
    return {state.lastOutput, state.stepCount, true, state.conversationTail};
}

std::string AgentRuntime::requestModel(const std::vector<ConversationTurn>& conversation) {
    try {
        if (options.streaming) {
            return provider.streamChat(conversation, [this](const std::string& fragment) {
                events.emit(EventKind::StreamFragment, fragment);
            });
        }
        return provider.chat(conversation);
    } catch (const ModelProviderError&) {
        throw;
    } catch (const std::exception& e) {
        throw ModelProviderError(std::string("Chat error: ") + e.what());
    }
}

void AgentRuntime::executeTool(const ToolCallIntent& intent, std::vector<ConversationTurn>& conversation) {
    events.info("Agent calling tool: " + intent.toolName);
    try {
        auto result = catalog.invoke(intent.toolName, intent.arguments);
        appendTurn(conversation, "system", "TOOL OUTPUT: " + ToolPrompt::renderContent(result.content),
                   {{"type", "tool_output"}});
    } catch (const ToolNotFoundError& e) {
        events.warning(e.what());
        appendTurn(conversation, "system", "TOOL OUTPUT: Error: Tool '" + intent.toolName + "' not found.",
                   {{"type", "tool_output_error"}});
    }
}

void AgentRuntime::appendTurn(std::vector<ConversationTurn>& conversation, const std::string& role,
                              const std::string& content, const nlohmann::json& metadata) {
    ConversationTurn turn{role, content, metadata};
    conversation.push_back(turn);
    state.conversationTail.push_back(turn);
    session.addTurn(role, content, metadata);
}

// ========== Prompt 组装 ==========

std::string AgentRuntime::assembleSystemPrompt(const std::string& systemRole) {
    std::ostringstream prompt;
    prompt << (systemRole.empty()
                   ? "You are Conduit, a helpful assistant that can use external tools to answer questions."
                   : systemRole);

    std::string tools = ToolPrompt::build(catalog.listAll());
    if (!tools.empty()) {
        prompt << "\n\n" << tools;
    }
    return prompt.str();
}
