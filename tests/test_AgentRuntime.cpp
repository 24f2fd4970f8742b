#include <gtest/gtest.h>
#include "agent/AgentRuntime.h"
#include "core/Errors.h"
#include "FakeTransport.h"
#include <deque>

namespace {
// Replays scripted replies; the last one repeats once the script runs out.
class ScriptedProvider : public IModelProvider {
public:
    explicit ScriptedProvider(std::vector<std::string> replies) : replies(replies.begin(), replies.end()) {}

    std::string getName() const override { return "scripted"; }

    std::string chat(const std::vector<ConversationTurn>& conversation) override {
        seen.push_back(conversation);
        if (failure) std::rethrow_exception(failure);
        std::string reply = replies.front();
        if (replies.size() > 1) replies.pop_front();
        return reply;
    }

    bool isAvailable() override { return true; }

    std::deque<std::string> replies;
    std::vector<std::vector<ConversationTurn>> seen;
    std::exception_ptr failure;
};

const char* kEchoCall = "<tool_code>{\"name\": \"echo\", \"arguments\": {\"text\": \"hi\"}}</tool_code>";
} // namespace

class AgentRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        tools = fleet.add("tools");
        tools->addTool("echo", "Echo text back");
        tools->content = nlohmann::json::array({{{"type", "text"}, {"text", "hi"}}});

        manager = std::make_unique<ServerManager>(events, fleet.factory(), fastRestarts());
        manager->addServer(localServer("tools"));
        catalog = std::make_unique<ToolCatalog>(*manager, events);
    }

    std::vector<ConversationTurn> startConversation(const std::string& userText) {
        return {{"system", "You are a test assistant."}, {"user", userText}};
    }

    FakeFleet fleet;
    RecordingEventSink events;
    InMemorySessionStore session;
    std::shared_ptr<FakeServer> tools;
    std::unique_ptr<ServerManager> manager;
    std::unique_ptr<ToolCatalog> catalog;
};

TEST_F(AgentRuntimeTest, PlainAnswerEndsTurn) {
    ScriptedProvider provider({"Paris."});
    AgentRuntime agent(provider, *catalog, session, events);

    auto result = agent.runTurn(startConversation("Capital of France?"));
    EXPECT_EQ(result.answer, "Paris.");
    EXPECT_EQ(result.steps, 1);
    EXPECT_FALSE(result.truncated);
    ASSERT_EQ(result.tail.size(), 1u);
    EXPECT_EQ(result.tail[0].role, "assistant");
    EXPECT_EQ(result.tail[0].metadata["provider"], "scripted");

    EXPECT_EQ(session.size(), 1u);
    EXPECT_EQ(tools->invocations.load(), 0);
    EXPECT_EQ(agent.getState().phase, AgentPhase::Done);
}

TEST_F(AgentRuntimeTest, ToolOutputIsFedBackToModel) {
    ScriptedProvider provider({kEchoCall, "The tool said hi."});
    AgentRuntime agent(provider, *catalog, session, events);

    auto result = agent.runTurn(startConversation("Say hi via the tool"));
    EXPECT_EQ(result.answer, "The tool said hi.");
    EXPECT_EQ(result.steps, 2);
    EXPECT_FALSE(result.truncated);
    EXPECT_EQ(tools->invocations.load(), 1);

    ASSERT_EQ(result.tail.size(), 3u);
    EXPECT_EQ(result.tail[0].role, "assistant");
    EXPECT_EQ(result.tail[0].content, kEchoCall);
    EXPECT_EQ(result.tail[0].metadata["toolCall"]["name"], "echo");
    EXPECT_EQ(result.tail[0].metadata["toolCall"]["args"]["text"], "hi");
    EXPECT_EQ(result.tail[1].role, "system");
    EXPECT_EQ(result.tail[1].content, "TOOL OUTPUT: hi");
    EXPECT_EQ(result.tail[1].metadata["type"], "tool_output");
    EXPECT_EQ(result.tail[2].content, "The tool said hi.");

    // Second request carried the tool output.
    ASSERT_EQ(provider.seen.size(), 2u);
    const auto& second = provider.seen[1];
    ASSERT_EQ(second.size(), 4u);
    EXPECT_EQ(second.back().content, "TOOL OUTPUT: hi");

    EXPECT_EQ(session.size(), 3u);
    EXPECT_EQ(events.count(EventKind::ToolStarted), 1);
}

TEST_F(AgentRuntimeTest, UnknownToolBecomesErrorTurn) {
    ScriptedProvider provider({
        "<tool_code>{\"name\": \"missing\", \"arguments\": {}}</tool_code>",
        "Sorry, I cannot do that."
    });
    AgentRuntime agent(provider, *catalog, session, events);

    auto result = agent.runTurn(startConversation("Use a missing tool"));
    EXPECT_EQ(result.answer, "Sorry, I cannot do that.");
    ASSERT_EQ(result.tail.size(), 3u);
    EXPECT_EQ(result.tail[1].role, "system");
    EXPECT_EQ(result.tail[1].content, "TOOL OUTPUT: Error: Tool 'missing' not found.");
    EXPECT_EQ(result.tail[1].metadata["type"], "tool_output_error");
}

TEST_F(AgentRuntimeTest, StepLimitReturnsLastOutput) {
    ScriptedProvider provider({kEchoCall});
    AgentOptions options;
    options.maxSteps = 3;
    AgentRuntime agent(provider, *catalog, session, events, options);

    auto result = agent.runTurn(startConversation("Loop forever"));
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.steps, 3);
    EXPECT_EQ(result.answer, kEchoCall);
    EXPECT_EQ(provider.seen.size(), 3u);
    EXPECT_EQ(tools->invocations.load(), 3);
    EXPECT_TRUE(agent.getState().truncated);
    EXPECT_GE(events.count(EventKind::Warning), 1);
}

TEST_F(AgentRuntimeTest, MaxStepsClampedToOne) {
    ScriptedProvider provider({kEchoCall});
    AgentOptions options;
    options.maxSteps = 0;
    AgentRuntime agent(provider, *catalog, session, events, options);
    EXPECT_EQ(agent.getMaxSteps(), 1);

    auto result = agent.runTurn(startConversation("x"));
    EXPECT_EQ(result.steps, 1);
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(tools->invocations.load(), 1);
}

TEST_F(AgentRuntimeTest, ProviderFailureFailsTurn) {
    ScriptedProvider provider({"unused"});
    provider.failure = std::make_exception_ptr(ModelProviderError("API error after 3 attempts: Status 500"));
    AgentRuntime agent(provider, *catalog, session, events);
    EXPECT_THROW(agent.runTurn(startConversation("x")), ModelProviderError);
    EXPECT_EQ(session.size(), 0u);

    provider.failure = std::make_exception_ptr(std::runtime_error("socket closed"));
    try {
        agent.runTurn(startConversation("x"));
        FAIL() << "expected ModelProviderError";
    } catch (const ModelProviderError& e) {
        EXPECT_STREQ(e.what(), "Chat error: socket closed");
    }
}

TEST_F(AgentRuntimeTest, StreamingEmitsFragments) {
    ScriptedProvider provider({"Streamed answer"});
    AgentOptions options;
    options.streaming = true;
    AgentRuntime agent(provider, *catalog, session, events, options);

    auto result = agent.runTurn(startConversation("x"));
    EXPECT_EQ(result.answer, "Streamed answer");
    EXPECT_EQ(events.count(EventKind::StreamFragment), 1);
}

TEST_F(AgentRuntimeTest, SystemPromptListsHealthyTools) {
    ScriptedProvider provider({"ok"});
    AgentRuntime agent(provider, *catalog, session, events);

    std::string prompt = agent.assembleSystemPrompt("You are a release bot.");
    EXPECT_EQ(prompt.rfind("You are a release bot.", 0), 0u);
    EXPECT_NE(prompt.find("- echo: Echo text back"), std::string::npos);

    manager->disableServer("tools");
    std::string bare = agent.assembleSystemPrompt();
    EXPECT_EQ(bare.find("TOOLS AVAILABLE"), std::string::npos);
    EXPECT_NE(bare.find("Conduit"), std::string::npos);
}

TEST_F(AgentRuntimeTest, StateResetsBetweenTurns) {
    ScriptedProvider provider({kEchoCall, "done", "second turn"});
    AgentRuntime agent(provider, *catalog, session, events);

    agent.runTurn(startConversation("first"));
    EXPECT_EQ(agent.getState().stepCount, 2);

    auto result = agent.runTurn(startConversation("second"));
    EXPECT_EQ(result.steps, 1);
    EXPECT_EQ(result.tail.size(), 1u);
    EXPECT_EQ(result.answer, "second turn");
}
