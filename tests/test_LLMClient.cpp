#include <gtest/gtest.h>
#include "core/LLMClient.h"
#include "core/Errors.h"
#include "utils/Url.h"
#include "TestServers.h"
#include <atomic>
#include <memory>
#include <mutex>

using json = nlohmann::json;

namespace {
json completion(const json& content) {
    return {
        {"id", "chatcmpl-1"},
        {"object", "chat.completion"},
        {"choices", {{{"index", 0}, {"message", {{"role", "assistant"}, {"content", content}}}}}}
    };
}
} // namespace

class LLMClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        server.server.Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
            int n = ++calls;
            {
                std::lock_guard<std::mutex> lock(mtx);
                lastBody = json::parse(req.body);
                lastAuthorization = req.get_header_value("Authorization");
            }
            if (n <= failuresBeforeSuccess) {
                res.status = 503;
                res.set_content("overloaded", "text/plain");
                return;
            }
            if (lastBody.value("stream", false)) {
                std::string stream;
                stream += "data: {\"choices\":[{\"delta\":{\"role\":\"assistant\"}}]}\n\n";
                stream += "data: {\"choices\":[{\"delta\":{\"content\":\"Hel\"}}]}\n\n";
                stream += ": keep-alive\n\n";
                stream += "data: {\"choices\":[{\"delta\":{\"content\":\"lo\"}}]}\n\n";
                stream += "data: [DONE]\n\n";
                res.set_content(stream, "text/event-stream");
                return;
            }
            res.set_content(reply.dump(), "application/json");
        });
        server.server.Get("/v1/models", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"data": []})", "application/json");
        });
        server.start();
    }

    LLMClient makeClient() {
        LLMClient client("sk-test", server.url("/v1/"), "test-model");
        client.setRetryPolicy(3, 0);
        return client;
    }

    LocalHttpServer server;
    std::atomic<int> calls{0};
    int failuresBeforeSuccess = 0;
    json reply = completion("Hello there");

    std::mutex mtx;
    json lastBody;
    std::string lastAuthorization;
};

TEST_F(LLMClientTest, ChatSendsConversationAndReturnsText) {
    auto client = makeClient();
    std::vector<ConversationTurn> conversation = {
        {"system", "You are terse."},
        {"user", "Hi"}
    };
    EXPECT_EQ(client.chat(conversation), "Hello there");
    EXPECT_EQ(client.getName(), "test-model");

    std::lock_guard<std::mutex> lock(mtx);
    EXPECT_EQ(lastAuthorization, "Bearer sk-test");
    EXPECT_EQ(lastBody["model"], "test-model");
    ASSERT_EQ(lastBody["messages"].size(), 2u);
    EXPECT_EQ(lastBody["messages"][0]["role"], "system");
    EXPECT_EQ(lastBody["messages"][1]["content"], "Hi");
}

TEST_F(LLMClientTest, ContentPartsAreFlattened) {
    reply = completion(json::array({
        {{"type", "text"}, {"text", "part one, "}},
        {{"type", "text"}, {"text", "part two"}}
    }));
    auto client = makeClient();
    EXPECT_EQ(client.chat({{"user", "Hi"}}), "part one, part two");
}

TEST_F(LLMClientTest, RetriesTransientFailures) {
    failuresBeforeSuccess = 2;
    auto client = makeClient();
    EXPECT_EQ(client.chat({{"user", "Hi"}}), "Hello there");
    EXPECT_EQ(calls.load(), 3);
}

TEST_F(LLMClientTest, GivesUpAfterRetries) {
    failuresBeforeSuccess = 10;
    auto client = makeClient();
    try {
        client.chat({{"user", "Hi"}});
        FAIL() << "expected ModelProviderError";
    } catch (const ModelProviderError& e) {
        EXPECT_NE(std::string(e.what()).find("Status 503"), std::string::npos);
    }
    EXPECT_EQ(calls.load(), 3);
}

TEST_F(LLMClientTest, MissingContentIsAnError) {
    reply = {{"choices", json::array()}};
    auto client = makeClient();
    EXPECT_THROW(client.chat({{"user", "Hi"}}), ModelProviderError);
}

TEST_F(LLMClientTest, StreamDeliversFragments) {
    auto client = makeClient();
    std::vector<std::string> fragments;
    std::string text = client.streamChat({{"user", "Hi"}}, [&](const std::string& fragment) {
        fragments.push_back(fragment);
    });
    EXPECT_EQ(text, "Hello");
    ASSERT_EQ(fragments.size(), 2u);
    EXPECT_EQ(fragments[0], "Hel");
    EXPECT_EQ(fragments[1], "lo");

    std::lock_guard<std::mutex> lock(mtx);
    EXPECT_TRUE(lastBody["stream"].get<bool>());
}

TEST_F(LLMClientTest, AvailabilityProbe) {
    auto client = makeClient();
    EXPECT_TRUE(client.isAvailable());

    LLMClient broken("k", "not a url");
    EXPECT_FALSE(broken.isAvailable());
    EXPECT_THROW(broken.chat({{"user", "Hi"}}), ModelProviderError);
}

TEST(UrlTest, PortMustFitTcpRange) {
    auto ok = parseUrl("https://api.example.com:8443/v1");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->port, 8443);
    EXPECT_EQ(ok->path, "/v1");
    EXPECT_EQ(parseUrl("http://localhost/v1")->port, 80);

    EXPECT_FALSE(parseUrl("http://localhost:99999999999999999999/v1").has_value());
    EXPECT_FALSE(parseUrl("http://localhost:70000").has_value());
    EXPECT_FALSE(parseUrl("http://localhost:0").has_value());
}

TEST(LLMClientConfigTest, OversizedPortIsReportedNotThrownAtConstruction) {
    std::unique_ptr<LLMClient> client;
    ASSERT_NO_THROW(client = std::make_unique<LLMClient>("k", "http://localhost:123456789012/v1", "m"));
    EXPECT_FALSE(client->isAvailable());
    EXPECT_THROW(client->chat({{"user", "Hi"}}), ModelProviderError);
}
