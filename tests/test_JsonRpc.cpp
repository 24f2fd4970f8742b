#include <gtest/gtest.h>
#include "mcp/JsonRpc.h"

using json = nlohmann::json;

TEST(JsonRpcTest, RequestFrame) {
    auto frame = JsonRpc::makeRequest(7, "tools/list", nullptr);
    EXPECT_EQ(frame["jsonrpc"], "2.0");
    EXPECT_EQ(frame["id"], 7);
    EXPECT_EQ(frame["method"], "tools/list");
    EXPECT_TRUE(frame["params"].is_object());

    auto note = JsonRpc::makeNotification(JsonRpc::kInitialized, json::object());
    EXPECT_FALSE(note.contains("id"));
    EXPECT_EQ(note["method"], "notifications/initialized");
}

TEST(JsonRpcTest, InitializeParams) {
    auto params = JsonRpc::initializeParams(nullptr);
    EXPECT_EQ(params["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(params["capabilities"]["tools"].is_object());
    EXPECT_EQ(params["clientInfo"]["name"], "conduit");
    EXPECT_EQ(params["clientInfo"]["version"], "1.0.0");

    auto custom = JsonRpc::initializeParams({{"name", "embedder"}, {"version", "2.1"}});
    EXPECT_EQ(custom["clientInfo"]["name"], "embedder");
}

TEST(JsonRpcTest, RecognizesResponses) {
    EXPECT_TRUE(JsonRpc::isResponse(json::parse(R"({"jsonrpc":"2.0","id":1,"result":{}})")));
    EXPECT_TRUE(JsonRpc::isResponse(json::parse(R"({"jsonrpc":"2.0","id":2,"error":{"code":-1,"message":"x"}})")));
    // Server-initiated request and notification
    EXPECT_FALSE(JsonRpc::isResponse(json::parse(R"({"jsonrpc":"2.0","id":3,"method":"roots/list"})")));
    EXPECT_FALSE(JsonRpc::isResponse(json::parse(R"({"jsonrpc":"2.0","method":"notifications/progress"})")));
    EXPECT_FALSE(JsonRpc::isResponse(json::parse(R"({"jsonrpc":"2.0","id":"abc","result":{}})")));
    EXPECT_FALSE(JsonRpc::isResponse(json::array()));
}

TEST(JsonRpcTest, ErrorMessage) {
    EXPECT_EQ(JsonRpc::errorMessage({{"code", -32601}, {"message", "Method not found"}}),
              "Method not found (code -32601)");
    EXPECT_EQ(JsonRpc::errorMessage("boom"), "boom");
}

TEST(JsonRpcTest, ParsesToolListSkippingNameless) {
    auto result = json::parse(R"({"tools": [
        {"name": "read_file", "description": "Read a file", "inputSchema": {"type": "object"}},
        {"description": "no name"},
        {"name": "list_dir"}
    ]})");
    auto tools = JsonRpc::parseToolList(result);
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "read_file");
    EXPECT_EQ(tools[0].description, "Read a file");
    EXPECT_EQ(tools[1].name, "list_dir");
    EXPECT_TRUE(tools[1].inputSchema.is_object());

    EXPECT_TRUE(JsonRpc::parseToolList(json::object()).empty());
}

TEST(JsonRpcTest, ExtractContent) {
    auto content = json::array({{{"type", "text"}, {"text", "hi"}}});
    EXPECT_EQ(JsonRpc::extractContent({{"content", content}}), content);
    EXPECT_EQ(JsonRpc::extractContent({{"value", 1}})["value"], 1);
}
