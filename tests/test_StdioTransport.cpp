#include <gtest/gtest.h>
#include "mcp/StdioTransport.h"
#include "mcp/JsonRpc.h"
#include "core/Errors.h"
#include <filesystem>
#include <fstream>
#include <chrono>
#include <thread>
#include <signal.h>

namespace fs = std::filesystem;

namespace {
// Line-oriented MCP server in POSIX sh. Request frames are serialized with
// sorted keys, so "id" and "method" can be picked out with sed.
const char* kMockServer = R"SH(#!/bin/sh
held=""
while IFS= read -r line; do
  id=$(printf '%s\n' "$line" | sed -n 's/^{"id":\([0-9]*\),.*/\1/p')
  method=$(printf '%s\n' "$line" | sed -n 's/.*"method":"\([^"]*\)".*/\1/p')
  if [ -z "$id" ]; then
    continue
  fi
  case "$method" in
    initialize)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"protocolVersion":"2024-11-05","capabilities":{"tools":{"listChanged":false}},"serverInfo":{"name":"mock","version":"0.1"}}}\n' "$id" ;;
    tools/list)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"tools":[{"name":"echo","description":"Echo text","inputSchema":{"type":"object","properties":{"text":{"type":"string"}}}}]}}\n' "$id" ;;
    tools/call)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"echoed"}]}}\n' "$id" ;;
    ping)
      printf '{"jsonrpc":"2.0","id":%s,"result":{}}\n' "$id" ;;
    env)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"mark":"%s"}}\n' "$id" "$CONDUIT_MARK" ;;
    fail)
      printf '{"jsonrpc":"2.0","id":%s,"error":{"code":-32601,"message":"Method not found"}}\n' "$id" ;;
    hold)
      held="$id" ;;
    release)
      printf 'this is not json\n'
      printf '{"jsonrpc":"2.0","id":99,"result":{"which":"stray"}}\n'
      printf '{"jsonrpc":"2.0","id":%s,"result":{"which":"release"}}\n' "$id"
      printf '{"jsonrpc":"2.0","id":%s,"result":{"which":"held"}}\n' "$held" ;;
    slow)
      ;;
    exit)
      exit 0 ;;
  esac
done
)SH";
} // namespace

class StdioTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / fs::path("conduit_stdio_test_" + std::to_string(now));
        fs::create_directories(testDir);

        scriptPath = (testDir / "mock_server.sh").string();
        std::ofstream f(scriptPath);
        f << kMockServer;
        f.close();
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    std::unique_ptr<StdioTransport> makeTransport(int timeoutMs = 5000,
                                                  const std::map<std::string, std::string>& env = {}) {
        return std::make_unique<StdioTransport>("/bin/sh", std::vector<std::string>{scriptPath}, env, timeoutMs);
    }

    fs::path testDir;
    std::string scriptPath;
};

TEST_F(StdioTransportTest, HandshakeListAndInvoke) {
    auto transport = makeTransport();
    transport->connect();
    ASSERT_TRUE(transport->isConnected());
    EXPECT_GT(transport->getPid(), 0);

    auto capabilities = transport->handshake(JsonRpc::defaultClientInfo());
    EXPECT_TRUE(capabilities.contains("tools"));

    auto tools = transport->listTools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_EQ(tools[0].inputSchema["properties"]["text"]["type"], "string");

    auto content = transport->invoke("echo", {{"text", "hello"}});
    ASSERT_TRUE(content.is_array());
    EXPECT_EQ(content[0]["text"], "echoed");

    EXPECT_TRUE(transport->probe());
    transport->disconnect();
    EXPECT_FALSE(transport->isConnected());
    EXPECT_FALSE(transport->probe());
}

TEST_F(StdioTransportTest, ResponsesMatchedByIdOutOfOrder) {
    auto transport = makeTransport();
    transport->connect();

    auto held = transport->sendRequestAsync("hold", nlohmann::json::object());
    auto released = transport->sendRequestAsync("release", nlohmann::json::object());

    ASSERT_EQ(released.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ASSERT_EQ(held.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(released.get()["which"], "release");
    EXPECT_EQ(held.get()["which"], "held");

    // The malformed line and the stray id 99 were dropped without harm.
    EXPECT_TRUE(transport->isConnected());
    EXPECT_EQ(transport->pendingCount(), 0u);
    EXPECT_TRUE(transport->probe());
}

TEST_F(StdioTransportTest, ConcurrentRequestsAllResolve) {
    auto transport = makeTransport();
    transport->connect();

    std::vector<std::thread> callers;
    std::atomic<int> ok{0};
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&]() {
            if (transport->probe()) ok++;
        });
    }
    for (auto& t : callers) t.join();
    EXPECT_EQ(ok.load(), 8);
}

TEST_F(StdioTransportTest, ErrorResponseThrows) {
    auto transport = makeTransport();
    transport->connect();
    try {
        transport->sendRequest("fail", nlohmann::json::object());
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("Method not found"), std::string::npos);
    }
    EXPECT_TRUE(transport->isConnected());
}

TEST_F(StdioTransportTest, TimeoutAbandonsRequestUntilDisconnect) {
    auto transport = makeTransport(200);
    transport->connect();
    try {
        transport->sendRequest("slow", nlohmann::json::object());
        FAIL() << "expected a timeout";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out after 200 ms"), std::string::npos);
    }
    EXPECT_EQ(transport->pendingCount(), 1u);
    EXPECT_TRUE(transport->isConnected());

    transport->disconnect();
    EXPECT_EQ(transport->pendingCount(), 0u);
}

TEST_F(StdioTransportTest, ProcessExitFailsPendingAndMarksDead) {
    auto transport = makeTransport();
    transport->connect();

    auto pending = transport->sendRequestAsync("exit", nlohmann::json::object());
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_THROW(pending.get(), TransportError);
    EXPECT_FALSE(transport->isConnected());
    EXPECT_THROW(transport->sendRequest("ping", nlohmann::json::object()), TransportError);
    EXPECT_FALSE(transport->probe());
}

TEST_F(StdioTransportTest, ExitDetectedWhenSiblingsSpawnedConcurrently) {
    for (int round = 0; round < 5; ++round) {
        std::vector<std::unique_ptr<StdioTransport>> transports;
        for (int i = 0; i < 12; ++i) {
            transports.push_back(makeTransport());
        }
        std::vector<std::thread> spawners;
        for (auto& transport : transports) {
            spawners.emplace_back([&transport]() { transport->connect(); });
        }
        for (auto& t : spawners) t.join();
        for (auto& transport : transports) {
            ASSERT_TRUE(transport->isConnected());
        }

        // Keep the first child running; every other one is killed.
        for (size_t i = 1; i < transports.size(); ++i) {
            kill(-transports[i]->getPid(), SIGKILL);
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        size_t dead = 0;
        while (std::chrono::steady_clock::now() < deadline) {
            dead = 0;
            for (size_t i = 1; i < transports.size(); ++i) {
                if (!transports[i]->isConnected()) dead++;
            }
            if (dead == transports.size() - 1) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        EXPECT_EQ(dead, transports.size() - 1) << "round " << round;
        EXPECT_TRUE(transports[0]->probe());
    }
}

TEST_F(StdioTransportTest, PassesConfiguredEnvironment) {
    auto transport = makeTransport(5000, {{"CONDUIT_MARK", "xyz"}});
    transport->connect();
    auto result = transport->sendRequest("env", nlohmann::json::object());
    EXPECT_EQ(result["mark"], "xyz");
}

TEST_F(StdioTransportTest, MissingExecutableNeverBecomesUsable) {
    StdioTransport transport((testDir / "no_such_binary").string(), {}, {}, 1000);
    try {
        transport.connect();
    } catch (const TransportError&) {
        return;
    }
    EXPECT_THROW(transport.handshake(JsonRpc::defaultClientInfo()), TransportError);
}

TEST_F(StdioTransportTest, RequestBeforeConnectThrows) {
    auto transport = makeTransport();
    EXPECT_THROW(transport->listTools(), TransportError);
}

TEST_F(StdioTransportTest, ReconnectAfterDisconnect) {
    auto transport = makeTransport();
    transport->connect();
    pid_t first = transport->getPid();
    transport->disconnect();

    transport->connect();
    EXPECT_TRUE(transport->isConnected());
    EXPECT_NE(transport->getPid(), first);
    EXPECT_TRUE(transport->probe());
}
