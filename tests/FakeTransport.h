#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcp/ITransport.h"
#include "mcp/ServerManager.h"
#include "core/EventSink.h"
#include "core/Errors.h"

// Behaviour and counters of one fake tool server, shared by every transport
// the factory builds for that name so tests can flip switches between restarts.
struct FakeServer {
    std::vector<Tool> tools;
    nlohmann::json content = nlohmann::json::array({{{"type", "text"}, {"text", "ok"}}});

    std::atomic<bool> failConnect{false};
    std::atomic<bool> failHandshake{false};
    std::atomic<bool> failList{false};
    std::atomic<bool> failInvoke{false};
    std::atomic<bool> failProbe{false};

    // Cleared to simulate the process dying under an open transport.
    std::atomic<bool> connected{false};

    std::atomic<int> created{0};
    std::atomic<int> connects{0};
    std::atomic<int> probes{0};
    std::atomic<int> invocations{0};
    std::atomic<int> disconnects{0};

    std::mutex mtx;
    std::vector<std::string> invokedTools;

    void addTool(const std::string& name, const std::string& description = "") {
        Tool tool;
        tool.name = name;
        tool.description = description;
        tools.push_back(tool);
    }
};

class FakeTransport : public ITransport {
public:
    FakeTransport(std::shared_ptr<FakeServer> server, TransportKind transportKind)
        : server(std::move(server)), transportKind(transportKind) {}

    TransportKind kind() const override { return transportKind; }

    void connect() override {
        server->connects++;
        if (server->failConnect) throw TransportError("spawn failed");
        open = true;
        server->connected = true;
    }

    nlohmann::json handshake(const nlohmann::json&) override {
        if (server->failHandshake) throw TransportError("initialize timed out");
        return {{"tools", nlohmann::json::object()}};
    }

    std::vector<Tool> listTools() override {
        if (!isConnected()) throw TransportError("Server process is not running");
        if (server->failList) throw TransportError("tools/list failed");
        return server->tools;
    }

    nlohmann::json invoke(const std::string& name, const nlohmann::json&) override {
        if (!isConnected()) throw TransportError("Server process is not running");
        server->invocations++;
        {
            std::lock_guard<std::mutex> lock(server->mtx);
            server->invokedTools.push_back(name);
        }
        if (server->failInvoke) throw TransportError("tools/call failed");
        return server->content;
    }

    bool probe() override {
        server->probes++;
        return isConnected() && !server->failProbe;
    }

    bool isConnected() const override { return open && server->connected; }

    void disconnect() override {
        if (open) server->disconnects++;
        open = false;
    }

private:
    std::shared_ptr<FakeServer> server;
    TransportKind transportKind;
    std::atomic<bool> open{false};
};

// Hands out FakeTransports by server name.
class FakeFleet {
public:
    std::shared_ptr<FakeServer> add(const std::string& name) {
        std::lock_guard<std::mutex> lock(mtx);
        auto server = std::make_shared<FakeServer>();
        fakes[name] = server;
        return server;
    }

    ServerManager::TransportFactory factory() {
        return [this](const ServerDefinition& def) -> std::shared_ptr<ITransport> {
            std::shared_ptr<FakeServer> server;
            {
                std::lock_guard<std::mutex> lock(mtx);
                auto it = fakes.find(def.name);
                if (it == fakes.end()) return nullptr;
                server = it->second;
            }
            server->created++;
            return std::make_shared<FakeTransport>(server, def.transportKind);
        };
    }

private:
    std::mutex mtx;
    std::map<std::string, std::shared_ptr<FakeServer>> fakes;
};

struct RecordedEvent {
    EventKind kind;
    std::string message;
    nlohmann::json details;
};

class RecordingEventSink : public IEventSink {
public:
    void emit(EventKind kind, const std::string& message, const nlohmann::json& details) override {
        std::lock_guard<std::mutex> lock(mtx);
        events.push_back({kind, message, details});
    }

    std::vector<RecordedEvent> snapshot() {
        std::lock_guard<std::mutex> lock(mtx);
        return events;
    }

    int count(EventKind kind) {
        std::lock_guard<std::mutex> lock(mtx);
        int n = 0;
        for (const auto& e : events) {
            if (e.kind == kind) n++;
        }
        return n;
    }

private:
    std::mutex mtx;
    std::vector<RecordedEvent> events;
};

inline ServerDefinition localServer(const std::string& name, int priority = 100, bool enabled = true) {
    ServerDefinition def;
    def.name = name;
    def.transportKind = TransportKind::LocalProcess;
    def.command = "npx";
    def.args = {"-y", "@example/" + name};
    def.priority = priority;
    def.enabled = enabled;
    def.timeoutMs = 1000;
    return def;
}

inline ServerDefinition remoteServer(const std::string& name, int priority = 100) {
    ServerDefinition def;
    def.name = name;
    def.transportKind = TransportKind::RemoteHttp;
    def.endpoint = "https://tools.example.com/mcp";
    def.credential = "token";
    def.priority = priority;
    def.timeoutMs = 1000;
    return def;
}

inline ManagerOptions fastRestarts() {
    ManagerOptions options;
    options.restartDelayMs = 0;
    return options;
}
