#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <chrono>
#include <functional>
#include <cstdint>
#include <condition_variable>
#include <nlohmann/json.hpp>
#include "mcp/ServerDefinition.h"
#include "mcp/ITransport.h"
#include "mcp/HealthMonitor.h"
#include "core/EventSink.h"

enum class ServerState {
    Disabled,
    Connecting,
    Healthy,
    Unhealthy
};

const char* serverStateName(ServerState state);

// Point-in-time view of one server for UIs and diagnostics.
struct ServerStatus {
    std::string name;
    TransportKind transportKind = TransportKind::LocalProcess;
    ServerState state = ServerState::Disabled;
    bool enabled = false;
    bool healthy = false;
    int priority = 100;
    int connectionAttempts = 0;
    std::optional<std::string> lastError;
    std::optional<std::chrono::system_clock::time_point> lastHealthCheckAt;
    std::string description;

    nlohmann::json toJson() const;
};

struct ManagerOptions {
    int restartDelayMs = 1000;
    nlohmann::json clientInfo;  // null: JsonRpc::defaultClientInfo()
};

/**
 * @brief Owns every configured tool server: definition, transport and health.
 *
 * All runtime state is mutated here and nowhere else. The catalog reads
 * health and transports through the accessors and reports failures through
 * recordInvocationError(), which never changes health.
 *
 * Transport I/O (connect, handshake, probe) runs outside the registry lock.
 * Each server also has a lifecycle mutex so a restart and a connect cannot
 * interleave on the same handle. Results that arrive after the server was
 * replaced, disabled or removed are discarded.
 */
class ServerManager {
public:
    using TransportFactory = std::function<std::shared_ptr<ITransport>(const ServerDefinition&)>;

    explicit ServerManager(IEventSink& events, TransportFactory factory = nullptr, ManagerOptions options = {});
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    // StdioTransport or HttpTransport according to the definition.
    static std::shared_ptr<ITransport> createTransport(const ServerDefinition& def);

    /**
     * @brief Validates and stores a definition without connecting.
     *
     * A definition with an existing name replaces it: the old handle is
     * killed and runtime state starts over.
     * @throws ConfigValidationError
     */
    void registerServer(const ServerDefinition& def);

    /**
     * @brief registerServer() followed by an immediate connect when enabled.
     * @return true if the server is healthy afterwards
     * @throws ConfigValidationError
     */
    bool addServer(const ServerDefinition& def);

    // Like addServer() but the name must already exist.
    bool updateServer(const ServerDefinition& def);

    bool removeServer(const std::string& name);
    bool enableServer(const std::string& name);
    bool disableServer(const std::string& name);

    // Connects every enabled server that has no live connection, in parallel.
    // Returns how many of those connected.
    int connectAll();
    bool connectServer(const std::string& name);

    // Kill, wait restartDelayMs, spawn a fresh transport, handshake.
    bool restartServer(const std::string& name);

    // One liveness check; updates health and lastHealthCheckAt.
    bool probeServer(const std::string& name);

    /**
     * @brief One monitor pass over every enabled server.
     *
     * An unhealthy local-process server (or one whose process died) is
     * restarted once, then probed. Remote servers are only probed. A failed
     * probe marks the server unhealthy; the restart happens next cycle.
     */
    void runHealthCycle();

    // Enabled, healthy servers by ascending priority (ties by name).
    // A healthy preferredServer is moved to the front.
    std::vector<std::string> routingOrder(const std::string& preferredServer = "") const;

    std::shared_ptr<ITransport> transportFor(const std::string& name) const;

    // Router-side failure: recorded as lastError, health is left alone.
    void recordInvocationError(const std::string& name, const std::string& error);

    bool hasServer(const std::string& name) const;
    bool isHealthy(const std::string& name) const;
    bool isEnabled(const std::string& name) const;
    std::optional<ServerDefinition> definitionOf(const std::string& name) const;

    std::vector<ServerStatus> status() const;
    std::optional<ServerStatus> statusOf(const std::string& name) const;

    // At least one enabled server is healthy.
    bool isAvailable() const;

    void startHealthMonitor(std::chrono::milliseconds interval);
    void stopHealthMonitor();
    bool isMonitorRunning() const;

    // Stops the monitor and disconnects everything. Never throws.
    void shutdown();

private:
    struct ServerRuntime {
        std::shared_ptr<ITransport> connection;
        bool isHealthy = false;
        ServerState state = ServerState::Disabled;
        std::optional<std::chrono::system_clock::time_point> lastHealthCheckAt;
        int connectionAttempts = 0;
        std::optional<std::string> lastError;
        uint64_t generation = 0;
    };

    struct ServerEntry {
        ServerDefinition definition;
        ServerRuntime runtime;
        std::shared_ptr<std::mutex> lifecycle;
    };

    IEventSink& events;
    TransportFactory factory;
    ManagerOptions options;

    mutable std::mutex mtx;
    std::map<std::string, ServerEntry> servers;
    uint64_t nextGeneration = 0;

    mutable std::mutex monitorMtx;
    std::unique_ptr<HealthMonitor> monitor;

    std::mutex shutdownMtx;
    std::condition_variable shutdownCv;
    bool shuttingDown = false;

    bool liveLocked(const ServerEntry& entry) const;
    ServerStatus statusLocked(const ServerEntry& entry) const;
    ServerRuntime freshRuntime(bool enabled);
    bool restart(const std::string& name, bool onlyIfDown);
    bool establish(const std::string& name, const ServerDefinition& def, uint64_t generation);
    bool waitRestartDelay();
    bool isShuttingDown();
    void closeQuietly(const std::shared_ptr<ITransport>& transport);
};
