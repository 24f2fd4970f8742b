#include "mcp/ServerManager.h"
#include "mcp/ConfigValidator.h"
#include "mcp/StdioTransport.h"
#include "mcp/HttpTransport.h"
#include "mcp/JsonRpc.h"
#include "core/Errors.h"
#include <algorithm>
#include <future>

const char* serverStateName(ServerState state) {
    switch (state) {
        case ServerState::Disabled: return "disabled";
        case ServerState::Connecting: return "connecting";
        case ServerState::Healthy: return "healthy";
        case ServerState::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

nlohmann::json ServerStatus::toJson() const {
    nlohmann::json j = {
        {"name", name},
        {"transport", transportKindName(transportKind)},
        {"state", serverStateName(state)},
        {"enabled", enabled},
        {"healthy", healthy},
        {"priority", priority},
        {"connection_attempts", connectionAttempts},
        {"description", description}
    };
    j["last_error"] = lastError ? nlohmann::json(*lastError) : nlohmann::json();
    if (lastHealthCheckAt) {
        j["last_health_check_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            lastHealthCheckAt->time_since_epoch()).count();
    } else {
        j["last_health_check_ms"] = nullptr;
    }
    return j;
}

ServerManager::ServerManager(IEventSink& events, TransportFactory factory, ManagerOptions options)
    : events(events),
      factory(factory ? std::move(factory) : TransportFactory(&ServerManager::createTransport)),
      options(std::move(options)) {
    if (this->options.clientInfo.is_null()) {
        this->options.clientInfo = JsonRpc::defaultClientInfo();
    }
}

ServerManager::~ServerManager() {
    shutdown();
}

std::shared_ptr<ITransport> ServerManager::createTransport(const ServerDefinition& def) {
    if (def.transportKind == TransportKind::RemoteHttp) {
        return std::make_shared<HttpTransport>(def.endpoint, def.credential, def.timeoutMs);
    }
    return std::make_shared<StdioTransport>(def.command, def.args, def.env, def.timeoutMs);
}

ServerManager::ServerRuntime ServerManager::freshRuntime(bool enabled) {
    ServerRuntime runtime;
    runtime.state = enabled ? ServerState::Connecting : ServerState::Disabled;
    runtime.generation = ++nextGeneration;
    return runtime;
}

bool ServerManager::liveLocked(const ServerEntry& entry) const {
    const auto& runtime = entry.runtime;
    return runtime.isHealthy && runtime.connection && runtime.connection->isConnected();
}

void ServerManager::closeQuietly(const std::shared_ptr<ITransport>& transport) {
    if (!transport) return;
    try {
        transport->disconnect();
    } catch (const std::exception& e) {
        events.warning(std::string("Error while closing MCP connection: ") + e.what());
    }
}

bool ServerManager::isShuttingDown() {
    std::lock_guard<std::mutex> lock(shutdownMtx);
    return shuttingDown;
}

bool ServerManager::waitRestartDelay() {
    std::unique_lock<std::mutex> lock(shutdownMtx);
    return !shutdownCv.wait_for(lock, std::chrono::milliseconds(options.restartDelayMs),
                                [this] { return shuttingDown; });
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

void ServerManager::registerServer(const ServerDefinition& def) {
    ConfigValidator::validate(def);

    std::shared_ptr<ITransport> old;
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(def.name);
        if (it != servers.end()) {
            old = std::move(it->second.runtime.connection);
            it->second.definition = def;
            it->second.runtime = freshRuntime(def.enabled);
            replaced = true;
        } else {
            ServerEntry entry;
            entry.definition = def;
            entry.runtime = freshRuntime(def.enabled);
            entry.lifecycle = std::make_shared<std::mutex>();
            servers.emplace(def.name, std::move(entry));
        }
    }
    closeQuietly(old);
    events.info(std::string(replaced ? "Replaced" : "Registered") + " MCP server: " + def.name);
}

bool ServerManager::addServer(const ServerDefinition& def) {
    registerServer(def);
    if (!def.enabled) return false;
    return connectServer(def.name);
}

bool ServerManager::updateServer(const ServerDefinition& def) {
    if (!hasServer(def.name)) return false;
    return addServer(def);
}

bool ServerManager::removeServer(const std::string& name) {
    std::shared_ptr<ITransport> old;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(name);
        if (it == servers.end()) return false;
        old = std::move(it->second.runtime.connection);
        servers.erase(it);
    }
    closeQuietly(old);
    events.info("Removed MCP server: " + name);
    return true;
}

bool ServerManager::enableServer(const std::string& name) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(name);
        if (it == servers.end()) return false;
        if (!it->second.definition.enabled) {
            it->second.definition.enabled = true;
            it->second.runtime = freshRuntime(true);
            changed = true;
        }
    }
    if (changed) events.info("Enabled MCP server: " + name);
    return connectServer(name);
}

bool ServerManager::disableServer(const std::string& name) {
    std::shared_ptr<ITransport> old;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(name);
        if (it == servers.end()) return false;
        old = std::move(it->second.runtime.connection);
        it->second.definition.enabled = false;
        it->second.runtime = freshRuntime(false);
    }
    closeQuietly(old);
    events.info("Disabled MCP server: " + name);
    return true;
}

// ---------------------------------------------------------------------------
// Connection lifecycle
// ---------------------------------------------------------------------------

bool ServerManager::establish(const std::string& name, const ServerDefinition& def, uint64_t generation) {
    std::shared_ptr<ITransport> transport;
    std::string error;
    try {
        transport = factory(def);
        if (!transport) {
            throw TransportError("No transport available for server '" + name + "'");
        }
        transport->connect();
        transport->handshake(options.clientInfo);
    } catch (const std::exception& e) {
        error = e.what();
    }

    // A local process that never completed initialize is not kept: a ping it happens
    // to answer must not make it routable. Remote sessions are kept for probing.
    bool keep = error.empty() || def.transportKind == TransportKind::RemoteHttp;
    bool stale = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(name);
        if (it == servers.end() || it->second.runtime.generation != generation) {
            stale = true;
        } else {
            auto& runtime = it->second.runtime;
            if (keep) runtime.connection = transport;
            runtime.lastHealthCheckAt = std::chrono::system_clock::now();
            if (error.empty()) {
                runtime.isHealthy = true;
                runtime.state = ServerState::Healthy;
                runtime.lastError.reset();
            } else {
                runtime.isHealthy = false;
                runtime.state = ServerState::Unhealthy;
                runtime.lastError = error;
            }
        }
    }

    if (stale || !keep) {
        closeQuietly(transport);
    }
    if (stale) return false;
    if (!error.empty()) {
        events.warning("Failed to connect to MCP server '" + name + "': " + error);
        return false;
    }
    events.info("Connected to MCP server: " + name);
    return true;
}

bool ServerManager::connectServer(const std::string& name) {
    if (isShuttingDown()) return false;

    std::shared_ptr<std::mutex> lifecycle;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(name);
        if (it == servers.end() || !it->second.definition.enabled) return false;
        lifecycle = it->second.lifecycle;
    }
    std::lock_guard<std::mutex> lifecycleLock(*lifecycle);

    ServerDefinition def;
    uint64_t generation = 0;
    std::shared_ptr<ITransport> old;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(name);
        if (it == servers.end() || !it->second.definition.enabled) return false;
        if (liveLocked(it->second)) return true;

        auto& runtime = it->second.runtime;
        def = it->second.definition;
        generation = runtime.generation;
        old = std::move(runtime.connection);
        runtime.connection.reset();
        runtime.isHealthy = false;
        runtime.state = ServerState::Connecting;
        ++runtime.connectionAttempts;
    }
    closeQuietly(old);
    return establish(name, def, generation);
}

bool ServerManager::restart(const std::string& name, bool onlyIfDown) {
    if (isShuttingDown()) return false;

    std::shared_ptr<std::mutex> lifecycle;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(name);
        if (it == servers.end() || !it->second.definition.enabled) return false;
        lifecycle = it->second.lifecycle;
    }
    std::lock_guard<std::mutex> lifecycleLock(*lifecycle);

    ServerDefinition def;
    uint64_t generation = 0;
    int attempt = 0;
    std::shared_ptr<ITransport> old;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(name);
        if (it == servers.end() || !it->second.definition.enabled) return false;
        // Another thread may have reconnected it while we waited for the lifecycle lock.
        if (onlyIfDown && liveLocked(it->second)) return true;

        auto& runtime = it->second.runtime;
        def = it->second.definition;
        generation = runtime.generation;
        old = std::move(runtime.connection);
        runtime.connection.reset();
        runtime.isHealthy = false;
        runtime.state = ServerState::Connecting;
        attempt = ++runtime.connectionAttempts;
    }

    events.info("Restarting MCP server '" + name + "' (attempt " + std::to_string(attempt) + ")");
    closeQuietly(old);
    if (!waitRestartDelay()) return false;
    return establish(name, def, generation);
}

bool ServerManager::restartServer(const std::string& name) {
    return restart(name, false);
}

int ServerManager::connectAll() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& [name, entry] : servers) {
            if (entry.definition.enabled && !liveLocked(entry)) {
                names.push_back(name);
            }
        }
    }

    std::vector<std::future<bool>> futures;
    futures.reserve(names.size());
    for (const auto& name : names) {
        futures.push_back(std::async(std::launch::async, [this, name]() {
            return connectServer(name);
        }));
    }

    int count = 0;
    for (auto& f : futures) {
        if (f.get()) count++;
    }
    return count;
}

bool ServerManager::probeServer(const std::string& name) {
    std::shared_ptr<ITransport> transport;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(name);
        if (it == servers.end() || !it->second.definition.enabled) return false;
        transport = it->second.runtime.connection;
    }

    bool ok = transport && transport->isConnected() && transport->probe();

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(name);
        // The handle was swapped while probing; the result is about a dead connection.
        if (it == servers.end() || it->second.runtime.connection != transport) return ok;

        auto& runtime = it->second.runtime;
        runtime.lastHealthCheckAt = std::chrono::system_clock::now();
        changed = (runtime.isHealthy != ok);
        runtime.isHealthy = ok;
        runtime.state = ok ? ServerState::Healthy : ServerState::Unhealthy;
        if (!ok) {
            runtime.lastError = transport ? "Health check failed" : "Not connected";
        }
    }

    if (changed) {
        if (ok) {
            events.info("MCP server recovered: " + name);
        } else {
            events.warning("Health check failed for MCP server: " + name);
        }
    }
    return ok;
}

void ServerManager::runHealthCycle() {
    struct Target {
        std::string name;
        TransportKind kind;
        bool live;
        bool hasConnection;
    };
    std::vector<Target> targets;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& [name, entry] : servers) {
            if (!entry.definition.enabled) continue;
            targets.push_back({name, entry.definition.transportKind, liveLocked(entry),
                               entry.runtime.connection != nullptr});
        }
    }

    for (const auto& target : targets) {
        if (isShuttingDown()) return;
        if (!target.live) {
            if (target.kind == TransportKind::LocalProcess) {
                restart(target.name, true);
            } else if (!target.hasConnection) {
                connectServer(target.name);
            }
        }
        probeServer(target.name);
    }
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

std::vector<std::string> ServerManager::routingOrder(const std::string& preferredServer) const {
    std::vector<std::pair<int, std::string>> ranked;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& [name, entry] : servers) {
            if (entry.definition.enabled && liveLocked(entry)) {
                ranked.push_back({entry.definition.priority, name});
            }
        }
    }
    std::sort(ranked.begin(), ranked.end());

    std::vector<std::string> order;
    order.reserve(ranked.size());
    for (const auto& [priority, name] : ranked) {
        order.push_back(name);
    }

    if (!preferredServer.empty()) {
        auto it = std::find(order.begin(), order.end(), preferredServer);
        if (it != order.end()) {
            std::rotate(order.begin(), it, it + 1);
        }
    }
    return order;
}

std::shared_ptr<ITransport> ServerManager::transportFor(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = servers.find(name);
    if (it == servers.end() || !it->second.definition.enabled) return nullptr;
    return it->second.runtime.connection;
}

void ServerManager::recordInvocationError(const std::string& name, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = servers.find(name);
        if (it == servers.end()) return;
        it->second.runtime.lastError = error;
    }
    events.warning("Tool call failed on MCP server '" + name + "': " + error);
}

bool ServerManager::hasServer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    return servers.count(name) > 0;
}

bool ServerManager::isHealthy(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = servers.find(name);
    return it != servers.end() && it->second.definition.enabled && liveLocked(it->second);
}

bool ServerManager::isEnabled(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = servers.find(name);
    return it != servers.end() && it->second.definition.enabled;
}

std::optional<ServerDefinition> ServerManager::definitionOf(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = servers.find(name);
    if (it == servers.end()) return std::nullopt;
    return it->second.definition;
}

ServerStatus ServerManager::statusLocked(const ServerEntry& entry) const {
    ServerStatus s;
    s.name = entry.definition.name;
    s.transportKind = entry.definition.transportKind;
    s.enabled = entry.definition.enabled;
    s.healthy = entry.definition.enabled && liveLocked(entry);
    s.state = entry.runtime.state;
    if (s.state == ServerState::Healthy && !s.healthy) {
        s.state = ServerState::Unhealthy;
    }
    s.priority = entry.definition.priority;
    s.connectionAttempts = entry.runtime.connectionAttempts;
    s.lastError = entry.runtime.lastError;
    s.lastHealthCheckAt = entry.runtime.lastHealthCheckAt;
    s.description = entry.definition.description;
    return s;
}

std::vector<ServerStatus> ServerManager::status() const {
    std::vector<ServerStatus> result;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& [name, entry] : servers) {
            result.push_back(statusLocked(entry));
        }
    }
    std::sort(result.begin(), result.end(), [](const ServerStatus& a, const ServerStatus& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.name < b.name;
    });
    return result;
}

std::optional<ServerStatus> ServerManager::statusOf(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = servers.find(name);
    if (it == servers.end()) return std::nullopt;
    return statusLocked(it->second);
}

bool ServerManager::isAvailable() const {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& [name, entry] : servers) {
        if (entry.definition.enabled && liveLocked(entry)) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Health monitor and shutdown
// ---------------------------------------------------------------------------

void ServerManager::startHealthMonitor(std::chrono::milliseconds interval) {
    stopHealthMonitor();
    std::lock_guard<std::mutex> lock(monitorMtx);
    monitor = std::make_unique<HealthMonitor>([this]() { runHealthCycle(); }, interval, events);
    monitor->start();
}

void ServerManager::stopHealthMonitor() {
    std::unique_ptr<HealthMonitor> stopped;
    {
        std::lock_guard<std::mutex> lock(monitorMtx);
        stopped = std::move(monitor);
    }
    if (stopped) stopped->stop();
}

bool ServerManager::isMonitorRunning() const {
    std::lock_guard<std::mutex> lock(monitorMtx);
    return monitor && monitor->isRunning();
}

void ServerManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(shutdownMtx);
        shuttingDown = true;
    }
    shutdownCv.notify_all();
    stopHealthMonitor();

    std::vector<std::shared_ptr<ITransport>> open;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto& [name, entry] : servers) {
            auto& runtime = entry.runtime;
            if (runtime.connection) {
                open.push_back(std::move(runtime.connection));
                runtime.connection.reset();
            }
            runtime.isHealthy = false;
            runtime.state = entry.definition.enabled ? ServerState::Unhealthy : ServerState::Disabled;
            runtime.generation = ++nextGeneration;
        }
    }

    for (const auto& transport : open) {
        closeQuietly(transport);
    }
    if (!open.empty()) {
        events.info("Disconnected " + std::to_string(open.size()) + " MCP server(s)");
    }
}
