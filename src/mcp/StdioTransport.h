#pragma once
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <atomic>
#include <nlohmann/json.hpp>
#include "mcp/ITransport.h"
#include <sys/types.h>

/**
 * @brief Tool server running as a child process, one JSON object per line.
 *
 * Requests are written to the child's stdin in issue order. A background
 * reader splits stdout on newlines and completes the pending request whose id
 * matches; lines that are not JSON, and responses nobody is waiting for, are
 * dropped. Child exit or a pipe error marks the transport dead at once and
 * fails every pending request.
 *
 * A request that times out is abandoned, not cancelled: it stays in the
 * pending map until disconnect().
 */
class StdioTransport : public ITransport {
public:
    StdioTransport(const std::string& command,
                   const std::vector<std::string>& args,
                   const std::map<std::string, std::string>& env,
                   int timeoutMs);
    ~StdioTransport() override;

    TransportKind kind() const override { return TransportKind::LocalProcess; }

    void connect() override;
    nlohmann::json handshake(const nlohmann::json& clientInfo) override;
    std::vector<Tool> listTools() override;
    nlohmann::json invoke(const std::string& name, const nlohmann::json& arguments) override;
    bool probe() override;
    bool isConnected() const override { return alive; }
    void disconnect() override;

    // Writes the request and returns without waiting; the future yields the response's result.
    std::future<nlohmann::json> sendRequestAsync(const std::string& method, const nlohmann::json& params);
    // Waits up to timeoutMs for the result.
    nlohmann::json sendRequest(const std::string& method, const nlohmann::json& params);
    void sendNotification(const std::string& method, const nlohmann::json& params);

    size_t pendingCount() const;
    pid_t getPid() const { return pid; }

private:
    struct PendingRequest {
        std::function<void(const nlohmann::json&)> resolve;
        std::function<void(const std::string&)> reject;
    };

    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    int timeoutMs;

    pid_t pid = -1;
    int readFd = -1;
    int writeFd = -1;

    std::thread readerThread;
    std::atomic<bool> stopReader{false};
    std::atomic<bool> alive{false};

    std::mutex writeMtx;          // id allocation + write, keeps frames in issue order
    mutable std::mutex mtx;       // pending map
    std::unordered_map<int, PendingRequest> pending;
    int requestId = 0;

    bool startProcess();
    void stopProcess();
    void readerLoop();
    void dispatchLine(const std::string& line);
    bool writeLine(const std::string& line);
    void failAllPending(const std::string& reason);
};
