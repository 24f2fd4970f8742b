#pragma once
#include <string>
#include <atomic>
#include <mutex>
#include <nlohmann/json.hpp>
#include "mcp/ITransport.h"
#include "utils/Url.h"

/**
 * @brief Remote tool server reached with one HTTP POST per call.
 *
 * Body is the same JSON-RPC object the stdio transport writes, sent with a
 * bearer credential. A non-2xx status or a populated "error" member fails the
 * call. There is no persistent connection: probe() re-issues the last method
 * that succeeded (tools/call excluded), or initialize when none has.
 */
class HttpTransport : public ITransport {
public:
    HttpTransport(const std::string& endpoint, const std::string& credential, int timeoutMs);

    TransportKind kind() const override { return TransportKind::RemoteHttp; }

    void connect() override;
    nlohmann::json handshake(const nlohmann::json& clientInfo) override;
    std::vector<Tool> listTools() override;
    nlohmann::json invoke(const std::string& name, const nlohmann::json& arguments) override;
    bool probe() override;
    bool isConnected() const override { return connected; }
    void disconnect() override { connected = false; }

    nlohmann::json sendRequest(const std::string& method, const nlohmann::json& params);

private:
    std::string endpoint;
    std::string credential;
    int timeoutMs;
    UrlParts url;
    std::atomic<bool> connected{false};
    std::atomic<int> requestId{0};

    std::mutex mtx;
    std::string lastGoodMethod;
    nlohmann::json lastGoodParams;
    nlohmann::json clientInfo;

    void rememberGood(const std::string& method, const nlohmann::json& params);
    static nlohmann::json parseBody(const std::string& body, const std::string& contentType);
};
