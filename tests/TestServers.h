#pragma once
#include <chrono>
#include <string>
#include <thread>
#include <httplib.h>

// httplib::Server on an ephemeral loopback port, serving on its own thread.
class LocalHttpServer {
public:
    httplib::Server server;

    void start() {
        port = server.bind_to_any_port("127.0.0.1");
        worker = std::thread([this]() { server.listen_after_bind(); });
        for (int i = 0; i < 200 && !server.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void stop() {
        server.stop();
        if (worker.joinable()) worker.join();
    }

    ~LocalHttpServer() { stop(); }

    std::string url(const std::string& path = "") const {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

    int getPort() const { return port; }

private:
    int port = -1;
    std::thread worker;
};
