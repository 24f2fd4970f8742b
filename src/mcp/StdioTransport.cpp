#include "mcp/StdioTransport.h"
#include "mcp/JsonRpc.h"
#include "core/Errors.h"
#include <chrono>
#include <cstring>
#include <cerrno>

#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>

extern char** environ;

namespace {
void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { signal(SIGPIPE, SIG_IGN); });
}

bool isBlank(const std::string& line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r') return false;
    }
    return true;
}
} // namespace

StdioTransport::StdioTransport(const std::string& command,
                               const std::vector<std::string>& args,
                               const std::map<std::string, std::string>& env,
                               int timeoutMs)
    : command(command), args(args), env(env), timeoutMs(timeoutMs) {}

StdioTransport::~StdioTransport() {
    stopProcess();
}

void StdioTransport::connect() {
    if (alive) return;
    stopProcess();
    if (!startProcess()) {
        throw TransportError("Failed to spawn '" + command + "': " + std::strerror(errno));
    }
}

void StdioTransport::disconnect() {
    stopProcess();
}

bool StdioTransport::startProcess() {
    ignoreSigpipe();

    // argv and envp are built before fork so the child only calls async-signal-safe functions.
    std::vector<std::string> argvStorage;
    argvStorage.push_back(command);
    argvStorage.insert(argvStorage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(argvStorage.size() + 1);
    for (auto& arg : argvStorage) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::map<std::string, std::string> mergedEnv;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        mergedEnv[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [key, value] : env) {
        mergedEnv[key] = value;
    }
    std::vector<std::string> envStorage;
    envStorage.reserve(mergedEnv.size());
    for (const auto& [key, value] : mergedEnv) {
        envStorage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(envStorage.size() + 1);
    for (auto& kv : envStorage) {
        envp.push_back(const_cast<char*>(kv.c_str()));
    }
    envp.push_back(nullptr);

    int inPipe[2];
    int outPipe[2];
    // Close-on-exec from creation: a sibling transport forking concurrently must not inherit these ends.
    if (pipe2(inPipe, O_CLOEXEC) != 0) return false;
    if (pipe2(outPipe, O_CLOEXEC) != 0) {
        close(inPipe[0]);
        close(inPipe[1]);
        return false;
    }

    pid = fork();
    if (pid == 0) {
        // Own process group so teardown also reaches launcher grandchildren (npx -> node).
        setpgid(0, 0);
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        int devNull = open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (devNull >= 0) {
            dup2(devNull, STDERR_FILENO);
        }
        environ = envp.data();
        execvp(argv[0], argv.data());
        _exit(127);
    }

    if (pid < 0) {
        close(inPipe[0]);
        close(inPipe[1]);
        close(outPipe[0]);
        close(outPipe[1]);
        pid = -1;
        return false;
    }

    setpgid(pid, pid);
    close(inPipe[0]);
    close(outPipe[1]);
    writeFd = inPipe[1];
    readFd = outPipe[0];

    stopReader = false;
    alive = true;
    readerThread = std::thread(&StdioTransport::readerLoop, this);
    return true;
}

void StdioTransport::stopProcess() {
    stopReader = true;
    if (readerThread.joinable()) readerThread.join();
    alive = false;

    {
        std::lock_guard<std::mutex> writeLock(writeMtx);
        if (writeFd >= 0) {
            close(writeFd);
            writeFd = -1;
        }
    }
    if (readFd >= 0) {
        close(readFd);
        readFd = -1;
    }

    if (pid > 0) {
        kill(-pid, SIGTERM);
        int status = 0;
        bool reaped = false;
        for (int i = 0; i < 20; ++i) {
            pid_t r = waitpid(pid, &status, WNOHANG);
            if (r == pid || r < 0) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (!reaped) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
        }
        pid = -1;
    }

    failAllPending("Connection closed");
}

void StdioTransport::readerLoop() {
    std::string buffer;
    char temp[4096];
    while (!stopReader) {
        struct pollfd pfd;
        pfd.fd = readFd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        ssize_t n = read(readFd, temp, sizeof(temp));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        buffer.append(temp, temp + n);

        std::size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (!isBlank(line)) {
                dispatchLine(line);
            }
        }
    }

    if (!stopReader) {
        // Child exited or the pipe broke.
        alive = false;
        failAllPending("Server process exited");
    }
}

void StdioTransport::dispatchLine(const std::string& line) {
    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
        return;
    }
    if (!JsonRpc::isResponse(msg)) return;

    int id = msg["id"].get<int>();
    PendingRequest request;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = pending.find(id);
        if (it == pending.end()) return;
        request = std::move(it->second);
        pending.erase(it);
    }

    if (msg.contains("error") && !msg["error"].is_null()) {
        request.reject("MCP error: " + JsonRpc::errorMessage(msg["error"]));
    } else {
        request.resolve(msg.contains("result") ? msg["result"] : nlohmann::json());
    }
}

bool StdioTransport::writeLine(const std::string& line) {
    if (writeFd < 0) return false;
    const char* data = line.c_str();
    ssize_t len = static_cast<ssize_t>(line.size());
    ssize_t total = 0;
    while (total < len) {
        ssize_t n = write(writeFd, data + total, len - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += n;
    }
    return true;
}

void StdioTransport::failAllPending(const std::string& reason) {
    std::unordered_map<int, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(mtx);
        failed.swap(pending);
    }
    for (auto& [id, request] : failed) {
        request.reject(reason);
    }
}

std::future<nlohmann::json> StdioTransport::sendRequestAsync(const std::string& method, const nlohmann::json& params) {
    auto promise = std::make_shared<std::promise<nlohmann::json>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> writeLock(writeMtx);
    if (!alive) {
        throw TransportError("Server process is not running");
    }

    int id = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        id = ++requestId;
        pending[id] = PendingRequest{
            [promise](const nlohmann::json& result) { promise->set_value(result); },
            [promise](const std::string& error) {
                promise->set_exception(std::make_exception_ptr(TransportError(error)));
            }
        };
    }

    if (!writeLine(JsonRpc::makeRequest(id, method, params).dump() + "\n")) {
        alive = false;
        {
            std::lock_guard<std::mutex> lock(mtx);
            pending.erase(id);
        }
        throw TransportError("Failed to write '" + method + "' request to server");
    }
    return future;
}

nlohmann::json StdioTransport::sendRequest(const std::string& method, const nlohmann::json& params) {
    auto future = sendRequestAsync(method, params);
    if (future.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
        throw TransportError("'" + method + "' timed out after " + std::to_string(timeoutMs) + " ms");
    }
    return future.get();
}

void StdioTransport::sendNotification(const std::string& method, const nlohmann::json& params) {
    std::lock_guard<std::mutex> writeLock(writeMtx);
    if (!alive) {
        throw TransportError("Server process is not running");
    }
    if (!writeLine(JsonRpc::makeNotification(method, params).dump() + "\n")) {
        alive = false;
        throw TransportError("Failed to write '" + method + "' notification to server");
    }
}

size_t StdioTransport::pendingCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pending.size();
}

nlohmann::json StdioTransport::handshake(const nlohmann::json& clientInfo) {
    auto result = sendRequest(JsonRpc::kInitialize, JsonRpc::initializeParams(clientInfo));
    sendNotification(JsonRpc::kInitialized, nlohmann::json::object());
    if (result.is_object() && result.contains("capabilities")) {
        return result["capabilities"];
    }
    return nlohmann::json::object();
}

std::vector<Tool> StdioTransport::listTools() {
    return JsonRpc::parseToolList(sendRequest(JsonRpc::kListTools, nlohmann::json::object()));
}

nlohmann::json StdioTransport::invoke(const std::string& name, const nlohmann::json& arguments) {
    nlohmann::json params = {
        {"name", name},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };
    return JsonRpc::extractContent(sendRequest(JsonRpc::kCallTool, params));
}

bool StdioTransport::probe() {
    if (!alive) return false;
    try {
        sendRequest(JsonRpc::kPing, nlohmann::json::object());
        return true;
    } catch (const TransportError&) {
        return false;
    }
}
