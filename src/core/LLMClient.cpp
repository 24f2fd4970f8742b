#include "core/LLMClient.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#ifdef _WIN32
    #include <winsock2.h>
#endif
#include <httplib.h>
#include <chrono>
#include <thread>

namespace {
// Some providers answer with content as an array of parts, e.g. [{"type":"text","text":"..."}],
// but only accept a string on the way back in.
std::string flattenContent(const nlohmann::json& content) {
    if (content.is_string()) return content.get<std::string>();
    if (content.is_array()) {
        std::string flat;
        for (const auto& part : content) {
            if (part.is_object() && part.contains("text") && part["text"].is_string()) {
                flat += part["text"].get<std::string>();
            }
        }
        return flat;
    }
    return "";
}

void configure(httplib::Client& cli) {
    cli.set_follow_location(true);
    cli.set_connection_timeout(10);
    cli.set_read_timeout(60);
}
} // namespace

LLMClient::LLMClient(const std::string& apiKey, const std::string& baseUrl, const std::string& model)
    : apiKey(apiKey), baseUrl(baseUrl), modelName(model) {
    auto parsed = parseUrl(baseUrl);
    if (parsed) {
        url = *parsed;
        // Trailing slash would double up with "/chat/completions".
        while (!url.path.empty() && url.path.back() == '/') url.path.pop_back();
        validUrl = true;
    }
}

void LLMClient::requireUrl() const {
    if (!validUrl) {
        throw ModelProviderError("Invalid base URL: " + baseUrl);
    }
}

void LLMClient::setRetryPolicy(int retries, int backoff) {
    maxRetries = retries < 1 ? 1 : retries;
    backoffMs = backoff < 0 ? 0 : backoff;
}

nlohmann::json LLMClient::toMessages(const std::vector<ConversationTurn>& conversation) {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& turn : conversation) {
        messages.push_back({{"role", turn.role}, {"content", turn.content}});
    }
    return messages;
}

std::string LLMClient::extractText(const nlohmann::json& response) {
    if (response.is_object() && response.contains("choices") && response["choices"].is_array() &&
        !response["choices"].empty()) {
        const auto& choice = response["choices"][0];
        if (choice.contains("message") && choice["message"].contains("content") &&
            !choice["message"]["content"].is_null()) {
            return flattenContent(choice["message"]["content"]);
        }
    }
    throw ModelProviderError("Model provider returned no message content");
}

nlohmann::json LLMClient::chatCompletion(const nlohmann::json& messages) {
    requireUrl();

    httplib::Headers headers = {
        {"Authorization", "Bearer " + apiKey}
    };
    nlohmann::json body = {
        {"model", modelName},
        {"messages", messages}
    };
    std::string endpoint = url.path + "/chat/completions";
    std::string bodyStr = body.dump();

    std::string lastError;
    for (int attempt = 1; attempt <= maxRetries; ++attempt) {
        httplib::Client cli(url.schemeHostPort());
        configure(cli);
        auto res = cli.Post(endpoint.c_str(), headers, bodyStr, "application/json");

        if (res && res->status == 200) {
            try {
                return nlohmann::json::parse(res->body);
            } catch (const nlohmann::json::parse_error& e) {
                throw ModelProviderError(std::string("Invalid JSON from model provider: ") + e.what());
            }
        }

        lastError = res ? "Status " + std::to_string(res->status) : httplib::to_string(res.error());
        if (attempt < maxRetries) {
            Logger::getInstance().warn("API request failed (" + lastError + "). Retrying (" +
                                       std::to_string(attempt) + "/" + std::to_string(maxRetries) + ")...");
            std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs * attempt));
        } else if (res && !res->body.empty()) {
            lastError += ", body: " + res->body;
        }
    }

    Logger::getInstance().error("API Error after " + std::to_string(maxRetries) + " attempts: " + lastError);
    throw ModelProviderError("API error after " + std::to_string(maxRetries) + " attempts: " + lastError);
}

std::string LLMClient::chat(const std::vector<ConversationTurn>& conversation) {
    return extractText(chatCompletion(toMessages(conversation)));
}

std::string LLMClient::streamChat(const std::vector<ConversationTurn>& conversation,
                                  const FragmentCallback& onFragment) {
    requireUrl();

    nlohmann::json body = {
        {"model", modelName},
        {"messages", toMessages(conversation)},
        {"stream", true}
    };

    std::string full;
    std::string pending;
    std::string raw;
    bool done = false;

    httplib::Request req;
    req.method = "POST";
    req.path = url.path + "/chat/completions";
    req.headers = {
        {"Authorization", "Bearer " + apiKey},
        {"Content-Type", "application/json"},
        {"Accept", "text/event-stream"}
    };
    req.body = body.dump();
    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        raw.append(data, len);
        pending.append(data, len);
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.rfind("data:", 0) != 0) continue;

            std::string payload = line.substr(5);
            if (!payload.empty() && payload.front() == ' ') payload.erase(0, 1);
            if (payload == "[DONE]") {
                done = true;
                return true;
            }
            try {
                auto chunk = nlohmann::json::parse(payload);
                if (chunk.contains("choices") && chunk["choices"].is_array() && !chunk["choices"].empty()) {
                    const auto& delta = chunk["choices"][0].value("delta", nlohmann::json::object());
                    if (delta.contains("content") && !delta["content"].is_null()) {
                        std::string text = flattenContent(delta["content"]);
                        if (!text.empty()) {
                            full += text;
                            if (onFragment) onFragment(text);
                        }
                    }
                }
            } catch (const nlohmann::json::exception&) {
                // keep-alive comments and frames that are not completion chunks
            }
        }
        return true;
    };

    httplib::Client cli(url.schemeHostPort());
    configure(cli);
    auto res = cli.send(req);
    if (!res) {
        throw ModelProviderError("Stream request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw ModelProviderError("Stream request failed: Status " + std::to_string(res->status) +
                                 (raw.empty() ? "" : ", body: " + raw));
    }
    if (!done && full.empty()) {
        throw ModelProviderError("Stream ended without content");
    }
    return full;
}

bool LLMClient::isAvailable() {
    if (!validUrl) return false;
    httplib::Client cli(url.schemeHostPort());
    cli.set_connection_timeout(5);
    cli.set_read_timeout(5);
    httplib::Headers headers = {{"Authorization", "Bearer " + apiKey}};
    auto res = cli.Get((url.path + "/models").c_str(), headers);
    return res && res->status == 200;
}
