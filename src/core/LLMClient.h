#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ModelProvider.h"
#include "utils/Url.h"

/**
 * @brief OpenAI-compatible chat completions client.
 *
 * Non-200 answers and connection failures are retried with linear back-off;
 * once attempts run out a ModelProviderError is thrown.
 */
class LLMClient : public IModelProvider {
public:
    LLMClient(const std::string& apiKey,
              const std::string& baseUrl = "https://api.openai.com/v1",
              const std::string& model = "gpt-4o-mini");

    std::string getName() const override { return modelName; }

    std::string chat(const std::vector<ConversationTurn>& conversation) override;

    // Server-sent events; each delta is handed to onFragment as it arrives.
    std::string streamChat(const std::vector<ConversationTurn>& conversation,
                           const FragmentCallback& onFragment) override;

    // GET {base}/models answers 200.
    bool isAvailable() override;

    // POST {base}/chat/completions, returns the parsed response body.
    nlohmann::json chatCompletion(const nlohmann::json& messages);

    void setRetryPolicy(int maxRetries, int backoffMs);

    static nlohmann::json toMessages(const std::vector<ConversationTurn>& conversation);
    static std::string extractText(const nlohmann::json& response);

private:
    std::string apiKey;
    std::string baseUrl;
    std::string modelName;
    UrlParts url;
    bool validUrl = false;

    int maxRetries = 3;
    int backoffMs = 2000;  // multiplied by the attempt number

    void requireUrl() const;
};
