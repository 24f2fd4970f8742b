#pragma once
#include <string>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>

struct ConversationTurn {
    std::string role;     // "system", "user" or "assistant"
    std::string content;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Language-model backend driven by the agent loop.
 *
 * Failures are reported by throwing; the loop treats them as fatal for the turn.
 */
class IModelProvider {
public:
    using FragmentCallback = std::function<void(const std::string&)>;

    virtual ~IModelProvider() = default;

    virtual std::string getName() const = 0;

    virtual std::string chat(const std::vector<ConversationTurn>& conversation) = 0;

    // Delivers the response piecewise to onFragment and returns the whole text.
    virtual std::string streamChat(const std::vector<ConversationTurn>& conversation,
                                   const FragmentCallback& onFragment) {
        std::string text = chat(conversation);
        if (onFragment) onFragment(text);
        return text;
    }

    virtual bool isAvailable() = 0;
};
