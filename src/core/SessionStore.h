#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>
#include "core/ModelProvider.h"

// Append-only record of conversation turns.
class ISessionStore {
public:
    virtual ~ISessionStore() = default;
    virtual void addTurn(const std::string& role, const std::string& content,
                         const nlohmann::json& metadata = nlohmann::json::object()) = 0;
};

class InMemorySessionStore : public ISessionStore {
public:
    void addTurn(const std::string& role, const std::string& content,
                 const nlohmann::json& metadata = nlohmann::json::object()) override;

    std::vector<ConversationTurn> getTurns() const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mtx;
    std::vector<ConversationTurn> turns;
};
