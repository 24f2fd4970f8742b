#include "core/SessionStore.h"

void InMemorySessionStore::addTurn(const std::string& role, const std::string& content,
                                   const nlohmann::json& metadata) {
    std::lock_guard<std::mutex> lock(mtx);
    turns.push_back({role, content, metadata.is_null() ? nlohmann::json::object() : metadata});
}

std::vector<ConversationTurn> InMemorySessionStore::getTurns() const {
    std::lock_guard<std::mutex> lock(mtx);
    return turns;
}

size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return turns.size();
}

void InMemorySessionStore::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    turns.clear();
}
