#pragma once
#include <string>
#include <nlohmann/json.hpp>

enum class EventKind {
    Info,
    Warning,
    ToolStarted,
    ToolOutput,
    StreamFragment
};

const char* eventKindName(EventKind kind);

/**
 * @brief Fire-and-forget notifications for presentation.
 *
 * The server manager, catalog and agent loop report through this interface
 * instead of logging directly. emit() must not block and must not throw.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void emit(EventKind kind, const std::string& message,
                      const nlohmann::json& details = nlohmann::json::object()) = 0;

    void info(const std::string& message) { emit(EventKind::Info, message); }
    void warning(const std::string& message) { emit(EventKind::Warning, message); }
};

// Forwards events to Logger.
class LoggerEventSink : public IEventSink {
public:
    void emit(EventKind kind, const std::string& message, const nlohmann::json& details) override;
};

class NullEventSink : public IEventSink {
public:
    void emit(EventKind, const std::string&, const nlohmann::json&) override {}
};
