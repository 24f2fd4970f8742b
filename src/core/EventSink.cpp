#include "core/EventSink.h"
#include "utils/Logger.h"
#include <iostream>

const char* eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::Info: return "info";
        case EventKind::Warning: return "warning";
        case EventKind::ToolStarted: return "tool_started";
        case EventKind::ToolOutput: return "tool_output";
        case EventKind::StreamFragment: return "stream_fragment";
    }
    return "unknown";
}

void LoggerEventSink::emit(EventKind kind, const std::string& message, const nlohmann::json& details) {
    auto& logger = Logger::getInstance();
    switch (kind) {
        case EventKind::Info:
            logger.info(message);
            break;
        case EventKind::Warning:
            logger.warn(message);
            break;
        case EventKind::ToolStarted: {
            std::string line = message;
            if (details.is_object() && details.contains("server") && details["server"].is_string()) {
                line += " @ " + details["server"].get<std::string>();
            }
            logger.action(line);
            break;
        }
        case EventKind::ToolOutput:
            logger.debug(message);
            break;
        case EventKind::StreamFragment:
            // Fragments go straight to the terminal, unprefixed.
            std::cout << message << std::flush;
            break;
    }
}
