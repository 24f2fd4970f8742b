#include "agent/ToolCallParser.h"
#include <regex>
#include <cctype>

namespace {
std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::optional<nlohmann::json> tryParse(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
}

bool isIdentifier(const std::string& s) {
    static const std::regex identifier(R"([A-Za-z_][A-Za-z0-9_]*)");
    return std::regex_match(s, identifier);
}

// Index of the ')' closing the '(' at openPos, honoring quoted strings and nesting.
size_t findClosingParen(const std::string& text, size_t openPos) {
    int depth = 0;
    char quote = 0;
    bool escaped = false;
    for (size_t i = openPos; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '(' || c == '{' || c == '[') {
            ++depth;
        } else if (c == ')' || c == '}' || c == ']') {
            --depth;
            if (depth == 0) return c == ')' ? i : std::string::npos;
            if (depth < 0) return std::string::npos;
        }
    }
    return std::string::npos;
}

// Splits on commas outside quotes and brackets.
std::vector<std::string> splitTopLevel(const std::string& text) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;
    char quote = 0;
    bool escaped = false;
    for (char c : text) {
        if (quote) {
            current += c;
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '(' || c == '{' || c == '[') {
            ++depth;
        } else if (c == ')' || c == '}' || c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    if (!trim(current).empty()) parts.push_back(current);
    return parts;
}

std::optional<nlohmann::json> parseKeywordValue(const std::string& raw) {
    std::string value = trim(raw);
    if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
        return nlohmann::json(value.substr(1, value.size() - 2));
    }
    if (value == "True") return nlohmann::json(true);
    if (value == "False") return nlohmann::json(false);
    if (value == "None") return nlohmann::json(nullptr);
    return tryParse(value);
}

// key=value, key=value ...
std::optional<nlohmann::json> parseKeywordArguments(const std::string& inner) {
    nlohmann::json args = nlohmann::json::object();
    for (const auto& part : splitTopLevel(inner)) {
        auto eq = part.find('=');
        if (eq == std::string::npos) return std::nullopt;
        std::string key = trim(part.substr(0, eq));
        if (!isIdentifier(key)) return std::nullopt;
        auto value = parseKeywordValue(part.substr(eq + 1));
        if (!value) return std::nullopt;
        args[key] = *value;
    }
    if (args.empty()) return std::nullopt;
    return args;
}
} // namespace

// ---------------------------------------------------------------------------
// ToolCallParser
// ---------------------------------------------------------------------------

ToolCallParser::ToolCallParser() {
    strategies.push_back(std::make_unique<TaggedBlockStrategy>());
    strategies.push_back(std::make_unique<FencedBlockStrategy>());
    strategies.push_back(std::make_unique<JsonObjectStrategy>());
    strategies.push_back(std::make_unique<FunctionCallStrategy>());
}

void ToolCallParser::addStrategy(std::unique_ptr<IToolCallStrategy> strategy) {
    if (strategy) strategies.push_back(std::move(strategy));
}

std::vector<std::string> ToolCallParser::strategyNames() const {
    std::vector<std::string> names;
    for (const auto& strategy : strategies) {
        names.push_back(strategy->getName());
    }
    return names;
}

std::optional<ToolCallIntent> ToolCallParser::parse(const std::string& text) const {
    for (const auto& strategy : strategies) {
        auto intent = strategy->parse(text);
        if (intent) return intent;
    }
    return std::nullopt;
}

std::optional<ToolCallIntent> ToolCallParser::intentFromJson(const nlohmann::json& j, bool requireArguments) {
    if (!j.is_object()) return std::nullopt;

    const nlohmann::json* source = &j;
    if (j.contains("function") && j["function"].is_object()) {
        source = &j["function"];
    }

    ToolCallIntent intent;
    for (const char* key : {"name", "tool", "tool_name"}) {
        auto it = source->find(key);
        if (it != source->end() && it->is_string() && !it->get<std::string>().empty()) {
            intent.toolName = it->get<std::string>();
            break;
        }
    }
    if (intent.toolName.empty()) return std::nullopt;

    const nlohmann::json* args = nullptr;
    for (const char* key : {"arguments", "parameters", "args", "input"}) {
        auto it = source->find(key);
        if (it != source->end()) {
            args = &*it;
            break;
        }
    }
    if (!args) {
        if (requireArguments) return std::nullopt;
        return intent;
    }

    if (args->is_string()) {
        auto decoded = tryParse(args->get<std::string>());
        if (!decoded || !decoded->is_object()) return std::nullopt;
        intent.arguments = *decoded;
    } else if (args->is_null()) {
        intent.arguments = nlohmann::json::object();
    } else if (args->is_object()) {
        intent.arguments = *args;
    } else {
        return std::nullopt;
    }
    return intent;
}

std::string ToolCallParser::extractObject(const std::string& text, size_t start) {
    if (start >= text.size() || text[start] != '{') return "";
    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        if (inString) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') inString = false;
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) return text.substr(start, i - start + 1);
        }
    }
    return "";
}

// ---------------------------------------------------------------------------
// Strategies
// ---------------------------------------------------------------------------

std::optional<ToolCallIntent> TaggedBlockStrategy::parse(const std::string& text) const {
    static const std::string openTag = "<tool_code>";
    static const std::string closeTag = "</tool_code>";

    size_t pos = 0;
    while ((pos = text.find(openTag, pos)) != std::string::npos) {
        size_t bodyStart = pos + openTag.size();
        size_t close = text.find(closeTag, bodyStart);
        if (close == std::string::npos) return std::nullopt;

        std::string body = trim(text.substr(bodyStart, close - bodyStart));
        auto parsed = tryParse(body);
        if (!parsed) {
            // Tolerate prose or a fence around the object inside the tags.
            size_t brace = body.find('{');
            if (brace != std::string::npos) {
                parsed = tryParse(ToolCallParser::extractObject(body, brace));
            }
        }
        if (parsed) {
            auto intent = ToolCallParser::intentFromJson(*parsed, false);
            if (intent) return intent;
        }
        pos = close + closeTag.size();
    }
    return std::nullopt;
}

std::optional<ToolCallIntent> FencedBlockStrategy::parse(const std::string& text) const {
    static const std::string fence = "```";

    size_t pos = 0;
    while ((pos = text.find(fence, pos)) != std::string::npos) {
        size_t lineEnd = text.find('\n', pos + fence.size());
        if (lineEnd == std::string::npos) return std::nullopt;
        std::string info = trim(text.substr(pos + fence.size(), lineEnd - pos - fence.size()));

        size_t close = text.find(fence, lineEnd + 1);
        if (close == std::string::npos) return std::nullopt;
        std::string body = trim(text.substr(lineEnd + 1, close - lineEnd - 1));
        pos = close + fence.size();

        bool toolFence = (info == "tool" || info == "tool_call" || info == "tool_code");
        if (!toolFence && info != "json" && !info.empty()) continue;

        auto parsed = tryParse(body);
        if (!parsed) continue;
        auto intent = ToolCallParser::intentFromJson(*parsed, !toolFence);
        if (intent) return intent;
    }
    return std::nullopt;
}

std::optional<ToolCallIntent> JsonObjectStrategy::parse(const std::string& text) const {
    size_t pos = 0;
    while ((pos = text.find('{', pos)) != std::string::npos) {
        std::string candidate = ToolCallParser::extractObject(text, pos);
        ++pos;
        if (candidate.empty()) continue;

        auto parsed = tryParse(candidate);
        if (!parsed) continue;
        auto intent = ToolCallParser::intentFromJson(*parsed, true);
        if (intent) return intent;
    }
    return std::nullopt;
}

std::optional<ToolCallIntent> FunctionCallStrategy::parse(const std::string& text) const {
    static const std::regex callStart(R"(([A-Za-z_][A-Za-z0-9_\-]*)\s*\()");

    auto begin = std::sregex_iterator(text.begin(), text.end(), callStart);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        size_t openPos = static_cast<size_t>(match.position(0) + match.length(0) - 1);
        size_t closePos = findClosingParen(text, openPos);
        if (closePos == std::string::npos) continue;

        std::string inner = trim(text.substr(openPos + 1, closePos - openPos - 1));
        if (inner.empty()) continue;

        std::optional<nlohmann::json> args;
        if (inner.front() == '{') {
            args = tryParse(inner);
            if (args && !args->is_object()) args.reset();
        } else {
            args = parseKeywordArguments(inner);
        }
        if (!args) continue;

        ToolCallIntent intent;
        intent.toolName = match[1].str();
        intent.arguments = *args;
        return intent;
    }
    return std::nullopt;
}
