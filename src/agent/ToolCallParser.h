#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

// A tool request found in model output.
struct ToolCallIntent {
    std::string toolName;
    nlohmann::json arguments = nlohmann::json::object();
};

/**
 * @brief One recognizable shape of tool request in free text.
 */
class IToolCallStrategy {
public:
    virtual ~IToolCallStrategy() = default;
    virtual std::string getName() const = 0;
    // First well-formed request of this shape, if any. Malformed candidates are skipped.
    virtual std::optional<ToolCallIntent> parse(const std::string& text) const = 0;
};

// <tool_code>{"name": ..., "arguments": {...}}</tool_code>
class TaggedBlockStrategy : public IToolCallStrategy {
public:
    std::string getName() const override { return "tagged_block"; }
    std::optional<ToolCallIntent> parse(const std::string& text) const override;
};

// ```json / ```tool_call fenced block holding a call object.
class FencedBlockStrategy : public IToolCallStrategy {
public:
    std::string getName() const override { return "fenced_block"; }
    std::optional<ToolCallIntent> parse(const std::string& text) const override;
};

// A bare JSON object with a tool name and an arguments member, anywhere in the text.
class JsonObjectStrategy : public IToolCallStrategy {
public:
    std::string getName() const override { return "json_object"; }
    std::optional<ToolCallIntent> parse(const std::string& text) const override;
};

// read_file({"path": "a.txt"}) or read_file(path="a.txt", limit=10)
class FunctionCallStrategy : public IToolCallStrategy {
public:
    std::string getName() const override { return "function_call"; }
    std::optional<ToolCallIntent> parse(const std::string& text) const override;
};

/**
 * @brief Ordered list of strategies; the first one that matches wins.
 *
 * Heuristic by nature: prose that merely looks like a call can match, and
 * formats no strategy knows are missed. New shapes are added with addStrategy().
 */
class ToolCallParser {
public:
    // Tagged, fenced, bare JSON, function call.
    ToolCallParser();

    void addStrategy(std::unique_ptr<IToolCallStrategy> strategy);
    std::vector<std::string> strategyNames() const;

    std::optional<ToolCallIntent> parse(const std::string& text) const;

    /**
     * @brief Reads a call object.
     *
     * Name keys: "name", "tool", "tool_name", or an OpenAI-style
     * {"function": {"name", "arguments"}}. Argument keys: "arguments",
     * "parameters", "args", "input". Arguments given as a JSON string are decoded.
     * @param requireArguments reject objects without an argument key
     */
    static std::optional<ToolCallIntent> intentFromJson(const nlohmann::json& j, bool requireArguments);

    // Balanced {...} starting at text[start], honoring JSON strings. Empty if unbalanced.
    static std::string extractObject(const std::string& text, size_t start);

private:
    std::vector<std::unique_ptr<IToolCallStrategy>> strategies;
};
