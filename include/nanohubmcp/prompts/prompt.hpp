#pragma once
#include "nanohubmcp/content.hpp"
#include "nanohubmcp/types.hpp"
#include "nanohubmcp/util/signature.hpp"

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace nanohubmcp::server
{
class Context;
}

namespace nanohubmcp::prompts
{

/// MCP Prompt argument definition
struct PromptArgument
{
    std::string name;
    std::optional<std::string> description;
    bool required{false};
};

/// MCP Prompt message
struct Message
{
    std::string role{"user"}; // "user" or "assistant"
    Content content;

    Message() = default;
    Message(std::string text, std::string r = "user")
        : role(std::move(r)), content(TextContent{"text", std::move(text)})
    {
    }
    Message(Content c, std::string r) : role(std::move(r)), content(std::move(c)) {}
};

struct PromptResult
{
    std::vector<Message> messages;
    std::optional<std::string> description;
    Json meta{Json::object()};

    PromptResult() = default;
    explicit PromptResult(std::vector<Message> msgs,
                          std::optional<std::string> desc = std::nullopt)
        : messages(std::move(msgs)), description(std::move(desc))
    {
    }

    /// Accepts a list of strings or {role, content} objects whose content is a string or
    /// a {"text": ...} object.
    static PromptResult from_json(const Json& messages);
};

void to_json(Json& j, const PromptArgument& a);
void to_json(Json& j, const Message& m);
void to_json(Json& j, const PromptResult& r);

using PromptOutput = std::variant<Json, PromptResult>;

/// Wire form of a prompts/get result: rich results as-is, arrays as the message list,
/// anything else as a single user message.
Json normalize_prompt_output(const PromptOutput& output);

/// Argument descriptors for a prompt handler, in declaration order, reserved names
/// skipped.
std::vector<PromptArgument> arguments_from_signature(const Signature& sig);

/// MCP Prompt definition
struct Prompt
{
    using Fn = std::function<PromptOutput(const Json& arguments, server::Context* ctx)>;

    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;
    std::set<std::string> tags;
    Json meta{Json::object()};
    Fn handler;
    std::optional<std::string> context_parameter;

    /// Entry for prompts/list.
    Json definition() const;
};

} // namespace nanohubmcp::prompts
