#pragma once
#include "nanohubmcp/content.hpp"
#include "nanohubmcp/types.hpp"

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

namespace nanohubmcp::tools
{

/// Rich result of a tool call.
struct ToolResult
{
    std::vector<Content> content;
    bool is_error{false};
    Json meta{Json::object()};

    ToolResult() = default;
    explicit ToolResult(std::string text, bool error = false)
        : content{TextContent{"text", std::move(text)}}, is_error(error)
    {
    }
    explicit ToolResult(std::vector<Content> items, bool error = false)
        : content(std::move(items)), is_error(error)
    {
    }
};

void to_json(Json& j, const ToolResult& r);

/// What a tool handler returns: a plain value or structured map (Json), or a rich result.
using ToolOutput = std::variant<Json, ToolResult>;

/// Wire form of a successful tools/call result.
Json normalize_tool_output(const ToolOutput& output);

/// Wire form of a failed tool call: the message as text content with isError set.
Json tool_error_result(const std::string& message);

/// Body of a direct REST call: maps as-is, rich results in wire form, anything else
/// as {"result": text}.
Json direct_call_body(const ToolOutput& output);

class Tool
{
  public:
    /// `ctx` is null unless the tool declared a context parameter.
    using Fn = std::function<ToolOutput(const Json& arguments, server::Context* ctx)>;

    Tool() = default;

    Tool(std::string name, Json input_schema, Fn fn,
         std::optional<std::string> context_parameter = std::nullopt)
        : name_(std::move(name)), input_schema_(std::move(input_schema)), fn_(std::move(fn)),
          context_parameter_(std::move(context_parameter))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }
    const std::set<std::string>& tags() const
    {
        return tags_;
    }
    const Json& meta() const
    {
        return meta_;
    }
    const std::optional<std::string>& context_parameter() const
    {
        return context_parameter_;
    }
    bool wants_context() const
    {
        return context_parameter_.has_value();
    }

    ToolOutput invoke(const Json& arguments, server::Context* ctx = nullptr) const
    {
        return fn_(arguments, wants_context() ? ctx : nullptr);
    }

    /// Entry for tools/list.
    Json definition() const
    {
        return Json{{"name", name_}, {"description", description_}, {"inputSchema", input_schema_}};
    }

    // Setters for optional fields (builder pattern)
    Tool& set_description(std::string desc)
    {
        description_ = std::move(desc);
        return *this;
    }
    Tool& set_tags(std::set<std::string> tags)
    {
        tags_ = std::move(tags);
        return *this;
    }
    Tool& set_meta(Json meta)
    {
        meta_ = std::move(meta);
        return *this;
    }

  private:
    std::string name_;
    std::string description_;
    Json input_schema_{Json::object()};
    std::set<std::string> tags_;
    Json meta_{Json::object()};
    Fn fn_;
    std::optional<std::string> context_parameter_;
};

} // namespace nanohubmcp::tools
