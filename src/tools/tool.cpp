#include "nanohubmcp/tools/tool.hpp"

#include "nanohubmcp/util/json.hpp"

namespace nanohubmcp::tools
{

void to_json(Json& j, const ToolResult& r)
{
    Json content = Json::array();
    for (const auto& item : r.content)
        content.push_back(item);
    j = Json{{"content", content}, {"isError", r.is_error}};
    if (r.meta.is_object() && !r.meta.empty())
        j["_meta"] = r.meta;
}

Json normalize_tool_output(const ToolOutput& output)
{
    if (const auto* rich = std::get_if<ToolResult>(&output))
        return *rich;

    const Json& value = std::get<Json>(output);
    // Structured maps and plain values both travel as a single text item
    return Json{{"content", Json::array({Json{{"type", "text"},
                                              {"text", util::json::to_text(value)}}})},
                {"isError", false}};
}

Json tool_error_result(const std::string& message)
{
    return Json{{"content", Json::array({Json{{"type", "text"}, {"text", message}}})},
                {"isError", true}};
}

Json direct_call_body(const ToolOutput& output)
{
    if (const auto* rich = std::get_if<ToolResult>(&output))
        return *rich;

    const Json& value = std::get<Json>(output);
    if (value.is_object())
        return value;
    return Json{{"result", util::json::to_text(value)}};
}

} // namespace nanohubmcp::tools
