#include "nanohubmcp/server/discovery.hpp"

#include "nanohubmcp/app.hpp"

namespace nanohubmcp::server
{

Json status_document(const McpServer& app)
{
    return Json{
        {"name", app.name()},
        {"version", app.version()},
        {"status", "running"},
        {"tools", app.tools().size()},
        {"resources", app.resources().size()},
        {"prompts", app.prompts().size()},
        {"endpoints", {{"sse", "/sse"}, {"mcp", "/mcp"}, {"openapi", "/openapi.json"}}},
    };
}

namespace
{

Json json_body(Json schema)
{
    return Json{{"application/json", Json{{"schema", std::move(schema)}}}};
}

Json object_schema()
{
    return Json{{"type", "object"}};
}

} // namespace

Json openapi_document(const McpServer& app)
{
    Json paths = Json::object();

    Json mcp_get = {{"operationId", "mcp_sse"}, {"summary", "MCP Streamable HTTP SSE endpoint"}};
    mcp_get["responses"]["200"]["description"] = "SSE stream";

    Json mcp_post = {{"operationId", "mcp_message"}, {"summary", "Send MCP JSON-RPC message"}};
    mcp_post["requestBody"]["content"] = json_body(object_schema());
    mcp_post["responses"]["200"]["description"] = "JSON-RPC response";

    paths["/mcp"]["get"] = mcp_get;
    paths["/mcp"]["post"] = mcp_post;

    for (const auto& tool : app.tools().list())
    {
        Json op = {{"operationId", tool->name()},
                   {"summary", tool->description().empty() ? tool->name() : tool->description()}};
        op["requestBody"]["required"] = true;
        op["requestBody"]["content"] = json_body(tool->input_schema());
        op["responses"]["200"]["description"] = "Tool result";
        op["responses"]["200"]["content"] = json_body(object_schema());
        paths["/tools/" + tool->name()]["post"] = op;
    }

    Json info = {{"title", app.name()},
                 {"version", app.version()},
                 {"description", "MCP Server exposing tools as OpenAPI endpoints"}};
    return Json{{"openapi", "3.1.0"}, {"info", info}, {"paths", paths}};
}

Json well_known_document(const McpServer& app)
{
    return Json{
        {"mcpVersion", PROTOCOL_VERSION},
        {"serverInfo", app.info()},
        {"capabilities", app.capabilities()},
        {"transports",
         Json::array({Json{{"type", "sse"}, {"endpoint", "/sse"}},
                      Json{{"type", "streamable-http"}, {"endpoint", "/mcp"}}})},
    };
}

} // namespace nanohubmcp::server
