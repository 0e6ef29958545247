#include "nanohubmcp/mcp/handler.hpp"

#include "nanohubmcp/app.hpp"
#include "nanohubmcp/logging.hpp"
#include "nanohubmcp/server/context.hpp"

#include <memory>

namespace nanohubmcp::mcp
{

Json jsonrpc_error(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id.is_null() ? Json() : id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

Json jsonrpc_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

namespace
{

// Raised inside dispatch to produce a JSON-RPC error reply
struct RpcError
{
    int code;
    std::string message;
};

std::string required_string(const Json& params, const char* key)
{
    if (!params.contains(key) || !params[key].is_string())
        throw RpcError{INVALID_PARAMS, std::string("Missing '") + key + "' parameter"};
    return params[key].get<std::string>();
}

Json arguments_of(const Json& params)
{
    if (!params.contains("arguments") || params["arguments"].is_null())
        return Json::object();
    if (!params["arguments"].is_object())
        throw RpcError{INVALID_PARAMS, "'arguments' must be an object"};
    return params["arguments"];
}

// Context for a handler that asked for one; null otherwise.
std::unique_ptr<server::Context> context_for(bool wanted, McpServer& app, const Json& id)
{
    if (!wanted)
        return nullptr;
    return std::make_unique<server::Context>(
        &app.broadcaster(), id.is_null() ? std::nullopt : std::optional<Json>(id));
}

Json call_tool(McpServer& app, const Json& id, const Json& params)
{
    std::string name = required_string(params, "name");
    Json args = arguments_of(params);

    auto tool = app.tools().find(name);
    if (!tool)
        throw RpcError{METHOD_NOT_FOUND, "Tool not found: " + name};

    auto ctx = context_for(tool->wants_context(), app, id);
    try
    {
        return tools::normalize_tool_output(tool->invoke(args, ctx.get()));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Warning, "Tool '" + name + "' failed: " + e.what());
        return tools::tool_error_result(e.what());
    }
    catch (...)
    {
        log(LogLevel::Warning, "Tool '" + name + "' failed with a non-standard exception");
        return tools::tool_error_result("Unknown error");
    }
}

Json read_resource(McpServer& app, const Json& id, const Json& params)
{
    std::string uri = required_string(params, "uri");

    auto resolved = app.resources().resolve(uri);
    if (!resolved)
        throw RpcError{METHOD_NOT_FOUND, "Resource not found: " + uri};

    const auto& res = *resolved->resource;
    auto ctx = context_for(res.context_parameter.has_value(), app, id);
    try
    {
        return resources::normalize_resource_output(res.handler(resolved->params, ctx.get()), uri,
                                                    res.mime_type);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "Resource '" + uri + "' failed: " + e.what());
        throw RpcError{INTERNAL_ERROR, e.what()};
    }
    catch (...)
    {
        log(LogLevel::Error, "Resource '" + uri + "' failed with a non-standard exception");
        throw RpcError{INTERNAL_ERROR, "Unknown error"};
    }
}

Json get_prompt(McpServer& app, const Json& id, const Json& params)
{
    std::string name = required_string(params, "name");
    Json args = arguments_of(params);

    auto prompt = app.prompts().find(name);
    if (!prompt)
        throw RpcError{METHOD_NOT_FOUND, "Prompt not found: " + name};

    auto ctx = context_for(prompt->context_parameter.has_value(), app, id);
    try
    {
        return prompts::normalize_prompt_output(prompt->handler(args, ctx.get()));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "Prompt '" + name + "' failed: " + e.what());
        throw RpcError{INTERNAL_ERROR, e.what()};
    }
    catch (...)
    {
        log(LogLevel::Error, "Prompt '" + name + "' failed with a non-standard exception");
        throw RpcError{INTERNAL_ERROR, "Unknown error"};
    }
}

} // namespace

McpHandler make_mcp_handler(McpServer& app)
{
    return [&app](const Json& message) -> std::optional<Json>
    {
        const Json id = message.is_object() && message.contains("id") ? message["id"] : Json();
        // Malformed (non-object) messages still get an error reply
        const bool is_notification = message.is_object() && id.is_null();

        Json result;
        try
        {
            if (!message.is_object())
                throw RpcError{INVALID_PARAMS, "Request must be a JSON object"};

            std::string method = message.value("method", std::string());
            Json params = message.contains("params") && !message["params"].is_null()
                              ? message["params"]
                              : Json::object();
            if (!params.is_object())
                throw RpcError{INVALID_PARAMS, "'params' must be an object"};

            log(LogLevel::Info, "Received: " + method);

            if (method == "initialize")
            {
                result = Json{{"protocolVersion", PROTOCOL_VERSION},
                              {"serverInfo", app.info()},
                              {"capabilities", app.capabilities()}};
            }
            else if (method == "initialized" || method == "notifications/initialized")
            {
                return std::nullopt;
            }
            else if (method == "ping")
            {
                result = Json::object();
            }
            else if (method == "tools/list")
            {
                Json tools = Json::array();
                for (const auto& t : app.tools().list())
                    tools.push_back(t->definition());
                result = Json{{"tools", tools}};
            }
            else if (method == "tools/call")
            {
                result = call_tool(app, id, params);
            }
            else if (method == "resources/list")
            {
                Json resources = Json::array();
                for (const auto& r : app.resources().list())
                    resources.push_back(r->definition());
                result = Json{{"resources", resources}};
            }
            else if (method == "resources/read")
            {
                result = read_resource(app, id, params);
            }
            else if (method == "prompts/list")
            {
                Json prompts = Json::array();
                for (const auto& p : app.prompts().list())
                    prompts.push_back(p->definition());
                result = Json{{"prompts", prompts}};
            }
            else if (method == "prompts/get")
            {
                result = get_prompt(app, id, params);
            }
            else
            {
                throw RpcError{METHOD_NOT_FOUND, "Method not found: " + method};
            }
        }
        catch (const RpcError& e)
        {
            if (is_notification)
                return std::nullopt;
            return jsonrpc_error(id, e.code, e.message);
        }
        catch (const std::exception& e)
        {
            log(LogLevel::Error, std::string("Dispatch failed: ") + e.what());
            if (is_notification)
                return std::nullopt;
            return jsonrpc_error(id, INTERNAL_ERROR, e.what());
        }
        catch (...)
        {
            log(LogLevel::Error, "Dispatch failed with a non-standard exception");
            if (is_notification)
                return std::nullopt;
            return jsonrpc_error(id, INTERNAL_ERROR, "Unknown error");
        }

        if (is_notification)
            return std::nullopt;
        return jsonrpc_result(id, std::move(result));
    };
}

} // namespace nanohubmcp::mcp
