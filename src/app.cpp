#include "nanohubmcp/app.hpp"

#include "nanohubmcp/exceptions.hpp"
#include "nanohubmcp/logging.hpp"
#include "nanohubmcp/server/http_server.hpp"
#include "nanohubmcp/util/schema_build.hpp"

namespace nanohubmcp
{

McpServer::McpServer(std::string name, std::string version)
    : info_{std::move(name), std::move(version)}
{
    handler_ = mcp::make_mcp_handler(*this);
}

tools::ToolManager::ToolPtr McpServer::tool(const std::string& name, const Signature& signature,
                                            tools::Tool::Fn handler, ToolOptions options)
{
    if (name.empty())
        throw ValidationError("Tool name must not be empty");
    if (!handler)
        throw ValidationError("Tool '" + name + "' has no handler");

    Json schema = options.input_schema
                      ? util::schema_build::to_object_schema_from_simple(*options.input_schema)
                      : util::schema_build::infer_input_schema(signature);

    tools::Tool t(name, std::move(schema), std::move(handler), signature.context_parameter());
    t.set_description(options.description.value_or(""))
        .set_tags(std::move(options.tags))
        .set_meta(std::move(options.meta));
    tools_.register_tool(std::move(t));
    return tools_.get(name);
}

void McpServer::resource(const std::string& uri, resources::Resource::Fn handler,
                         ResourceOptions options)
{
    resource(uri, Signature{}, std::move(handler), std::move(options));
}

void McpServer::resource(const std::string& uri, const Signature& signature,
                         resources::Resource::Fn handler, ResourceOptions options)
{
    if (uri.empty())
        throw ValidationError("Resource URI must not be empty");
    if (!handler)
        throw ValidationError("Resource '" + uri + "' has no handler");

    resources::Resource r;
    r.uri = uri;
    r.name = options.name.value_or(uri);
    r.description = std::move(options.description);
    r.mime_type = std::move(options.mime_type);
    r.tags = std::move(options.tags);
    r.meta = std::move(options.meta);
    r.handler = std::move(handler);
    r.context_parameter = signature.context_parameter();
    resources_.register_resource(std::move(r));
}

void McpServer::prompt(const std::string& name, const Signature& signature,
                       prompts::Prompt::Fn handler, PromptOptions options)
{
    if (name.empty())
        throw ValidationError("Prompt name must not be empty");
    if (!handler)
        throw ValidationError("Prompt '" + name + "' has no handler");

    prompts::Prompt p;
    p.name = name;
    p.description = std::move(options.description);
    p.arguments = prompts::arguments_from_signature(signature);
    p.tags = std::move(options.tags);
    p.meta = std::move(options.meta);
    p.handler = std::move(handler);
    p.context_parameter = signature.context_parameter();
    prompts_.add(std::move(p));
}

ServerCapabilities McpServer::capabilities() const
{
    ServerCapabilities caps;
    caps.tools = !tools_.empty();
    caps.resources = !resources_.empty();
    caps.prompts = !prompts_.empty();
    caps.logging = true;
    return caps;
}

void McpServer::run(const std::string& host, int port, const std::string& path_prefix)
{
    server::HttpServerWrapper http(*this, host, port, path_prefix);
    if (!http.start())
        throw TransportError("Failed to start HTTP server on " + host + ":" +
                             std::to_string(port));
    http.wait();
}

} // namespace nanohubmcp
