#pragma once

#include "nanohubmcp/mcp/handler.hpp"
#include "nanohubmcp/prompts/manager.hpp"
#include "nanohubmcp/resources/manager.hpp"
#include "nanohubmcp/server/broadcaster.hpp"
#include "nanohubmcp/tools/manager.hpp"
#include "nanohubmcp/types.hpp"
#include "nanohubmcp/util/signature.hpp"

#include <optional>
#include <set>
#include <string>

namespace nanohubmcp
{

struct ToolOptions
{
    std::optional<std::string> description;
    std::set<std::string> tags;
    Json meta{Json::object()};
    // Full schema or simple {"a": "number"} map; inferred from the signature if unset
    std::optional<Json> input_schema;
};

struct ResourceOptions
{
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
    std::set<std::string> tags;
    Json meta{Json::object()};
};

struct PromptOptions
{
    std::optional<std::string> description;
    std::set<std::string> tags;
    Json meta{Json::object()};
};

/// MCP server application: metadata, the three registries and the broadcaster.
///
/// Usage:
/// ```cpp
/// McpServer app("calculator", "1.0.0");
/// app.tool("add", {param<double>("a"), param<double>("b")},
///          [](const Json& args, server::Context*) -> tools::ToolOutput
///          { return args.at("a").get<double>() + args.at("b").get<double>(); },
///          {"Add two numbers"});
/// app.run("0.0.0.0", 8000);
/// ```
class McpServer
{
  public:
    explicit McpServer(std::string name = "nanohubmcp", std::string version = "1.0.0");

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    const std::string& name() const
    {
        return info_.name;
    }
    const std::string& version() const
    {
        return info_.version;
    }
    const ServerInfo& info() const
    {
        return info_;
    }

    // Manager accessors
    tools::ToolManager& tools()
    {
        return tools_;
    }
    const tools::ToolManager& tools() const
    {
        return tools_;
    }

    resources::ResourceManager& resources()
    {
        return resources_;
    }
    const resources::ResourceManager& resources() const
    {
        return resources_;
    }

    prompts::PromptManager& prompts()
    {
        return prompts_;
    }
    const prompts::PromptManager& prompts() const
    {
        return prompts_;
    }

    server::Broadcaster& broadcaster()
    {
        return broadcaster_;
    }

    /// Register (or replace) a tool. Returns the schema-bearing definition as stored; it
    /// stays valid after the name is registered again.
    tools::ToolManager::ToolPtr tool(const std::string& name, const Signature& signature,
                                     tools::Tool::Fn handler, ToolOptions options = {});

    /// Register (or replace) a resource. A URI containing `{...}` is a template.
    void resource(const std::string& uri, resources::Resource::Fn handler,
                  ResourceOptions options = {});
    /// Same, for handlers that may declare a context parameter.
    void resource(const std::string& uri, const Signature& signature,
                  resources::Resource::Fn handler, ResourceOptions options = {});

    /// Register (or replace) a prompt; its arguments are taken from the signature.
    void prompt(const std::string& name, const Signature& signature,
                prompts::Prompt::Fn handler, PromptOptions options = {});

    /// Capabilities derived from the registries; logging is always on.
    ServerCapabilities capabilities() const;

    /// Dispatch one JSON-RPC envelope. nullopt for notifications.
    std::optional<Json> handle(const Json& request) const
    {
        return handler_(request);
    }

    /// Push an envelope to every streaming client.
    size_t broadcast(const Json& envelope)
    {
        return broadcaster_.broadcast(envelope);
    }

    /// Serve HTTP on host:port until the process is stopped. `path_prefix` is stripped
    /// from incoming request paths.
    void run(const std::string& host = "0.0.0.0", int port = 8000,
             const std::string& path_prefix = "");

  private:
    ServerInfo info_;
    tools::ToolManager tools_;
    resources::ResourceManager resources_;
    prompts::PromptManager prompts_;
    server::Broadcaster broadcaster_;
    mcp::McpHandler handler_;
};

} // namespace nanohubmcp
