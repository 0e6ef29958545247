#pragma once

/// @file nanohubmcp.hpp
/// @brief Main header for nanohubmcp - includes everything needed to define and serve
/// an MCP server.
///
/// Usage:
/// @code
/// #include <nanohubmcp.hpp>
///
/// int main() {
///     using namespace nanohubmcp;
///     McpServer app("echo", "1.0.0");
///     app.tool("echo", {param<std::string>("text")},
///              [](const Json& args, server::Context*) -> tools::ToolOutput
///              { return args.at("text"); });
///     app.run("0.0.0.0", 8000);
/// }
/// @endcode

// Core types and exceptions
#include "nanohubmcp/types.hpp"
#include "nanohubmcp/exceptions.hpp"
#include "nanohubmcp/content.hpp"
#include "nanohubmcp/logging.hpp"
#include "nanohubmcp/settings.hpp"
#include "nanohubmcp/version.hpp"

// Handler signatures and schema inference
#include "nanohubmcp/util/signature.hpp"
#include "nanohubmcp/util/schema_build.hpp"

// Registries
#include "nanohubmcp/tools/manager.hpp"
#include "nanohubmcp/resources/manager.hpp"
#include "nanohubmcp/prompts/manager.hpp"

// Server
#include "nanohubmcp/app.hpp"
#include "nanohubmcp/mcp/handler.hpp"
#include "nanohubmcp/server/broadcaster.hpp"
#include "nanohubmcp/server/context.hpp"
#include "nanohubmcp/server/discovery.hpp"
#include "nanohubmcp/server/http_server.hpp"
