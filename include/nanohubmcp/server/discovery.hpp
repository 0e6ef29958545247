#pragma once
#include "nanohubmcp/types.hpp"

namespace nanohubmcp
{
class McpServer;
}

namespace nanohubmcp::server
{

/// GET / : name, version, registry counts and the endpoint map.
Json status_document(const McpServer& app);

/// GET /openapi.json : OpenAPI 3.1 description with one POST path per tool
/// (/tools/<name>, the tool's input schema as request body) plus the /mcp endpoint.
Json openapi_document(const McpServer& app);

/// GET /.well-known/mcp.json : protocol version, server info, capabilities and the
/// transports this server speaks.
Json well_known_document(const McpServer& app);

} // namespace nanohubmcp::server
