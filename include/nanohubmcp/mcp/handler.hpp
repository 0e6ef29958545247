#pragma once
#include "nanohubmcp/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace nanohubmcp
{
class McpServer; // Forward declaration
}

namespace nanohubmcp::mcp
{

/// JSON-RPC error codes used by the dispatcher
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_PARAMS = -32602;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INTERNAL_ERROR = -32603;

/// Dispatcher: a request envelope in, a response envelope out, or nullopt when the
/// request was a notification (no id, or a null id).
using McpHandler = std::function<std::optional<Json>(const Json&)>;

Json jsonrpc_error(const Json& id, int code, const std::string& message);
Json jsonrpc_result(const Json& id, Json result);

/// Build the dispatcher for `app`. Handles initialize, initialized, ping, tools/list,
/// tools/call, resources/list, resources/read, prompts/list and prompts/get; any other
/// method is -32601. The app must outlive the returned handler.
McpHandler make_mcp_handler(McpServer& app);

} // namespace nanohubmcp::mcp
