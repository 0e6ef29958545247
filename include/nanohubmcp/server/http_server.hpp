#pragma once
#include "nanohubmcp/types.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib
{
class Server;
struct Request;
struct Response;
} // namespace httplib

namespace nanohubmcp
{
class McpServer;
}

namespace nanohubmcp::server
{

/// Path of a request as seen behind a reverse proxy: `prefix` (already normalized) is
/// removed when the path starts with it at a segment boundary, and the result always
/// has a leading slash.
std::string strip_path_prefix(const std::string& path, const std::string& prefix);

/**
 * HTTP listener serving every transport of an McpServer on one port.
 *
 * Routes (after prefix stripping):
 *   GET  /sse                  SSE stream, opens with `event: open`
 *   GET  /mcp                  streamable HTTP stream, opens with `event: endpoint`
 *   GET  /openapi.json         OpenAPI description of the tools
 *   GET  /.well-known/mcp.json discovery document
 *   GET  anything else         status document
 *   POST /tools/<name>         direct tool call, body = arguments
 *   POST anything else         JSON-RPC; non-null replies are also broadcast
 *   OPTIONS *                  CORS preflight
 *
 * Every response carries `Access-Control-Allow-Origin: *`. Each connection runs on
 * its own thread.
 */
class HttpServerWrapper
{
  public:
    /// `port` 0 binds an ephemeral port; see port() after start().
    HttpServerWrapper(McpServer& app, std::string host = "127.0.0.1", int port = 18080,
                      std::string path_prefix = "");
    ~HttpServerWrapper();

    HttpServerWrapper(const HttpServerWrapper&) = delete;
    HttpServerWrapper& operator=(const HttpServerWrapper&) = delete;

    /// Bind and start serving in the background. False if already running or the
    /// address cannot be bound.
    bool start();

    /// Close every streaming client, stop the listener and join it. Safe to call
    /// multiple times.
    void stop();

    /// Block until the listener exits.
    void wait();

    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }
    const std::string& path_prefix() const
    {
        return path_prefix_;
    }

  private:
    void handle_get(const std::string& path, httplib::Response& res);
    void handle_post(const std::string& path, const httplib::Request& req,
                     httplib::Response& res);
    void handle_rpc(const httplib::Request& req, httplib::Response& res);
    void handle_direct_call(const std::string& tool_name, const httplib::Request& req,
                            httplib::Response& res);
    void open_stream(const char* transport, std::string opening_event, httplib::Response& res);

    McpServer& app_;
    std::string host_;
    int port_;
    std::string path_prefix_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace nanohubmcp::server
