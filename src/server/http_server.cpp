#include "nanohubmcp/server/http_server.hpp"

#include "../internal/connection_queue.hpp"
#include "nanohubmcp/app.hpp"
#include "nanohubmcp/exceptions.hpp"
#include "nanohubmcp/logging.hpp"
#include "nanohubmcp/mcp/handler.hpp"
#include "nanohubmcp/server/discovery.hpp"
#include "nanohubmcp/settings.hpp"
#include "nanohubmcp/util/json.hpp"

#include <httplib.h>

#include <chrono>

namespace nanohubmcp::server
{

namespace
{

constexpr auto STREAM_WAIT = std::chrono::milliseconds(100);
const std::string TOOLS_ROUTE = "/tools/";

void send_json(httplib::Response& res, int status, const Json& body)
{
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

bool write_event(httplib::DataSink& sink, const std::string& event)
{
    return sink.is_writable() && sink.write(event.data(), event.size());
}

} // namespace

std::string strip_path_prefix(const std::string& path, const std::string& prefix)
{
    std::string local = path;
    if (!prefix.empty() && path.compare(0, prefix.size(), prefix) == 0 &&
        (path.size() == prefix.size() || path[prefix.size()] == '/' ||
         path[prefix.size()] == '?'))
        local = path.substr(prefix.size());
    if (local.empty() || local.front() != '/')
        local.insert(local.begin(), '/');
    return local;
}

HttpServerWrapper::HttpServerWrapper(McpServer& app, std::string host, int port,
                                     std::string path_prefix)
    : app_(app), host_(std::move(host)), port_(port),
      path_prefix_(normalize_prefix(path_prefix))
{
}

HttpServerWrapper::~HttpServerWrapper()
{
    stop();
}

bool HttpServerWrapper::start()
{
    // Idempotent start: return false if already running
    if (running_)
        return false;
    svr_ = std::make_unique<httplib::Server>();

    svr_->new_task_queue = [] { return new internal::ConnectionTaskQueue(); };
    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);
    svr_->set_keep_alive_timeout(2);
    svr_->set_default_headers({{"Access-Control-Allow-Origin", "*"}});

    svr_->Get(R"(/.*)", [this](const httplib::Request& req, httplib::Response& res)
              { handle_get(strip_path_prefix(req.path, path_prefix_), res); });

    svr_->Post(R"(/.*)", [this](const httplib::Request& req, httplib::Response& res)
               { handle_post(strip_path_prefix(req.path, path_prefix_), req, res); });

    svr_->Options(R"(/.*)",
                  [](const httplib::Request&, httplib::Response& res)
                  {
                      res.status = 200;
                      res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS, DELETE");
                      res.set_header("Access-Control-Allow-Headers",
                                     "Content-Type, Authorization, Mcp-Session-Id");
                  });

    svr_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep)
        {
            std::string message = "Internal server error";
            try
            {
                std::rethrow_exception(ep);
            }
            catch (const std::exception& e)
            {
                message = e.what();
            }
            catch (...)
            {
                // Non-standard exception; keep the generic message
            }
            log(LogLevel::Error, "Error handling " + req.method + " " + req.path + ": " + message);
            send_json(res, 500, Json{{"error", message}});
        });

    bool bound = false;
    if (port_ == 0)
    {
        int assigned = svr_->bind_to_any_port(host_);
        bound = assigned > 0;
        if (bound)
            port_ = assigned;
    }
    else
    {
        bound = svr_->bind_to_port(host_, port_);
    }
    if (!bound)
    {
        log(LogLevel::Error, "Cannot bind " + host_ + ":" + std::to_string(port_));
        svr_.reset();
        return false;
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });

    std::string base = "http://" + host_ + ":" + std::to_string(port_) + path_prefix_;
    log(LogLevel::Info, "MCP Server '" + app_.name() + "' v" + app_.version() + " listening on " +
                            host_ + ":" + std::to_string(port_));
    log(LogLevel::Info, "  Tools: " + std::to_string(app_.tools().size()) +
                            ", Resources: " + std::to_string(app_.resources().size()) +
                            ", Prompts: " + std::to_string(app_.prompts().size()));
    log(LogLevel::Info, "  SSE transport:     " + base + "/sse");
    log(LogLevel::Info, "  Streamable HTTP:   " + base + "/mcp");
    log(LogLevel::Info, "  OpenAPI schema:    " + base + "/openapi.json");
    log(LogLevel::Info, "  MCP discovery:     " + base + "/.well-known/mcp.json");
    log(LogLevel::Info, "  Direct tool calls: " + base + "/tools/<name>");
    return true;
}

void HttpServerWrapper::stop()
{
    // Always attempt a graceful shutdown; safe to call multiple times
    running_ = false;
    app_.broadcaster().close_all();
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    svr_.reset();
}

void HttpServerWrapper::wait()
{
    if (thread_.joinable())
        thread_.join();
}

void HttpServerWrapper::handle_get(const std::string& path, httplib::Response& res)
{
    std::string route = path;
    if (route.size() > 1 && route.back() == '/')
        route.pop_back();

    if (route == "/sse")
        open_stream("SSE", "event: open\ndata: {}\n\n", res);
    else if (route == "/mcp")
        open_stream("Streamable HTTP", "event: endpoint\ndata: /mcp\n\n", res);
    else if (route == "/openapi.json")
        send_json(res, 200, openapi_document(app_));
    else if (route == "/.well-known/mcp.json")
        send_json(res, 200, well_known_document(app_));
    else
        send_json(res, 200, status_document(app_));
}

void HttpServerWrapper::handle_post(const std::string& path, const httplib::Request& req,
                                    httplib::Response& res)
{
    if (path.compare(0, TOOLS_ROUTE.size(), TOOLS_ROUTE) == 0)
        handle_direct_call(path.substr(TOOLS_ROUTE.size()), req, res);
    else
        handle_rpc(req, res);
}

void HttpServerWrapper::handle_rpc(const httplib::Request& req, httplib::Response& res)
{
    Json request;
    try
    {
        request = util::json::parse(req.body);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Warning, std::string("Malformed JSON-RPC body: ") + e.what());
        send_json(res, 400,
                  mcp::jsonrpc_error(Json(), mcp::PARSE_ERROR, std::string("Parse error: ") + e.what()));
        return;
    }

    std::optional<Json> reply;
    try
    {
        reply = app_.handle(request);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, std::string("Error handling POST: ") + e.what());
        Json id = request.is_object() && request.contains("id") ? request["id"] : Json();
        send_json(res, 500, mcp::jsonrpc_error(id, mcp::INTERNAL_ERROR, e.what()));
        return;
    }

    if (!reply)
    {
        send_json(res, 202, Json{{"status", "accepted"}});
        return;
    }

    app_.broadcast(*reply);
    send_json(res, 200, *reply);
}

void HttpServerWrapper::handle_direct_call(const std::string& tool_name,
                                           const httplib::Request& req, httplib::Response& res)
{
    auto tool = app_.tools().find(tool_name);
    if (!tool)
    {
        send_json(res, 404, Json{{"error", "Tool not found: " + tool_name}});
        return;
    }

    try
    {
        Json args = req.body.empty() ? Json::object() : util::json::parse(req.body);
        if (!args.is_object())
            throw ValidationError("Tool arguments must be a JSON object");

        // No JSON-RPC request id on this route
        std::unique_ptr<Context> ctx;
        if (tool->wants_context())
            ctx = std::make_unique<Context>(&app_.broadcaster());
        send_json(res, 200, tools::direct_call_body(tool->invoke(args, ctx.get())));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Warning, "Direct call to '" + tool_name + "' failed: " + e.what());
        send_json(res, 500, Json{{"error", e.what()}});
    }
    catch (...)
    {
        log(LogLevel::Warning,
            "Direct call to '" + tool_name + "' failed with a non-standard exception");
        send_json(res, 500, Json{{"error", "Unknown error"}});
    }
}

void HttpServerWrapper::open_stream(const char* transport, std::string opening_event,
                                    httplib::Response& res)
{
    auto client = app_.broadcaster().add_client();
    log(LogLevel::Info, std::string(transport) + " client connected. Total: " +
                            std::to_string(app_.broadcaster().client_count()));

    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, client, opening_event](size_t /*offset*/, httplib::DataSink& sink)
        {
            if (!write_event(sink, opening_event))
                return false;

            while (running_ && client->alive())
            {
                auto payload = client->wait_pop(STREAM_WAIT);
                if (!payload)
                {
                    if (!sink.is_writable())
                        return false;
                    continue;
                }
                if (!write_event(sink, "event: message\ndata: " + *payload + "\n\n"))
                    return false;
            }
            // Shutdown, or the client was dropped for falling behind
            sink.done();
            return true;
        },
        [this, client, transport = std::string(transport)](bool /*success*/)
        {
            app_.broadcaster().remove_client(client->id());
            log(LogLevel::Info, transport + " client disconnected. Total: " +
                                    std::to_string(app_.broadcaster().client_count()));
        });
}

} // namespace nanohubmcp::server
