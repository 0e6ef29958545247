#include "nanohubmcp/server/context.hpp"

#include "nanohubmcp/server/broadcaster.hpp"

#include <algorithm>
#include <cctype>

namespace nanohubmcp::server
{

void to_json(Json& j, const LogEntry& e)
{
    j = Json{{"level", e.level}, {"message", e.message}, {"data", e.data}};
}

void Context::log(LogLevel level, const std::string& message, Json data)
{
    std::string name = to_string(level);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    log_messages_.push_back(LogEntry{std::move(name), message, std::move(data)});

    nanohubmcp::log(level, message, "nanohubmcp.context");
}

void Context::report_progress(double progress, std::optional<double> total,
                              std::optional<std::string> message)
{
    Json info = {{"progress", progress}};
    if (total)
        info["total"] = *total;
    if (message && !message->empty())
        info["message"] = *message;

    this->info("Progress: " + info.dump());

    if (!broadcaster_)
        return;

    Json params = {{"requestId", request_id_ ? *request_id_ : Json()}};
    params.update(info);
    broadcaster_->broadcast(Json{
        {"jsonrpc", "2.0"},
        {"method", "notifications/progress"},
        {"params", params},
    });
}

} // namespace nanohubmcp::server
