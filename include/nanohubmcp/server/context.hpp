#pragma once
#include "nanohubmcp/logging.hpp"
#include "nanohubmcp/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nanohubmcp::server
{

class Broadcaster;

/// One entry of a context's invocation log.
struct LogEntry
{
    std::string level; // "debug", "info", "warning", "error"
    std::string message;
    Json data{Json::object()};
};

void to_json(Json& j, const LogEntry& e);

/// Per-invocation execution context handed to handlers that declare a `ctx` or
/// `context` parameter.
///
/// Log calls are recorded on the context and forwarded to the process log sink.
/// Progress reports are broadcast to streaming clients as notifications/progress
/// tagged with the originating request id.
class Context
{
  public:
    explicit Context(Broadcaster* broadcaster = nullptr,
                     std::optional<Json> request_id = std::nullopt,
                     Json meta = Json::object())
        : broadcaster_(broadcaster), request_id_(std::move(request_id)), meta_(std::move(meta))
    {
    }

    const std::optional<Json>& request_id() const
    {
        return request_id_;
    }

    const Json& meta() const
    {
        return meta_;
    }

    Broadcaster* broadcaster() const
    {
        return broadcaster_;
    }

    void debug(const std::string& message, Json data = Json::object())
    {
        log(LogLevel::Debug, message, std::move(data));
    }
    void info(const std::string& message, Json data = Json::object())
    {
        log(LogLevel::Info, message, std::move(data));
    }
    void warning(const std::string& message, Json data = Json::object())
    {
        log(LogLevel::Warning, message, std::move(data));
    }
    void error(const std::string& message, Json data = Json::object())
    {
        log(LogLevel::Error, message, std::move(data));
    }

    void log(LogLevel level, const std::string& message, Json data = Json::object());

    void report_progress(double progress, std::optional<double> total = std::nullopt,
                         std::optional<std::string> message = std::nullopt);

    const std::vector<LogEntry>& log_messages() const
    {
        return log_messages_;
    }

  private:
    Broadcaster* broadcaster_;
    std::optional<Json> request_id_;
    Json meta_;
    std::vector<LogEntry> log_messages_;
};

} // namespace nanohubmcp::server
