#pragma once
#include <functional>
#include <string>

namespace nanohubmcp
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

inline std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

/// Case-insensitive; "WARN" is accepted for Warning. Unknown names map to Info.
LogLevel log_level_from_string(const std::string& name);

/// (level, message, logger_name)
using LogCallback = std::function<void(LogLevel, const std::string&, const std::string&)>;

/// Replace the process-wide sink. An empty callback silences logging. The sink is
/// called without any library lock held, possibly from several threads at once.
void set_log_sink(LogCallback sink);

/// Restore the default sink (one line per message on stderr).
void reset_log_sink();

void set_log_threshold(LogLevel level);
LogLevel log_threshold();

void log(LogLevel level, const std::string& message,
         const std::string& logger_name = "nanohubmcp");

} // namespace nanohubmcp
