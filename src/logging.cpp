#include "nanohubmcp/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace nanohubmcp
{

namespace
{

std::mutex& stderr_mutex()
{
    static std::mutex m;
    return m;
}

void stderr_sink(LogLevel level, const std::string& message, const std::string& logger_name)
{
    // Serialized so concurrent connection threads do not interleave lines
    std::lock_guard<std::mutex> lock(stderr_mutex());
    std::cerr << "[" << to_string(level) << "] " << logger_name << ": " << message << std::endl;
}

std::mutex& sink_mutex()
{
    static std::mutex m;
    return m;
}

LogCallback& sink()
{
    static LogCallback s = stderr_sink;
    return s;
}

std::atomic<int>& threshold()
{
    static std::atomic<int> t{static_cast<int>(LogLevel::Info)};
    return t;
}

} // namespace

LogLevel log_level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

void set_log_sink(LogCallback callback)
{
    std::lock_guard<std::mutex> lock(sink_mutex());
    sink() = std::move(callback);
}

void reset_log_sink()
{
    set_log_sink(stderr_sink);
}

void set_log_threshold(LogLevel level)
{
    threshold().store(static_cast<int>(level));
}

LogLevel log_threshold()
{
    return static_cast<LogLevel>(threshold().load());
}

void log(LogLevel level, const std::string& message, const std::string& logger_name)
{
    if (static_cast<int>(level) < threshold().load())
        return;
    LogCallback current;
    {
        std::lock_guard<std::mutex> lock(sink_mutex());
        current = sink();
    }
    // Sinks run unlocked and may log themselves
    if (current)
        current(level, message, logger_name);
}

} // namespace nanohubmcp
