#include "connection_queue.hpp"

#include "nanohubmcp/logging.hpp"

#include <system_error>
#include <thread>

namespace nanohubmcp::internal
{

bool ConnectionTaskQueue::enqueue(std::function<void()> fn)
{
    {
        std::lock_guard<std::mutex> lock(m_);
        if (shutting_down_)
            return false;
        ++active_;
    }

    try
    {
        std::thread(
            [this, fn = std::move(fn)]()
            {
                try
                {
                    fn();
                }
                catch (const std::exception& e)
                {
                    log(LogLevel::Error, std::string("Connection worker failed: ") + e.what());
                }
                catch (...)
                {
                    log(LogLevel::Error, "Connection worker failed with a non-standard exception");
                }
                // Notify under the lock: shutdown() may destroy the queue as soon as it
                // observes zero, and nothing below touches `this`.
                std::lock_guard<std::mutex> lock(m_);
                --active_;
                cv_.notify_all();
            })
            .detach();
    }
    catch (const std::system_error& e)
    {
        log(LogLevel::Error, std::string("Cannot start connection thread: ") + e.what());
        std::lock_guard<std::mutex> lock(m_);
        --active_;
        cv_.notify_all();
        return false;
    }
    return true;
}

void ConnectionTaskQueue::shutdown()
{
    std::unique_lock<std::mutex> lock(m_);
    shutting_down_ = true;
    cv_.wait(lock, [&] { return active_ == 0; });
}

} // namespace nanohubmcp::internal
