// httplib task queue that gives every accepted connection its own thread

#pragma once

#include <httplib.h>

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace nanohubmcp::internal
{

/// Replacement for httplib's fixed-size pool. Streaming connections hold their worker
/// for their whole lifetime, so a bounded pool would starve ordinary requests once
/// enough clients are connected.
///
/// Workers are detached; shutdown() blocks until every running connection has returned,
/// which httplib guarantees happens only after the listening socket is closed.
class ConnectionTaskQueue : public httplib::TaskQueue
{
  public:
    ConnectionTaskQueue() = default;
    ~ConnectionTaskQueue() override = default;

    bool enqueue(std::function<void()> fn) override;
    void shutdown() override;

    size_t active() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return active_;
    }

  private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    size_t active_{0};
    bool shutting_down_{false};
};

} // namespace nanohubmcp::internal
