#pragma once
#include "nanohubmcp/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nanohubmcp::server
{

/// One open streaming connection (SSE or streamable HTTP).
///
/// Owns a FIFO of serialized envelopes. The broadcaster pushes from request threads, the
/// connection's own thread drains with wait_pop(). Once closed, a client accepts nothing
/// and wait_pop() returns immediately.
class StreamingClient
{
  public:
    explicit StreamingClient(std::string id, size_t max_pending)
        : id_(std::move(id)), max_pending_(max_pending)
    {
    }

    const std::string& id() const
    {
        return id_;
    }

    /// Enqueue one serialized envelope. Returns false when the client is closed, or when
    /// the queue is full, in which case the client is closed as well.
    bool push(std::string payload);

    /// Wait up to `timeout` for the next envelope. nullopt on timeout or once closed.
    std::optional<std::string> wait_pop(std::chrono::milliseconds timeout);

    void close();

    bool alive() const
    {
        return alive_.load();
    }

    size_t pending() const;

  private:
    std::string id_;
    size_t max_pending_;
    std::deque<std::string> queue_;
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::atomic<bool> alive_{true};
};

/// Fans out envelopes to every connected streaming client.
class Broadcaster
{
  public:
    static constexpr size_t MAX_QUEUE_SIZE = 1000;

    explicit Broadcaster(size_t max_pending = MAX_QUEUE_SIZE) : max_pending_(max_pending) {}

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    /// Register a new client; it receives every envelope broadcast from now on.
    std::shared_ptr<StreamingClient> add_client();

    /// Close and deregister. Unknown ids are ignored.
    void remove_client(const std::string& id);

    /// Serialize once and enqueue on every client, in call order per client.
    /// Clients that overflow are closed and dropped. Returns the number of clients reached.
    size_t broadcast(const Json& envelope);

    size_t client_count() const;

    /// Close every client so their streaming loops end; used on shutdown.
    void close_all();

  private:
    size_t max_pending_;
    std::vector<std::shared_ptr<StreamingClient>> clients_;
    mutable std::mutex clients_mutex_;
    // Serializes broadcast() so all clients observe the same envelope order
    std::mutex order_mutex_;
    std::atomic<uint64_t> next_id_{1};
};

} // namespace nanohubmcp::server
