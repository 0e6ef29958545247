#include "nanohubmcp/server/broadcaster.hpp"

#include "nanohubmcp/logging.hpp"

#include <algorithm>

namespace nanohubmcp::server
{

bool StreamingClient::push(std::string payload)
{
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(m_);
        if (!alive_)
            return false;
        if (queue_.size() >= max_pending_)
        {
            alive_ = false;
            queue_.clear();
        }
        else
        {
            queue_.push_back(std::move(payload));
            accepted = true;
        }
    }
    cv_.notify_all();
    return accepted;
}

std::optional<std::string> StreamingClient::wait_pop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_);
    cv_.wait_for(lock, timeout, [&] { return !queue_.empty() || !alive_; });
    if (!alive_ || queue_.empty())
        return std::nullopt;
    std::string payload = std::move(queue_.front());
    queue_.pop_front();
    return payload;
}

void StreamingClient::close()
{
    {
        std::lock_guard<std::mutex> lock(m_);
        alive_ = false;
        queue_.clear();
    }
    cv_.notify_all();
}

size_t StreamingClient::pending() const
{
    std::lock_guard<std::mutex> lock(m_);
    return queue_.size();
}

std::shared_ptr<StreamingClient> Broadcaster::add_client()
{
    auto client =
        std::make_shared<StreamingClient>("client-" + std::to_string(next_id_++), max_pending_);
    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.push_back(client);
    return client;
}

void Broadcaster::remove_client(const std::string& id)
{
    std::shared_ptr<StreamingClient> removed;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = std::find_if(clients_.begin(), clients_.end(),
                               [&](const auto& c) { return c->id() == id; });
        if (it == clients_.end())
            return;
        removed = *it;
        clients_.erase(it);
    }
    removed->close();
}

size_t Broadcaster::broadcast(const Json& envelope)
{
    const std::string payload = envelope.dump();

    std::lock_guard<std::mutex> order(order_mutex_);
    std::vector<std::shared_ptr<StreamingClient>> targets;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        targets = clients_;
    }

    size_t delivered = 0;
    std::vector<std::string> overflowed;
    for (const auto& client : targets)
    {
        if (client->push(payload))
            ++delivered;
        else
            overflowed.push_back(client->id());
    }

    for (const auto& id : overflowed)
    {
        log(LogLevel::Warning, "Dropping streaming client " + id + " (queue full or closed)");
        remove_client(id);
    }
    return delivered;
}

size_t Broadcaster::client_count() const
{
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

void Broadcaster::close_all()
{
    std::vector<std::shared_ptr<StreamingClient>> all;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        all.swap(clients_);
    }
    for (const auto& client : all)
        client->close();
}

} // namespace nanohubmcp::server
