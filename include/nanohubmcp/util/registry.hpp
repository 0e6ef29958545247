#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace nanohubmcp::util
{

/// String-keyed map of immutable entries that remembers registration order.
///
/// Re-registering a key replaces the entry in place (last write wins, original
/// position kept). Entries are handed out as shared_ptr<const T>, so a lookup stays
/// valid even if the key is replaced while the caller still uses it.
template <typename T>
class OrderedRegistry
{
  public:
    using Ptr = std::shared_ptr<const T>;

    void put(const std::string& key, T value)
    {
        auto entry = std::make_shared<const T>(std::move(value));
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end())
        {
            entries_[it->second] = std::move(entry);
            return;
        }
        index_.emplace(key, entries_.size());
        entries_.push_back(std::move(entry));
    }

    Ptr find(const std::string& key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end())
            return nullptr;
        return entries_[it->second];
    }

    bool has(const std::string& key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.count(key) > 0;
    }

    std::vector<Ptr> list() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    bool empty() const
    {
        return size() == 0;
    }

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<Ptr> entries_;
};

} // namespace nanohubmcp::util
