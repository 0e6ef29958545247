#pragma once
#include "nanohubmcp/exceptions.hpp"
#include "nanohubmcp/resources/resource.hpp"
#include "nanohubmcp/resources/template.hpp"
#include "nanohubmcp/util/registry.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nanohubmcp::resources
{

/// A resource resolved for a concrete URI, with the values its template extracted.
struct ResolvedResource
{
    std::shared_ptr<const Resource> resource;
    Json params{Json::object()};
};

class ResourceManager
{
  public:
    using ResourcePtr = std::shared_ptr<const Resource>;

    void register_resource(Resource res);

    /// Exact-URI lookup; nullptr when absent.
    ResourcePtr find(const std::string& uri) const
    {
        return by_uri_.find(uri);
    }

    bool has(const std::string& uri) const
    {
        return by_uri_.has(uri);
    }

    /// Exact match first, then templates in registration order.
    std::optional<ResolvedResource> resolve(const std::string& uri) const;

    std::vector<ResourcePtr> list() const
    {
        return by_uri_.list();
    }

    size_t size() const
    {
        return by_uri_.size();
    }
    bool empty() const
    {
        return by_uri_.empty();
    }

  private:
    struct TemplateEntry
    {
        std::string uri;
        UriTemplate matcher;
    };

    util::OrderedRegistry<Resource> by_uri_;
    std::vector<TemplateEntry> templates_;
    mutable std::mutex templates_mutex_;
};

} // namespace nanohubmcp::resources
