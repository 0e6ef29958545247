#include "nanohubmcp/resources/manager.hpp"

#include <algorithm>

namespace nanohubmcp::resources
{

void ResourceManager::register_resource(Resource res)
{
    if (res.is_template())
    {
        std::lock_guard<std::mutex> lock(templates_mutex_);
        bool known = std::any_of(templates_.begin(), templates_.end(),
                                 [&](const TemplateEntry& t) { return t.uri == res.uri; });
        if (!known)
            templates_.push_back(TemplateEntry{res.uri, UriTemplate(res.uri)});
    }
    auto uri = res.uri;
    by_uri_.put(uri, std::move(res));
}

std::optional<ResolvedResource> ResourceManager::resolve(const std::string& uri) const
{
    if (auto exact = by_uri_.find(uri))
        return ResolvedResource{exact, Json::object()};

    std::vector<TemplateEntry> templates;
    {
        std::lock_guard<std::mutex> lock(templates_mutex_);
        templates = templates_;
    }

    for (const auto& templ : templates)
    {
        auto values = templ.matcher.match(uri);
        if (!values)
            continue;
        auto res = by_uri_.find(templ.uri);
        if (!res)
            continue;
        Json params = Json::object();
        for (const auto& [key, value] : *values)
            params[key] = value;
        return ResolvedResource{res, params};
    }
    return std::nullopt;
}

} // namespace nanohubmcp::resources
