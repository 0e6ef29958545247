#include "nanohubmcp/resources/resource.hpp"

#include "nanohubmcp/util/json.hpp"

namespace nanohubmcp::resources
{

void to_json(Json& j, const ResourceContent& c)
{
    j = Json{{"uri", c.uri}};
    if (c.text)
        j["text"] = *c.text;
    if (c.blob)
        j["blob"] = *c.blob;
    if (c.mime_type && !c.mime_type->empty())
        j["mimeType"] = *c.mime_type;
}

void to_json(Json& j, const ResourceResult& r)
{
    Json contents = Json::array();
    for (const auto& c : r.contents)
        contents.push_back(c);
    j = Json{{"contents", contents}};
    if (r.meta.is_object() && !r.meta.empty())
        j["_meta"] = r.meta;
}

Json normalize_resource_output(const ResourceOutput& output, const std::string& uri,
                               const std::optional<std::string>& mime_type)
{
    ResourceResult result;
    if (const auto* rich = std::get_if<ResourceResult>(&output))
    {
        result = *rich;
    }
    else
    {
        const Json& value = std::get<Json>(output);
        result.contents.push_back(
            ResourceContent{uri, util::json::to_text(value), std::nullopt, std::nullopt});
    }

    for (auto& item : result.contents)
    {
        if (item.uri.empty())
            item.uri = uri;
        if (!item.mime_type && mime_type)
            item.mime_type = mime_type;
    }
    return result;
}

} // namespace nanohubmcp::resources
