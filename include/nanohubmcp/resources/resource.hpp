#pragma once
#include "nanohubmcp/types.hpp"

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace nanohubmcp::server
{
class Context;
}

namespace nanohubmcp::resources
{

/// One item of a resources/read result.
struct ResourceContent
{
    std::string uri;
    std::optional<std::string> text;
    std::optional<std::string> blob; // base64-encoded
    std::optional<std::string> mime_type;
};

/// Rich result of a resource read.
struct ResourceResult
{
    std::vector<ResourceContent> contents;
    Json meta{Json::object()};

    ResourceResult() = default;
    explicit ResourceResult(std::vector<ResourceContent> items) : contents(std::move(items)) {}
    /// Single text item; the URI is filled in from the request when left empty.
    explicit ResourceResult(std::string text)
        : contents{ResourceContent{"", std::move(text), std::nullopt, std::nullopt}}
    {
    }
};

void to_json(Json& j, const ResourceContent& c);
void to_json(Json& j, const ResourceResult& r);

using ResourceOutput = std::variant<Json, ResourceResult>;

/// Wire form of a resources/read result for `uri`. Maps are serialized as JSON text,
/// plain strings are taken verbatim. `mime_type` applies to items that carry none.
Json normalize_resource_output(const ResourceOutput& output, const std::string& uri,
                               const std::optional<std::string>& mime_type);

/// MCP Resource definition
struct Resource
{
    /// `params` holds the values extracted from a template URI (empty object otherwise).
    using Fn = std::function<ResourceOutput(const Json& params, server::Context* ctx)>;

    std::string uri;                        // e.g., "config://app/settings"
    std::string name;                       // Human-readable name
    std::optional<std::string> description; // Optional description
    std::optional<std::string> mime_type;   // MIME type hint
    std::set<std::string> tags;
    Json meta{Json::object()};
    Fn handler;
    std::optional<std::string> context_parameter;

    bool is_template() const
    {
        return uri.find('{') != std::string::npos;
    }

    /// Entry for resources/list.
    Json definition() const
    {
        Json j = {{"uri", uri}, {"name", name}};
        if (description && !description->empty())
            j["description"] = *description;
        if (mime_type && !mime_type->empty())
            j["mimeType"] = *mime_type;
        return j;
    }
};

} // namespace nanohubmcp::resources
