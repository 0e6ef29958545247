#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace nanohubmcp
{

using Json = nlohmann::json;

/// Protocol revision announced in initialize and the discovery document.
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

struct ServerInfo
{
    std::string name;
    std::string version{"1.0.0"};
};

/// Capabilities advertised during initialize.
/// Only enabled capabilities appear on the wire, each as an empty object.
struct ServerCapabilities
{
    bool tools{false};
    bool resources{false};
    bool prompts{false};
    bool logging{false};
};

// nlohmann::json adapters
inline void to_json(Json& j, const ServerInfo& info)
{
    j = Json{{"name", info.name}, {"version", info.version}};
}

inline void to_json(Json& j, const ServerCapabilities& caps)
{
    j = Json::object();
    if (caps.tools)
        j["tools"] = Json::object();
    if (caps.resources)
        j["resources"] = Json::object();
    if (caps.prompts)
        j["prompts"] = Json::object();
    if (caps.logging)
        j["logging"] = Json::object();
}

} // namespace nanohubmcp
