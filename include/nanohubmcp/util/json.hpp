#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace nanohubmcp::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
inline std::string dump(const json& j)
{
    return j.dump();
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent);
}

/// Text form of a value for human-facing content: strings are taken verbatim,
/// everything else is serialized as compact JSON.
inline std::string to_text(const json& j)
{
    if (j.is_string())
        return j.get<std::string>();
    return j.dump();
}

} // namespace nanohubmcp::util::json
