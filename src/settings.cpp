#include "nanohubmcp/settings.hpp"

#include <algorithm>
#include <cstdlib>

namespace nanohubmcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static bool valid_port(long long v)
{
    return v > 0 && v <= 65535;
}

static int parse_port(const std::string& s, int default_value)
{
    try
    {
        size_t pos = 0;
        long long v = std::stoll(s, &pos, 10);
        if (pos != s.size() || !valid_port(v))
            return default_value;
        return static_cast<int>(v);
    }
    catch (const std::exception&)
    {
        return default_value;
    }
}

// Accepts a JSON integer or a numeric string; anything else keeps the default
static int port_from_json(const Json& v, int default_value)
{
    if (v.is_number_integer())
    {
        auto n = v.get<long long>();
        return valid_port(n) ? static_cast<int>(n) : default_value;
    }
    if (v.is_string())
        return parse_port(v.get<std::string>(), default_value);
    return default_value;
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("NANOHUBMCP_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.host = getenv_str("MCP_HOST", s.host);
    s.port = parse_port(getenv_str("MCP_PORT", ""), s.port);
    s.path_prefix = getenv_str("MCP_PATH_PREFIX", s.path_prefix);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("host"))
        s.host = j.at("host").get<std::string>();
    if (j.contains("port"))
        s.port = port_from_json(j.at("port"), s.port);
    if (j.contains("path_prefix"))
        s.path_prefix = j.at("path_prefix").get<std::string>();
    return s;
}

std::string normalize_prefix(const std::string& prefix)
{
    size_t end = prefix.find_last_not_of('/');
    if (end == std::string::npos)
        return "";
    std::string out = prefix.substr(0, end + 1);
    size_t start = out.find_first_not_of('/');
    return "/" + out.substr(start);
}

} // namespace nanohubmcp
