#pragma once
#include "nanohubmcp/types.hpp"

#include <string>

namespace nanohubmcp
{

struct Settings
{
    std::string log_level{"INFO"};
    std::string host{"0.0.0.0"};
    int port{8000};
    std::string path_prefix;

    static Settings from_env();
    static Settings from_json(const Json& j);
};

/// Normalize a reverse-proxy path prefix to "/a/b" form (leading slash, no trailing
/// slash). An empty or all-slash prefix normalizes to "".
std::string normalize_prefix(const std::string& prefix);

} // namespace nanohubmcp
