#pragma once
#include "nanohubmcp/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nanohubmcp
{

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

struct ImageContent
{
    std::string type{"image"};
    std::string data;                 // base64-encoded image bytes
    std::string mimeType{"image/png"};
};

using Content = std::variant<TextContent, ImageContent>;

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void to_json(Json& j, const ImageContent& c)
{
    j = Json{{"type", c.type}, {"data", c.data}, {"mimeType", c.mimeType}};
}

inline void to_json(Json& j, const Content& c)
{
    std::visit([&j](const auto& item) { to_json(j, item); }, c);
}

/// Image returned from a tool, either as ready base64 data or as a file read on demand.
class Image
{
  public:
    static Image from_data(std::string base64_data, std::string mime_type = "image/png");
    static Image from_file(std::string path, std::string mime_type = "image/png");

    const std::string& mime_type() const
    {
        return mime_type_;
    }

    /// Throws nanohubmcp::Error when the backing file cannot be read.
    ImageContent to_content() const;

  private:
    std::optional<std::string> data_;
    std::optional<std::string> path_;
    std::string mime_type_{"image/png"};
};

std::string base64_encode(const std::vector<uint8_t>& bytes);

} // namespace nanohubmcp
