#include "nanohubmcp/content.hpp"

#include "nanohubmcp/exceptions.hpp"

#include <fstream>
#include <iterator>

namespace nanohubmcp
{

std::string base64_encode(const std::vector<uint8_t>& bytes)
{
    static const char* b64_chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string b64;
    b64.reserve((bytes.size() + 2) / 3 * 4);
    for (size_t i = 0; i < bytes.size(); i += 3)
    {
        uint32_t n = static_cast<uint32_t>(bytes[i]) << 16;
        if (i + 1 < bytes.size())
            n |= static_cast<uint32_t>(bytes[i + 1]) << 8;
        if (i + 2 < bytes.size())
            n |= bytes[i + 2];
        b64.push_back(b64_chars[(n >> 18) & 0x3F]);
        b64.push_back(b64_chars[(n >> 12) & 0x3F]);
        b64.push_back((i + 1 < bytes.size()) ? b64_chars[(n >> 6) & 0x3F] : '=');
        b64.push_back((i + 2 < bytes.size()) ? b64_chars[n & 0x3F] : '=');
    }
    return b64;
}

Image Image::from_data(std::string base64_data, std::string mime_type)
{
    Image img;
    img.data_ = std::move(base64_data);
    img.mime_type_ = std::move(mime_type);
    return img;
}

Image Image::from_file(std::string path, std::string mime_type)
{
    Image img;
    img.path_ = std::move(path);
    img.mime_type_ = std::move(mime_type);
    return img;
}

ImageContent Image::to_content() const
{
    ImageContent content;
    content.mimeType = mime_type_;
    if (data_)
    {
        content.data = *data_;
    }
    else if (path_)
    {
        std::ifstream in(*path_, std::ios::binary);
        if (!in)
            throw Error("Cannot read image file: " + *path_);
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                   std::istreambuf_iterator<char>());
        content.data = base64_encode(bytes);
    }
    return content;
}

} // namespace nanohubmcp
