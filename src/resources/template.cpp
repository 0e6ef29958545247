#include "nanohubmcp/resources/template.hpp"

namespace nanohubmcp::resources
{

namespace
{

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool ends_segment(char c)
{
    return c == '/' || c == '?' || c == '#';
}

} // namespace

std::string url_decode(const std::string& encoded)
{
    std::string out;
    out.reserve(encoded.size());
    size_t i = 0;
    while (i < encoded.size())
    {
        if (encoded[i] == '%' && i + 2 < encoded.size())
        {
            int hi = hex_value(encoded[i + 1]);
            int lo = hex_value(encoded[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 3;
                continue;
            }
        }
        out.push_back(encoded[i++]);
    }
    return out;
}

UriTemplate::UriTemplate(std::string uri_template) : uri_template_(std::move(uri_template))
{
    std::string literal;
    size_t pos = 0;
    while (pos < uri_template_.size())
    {
        size_t open = uri_template_.find('{', pos);
        size_t close = open == std::string::npos ? open : uri_template_.find('}', open);
        if (close == std::string::npos)
        {
            literal += uri_template_.substr(pos);
            break;
        }

        literal += uri_template_.substr(pos, open - pos);
        std::string name = uri_template_.substr(open + 1, close - open - 1);
        bool wildcard = !name.empty() && name.back() == '*';
        if (wildcard)
            name.pop_back();

        if (name.empty())
        {
            // "{}" and "{*}" name nothing
            literal += uri_template_.substr(open, close - open + 1);
        }
        else
        {
            if (!literal.empty())
                pieces_.push_back(Piece{std::move(literal), -1});
            literal.clear();
            pieces_.push_back(Piece{{}, static_cast<int>(params_.size())});
            params_.push_back(TemplateParameter{std::move(name), wildcard});
        }
        pos = close + 1;
    }
    if (!literal.empty())
        pieces_.push_back(Piece{std::move(literal), -1});
}

bool UriTemplate::match_from(size_t piece, const std::string& uri, size_t pos,
                             std::vector<std::string>& values) const
{
    if (piece == pieces_.size())
        return pos == uri.size();

    const Piece& p = pieces_[piece];
    if (p.param < 0)
    {
        if (uri.compare(pos, p.literal.size(), p.literal) != 0)
            return false;
        return match_from(piece + 1, uri, pos + p.literal.size(), values);
    }

    // Longest candidate first, shrinking until the remaining pieces fit
    size_t limit = pos;
    if (params_[p.param].is_wildcard)
        limit = uri.size();
    else
        while (limit < uri.size() && !ends_segment(uri[limit]))
            ++limit;

    for (size_t end = limit; end > pos; --end)
    {
        if (match_from(piece + 1, uri, end, values))
        {
            values[p.param] = uri.substr(pos, end - pos);
            return true;
        }
    }
    return false;
}

std::optional<std::unordered_map<std::string, std::string>>
UriTemplate::match(const std::string& uri) const
{
    std::vector<std::string> values(params_.size());
    if (!match_from(0, uri, 0, values))
        return std::nullopt;

    std::unordered_map<std::string, std::string> out;
    for (size_t i = 0; i < params_.size(); ++i)
        out[params_[i].name] = url_decode(values[i]);
    return out;
}

} // namespace nanohubmcp::resources
