#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nanohubmcp::resources
{

struct TemplateParameter
{
    std::string name;
    bool is_wildcard{false}; // {var*} vs {var}
};

/// Matcher for resource URIs containing placeholders:
///   - {var}  - one segment: at least one character, none of '/', '?', '#'
///   - {var*} - the rest: at least one character, anything
/// Everything outside braces is compared literally. A '{' without a closing '}' is
/// literal text.
class UriTemplate
{
  public:
    explicit UriTemplate(std::string uri_template);

    const std::string& uri_template() const
    {
        return uri_template_;
    }
    const std::vector<TemplateParameter>& parameters() const
    {
        return params_;
    }

    /// nullopt if `uri` does not fit the template, otherwise parameter name ->
    /// URL-decoded value.
    std::optional<std::unordered_map<std::string, std::string>> match(const std::string& uri) const;

  private:
    // Literal text (param < 0) or a reference into params_
    struct Piece
    {
        std::string literal;
        int param{-1};
    };

    bool match_from(size_t piece, const std::string& uri, size_t pos,
                    std::vector<std::string>& values) const;

    std::string uri_template_;
    std::vector<TemplateParameter> params_;
    std::vector<Piece> pieces_;
};

/// Percent-decode `%XX` sequences; malformed sequences are kept as-is.
std::string url_decode(const std::string& encoded);

} // namespace nanohubmcp::resources
