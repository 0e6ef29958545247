#include "nanohubmcp/util/schema_build.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace nanohubmcp::util::schema_build
{

namespace
{

nanohubmcp::Json schema_of(const char* type)
{
    return nanohubmcp::Json{{"type", type}};
}

std::string trim(const std::string& s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool starts_with(const std::string& s, const std::string& prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string strip_module(std::string name)
{
    for (const char* module : {"typing.", "collections.abc.", "builtins."})
        if (starts_with(name, module))
            return name.substr(std::char_traits<char>::length(module));
    return name;
}

const std::unordered_set<std::string>& string_names()
{
    static const std::unordered_set<std::string> names{"str", "string", "unicode", "Text",
                                                       "bytes"};
    return names;
}

const std::unordered_set<std::string>& integer_names()
{
    static const std::unordered_set<std::string> names{"int", "integer", "long"};
    return names;
}

const std::unordered_set<std::string>& number_names()
{
    static const std::unordered_set<std::string> names{"float", "number", "double"};
    return names;
}

const std::unordered_set<std::string>& boolean_names()
{
    static const std::unordered_set<std::string> names{"bool", "boolean"};
    return names;
}

const std::unordered_set<std::string>& array_names()
{
    static const std::unordered_set<std::string> names{
        "list", "List", "tuple", "Tuple", "set", "Set", "frozenset", "FrozenSet",
        "Sequence", "Iterable", "array"};
    return names;
}

const std::unordered_set<std::string>& object_names()
{
    static const std::unordered_set<std::string> names{"dict", "Dict", "Mapping", "object"};
    return names;
}

bool is_null_name(const std::string& name)
{
    return name == "None" || name == "NoneType" || name == "null";
}

// Primitive or container name without brackets. nullopt when unrecognized.
std::optional<nanohubmcp::Json> simple_name_to_schema(const std::string& name)
{
    if (string_names().count(name))
        return schema_of("string");
    if (integer_names().count(name))
        return schema_of("integer");
    if (number_names().count(name))
        return schema_of("number");
    if (boolean_names().count(name))
        return schema_of("boolean");
    if (array_names().count(name))
        return schema_of("array");
    if (object_names().count(name))
        return schema_of("object");
    if (is_null_name(name))
        return schema_of("null");
    return std::nullopt;
}

// "Head[inner]" -> (Head, inner). nullopt when expr is not a bracketed form.
std::optional<std::pair<std::string, std::string>> split_generic(const std::string& expr)
{
    size_t open = expr.find('[');
    if (open == std::string::npos || expr.back() != ']')
        return std::nullopt;
    return std::make_pair(trim(expr.substr(0, open)),
                          expr.substr(open + 1, expr.size() - open - 2));
}

nanohubmcp::Json union_to_schema(const std::vector<std::string>& branches)
{
    std::vector<nanohubmcp::Json> schemas;
    for (const auto& branch : branches)
    {
        if (is_null_name(strip_module(branch)))
            continue;
        schemas.push_back(type_expression_to_schema(branch));
    }
    if (schemas.empty())
        return schema_of("null");
    for (const auto& s : schemas)
        if (s != schemas.front())
            return schema_of("string");
    return schemas.front();
}

} // namespace

nanohubmcp::Json to_object_schema_from_simple(const nanohubmcp::Json& simple)
{
    // If already a schema with type+properties, return copy
    if (simple.is_object() && simple.contains("type") && simple.contains("properties"))
        return simple;

    nanohubmcp::Json properties = nanohubmcp::Json::object();
    nanohubmcp::Json required = nanohubmcp::Json::array();
    if (simple.is_object())
    {
        for (auto it = simple.begin(); it != simple.end(); ++it)
        {
            nanohubmcp::Json prop = schema_of("string");
            if (it->is_string())
            {
                std::string t = it->get<std::string>();
                if (t == "string" || t == "number" || t == "integer" || t == "boolean" ||
                    t == "object" || t == "array")
                    prop = nanohubmcp::Json{{"type", t}};
            }
            properties[it.key()] = prop;
            required.push_back(it.key());
        }
    }
    return nanohubmcp::Json{
        {"type", "object"},
        {"properties", properties},
        {"required", required},
    };
}

bool is_reserved_parameter(const std::string& name)
{
    return name == "self" || name == "cls" || name == "ctx" || name == "context";
}

nanohubmcp::Json annotation_to_schema(const std::string& annotation)
{
    std::string name = strip_module(trim(annotation));
    if (auto generic = split_generic(name))
    {
        // Only the container head matters for a static annotation
        const std::string& head = generic->first;
        if (array_names().count(head))
            return schema_of("array");
        if (object_names().count(head))
            return schema_of("object");
        return schema_of("string");
    }
    if (auto schema = simple_name_to_schema(name))
        return *schema;
    return schema_of("string");
}

nanohubmcp::Json type_expression_to_schema(const std::string& expr)
{
    std::string e = strip_module(trim(expr));
    if (e.empty())
        return schema_of("string");

    // PEP 604 spelling: int | None
    auto alternatives = split_top_level(e, '|');
    if (alternatives.size() > 1)
        return union_to_schema(alternatives);

    if (auto generic = split_generic(e))
    {
        const std::string head = strip_module(generic->first);
        if (head == "Optional")
            return union_to_schema(split_top_level(generic->second));
        if (head == "Union")
            return union_to_schema(split_top_level(generic->second));
        if (array_names().count(head))
            return schema_of("array");
        if (object_names().count(head))
            return schema_of("object");
        return schema_of("string");
    }

    if (auto schema = simple_name_to_schema(e))
        return *schema;
    return schema_of("string");
}

nanohubmcp::Json value_to_schema(const nanohubmcp::Json& value)
{
    if (value.is_boolean())
        return schema_of("boolean");
    if (value.is_number_integer())
        return schema_of("integer");
    if (value.is_number_float())
        return schema_of("number");
    if (value.is_array())
        return schema_of("array");
    if (value.is_object())
        return schema_of("object");
    return schema_of("string");
}

std::vector<std::string> split_top_level(const std::string& s, char sep)
{
    std::vector<std::string> parts;
    int depth = 0;
    std::string current;
    for (char c : s)
    {
        if (c == '[' || c == '(' || c == '{')
            ++depth;
        else if ((c == ']' || c == ')' || c == '}') && depth > 0)
            --depth;

        if (c == sep && depth == 0)
        {
            auto piece = trim(current);
            if (!piece.empty())
                parts.push_back(piece);
            current.clear();
            continue;
        }
        current += c;
    }
    auto piece = trim(current);
    if (!piece.empty())
        parts.push_back(piece);
    return parts;
}

std::optional<std::vector<std::string>> parse_type_comment(const std::string& comment)
{
    std::string c = trim(comment);
    if (starts_with(c, "#"))
        c = trim(c.substr(1));
    if (starts_with(c, "type:"))
        c = trim(c.substr(5));
    if (c.empty() || c.front() != '(')
        return std::nullopt;

    // Find the parenthesis closing the argument list
    int depth = 0;
    size_t close = std::string::npos;
    for (size_t i = 0; i < c.size(); ++i)
    {
        if (c[i] == '(' || c[i] == '[')
            ++depth;
        else if (c[i] == ')' || c[i] == ']')
        {
            if (--depth == 0)
            {
                close = i;
                break;
            }
        }
    }
    if (close == std::string::npos)
        return std::nullopt;

    std::string rest = trim(c.substr(close + 1));
    if (!rest.empty() && !starts_with(rest, "->"))
        return std::nullopt;

    return split_top_level(c.substr(1, close - 1));
}

nanohubmcp::Json infer_input_schema(const Signature& sig, const std::set<std::string>& exclude)
{
    const auto& params = sig.parameters;

    // Positional type-comment entries, aligned with `params`
    std::vector<std::optional<std::string>> comment_types(params.size());
    if (sig.type_comment)
    {
        try
        {
            if (auto types = parse_type_comment(*sig.type_comment))
            {
                if (types->size() == params.size())
                {
                    for (size_t i = 0; i < params.size(); ++i)
                        comment_types[i] = (*types)[i];
                }
                else
                {
                    // Comments on methods conventionally omit the receiver
                    size_t receivers = static_cast<size_t>(std::count_if(
                        params.begin(), params.end(),
                        [](const Parameter& p) { return p.name == "self" || p.name == "cls"; }));
                    if (receivers > 0 && types->size() + receivers == params.size())
                    {
                        size_t t = 0;
                        for (size_t i = 0; i < params.size(); ++i)
                            if (params[i].name != "self" && params[i].name != "cls")
                                comment_types[i] = (*types)[t++];
                    }
                }
            }
        }
        catch (const std::exception&)
        {
            std::fill(comment_types.begin(), comment_types.end(), std::nullopt);
        }
    }

    nanohubmcp::Json properties = nanohubmcp::Json::object();
    nanohubmcp::Json required = nanohubmcp::Json::array();

    for (size_t i = 0; i < params.size(); ++i)
    {
        const auto& p = params[i];
        if (is_reserved_parameter(p.name) || exclude.count(p.name))
            continue;

        nanohubmcp::Json prop;
        if (p.annotation)
            prop = annotation_to_schema(*p.annotation);
        else if (comment_types[i])
            prop = type_expression_to_schema(*comment_types[i]);
        else if (p.default_value && !p.default_value->is_null())
            prop = value_to_schema(*p.default_value);
        else
            prop = schema_of("string");

        properties[p.name] = prop;
        if (!p.default_value)
            required.push_back(p.name);
    }

    return nanohubmcp::Json{
        {"type", "object"},
        {"properties", properties},
        {"required", required},
    };
}

} // namespace nanohubmcp::util::schema_build
