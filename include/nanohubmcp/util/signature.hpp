#pragma once
#include "nanohubmcp/types.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace nanohubmcp
{

/// One declared parameter of a handler.
///
/// `annotation` is a static type expression ("int", "List[str]", ...). A parameter with
/// a `default_value` is optional; a default of JSON null still makes it optional but
/// carries no type information.
struct Parameter
{
    std::string name;
    std::optional<std::string> annotation;
    std::optional<Json> default_value;
};

/// The declared parameter list of a handler plus an optional legacy type comment of
/// the form "(T1, T2) -> R".
struct Signature
{
    std::vector<Parameter> parameters;
    std::optional<std::string> type_comment;

    Signature() = default;
    Signature(std::initializer_list<Parameter> params) : parameters(params) {}
    Signature(std::vector<Parameter> params, std::optional<std::string> comment = std::nullopt)
        : parameters(std::move(params)), type_comment(std::move(comment))
    {
    }

    Signature& with_type_comment(std::string comment)
    {
        type_comment = std::move(comment);
        return *this;
    }

    /// Name of the execution-context parameter the handler declares, if any.
    /// "ctx" wins over "context" when both are present.
    std::optional<std::string> context_parameter() const
    {
        std::optional<std::string> found;
        for (const auto& p : parameters)
        {
            if (p.name == "ctx")
                return p.name;
            if (p.name == "context")
                found = p.name;
        }
        return found;
    }
};

namespace detail
{

template <typename T, typename = void>
struct is_mapping : std::false_type
{
};
template <typename T>
struct is_mapping<T, std::void_t<typename T::key_type, typename T::mapped_type>> : std::true_type
{
};

template <typename T, typename = void>
struct is_sequence : std::false_type
{
};
template <typename T>
struct is_sequence<T, std::void_t<typename T::value_type, decltype(std::declval<T>().begin())>>
    : std::true_type
{
};

} // namespace detail

/// Static annotation for a C++ parameter type.
template <typename T>
std::string annotation_for()
{
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, bool>)
        return "bool";
    else if constexpr (std::is_integral_v<U>)
        return "int";
    else if constexpr (std::is_floating_point_v<U>)
        return "float";
    else if constexpr (std::is_same_v<U, Json>)
        return "Any";
    else if constexpr (std::is_convertible_v<U, std::string>)
        return "str";
    else if constexpr (detail::is_mapping<U>::value)
        return "dict";
    else if constexpr (detail::is_sequence<U>::value)
        return "list";
    else
        return "Any";
}

template <typename T>
Parameter param(std::string name)
{
    return Parameter{std::move(name), annotation_for<T>(), std::nullopt};
}

template <typename T>
Parameter param(std::string name, const T& default_value)
{
    return Parameter{std::move(name), annotation_for<T>(), Json(default_value)};
}

/// Parameter with no static annotation.
inline Parameter untyped_param(std::string name,
                               std::optional<Json> default_value = std::nullopt)
{
    return Parameter{std::move(name), std::nullopt, std::move(default_value)};
}

inline Parameter context_param(std::string name = "ctx")
{
    return Parameter{std::move(name), std::string("Context"), std::nullopt};
}

} // namespace nanohubmcp
