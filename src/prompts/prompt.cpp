#include "nanohubmcp/prompts/prompt.hpp"

#include "nanohubmcp/util/json.hpp"
#include "nanohubmcp/util/schema_build.hpp"

namespace nanohubmcp::prompts
{

namespace
{

// Bring a handler-supplied message into {role, content:{type,...}} form.
Json normalize_message(const Json& msg)
{
    if (!msg.is_object())
        return Message(util::json::to_text(msg));

    Json out = msg;
    if (!out.contains("role"))
        out["role"] = "user";
    if (!out.contains("content"))
        out["content"] = Json{{"type", "text"}, {"text", ""}};
    else if (!out["content"].is_object())
        out["content"] = Json{{"type", "text"}, {"text", util::json::to_text(out["content"])}};
    return out;
}

} // namespace

PromptResult PromptResult::from_json(const Json& messages)
{
    PromptResult result;
    if (!messages.is_array())
        return result;

    for (const auto& msg : messages)
    {
        if (msg.is_string())
        {
            result.messages.emplace_back(msg.get<std::string>());
        }
        else if (msg.is_object())
        {
            std::string role = msg.value("role", std::string("user"));
            std::string text;
            if (msg.contains("content"))
            {
                const auto& content = msg["content"];
                if (content.is_object())
                    text = content.contains("text") ? util::json::to_text(content["text"])
                                                    : content.dump();
                else
                    text = util::json::to_text(content);
            }
            result.messages.emplace_back(std::move(text), std::move(role));
        }
    }
    return result;
}

void to_json(Json& j, const PromptArgument& a)
{
    j = Json{{"name", a.name}, {"required", a.required}};
    if (a.description)
        j["description"] = *a.description;
}

void to_json(Json& j, const Message& m)
{
    j = Json{{"role", m.role}, {"content", Json(m.content)}};
}

void to_json(Json& j, const PromptResult& r)
{
    Json messages = Json::array();
    for (const auto& m : r.messages)
        messages.push_back(m);
    j = Json{{"messages", messages}};
    if (r.description && !r.description->empty())
        j["description"] = *r.description;
    if (r.meta.is_object() && !r.meta.empty())
        j["_meta"] = r.meta;
}

Json normalize_prompt_output(const PromptOutput& output)
{
    if (const auto* rich = std::get_if<PromptResult>(&output))
        return *rich;

    const Json& value = std::get<Json>(output);
    Json messages = Json::array();
    if (value.is_array())
    {
        for (const auto& msg : value)
            messages.push_back(normalize_message(msg));
    }
    else
    {
        messages.push_back(Message(util::json::to_text(value)));
    }
    return Json{{"messages", messages}};
}

std::vector<PromptArgument> arguments_from_signature(const Signature& sig)
{
    std::vector<PromptArgument> args;
    for (const auto& p : sig.parameters)
    {
        if (util::schema_build::is_reserved_parameter(p.name))
            continue;
        args.push_back(PromptArgument{p.name, std::nullopt, !p.default_value.has_value()});
    }
    return args;
}

Json Prompt::definition() const
{
    Json j = {{"name", name}};
    if (description && !description->empty())
        j["description"] = *description;
    if (!arguments.empty())
        j["arguments"] = arguments;
    return j;
}

} // namespace nanohubmcp::prompts
