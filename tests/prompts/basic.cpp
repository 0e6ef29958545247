#include "nanohubmcp/prompts/manager.hpp"

#include <cassert>
#include <iostream>

using namespace nanohubmcp;
using namespace nanohubmcp::prompts;

void test_arguments_from_signature()
{
    std::cout << "test_arguments_from_signature...\n";
    Signature sig{context_param(), param<std::string>("expression"),
                  param<std::string>("style", std::string("short")), untyped_param("self")};
    auto args = arguments_from_signature(sig);
    assert(args.size() == 2);
    assert(args[0].name == "expression" && args[0].required);
    assert(args[1].name == "style" && !args[1].required);
    std::cout << "  [PASS]\n";
}

void test_definition()
{
    std::cout << "test_definition...\n";
    Prompt p;
    p.name = "calculate";
    auto bare = p.definition();
    assert(bare == (Json{{"name", "calculate"}}));

    p.description = "Generate a calculation prompt";
    p.arguments = {PromptArgument{"expression", std::nullopt, true}};
    auto def = p.definition();
    assert(def["description"] == "Generate a calculation prompt");
    assert(def["arguments"].size() == 1);
    assert(def["arguments"][0]["name"] == "expression");
    assert(def["arguments"][0]["required"] == true);
    std::cout << "  [PASS]\n";
}

void test_normalize_bare_value()
{
    std::cout << "test_normalize_bare_value...\n";
    auto wire = normalize_prompt_output(Json("Please calculate: 2+2"));
    assert(wire["messages"].size() == 1);
    assert(wire["messages"][0]["role"] == "user");
    assert(wire["messages"][0]["content"]["type"] == "text");
    assert(wire["messages"][0]["content"]["text"] == "Please calculate: 2+2");

    auto number = normalize_prompt_output(Json(4));
    assert(number["messages"][0]["content"]["text"] == "4");
    std::cout << "  [PASS]\n";
}

void test_normalize_message_list()
{
    std::cout << "test_normalize_message_list...\n";
    Json list = Json::array();
    list.push_back(Json{{"role", "assistant"}, {"content", {{"type", "text"}, {"text", "hi"}}}});
    list.push_back(Json{{"role", "user"}, {"content", "plain"}});
    list.push_back("bare string");

    auto wire = normalize_prompt_output(list);
    const auto& msgs = wire["messages"];
    assert(msgs.size() == 3);
    assert(msgs[0] == list[0]);
    assert(msgs[1]["content"]["type"] == "text");
    assert(msgs[1]["content"]["text"] == "plain");
    assert(msgs[2]["role"] == "user");
    assert(msgs[2]["content"]["text"] == "bare string");
    std::cout << "  [PASS]\n";
}

void test_prompt_result()
{
    std::cout << "test_prompt_result...\n";
    PromptResult r({Message("question"), Message("answer", "assistant")}, "two turns");
    Json wire = normalize_prompt_output(r);
    assert(wire["description"] == "two turns");
    assert(wire["messages"][1]["role"] == "assistant");
    assert(wire["messages"][1]["content"]["text"] == "answer");

    auto parsed = PromptResult::from_json(
        Json::array({"first", Json{{"role", "assistant"}, {"content", {{"text", "second"}}}}}));
    assert(parsed.messages.size() == 2);
    assert(parsed.messages[0].role == "user");
    assert(parsed.messages[1].role == "assistant");
    assert(std::get<TextContent>(parsed.messages[1].content).text == "second");
    std::cout << "  [PASS]\n";
}

void test_manager()
{
    std::cout << "test_manager...\n";
    PromptManager pm;
    Prompt p;
    p.name = "greet";
    p.handler = [](const Json& args, server::Context*) -> PromptOutput
    { return Json("Hello " + args.value("name", std::string("world"))); };
    pm.add(p);
    assert(pm.has("greet"));
    auto wire = normalize_prompt_output(pm.get("greet")->handler(Json{{"name", "Ada"}}, nullptr));
    assert(wire["messages"][0]["content"]["text"] == "Hello Ada");

    bool threw = false;
    try
    {
        pm.get("missing");
    }
    catch (const NotFoundError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS]\n";
}

int main()
{
    std::cout << "Running prompt tests...\n\n";
    test_arguments_from_signature();
    test_definition();
    test_normalize_bare_value();
    test_normalize_message_list();
    test_prompt_result();
    test_manager();
    std::cout << "\nAll prompt tests passed!\n";
    return 0;
}
