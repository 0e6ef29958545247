// JSON-RPC dispatcher over an in-process McpServer

#include "nanohubmcp/app.hpp"
#include "nanohubmcp/logging.hpp"
#include "nanohubmcp/server/context.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

using namespace nanohubmcp;

static std::atomic<int> add_calls{0};

static Json request(int id, const std::string& method, Json params = Json::object())
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

static void build_calculator(McpServer& app)
{
    app.tool("add", {param<double>("a"), param<double>("b")},
             [](const Json& args, server::Context*) -> tools::ToolOutput
             {
                 ++add_calls;
                 return args.at("a").get<double>() + args.at("b").get<double>();
             },
             {"Add two numbers together."});

    app.tool("divide", {param<double>("a"), param<double>("b")},
             [](const Json& args, server::Context*) -> tools::ToolOutput
             {
                 if (args.at("b").get<double>() == 0)
                     throw ValidationError("Cannot divide by zero");
                 return args.at("a").get<double>() / args.at("b").get<double>();
             });

    app.tool("power", {context_param(), param<double>("base"), param<double>("exponent")},
             [](const Json& args, server::Context* ctx) -> tools::ToolOutput
             {
                 assert(ctx != nullptr);
                 ctx->info("Computing power");
                 ctx->report_progress(1, 1.0);
                 return ctx->request_id() ? *ctx->request_id() : Json("no-id");
             });

    app.tool("plain", {param<int>("x")},
             [](const Json&, server::Context* ctx) -> tools::ToolOutput
             { return ctx == nullptr ? "no context" : "context"; });

    app.resource("config://calculator/settings",
                 [](const Json&, server::Context*) -> resources::ResourceOutput
                 { return Json{{"precision", 10}}; },
                 {std::nullopt, "Calculator settings", std::string("application/json")});

    app.resource("broken://res",
                 [](const Json&, server::Context*) -> resources::ResourceOutput
                 { throw Error("disk on fire"); });

    app.resource("users://{id}",
                 [](const Json& params, server::Context*) -> resources::ResourceOutput
                 { return "user " + params.at("id").get<std::string>(); });

    app.prompt("calculate", {param<std::string>("expression")},
               [](const Json& args, server::Context*) -> prompts::PromptOutput
               { return Json("Please calculate: " + args.at("expression").get<std::string>()); },
               {"Generate a calculation prompt."});
}

void test_initialize_and_capabilities()
{
    std::cout << "test_initialize_and_capabilities...\n";
    McpServer empty("empty", "0.1.0");
    auto r0 = empty.handle(request(1, "initialize"));
    assert(r0);
    auto caps0 = (*r0)["result"]["capabilities"];
    assert(caps0.size() == 1 && caps0.contains("logging"));

    McpServer app("calc", "2.0.0");
    build_calculator(app);
    auto r = app.handle(request(2, "initialize"));
    const auto& result = (*r)["result"];
    assert((*r)["jsonrpc"] == "2.0" && (*r)["id"] == 2);
    assert(result["protocolVersion"] == "2024-11-05");
    assert(result["serverInfo"]["name"] == "calc");
    assert(result["serverInfo"]["version"] == "2.0.0");
    assert(result["capabilities"].contains("tools"));
    assert(result["capabilities"].contains("resources"));
    assert(result["capabilities"].contains("prompts"));
    assert(result["capabilities"]["tools"].is_object());
    std::cout << "  [PASS]\n";
}

void test_tools_list_matches_inferred_schema()
{
    std::cout << "test_tools_list_matches_inferred_schema...\n";
    McpServer app("calc");
    build_calculator(app);
    auto r = app.handle(request(3, "tools/list"));
    const auto& tools = (*r)["result"]["tools"];
    assert(tools.size() == 4);
    assert(tools[0]["name"] == "add");
    assert(tools[0]["description"] == "Add two numbers together.");
    assert(tools[0]["inputSchema"] == app.tools().get("add")->input_schema());
    assert(tools[0]["inputSchema"]["properties"]["a"]["type"] == "number");
    assert(tools[1]["description"] == "");
    // The context parameter is not part of the schema
    assert(!tools[2]["inputSchema"]["properties"].contains("ctx"));
    std::cout << "  [PASS]\n";
}

void test_tools_call()
{
    std::cout << "test_tools_call...\n";
    McpServer app("calc");
    build_calculator(app);

    add_calls = 0;
    auto r = app.handle(
        request(4, "tools/call", {{"name", "add"}, {"arguments", {{"a", 2}, {"b", 3}}}}));
    const auto& result = (*r)["result"];
    assert(result["isError"] == false);
    assert(result["content"][0]["text"].get<std::string>().find('5') != std::string::npos);
    assert(add_calls == 1);

    auto d = app.handle(
        request(5, "tools/call", {{"name", "divide"}, {"arguments", {{"a", 1}, {"b", 0}}}}));
    assert(!d->contains("error"));
    assert((*d)["result"]["isError"] == true);
    assert((*d)["result"]["content"][0]["text"].get<std::string>().find("zero") !=
           std::string::npos);

    auto missing = app.handle(request(6, "tools/call", {{"name", "nope"}}));
    assert((*missing)["error"]["code"] == -32601);

    auto no_name = app.handle(request(7, "tools/call", {{"arguments", Json::object()}}));
    assert((*no_name)["error"]["code"] == -32602);
    std::cout << "  [PASS]\n";
}

void test_context_injection()
{
    std::cout << "test_context_injection...\n";
    set_log_sink({});
    McpServer app("calc");
    build_calculator(app);
    auto client = app.broadcaster().add_client();

    auto r = app.handle(request(
        11, "tools/call", {{"name", "power"}, {"arguments", {{"base", 2}, {"exponent", 3}}}}));
    assert((*r)["result"]["content"][0]["text"] == "11");

    // Progress went out on the broadcast channel tagged with the request id
    auto progress = client->wait_pop(std::chrono::milliseconds(100));
    assert(progress);
    assert(Json::parse(*progress)["params"]["requestId"] == 11);

    auto plain =
        app.handle(request(12, "tools/call", {{"name", "plain"}, {"arguments", {{"x", 1}}}}));
    assert((*plain)["result"]["content"][0]["text"] == "no context");
    reset_log_sink();
    std::cout << "  [PASS]\n";
}

void test_resources()
{
    std::cout << "test_resources...\n";
    set_log_sink({});
    McpServer app("calc");
    build_calculator(app);

    auto list = app.handle(request(20, "resources/list"));
    const auto& resources = (*list)["result"]["resources"];
    assert(resources.size() == 3);
    assert(resources[0]["uri"] == "config://calculator/settings");
    assert(resources[0]["description"] == "Calculator settings");
    assert(resources[0]["mimeType"] == "application/json");
    assert(resources[1]["name"] == "broken://res");

    auto read = app.handle(request(21, "resources/read", {{"uri", "config://calculator/settings"}}));
    const auto& item = (*read)["result"]["contents"][0];
    assert(item["uri"] == "config://calculator/settings");
    assert(Json::parse(item["text"].get<std::string>()) == (Json{{"precision", 10}}));
    assert(item["mimeType"] == "application/json");

    auto missing = app.handle(request(22, "resources/read", {{"uri", "config://nope"}}));
    assert((*missing)["error"]["code"] == -32601);

    auto broken = app.handle(request(23, "resources/read", {{"uri", "broken://res"}}));
    assert((*broken)["error"]["code"] == -32603);
    assert((*broken)["error"]["message"] == "disk on fire");

    auto templ = app.handle(request(24, "resources/read", {{"uri", "users://ada"}}));
    assert((*templ)["result"]["contents"][0]["text"] == "user ada");
    assert((*templ)["result"]["contents"][0]["uri"] == "users://ada");
    reset_log_sink();
    std::cout << "  [PASS]\n";
}

void test_prompts()
{
    std::cout << "test_prompts...\n";
    McpServer app("calc");
    build_calculator(app);

    auto list = app.handle(request(30, "prompts/list"));
    const auto& prompts = (*list)["result"]["prompts"];
    assert(prompts.size() == 1);
    assert(prompts[0]["arguments"][0]["name"] == "expression");
    assert(prompts[0]["arguments"][0]["required"] == true);

    auto r = app.handle(
        request(31, "prompts/get", {{"name", "calculate"}, {"arguments", {{"expression", "2+2"}}}}));
    const auto& msgs = (*r)["result"]["messages"];
    assert(msgs.size() == 1);
    assert(msgs[0]["role"] == "user");
    assert(msgs[0]["content"]["text"].get<std::string>().find("2+2") != std::string::npos);

    auto missing = app.handle(request(32, "prompts/get", {{"name", "nope"}}));
    assert((*missing)["error"]["code"] == -32601);
    std::cout << "  [PASS]\n";
}

void test_notifications_and_unknown_methods()
{
    std::cout << "test_notifications_and_unknown_methods...\n";
    McpServer app("calc");
    build_calculator(app);

    assert(!app.handle(Json{{"jsonrpc", "2.0"}, {"method", "initialized"}}));
    assert(!app.handle(Json{{"jsonrpc", "2.0"}, {"method", "ping"}}));
    assert(!app.handle(Json{{"jsonrpc", "2.0"}, {"method", "no/such"}}));

    // A notification still runs the handler
    add_calls = 0;
    auto none = app.handle(Json{{"jsonrpc", "2.0"},
                                {"method", "tools/call"},
                                {"params", {{"name", "add"}, {"arguments", {{"a", 1}, {"b", 1}}}}}});
    assert(!none);
    assert(add_calls == 1);

    auto ping = app.handle(request(40, "ping"));
    assert((*ping)["result"].is_object() && (*ping)["result"].empty());

    auto unknown = app.handle(request(41, "tools/explode"));
    assert((*unknown)["error"]["code"] == -32601);
    assert((*unknown)["error"]["message"] == "Method not found: tools/explode");

    auto bad_params = app.handle(Json{{"jsonrpc", "2.0"}, {"id", 42}, {"method", "ping"}, {"params", 3}});
    assert((*bad_params)["error"]["code"] == -32602);

    auto not_object = app.handle(Json::array({1, 2}));
    assert((*not_object)["error"]["code"] == -32602);
    assert((*not_object)["id"].is_null());

    // String ids are echoed back unchanged
    auto str_id = app.handle(Json{{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "ping"}});
    assert((*str_id)["id"] == "abc");
    std::cout << "  [PASS]\n";
}

void test_non_standard_exceptions()
{
    std::cout << "test_non_standard_exceptions...\n";
    McpServer app("throwers");
    app.tool("odd", {},
             [](const Json&, server::Context*) -> tools::ToolOutput { throw 42; });
    app.resource("odd://res", [](const Json&, server::Context*) -> resources::ResourceOutput
                 { throw std::string("not an exception"); });
    app.prompt("odd", {},
               [](const Json&, server::Context*) -> prompts::PromptOutput { throw 3.5; });

    auto tool = app.handle(request(50, "tools/call", {{"name", "odd"}}));
    assert(tool);
    assert((*tool)["result"]["isError"] == true);
    assert((*tool)["result"]["content"][0]["text"] == "Unknown error");

    auto res = app.handle(request(51, "resources/read", {{"uri", "odd://res"}}));
    assert((*res)["error"]["code"] == -32603);
    assert((*res)["id"] == 51);

    auto prompt = app.handle(request(52, "prompts/get", {{"name", "odd"}}));
    assert((*prompt)["error"]["code"] == -32603);

    // Notifications swallow the failure silently
    assert(!app.handle(Json{{"jsonrpc", "2.0"},
                            {"method", "resources/read"},
                            {"params", {{"uri", "odd://res"}}}}));
    std::cout << "  [PASS]\n";
}

void test_reregistered_tool_stays_valid()
{
    std::cout << "test_reregistered_tool_stays_valid...\n";
    McpServer app("rereg");
    auto first = app.tool("x", {param<int>("n")},
                          [](const Json&, server::Context*) -> tools::ToolOutput { return 1; },
                          {"first"});
    auto second = app.tool("x", {param<std::string>("s")},
                           [](const Json&, server::Context*) -> tools::ToolOutput { return 2; },
                           {"second"});

    // The earlier definition is still usable after being replaced
    assert(first->description() == "first");
    assert(first->input_schema()["properties"].contains("n"));
    assert(std::get<Json>(first->invoke(Json{{"n", 1}}, nullptr)) == 1);

    assert(second->description() == "second");
    assert(app.tools().size() == 1);
    assert(app.tools().get("x")->description() == "second");
    auto r = app.handle(request(60, "tools/call", {{"name", "x"}, {"arguments", {{"s", "a"}}}}));
    assert((*r)["result"]["content"][0]["text"] == "2");
    std::cout << "  [PASS]\n";
}

int main()
{
    std::cout << "Running MCP dispatcher tests...\n\n";
    test_initialize_and_capabilities();
    test_tools_list_matches_inferred_schema();
    test_tools_call();
    test_context_injection();
    test_resources();
    test_prompts();
    test_notifications_and_unknown_methods();
    test_non_standard_exceptions();
    test_reregistered_tool_stays_valid();
    std::cout << "\nAll MCP dispatcher tests passed!\n";
    return 0;
}
