// Simple calculator MCP server.
//
// Run:
//   ./calculator_server [port]
//
// Connect to:
//   http://localhost:8000/sse   SSE stream
//   POST http://localhost:8000  JSON-RPC messages

#include "nanohubmcp.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace nanohubmcp;

namespace
{

// Arguments arrive as JSON numbers, or as numeric strings from loosely typed clients
double number_arg(const Json& args, const std::string& key)
{
    const Json& v = args.at(key);
    if (v.is_number())
        return v.get<double>();
    if (v.is_string())
        return std::stod(v.get<std::string>());
    throw ValidationError("Argument '" + key + "' must be a number");
}

} // namespace

int main(int argc, char** argv)
{
    Settings settings = Settings::from_env();
    if (argc > 1)
    {
        try
        {
            settings.port = std::stoi(argv[1]);
        }
        catch (const std::exception&)
        {
            std::cerr << "Ignoring invalid port argument: " << argv[1] << std::endl;
        }
    }
    set_log_threshold(log_level_from_string(settings.log_level));

    McpServer server("simple-calculator", "1.0.0");

    server.tool("add",
                Signature({untyped_param("a"), untyped_param("b")})
                    .with_type_comment("# type: (float, float) -> float"),
                [](const Json& args, server::Context*) -> tools::ToolOutput
                { return number_arg(args, "a") + number_arg(args, "b"); },
                {"Add two numbers together."});

    server.tool(
        "power", {context_param(), param<double>("base"), param<double>("exponent")},
        [](const Json& args, server::Context* ctx) -> tools::ToolOutput
        {
            double base = number_arg(args, "base");
            double exponent = number_arg(args, "exponent");
            ctx->info("Computing " + args.at("base").dump() + "^" + args.at("exponent").dump());
            return std::pow(base, exponent);
        },
        {"Raise base to the power of exponent.", {"math", "advanced"}});

    server.tool("subtract", {param<double>("a"), param<double>("b")},
                [](const Json& args, server::Context*) -> tools::ToolOutput
                { return number_arg(args, "a") - number_arg(args, "b"); },
                {"Subtract b from a."});

    server.tool("multiply", {param<double>("a"), param<double>("b")},
                [](const Json& args, server::Context*) -> tools::ToolOutput
                { return number_arg(args, "a") * number_arg(args, "b"); },
                {"Multiply two numbers."});

    server.tool("divide", {param<double>("a"), param<double>("b")},
                [](const Json& args, server::Context*) -> tools::ToolOutput
                {
                    double b = number_arg(args, "b");
                    if (b == 0)
                        throw ValidationError("Cannot divide by zero");
                    return number_arg(args, "a") / b;
                },
                {"Divide a by b."});

    server.resource("config://calculator/settings",
                    [](const Json&, server::Context*) -> resources::ResourceOutput
                    {
                        return Json{{"precision", 10},
                                    {"max_value", 1e308},
                                    {"supported_operations",
                                     {"add", "subtract", "multiply", "divide", "power"}}};
                    },
                    {std::nullopt, "Get calculator settings."});

    server.prompt("calculate", {param<std::string>("expression")},
                  [](const Json& args, server::Context*) -> prompts::PromptOutput
                  {
                      return Json::array(
                          {Json{{"role", "user"},
                                {"content",
                                 {{"type", "text"},
                                  {"text", "Please calculate: " +
                                               args.at("expression").get<std::string>()}}}}});
                  },
                  {"Generate a calculation prompt."});

    try
    {
        server.run(settings.host, settings.port, settings.path_prefix);
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
