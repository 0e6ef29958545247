// Input schema inference from handler signatures

#include "nanohubmcp/util/schema_build.hpp"
#include "nanohubmcp/util/signature.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace nanohubmcp;
using util::schema_build::infer_input_schema;

static bool required_contains(const Json& schema, const std::string& name)
{
    for (const auto& r : schema.at("required"))
        if (r == name)
            return true;
    return false;
}

void test_annotations_from_cpp_types()
{
    std::cout << "test_annotations_from_cpp_types...\n";
    Signature sig{param<std::string>("name"), param<int>("count"), param<double>("ratio"),
                  param<bool>("flag"), param<std::vector<int>>("items"),
                  param<std::map<std::string, int>>("table")};
    auto schema = infer_input_schema(sig);
    const auto& props = schema.at("properties");
    assert(schema.at("type") == "object");
    assert(props.at("name").at("type") == "string");
    assert(props.at("count").at("type") == "integer");
    assert(props.at("ratio").at("type") == "number");
    assert(props.at("flag").at("type") == "boolean");
    assert(props.at("items").at("type") == "array");
    assert(props.at("table").at("type") == "object");
    assert(schema.at("required").size() == 6);
    std::cout << "  [PASS]\n";
}

void test_required_iff_no_default()
{
    std::cout << "test_required_iff_no_default...\n";
    Signature sig{param<double>("a"), param<double>("b", 2.0), untyped_param("c", Json())};
    auto schema = infer_input_schema(sig);
    assert(required_contains(schema, "a"));
    assert(!required_contains(schema, "b"));
    // a null default still makes the parameter optional
    assert(!required_contains(schema, "c"));
    assert(schema["properties"]["c"]["type"] == "string");
    std::cout << "  [PASS]\n";
}

void test_reserved_names_excluded()
{
    std::cout << "test_reserved_names_excluded...\n";
    Signature sig{untyped_param("self"), context_param("ctx"), untyped_param("cls"),
                  context_param("context"), param<int>("x")};
    auto schema = infer_input_schema(sig, {"x_extra"});
    assert(schema["properties"].size() == 1);
    assert(schema["properties"].contains("x"));
    assert(schema["required"] == Json::array({"x"}));

    // Caller exclusions are added on top
    auto excluded = infer_input_schema(sig, {"x"});
    assert(excluded["properties"].empty());
    assert(excluded["required"].empty());
    std::cout << "  [PASS]\n";
}

void test_type_comment_tier()
{
    std::cout << "test_type_comment_tier...\n";
    Signature sig({untyped_param("a"), untyped_param("b"), untyped_param("opts", Json())},
                  "# type: (float, Optional[int], Dict[str, str]) -> float");
    auto schema = infer_input_schema(sig);
    assert(schema["properties"]["a"]["type"] == "number");
    assert(schema["properties"]["b"]["type"] == "integer");
    assert(schema["properties"]["opts"]["type"] == "object");
    assert(required_contains(schema, "a"));
    assert(!required_contains(schema, "opts"));
    std::cout << "  [PASS]\n";
}

void test_type_comment_with_context_counted()
{
    std::cout << "test_type_comment_with_context_counted...\n";
    // The comment lists the context parameter too; arity matches the full list
    Signature sig({untyped_param("ctx"), untyped_param("base"), untyped_param("exponent")},
                  "(Context, float, float) -> float");
    auto schema = infer_input_schema(sig);
    assert(!schema["properties"].contains("ctx"));
    assert(schema["properties"]["base"]["type"] == "number");
    assert(schema["properties"]["exponent"]["type"] == "number");
    std::cout << "  [PASS]\n";
}

void test_type_comment_omitting_receiver()
{
    std::cout << "test_type_comment_omitting_receiver...\n";
    Signature sig({untyped_param("self"), untyped_param("n")}, "(int) -> str");
    auto schema = infer_input_schema(sig);
    assert(schema["properties"]["n"]["type"] == "integer");
    std::cout << "  [PASS]\n";
}

void test_type_comment_arity_mismatch_ignored()
{
    std::cout << "test_type_comment_arity_mismatch_ignored...\n";
    Signature sig({untyped_param("a"), untyped_param("b", 3)}, "(float) -> float");
    auto schema = infer_input_schema(sig);
    // Falls through to the default tier for b, and to string for a
    assert(schema["properties"]["a"]["type"] == "string");
    assert(schema["properties"]["b"]["type"] == "integer");
    std::cout << "  [PASS]\n";
}

void test_malformed_type_comment_degrades()
{
    std::cout << "test_malformed_type_comment_degrades...\n";
    Signature sig({untyped_param("a", true)}, "# type: (((");
    auto schema = infer_input_schema(sig);
    assert(schema["properties"]["a"]["type"] == "boolean");
    std::cout << "  [PASS]\n";
}

void test_annotation_beats_comment_and_default()
{
    std::cout << "test_annotation_beats_comment_and_default...\n";
    Signature sig({Parameter{"x", std::string("str"), Json(5)}}, "(int) -> None");
    auto schema = infer_input_schema(sig);
    assert(schema["properties"]["x"]["type"] == "string");
    std::cout << "  [PASS]\n";
}

void test_default_value_tier()
{
    std::cout << "test_default_value_tier...\n";
    Signature sig{untyped_param("flag", false), untyped_param("n", 10), untyped_param("r", 0.5),
                  untyped_param("xs", Json::array()), untyped_param("m", Json::object()),
                  untyped_param("s", "hi"), untyped_param("bare")};
    auto props = infer_input_schema(sig)["properties"];
    assert(props["flag"]["type"] == "boolean");
    assert(props["n"]["type"] == "integer");
    assert(props["r"]["type"] == "number");
    assert(props["xs"]["type"] == "array");
    assert(props["m"]["type"] == "object");
    assert(props["s"]["type"] == "string");
    assert(props["bare"]["type"] == "string");
    std::cout << "  [PASS]\n";
}

void test_inference_is_idempotent()
{
    std::cout << "test_inference_is_idempotent...\n";
    Signature sig({untyped_param("a"), param<int>("b", 1)}, "(List[int], int) -> None");
    auto first = infer_input_schema(sig);
    auto second = infer_input_schema(sig);
    assert(first == second);
    assert(first.dump() == second.dump());
    std::cout << "  [PASS]\n";
}

void test_context_parameter_detection()
{
    std::cout << "test_context_parameter_detection...\n";
    Signature none{param<int>("a")};
    assert(!none.context_parameter());

    Signature context_only{context_param("context"), param<int>("a")};
    assert(context_only.context_parameter() == std::string("context"));

    // ctx wins when both are declared
    Signature both{context_param("context"), context_param("ctx")};
    assert(both.context_parameter() == std::string("ctx"));
    std::cout << "  [PASS]\n";
}

int main()
{
    std::cout << "Running schema inference tests...\n\n";
    test_annotations_from_cpp_types();
    test_required_iff_no_default();
    test_reserved_names_excluded();
    test_type_comment_tier();
    test_type_comment_with_context_counted();
    test_type_comment_omitting_receiver();
    test_type_comment_arity_mismatch_ignored();
    test_malformed_type_comment_degrades();
    test_annotation_beats_comment_and_default();
    test_default_value_tier();
    test_inference_is_idempotent();
    test_context_parameter_detection();
    std::cout << "\nAll schema inference tests passed!\n";
    return 0;
}
