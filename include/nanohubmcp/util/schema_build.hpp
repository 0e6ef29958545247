#pragma once
#include "nanohubmcp/types.hpp"
#include "nanohubmcp/util/signature.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace nanohubmcp::util::schema_build
{

// Convert a simple parameter map into a JSON Schema.
// If the input already looks like a JSON Schema (has both type and properties),
// it is returned as-is.
// Simple format example: {"a":"integer","b":"number","c":"string","d":"boolean"}
// Resulting schema:
// {"type":"object","properties":{...},"required":["a","b","c","d"]}
nanohubmcp::Json to_object_schema_from_simple(const nanohubmcp::Json& simple);

/// Build the input schema of a handler from its signature.
///
/// Per parameter, the first source that yields information wins:
///   1. the static annotation
///   2. the legacy type comment, when its arity matches the parameter list
///   3. the type of a non-null default value
///   4. "string"
/// A parameter is required iff it has no default. Context and self/cls receivers are
/// always excluded, in addition to `exclude`. Never throws.
nanohubmcp::Json infer_input_schema(const Signature& sig, const std::set<std::string>& exclude = {});

/// True for names that never appear in a schema or prompt argument list.
bool is_reserved_parameter(const std::string& name);

/// Map a static annotation to a schema. Unrecognized annotations map to string.
nanohubmcp::Json annotation_to_schema(const std::string& annotation);

/// Map a type-comment expression (Optional/Union/generics aware) to a schema.
nanohubmcp::Json type_expression_to_schema(const std::string& expr);

/// Schema from the runtime type of a value: boolean before integer before number before
/// array before object before string.
nanohubmcp::Json value_to_schema(const nanohubmcp::Json& value);

/// Parameter types of a "(T1, T2) -> R" comment, or nullopt when it does not parse.
/// A leading "# type:" or "type:" marker is accepted.
std::optional<std::vector<std::string>> parse_type_comment(const std::string& comment);

/// Split on `sep` outside of [], () and {} nesting. Pieces are trimmed; empty pieces are
/// dropped.
std::vector<std::string> split_top_level(const std::string& s, char sep = ',');

} // namespace nanohubmcp::util::schema_build
