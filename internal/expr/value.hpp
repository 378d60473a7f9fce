#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rulegraph::expr {

/*
  Helpers over google::protobuf::Value, the JSON value type used for
  expression literals, contexts, entity fields and patch documents.

  An unset Value (KIND_NOT_SET) is treated as null everywhere.
*/

using Value  = google::protobuf::Value;
using Struct = google::protobuf::Struct;

Value NullValue();
Value NumberValue(double v);
Value StringValue(std::string_view v);
Value BoolValue(bool v);
Value StructValue(const Struct& s);
Value ListValue(const std::vector<Value>& items);

bool IsNull(const Value& v);
bool IsNumber(const Value& v);
bool IsString(const Value& v);
bool IsBool(const Value& v);
bool IsList(const Value& v);
bool IsStruct(const Value& v);

// JSON-logic truthiness: false, null, 0, "" and [] are falsy.
bool Truthy(const Value& v);

// Deep structural equality; null == unset.
bool DeepEquals(const Value& a, const Value& b);

// Parses a whole string as a plain decimal number ("12" -> 12,
// "-1.5e3" -> -1500, "12a", " 12", "0x10" and "inf" -> nullopt).
std::optional<double> ParseNumber(const std::string& s);

// Looks up a dotted path ("settlement.level") through nested structs.
// Numeric segments index into lists. Returns nullptr when absent.
const Value* Lookup(const Struct& root, std::string_view dotted_path);

// Splits "a.b.c" into {"a","b","c"}.
std::vector<std::string> SplitPath(std::string_view dotted_path, char separator = '.');

// Unescaped reference tokens of a JSON pointer ("/a~1b/0" -> {"a/b","0"}).
// Empty for "" and for strings not starting with '/'.
std::vector<std::string> SplitPointer(std::string_view pointer);

// Text used by the `cat` operator and log fields; integral numbers print without a fraction.
std::string ToDisplayString(const Value& v);

// Compact JSON (protobuf json_util); falls back to display string on error.
std::string ToJson(const Value& v);
std::string ToJson(const Struct& s);

// Throws util::EvaluationError on malformed JSON.
Value  ParseJsonValue(const std::string& json);
Struct ParseJsonStruct(const std::string& json);

} // namespace rulegraph::expr
