#include "internal/expr/value.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <cmath>
#include <cstdlib>
#include <sstream>

#include "internal/util/errors.hpp"

namespace rulegraph::expr {

Value NullValue() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

Value NumberValue(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

Value StringValue(std::string_view s) {
  Value v;
  v.set_string_value(std::string(s));
  return v;
}

Value BoolValue(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

Value StructValue(const Struct& s) {
  Value v;
  *v.mutable_struct_value() = s;
  return v;
}

Value ListValue(const std::vector<Value>& items) {
  Value v;
  auto* list = v.mutable_list_value();
  for (const auto& item : items) {
    *list->add_values() = item;
  }
  return v;
}

bool IsNull(const Value& v) {
  return v.kind_case() == Value::KIND_NOT_SET || v.kind_case() == Value::kNullValue;
}

bool IsNumber(const Value& v) {
  return v.kind_case() == Value::kNumberValue;
}

bool IsString(const Value& v) {
  return v.kind_case() == Value::kStringValue;
}

bool IsBool(const Value& v) {
  return v.kind_case() == Value::kBoolValue;
}

bool IsList(const Value& v) {
  return v.kind_case() == Value::kListValue;
}

bool IsStruct(const Value& v) {
  return v.kind_case() == Value::kStructValue;
}

bool Truthy(const Value& v) {
  switch (v.kind_case()) {
    case Value::kBoolValue:
      return v.bool_value();
    case Value::kNumberValue:
      return v.number_value() != 0.0 && !std::isnan(v.number_value());
    case Value::kStringValue:
      return !v.string_value().empty();
    case Value::kListValue:
      return v.list_value().values_size() > 0;
    case Value::kStructValue:
      return true;
    default:
      return false;
  }
}

bool DeepEquals(const Value& a, const Value& b) {
  if (IsNull(a) || IsNull(b)) {
    return IsNull(a) && IsNull(b);
  }
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

namespace {

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

// -?digits(.digits)?([eE][+-]?digits)? ; no whitespace, hex, inf or nan.
bool IsDecimal(const std::string& s) {
  std::size_t i = 0;
  if (i < s.size() && s[i] == '-') ++i;

  const auto digits = [&] {
    const auto start = i;
    while (i < s.size() && IsDigit(s[i])) ++i;
    return i > start;
  };

  if (!digits()) return false;
  if (i < s.size() && s[i] == '.') {
    ++i;
    if (!digits()) return false;
  }
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    if (!digits()) return false;
  }
  return i == s.size();
}

} // namespace

std::optional<double> ParseNumber(const std::string& s) {
  if (!IsDecimal(s)) {
    return std::nullopt;
  }
  const double parsed = std::strtod(s.c_str(), nullptr);
  if (!std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

std::vector<std::string> SplitPath(std::string_view dotted_path, char separator) {
  std::vector<std::string> out;
  std::size_t              start = 0;
  while (start <= dotted_path.size()) {
    auto pos = dotted_path.find(separator, start);
    if (pos == std::string_view::npos) {
      out.emplace_back(dotted_path.substr(start));
      break;
    }
    out.emplace_back(dotted_path.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

std::vector<std::string> SplitPointer(std::string_view pointer) {
  std::vector<std::string> out;
  if (pointer.empty() || pointer.front() != '/') {
    return out;
  }
  for (const auto& raw : SplitPath(pointer.substr(1), '/')) {
    std::string token;
    for (std::size_t i = 0; i < raw.size(); ++i) {
      if (raw[i] == '~' && i + 1 < raw.size() && (raw[i + 1] == '0' || raw[i + 1] == '1')) {
        token.push_back(raw[i + 1] == '0' ? '~' : '/');
        ++i;
      } else {
        token.push_back(raw[i]);
      }
    }
    out.push_back(std::move(token));
  }
  return out;
}

const Value* Lookup(const Struct& root, std::string_view dotted_path) {
  if (dotted_path.empty()) {
    return nullptr;
  }

  const auto segments = SplitPath(dotted_path);

  auto it = root.fields().find(segments.front());
  if (it == root.fields().end()) {
    return nullptr;
  }
  const Value* current = &it->second;

  for (std::size_t i = 1; i < segments.size(); ++i) {
    const auto& segment = segments[i];
    if (IsStruct(*current)) {
      const auto& fields = current->struct_value().fields();
      auto        next   = fields.find(segment);
      if (next == fields.end()) {
        return nullptr;
      }
      current = &next->second;
    } else if (IsList(*current)) {
      auto index = ParseNumber(segment);
      if (!index || *index < 0 || *index >= current->list_value().values_size()) {
        return nullptr;
      }
      current = &current->list_value().values(static_cast<int>(*index));
    } else {
      return nullptr;
    }
  }
  return current;
}

std::string ToDisplayString(const Value& v) {
  switch (v.kind_case()) {
    case Value::kStringValue:
      return v.string_value();
    case Value::kBoolValue:
      return v.bool_value() ? "true" : "false";
    case Value::kNumberValue: {
      const double n = v.number_value();
      if (std::isfinite(n) && n == std::floor(n) && std::fabs(n) < 1e15) {
        return std::to_string(static_cast<long long>(n));
      }
      std::ostringstream out;
      out << n;
      return out.str();
    }
    case Value::kListValue:
    case Value::kStructValue:
      return ToJson(v);
    default:
      return "";
  }
}

std::string ToJson(const Value& v) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(v, &json);
  if (!status.ok()) {
    return IsList(v) || IsStruct(v) ? "null" : ToDisplayString(v);
  }
  return json;
}

std::string ToJson(const Struct& s) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(s, &json);
  if (!status.ok()) {
    return "{}";
  }
  return json;
}

Value ParseJsonValue(const std::string& json) {
  Value value;
  auto  status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw util::EvaluationError("malformed JSON value: " + std::string(status.message()));
  }
  return value;
}

Struct ParseJsonStruct(const std::string& json) {
  Struct value;
  auto   status = google::protobuf::util::JsonStringToMessage(json.empty() ? std::string("{}") : json, &value);
  if (!status.ok()) {
    throw util::EvaluationError("malformed JSON object: " + std::string(status.message()));
  }
  return value;
}

} // namespace rulegraph::expr
