#pragma once

#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

namespace rulegraph::db::sql {

/*
  Protobuf message <-> JSON column text.

  Backends store Struct / Value / ListValue through these so both
  engines persist the same representation.
*/

template <typename Message>
std::string ToJsonColumn(const Message& message) {
  std::string out;
  if (!google::protobuf::util::MessageToJsonString(message, &out).ok()) return "null";
  return out;
}

// Empty text leaves the message untouched. Returns false on malformed JSON.
template <typename Message>
bool FromJsonColumn(const std::string& text, Message* message) {
  if (text.empty()) return true;
  return google::protobuf::util::JsonStringToMessage(text, message).ok();
}

inline std::string StringsToJsonColumn(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& v : values) list.add_values()->set_string_value(v);
  return ToJsonColumn(list);
}

inline bool StringsFromJsonColumn(const std::string& text, std::vector<std::string>* out) {
  google::protobuf::ListValue list;
  if (!FromJsonColumn(text, &list)) return false;
  out->clear();
  for (const auto& v : list.values()) {
    if (v.kind_case() == google::protobuf::Value::kStringValue) out->push_back(v.string_value());
  }
  return true;
}

} // namespace rulegraph::db::sql
