#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

namespace rulegraph::db::model {

/*
  StateVariable row.

  Exactly one of value / formula is populated. A row with a formula is
  a derived variable. (scope, scope_id, key) is unique among live rows.
*/

struct VariableRecord {
  std::string id;
  std::string campaign_id;

  std::string scope;    // "world", "settlement", "structure", ...
  std::string scope_id; // empty for world scope
  std::string key;

  std::optional<google::protobuf::Value> value;
  std::optional<google::protobuf::Value> formula;

  bool     is_active   = true;
  uint64_t version     = 1;
  uint64_t created_seq = 0;

  uint64_t deleted_at_ms = 0;

  bool IsDerived() const {
    return formula.has_value();
  }
};

} // namespace rulegraph::db::model
