#pragma once

#include <cstdint>
#include <string>

#include <google/protobuf/struct.pb.h>

namespace rulegraph::db::model {

struct ConditionRecord {
  std::string id;
  std::string campaign_id;

  std::string entity_type;
  std::string entity_id; // empty = applies to every entity of entity_type
  std::string field;     // computed-field name

  google::protobuf::Value expression;

  int32_t  priority  = 0;
  bool     is_active = true;
  uint64_t version   = 1;

  // Assigned by the repository on insert; tie-breaker for evaluation order.
  uint64_t created_seq = 0;

  uint64_t deleted_at_ms = 0;
};

} // namespace rulegraph::db::model
