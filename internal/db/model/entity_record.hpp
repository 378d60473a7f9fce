#pragma once

#include <cstdint>
#include <string>

#include <google/protobuf/struct.pb.h>

namespace rulegraph::db::model {

/*
  Entity row (settlement, structure, kingdom, ...).

  Fields are a free-form JSON object. Structures reference their
  settlement through parent_type / parent_id.
*/

struct EntityRecord {
  std::string entity_type;
  std::string id;
  std::string campaign_id;

  std::string parent_type;
  std::string parent_id;

  google::protobuf::Struct fields;

  // Optimistic concurrency; bumped on every write.
  uint64_t version = 0;

  uint64_t updated_at_ms = 0;
  uint64_t deleted_at_ms = 0; // 0 = live
};

} // namespace rulegraph::db::model
