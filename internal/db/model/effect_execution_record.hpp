#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "rulegraph/v1/types.pb.h"

namespace rulegraph::db::model {

/*
  Append-only audit row. One per execution attempt, never updated.
*/

struct EffectExecutionRecord {
  std::string id;
  std::string effect_id;
  std::string entity_type;
  std::string entity_id;
  std::string executed_by;

  uint64_t executed_at_ms = 0;

  // entity fields before the patch
  google::protobuf::Struct context;

  bool                        success = false;
  google::protobuf::ListValue patch_applied;
  std::vector<std::string>    affected_fields;
  std::string                 error;

  rulegraph::v1::ExecutionState state = rulegraph::v1::EXECUTION_STATE_PENDING;
};

} // namespace rulegraph::db::model
