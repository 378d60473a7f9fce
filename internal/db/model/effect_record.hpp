#pragma once

#include <cstdint>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "rulegraph/v1/types.pb.h"

namespace rulegraph::db::model {

struct EffectRecord {
  std::string id;
  std::string campaign_id;

  std::string entity_type;
  std::string entity_id;

  std::string source_type; // "encounter" | "event"
  std::string source_id;

  // JSON-patch operations
  google::protobuf::ListValue payload;

  rulegraph::v1::EffectTiming timing = rulegraph::v1::EFFECT_TIMING_ON_RESOLVE;

  int32_t  priority    = 0;
  bool     is_active   = true;
  uint64_t version     = 1;
  uint64_t created_seq = 0;

  uint64_t deleted_at_ms = 0;
};

} // namespace rulegraph::db::model
