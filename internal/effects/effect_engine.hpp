#pragma once

#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/cache/invalidation_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/effects/path_whitelist.hpp"
#include "internal/graph/dependency_graph_service.hpp"

namespace rulegraph::effects {

struct BatchResult {
  int total     = 0;
  int succeeded = 0;
  int failed    = 0;

  std::vector<db::model::EffectExecutionRecord> executions;
  std::vector<std::string>                      execution_order; // effect ids
};

struct PreviewResult {
  bool                     valid = true;
  std::vector<std::string> errors;
  google::protobuf::Struct before;
  google::protobuf::Struct after;
  std::vector<std::string> changed_fields;
};

/*
  Applies effect patches to entities.

  Each effect runs in its own transaction: fresh snapshot, path and
  patch validation, patch applied to a clone, version-checked entity
  update plus audit row, commit, then EntityChanged invalidation.

  A failing effect is recorded (audit row with the error) and the batch
  moves on; nothing is retried.
*/
class EffectEngine {
 public:
  EffectEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<graph::DependencyGraphService> graphs,
               std::shared_ptr<cache::InvalidationCoordinator> invalidation, PathWhitelist whitelist);

  // EFFECT_TIMING_UNSPECIFIED runs every phase.
  BatchResult ExecuteEffectsForEntity(const std::string& entity_type, const std::string& entity_id, rulegraph::v1::EffectTiming timing,
                                      const std::string& actor, const std::string& branch_id);

  // Dry run validates and patches a clone; no audit row, nothing persisted.
  // Throws util::NotFound for an unknown effect.
  db::model::EffectExecutionRecord ExecuteEffect(const std::string& effect_id, const std::string& actor, bool dry_run);

  // Topological order over the subset. Throws util::CircularDependency
  // before anything is applied when the subset sits on a cycle.
  BatchResult ExecuteEffectsWithDependencies(const std::vector<std::string>& effect_ids, const std::string& actor,
                                             const std::string& branch_id);

  PreviewResult PreviewEffect(const std::string& effect_id);

 private:
  // Phase / priority / creation order, replaced by graph order when
  // effects of the batch depend on each other.
  std::vector<db::model::EffectRecord> Order(std::vector<db::model::EffectRecord> effects, const std::string& branch_id);

  BatchResult RunBatch(const std::vector<db::model::EffectRecord>& effects, const std::string& actor);

  // Invalidates every branch after a commit; the entity row is not branched.
  db::model::EffectExecutionRecord Run(const db::model::EffectRecord& effect, const std::string& actor, bool dry_run);

  void RecordFailure(db::model::EffectExecutionRecord& record, const std::string& error);

  db::model::EffectRecord LoadEffect(const std::string& effect_id);

  std::shared_ptr<db::Repository>                 repository_;
  std::shared_ptr<graph::DependencyGraphService>  graphs_;
  std::shared_ptr<cache::InvalidationCoordinator> invalidation_;
  PathWhitelist                                   whitelist_;
};

} // namespace rulegraph::effects
