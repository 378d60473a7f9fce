#include "internal/effects/effect_engine.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <unordered_map>

#include "internal/cache/cache_keys.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/effects/json_patch.hpp"
#include "internal/effects/state_machine.hpp"
#include "internal/graph/dependency_graph_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace rulegraph::effects {

using db::model::EffectExecutionRecord;
using db::model::EffectRecord;

namespace {

void Transition(EffectExecutionRecord& record, ExecutionState to) {
  if (!CanTransition(record.state, to)) {
    throw std::logic_error("invalid execution state transition to " + rulegraph::v1::ExecutionState_Name(to));
  }
  record.state = to;
}

bool Precedes(const EffectRecord& a, const EffectRecord& b) {
  if (a.timing != b.timing) return a.timing < b.timing;
  if (a.priority != b.priority) return a.priority < b.priority;
  if (a.created_seq != b.created_seq) return a.created_seq < b.created_seq;
  return a.id < b.id;
}

} // namespace

EffectEngine::EffectEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<graph::DependencyGraphService> graphs,
                           std::shared_ptr<cache::InvalidationCoordinator> invalidation, PathWhitelist whitelist)
    : repository_(std::move(repository)),
      graphs_(std::move(graphs)),
      invalidation_(std::move(invalidation)),
      whitelist_(std::move(whitelist)) {
}

EffectRecord EffectEngine::LoadEffect(const std::string& effect_id) {
  auto tx     = repository_->Begin();
  auto effect = repository_->GetEffect(*tx, effect_id);
  tx->Commit();
  if (!effect || effect->deleted_at_ms != 0) throw util::NotFound("effect not found: " + effect_id);
  return *effect;
}

std::vector<EffectRecord> EffectEngine::Order(std::vector<EffectRecord> effects, const std::string& branch_id) {
  std::sort(effects.begin(), effects.end(), Precedes);
  if (effects.size() < 2) return effects;

  std::shared_ptr<const graph::DependencyGraph> g;
  try {
    g = graphs_->GetGraph(effects.front().campaign_id, branch_id);
  } catch (const std::exception& e) {
    RULEGRAPH_LOG_WARN("effect ordering without dependency graph", {observability::StringField("error", e.what())});
    return effects;
  }

  std::vector<graph::DependencyGraph::NodeIndex>                   nodes;
  std::unordered_map<graph::DependencyGraph::NodeIndex, std::size_t> position;
  for (std::size_t i = 0; i < effects.size(); ++i) {
    if (auto idx = g->Find(graph::EffectNodeKey(effects[i].id))) {
      nodes.push_back(*idx);
      position[*idx] = i;
    }
  }

  bool linked = false;
  for (auto a : nodes) {
    for (auto b : nodes) {
      if (a != b && g->HasPath(a, b)) linked = true;
    }
  }
  if (!linked) return effects;

  auto topo = g->TopologicalOrder(nodes);
  if (topo.HasCycle()) {
    RULEGRAPH_LOG_WARN("effects of the batch form a cycle; keeping priority order",
                       {observability::IntField("effects", static_cast<std::int64_t>(effects.size()))});
    return effects;
  }

  std::vector<EffectRecord> ordered;
  std::vector<bool>         taken(effects.size(), false);
  for (auto idx : topo.order) {
    auto it = position.find(idx);
    if (it == position.end()) continue;
    ordered.push_back(effects[it->second]);
    taken[it->second] = true;
  }
  // Effects missing from the graph (inactive since it was built) keep their place at the end.
  for (std::size_t i = 0; i < effects.size(); ++i) {
    if (!taken[i]) ordered.push_back(effects[i]);
  }
  return ordered;
}

void EffectEngine::RecordFailure(EffectExecutionRecord& record, const std::string& error) {
  record.success = false;
  record.error   = error;
  record.state   = rulegraph::v1::EXECUTION_STATE_FAILED;
  record.affected_fields.clear();

  try {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->InsertEffectExecution(*tx, record), "insert effect execution");
    tx->Commit();
  } catch (const std::exception& e) {
    RULEGRAPH_LOG_ERROR("failed to record effect failure", {observability::StringField("effect_id", record.effect_id),
                                                            observability::StringField("error", e.what())});
  }
}

EffectExecutionRecord EffectEngine::Run(const EffectRecord& effect, const std::string& actor, bool dry_run) {
  observability::SpanScope span("rulegraph.effect.execute");
  span.SetAttribute("rulegraph.effect_id", effect.id);
  const auto started_at = std::chrono::steady_clock::now();

  EffectExecutionRecord record;
  record.id             = util::NewId();
  record.effect_id      = effect.id;
  record.entity_type    = effect.entity_type;
  record.entity_id      = effect.entity_id;
  record.executed_by    = actor;
  record.executed_at_ms = util::NowMillis();
  record.patch_applied  = effect.payload;
  record.state          = rulegraph::v1::EXECUTION_STATE_PENDING;

  std::string parent_type;
  std::string parent_id;

  try {
    ValidatePatch(effect.payload);
    whitelist_.Validate(effect.entity_type, effect.payload);
    Transition(record, rulegraph::v1::EXECUTION_STATE_APPLYING);

    auto tx     = repository_->Begin();
    auto entity = repository_->GetEntity(*tx, effect.entity_type, effect.entity_id);
    if (!entity || entity->deleted_at_ms != 0) {
      throw util::EntityNotFound(effect.entity_type + " not found: " + effect.entity_id);
    }
    parent_type = entity->parent_type;
    parent_id   = entity->parent_id;

    record.context         = entity->fields;
    auto after             = ApplyPatch(entity->fields, effect.payload);
    record.affected_fields = ChangedFields(entity->fields, after);

    if (dry_run) {
      tx->Rollback();
      record.success = true;
      Transition(record, rulegraph::v1::EXECUTION_STATE_SUCCEEDED);
      return record;
    }

    auto updated          = *entity;
    updated.fields        = std::move(after);
    updated.version       = entity->version + 1;
    updated.updated_at_ms = util::NowMillis();
    db::ThrowIfDbError(repository_->UpdateEntity(*tx, updated, entity->version), "update " + effect.entity_type);

    record.success = true;
    Transition(record, rulegraph::v1::EXECUTION_STATE_SUCCEEDED);
    db::ThrowIfDbError(repository_->InsertEffectExecution(*tx, record), "insert effect execution");
    tx->Commit();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    RULEGRAPH_LOG_WARN("effect failed", {observability::StringField("effect_id", effect.id),
                                         observability::StringField("entity_id", effect.entity_id),
                                         observability::StringField("error", e.what())});
    if (dry_run) {
      record.success = false;
      record.error   = e.what();
      record.state   = rulegraph::v1::EXECUTION_STATE_FAILED;
    } else {
      RecordFailure(record, e.what());
    }
    observability::Metrics::Instance().RecordEffectExecution(false);
    return record;
  }

  observability::Metrics::Instance().RecordEffectExecution(true);
  observability::Metrics::Instance().ObserveEvaluationMs(
      "effect", std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

  if (!record.affected_fields.empty()) {
    invalidation_->Invalidate(cache::EntityChanged{effect.campaign_id, cache::kAllBranches, effect.entity_type, effect.entity_id,
                                                   record.affected_fields, parent_type, parent_id});
  }

  RULEGRAPH_LOG_INFO("effect applied", {observability::StringField("effect_id", effect.id),
                                        observability::StringField("entity_id", effect.entity_id),
                                        observability::IntField("affected_fields", static_cast<std::int64_t>(record.affected_fields.size()))});
  return record;
}

BatchResult EffectEngine::RunBatch(const std::vector<EffectRecord>& effects, const std::string& actor) {
  BatchResult out;
  out.total = static_cast<int>(effects.size());
  for (const auto& effect : effects) {
    out.execution_order.push_back(effect.id);
    auto record = Run(effect, actor, false);
    if (record.success) {
      ++out.succeeded;
    } else {
      ++out.failed;
    }
    out.executions.push_back(std::move(record));
  }
  return out;
}

BatchResult EffectEngine::ExecuteEffectsForEntity(const std::string& entity_type, const std::string& entity_id,
                                                  rulegraph::v1::EffectTiming timing, const std::string& actor, const std::string& branch_id) {
  std::vector<EffectRecord> effects;
  {
    auto tx = repository_->Begin();
    for (auto& e : repository_->ListEffectsForEntity(*tx, entity_type, entity_id)) {
      if (!e.is_active) continue;
      if (timing != rulegraph::v1::EFFECT_TIMING_UNSPECIFIED && e.timing != timing) continue;
      effects.push_back(std::move(e));
    }
    tx->Commit();
  }

  auto result = RunBatch(Order(std::move(effects), branch_id), actor);
  RULEGRAPH_LOG_INFO("effect batch finished", {observability::StringField("entity_type", entity_type),
                                               observability::StringField("entity_id", entity_id),
                                               observability::IntField("succeeded", result.succeeded),
                                               observability::IntField("failed", result.failed)});
  return result;
}

EffectExecutionRecord EffectEngine::ExecuteEffect(const std::string& effect_id, const std::string& actor, bool dry_run) {
  return Run(LoadEffect(effect_id), actor, dry_run);
}

BatchResult EffectEngine::ExecuteEffectsWithDependencies(const std::vector<std::string>& effect_ids, const std::string& actor,
                                                         const std::string& branch_id) {
  if (effect_ids.empty()) return {};

  std::vector<EffectRecord> effects;
  for (const auto& id : effect_ids) effects.push_back(LoadEffect(id));
  std::sort(effects.begin(), effects.end(), Precedes);

  auto g = graphs_->GetGraph(effects.front().campaign_id, branch_id);

  std::vector<graph::DependencyGraph::NodeIndex>                   nodes;
  std::unordered_map<graph::DependencyGraph::NodeIndex, std::size_t> position;
  std::vector<EffectRecord>                                        missing;
  for (std::size_t i = 0; i < effects.size(); ++i) {
    if (auto idx = g->Find(graph::EffectNodeKey(effects[i].id))) {
      nodes.push_back(*idx);
      position[*idx] = i;
    } else {
      missing.push_back(effects[i]);
    }
  }

  auto topo = g->TopologicalOrder(nodes);
  if (topo.HasCycle()) {
    std::vector<std::string> path;
    for (const auto& cycle : g->DetectCycles()) {
      for (auto idx : nodes) {
        if (std::find(cycle.path.begin(), cycle.path.end(), g->Node(idx).key) != cycle.path.end()) path = cycle.path;
      }
      if (!path.empty()) break;
    }
    if (path.empty()) {
      for (auto idx : topo.unordered) path.push_back(g->Node(idx).key);
    }
    throw util::CircularDependency("circular dependency: " + graph::FormatCycle(path), path);
  }

  std::vector<EffectRecord> ordered;
  for (auto idx : topo.order) {
    if (auto it = position.find(idx); it != position.end()) ordered.push_back(effects[it->second]);
  }
  ordered.insert(ordered.end(), missing.begin(), missing.end());

  return RunBatch(ordered, actor);
}

PreviewResult EffectEngine::PreviewEffect(const std::string& effect_id) {
  auto effect = LoadEffect(effect_id);

  PreviewResult out;
  {
    auto tx     = repository_->Begin();
    auto entity = repository_->GetEntity(*tx, effect.entity_type, effect.entity_id);
    tx->Commit();
    if (!entity || entity->deleted_at_ms != 0) {
      throw util::EntityNotFound(effect.entity_type + " not found: " + effect.entity_id);
    }
    out.before = entity->fields;
  }

  try {
    ValidatePatch(effect.payload);
    whitelist_.Validate(effect.entity_type, effect.payload);
    out.after          = ApplyPatch(out.before, effect.payload);
    out.changed_fields = ChangedFields(out.before, out.after);
  } catch (const util::ForbiddenPath& e) {
    out.valid = false;
    out.errors.push_back(e.what());
    out.after = out.before;
  } catch (const util::EvaluationError& e) {
    out.valid = false;
    out.errors.push_back(e.what());
    out.after = out.before;
  }
  return out;
}

} // namespace rulegraph::effects
