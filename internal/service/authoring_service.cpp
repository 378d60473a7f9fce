#include "authoring_service.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include "conversions.hpp"
#include "observe_rpc.hpp"
#include "internal/cache/cache_keys.hpp"
#include "internal/cache/invalidation_coordinator.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/effects/json_patch.hpp"
#include "internal/expr/expression.hpp"
#include "internal/graph/dependency_graph_builder.hpp"
#include "internal/graph/dependency_graph_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace rulegraph::service {

using namespace rulegraph::v1;

namespace {

void Require(bool ok, const std::string& msg) {
  if (!ok) throw util::InvalidArgument(msg);
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

void ValidateCondition(const db::model::ConditionRecord& c, std::size_t max_depth) {
  Require(!c.campaign_id.empty(), "condition campaign_id is required");
  Require(!c.entity_type.empty(), "condition entity_type is required");
  expr::ValidateExpression(c.expression, max_depth);
}

// Lowercases the scope and checks the value / formula split.
void NormalizeVariable(db::model::VariableRecord& v, std::size_t max_depth) {
  v.scope = Lower(v.scope);
  Require(!v.campaign_id.empty(), "variable campaign_id is required");
  Require(!v.scope.empty(), "variable scope is required");
  Require(!v.key.empty(), "variable key is required");
  if (v.scope == graph::kWorldScope) {
    v.scope_id.clear();
  } else {
    Require(!v.scope_id.empty(), "variable scope_id is required for scope " + v.scope);
  }
  Require(v.value.has_value() != v.formula.has_value(), "exactly one of value and formula must be set");
  if (v.formula) expr::ValidateExpression(*v.formula, max_depth);
}

void ValidateEffect(const db::model::EffectRecord& e) {
  Require(!e.campaign_id.empty(), "effect campaign_id is required");
  Require(!e.entity_type.empty() && !e.entity_id.empty(), "effect target entity is required");
  Require(e.source_type == "encounter" || e.source_type == "event", "effect source_type must be encounter or event");
  effects::ValidatePatch(e.payload);
}

uint64_t ExpectedVersion(uint64_t requested, uint64_t current) {
  return requested == 0 ? current : requested;
}

// Reads run in their own short transaction so validation (which reads the
// store again) never nests inside a write transaction.
template <typename Record>
Record LoadLive(db::Repository& repo, std::optional<Record> (db::Repository::*get)(db::Transaction&, const std::string&),
                const std::string& kind, const std::string& id) {
  auto tx  = repo.Begin();
  auto row = (repo.*get)(*tx, id);
  tx->Commit();
  if (!row || row->deleted_at_ms != 0) throw util::NotFound(kind + " not found: " + id);
  return *row;
}

} // namespace

AuthoringService::AuthoringService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

db::model::ConditionRecord AuthoringService::LoadCondition(const std::string& id) {
  return LoadLive(*ctx_.repository, &db::Repository::GetCondition, "condition", id);
}

db::model::VariableRecord AuthoringService::LoadVariable(const std::string& id) {
  return LoadLive(*ctx_.repository, &db::Repository::GetVariable, "variable", id);
}

db::model::EffectRecord AuthoringService::LoadEffect(const std::string& id) {
  return LoadLive(*ctx_.repository, &db::Repository::GetEffect, "effect", id);
}

// ------------------------------------------------------------
// Entities
// ------------------------------------------------------------

Entity AuthoringService::UpsertEntity(const UpsertEntityRequest& req) {
  return ObserveRpc("rulegraph.authoring.UpsertEntity", [&] {
    auto record = FromProto(req.entity());
    Require(!record.entity_type.empty() && !record.id.empty(), "entity_type and id are required");

    auto tx       = ctx_.repository->Begin();
    auto existing = ctx_.repository->GetEntity(*tx, record.entity_type, record.id);

    record.updated_at_ms = util::NowMillis();
    if (req.expected_version() != 0) {
      if (!existing) throw util::EntityNotFound(record.entity_type + " not found: " + record.id);
      record.version = req.expected_version() + 1;
      db::ThrowIfDbError(ctx_.repository->UpdateEntity(*tx, record, req.expected_version()), "update entity");
    } else {
      record.version = existing ? existing->version + 1 : 1;
      db::ThrowIfDbError(ctx_.repository->UpsertEntity(*tx, record), "upsert entity");
    }
    tx->Commit();

    const auto branch = std::string(cache::kAllBranches);
    if (!existing) {
      ctx_.invalidation->Invalidate(cache::EntityChanged{record.campaign_id, branch, record.entity_type, record.id, {},
                                                         record.parent_type, record.parent_id});
      return ToProto(record);
    }

    auto changed = effects::ChangedFields(existing->fields, record.fields);
    const bool reparented = existing->parent_type != record.parent_type || existing->parent_id != record.parent_id;
    if (!changed.empty() || reparented) {
      ctx_.invalidation->Invalidate(cache::EntityChanged{record.campaign_id, branch, record.entity_type, record.id, changed,
                                                         record.parent_type, record.parent_id});
    }
    if (reparented && !existing->parent_id.empty()) {
      ctx_.invalidation->Invalidate(cache::EntityChanged{record.campaign_id, branch, record.entity_type, record.id, changed,
                                                         existing->parent_type, existing->parent_id});
    }
    return ToProto(record);
  });
}

Entity AuthoringService::GetEntity(const GetEntityRequest& req) {
  return ObserveRpc("rulegraph.authoring.GetEntity", [&] {
    auto tx     = ctx_.repository->Begin();
    auto entity = ctx_.repository->GetEntity(*tx, req.entity_type(), req.entity_id());
    tx->Commit();
    if (!entity) throw util::EntityNotFound(req.entity_type() + " not found: " + req.entity_id());
    return ToProto(*entity);
  });
}

// ------------------------------------------------------------
// Conditions
// ------------------------------------------------------------

Condition AuthoringService::CreateCondition(const Condition& req) {
  return ObserveRpc("rulegraph.authoring.CreateCondition", [&] {
    auto record = FromProto(req);
    if (record.id.empty()) record.id = util::NewId();
    if (record.field.empty()) record.field = record.id;
    record.is_active = true;
    record.version   = 1;
    ValidateCondition(record, ctx_.settings.max_depth);
    ctx_.graphs->ValidateCandidate(record.campaign_id, record);

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->InsertCondition(*tx, record), "insert condition");
    tx->Commit();

    ctx_.invalidation->Invalidate(
        cache::ConditionDefinitionChanged{record.campaign_id, cache::kAllBranches, record.id, record.entity_type, record.entity_id});
    return ToProto(record);
  });
}

Condition AuthoringService::UpdateCondition(const Condition& req) {
  return ObserveRpc("rulegraph.authoring.UpdateCondition", [&] {
    auto existing = LoadCondition(req.id());

    auto record        = FromProto(req);
    record.campaign_id = existing.campaign_id;
    record.created_seq = existing.created_seq;
    if (record.field.empty()) record.field = existing.field;
    ValidateCondition(record, ctx_.settings.max_depth);
    ctx_.graphs->ValidateCandidate(record.campaign_id, record);

    const auto expected = ExpectedVersion(req.version(), existing.version);
    record.version      = expected + 1;
    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpdateCondition(*tx, record, expected), "update condition");
    tx->Commit();

    for (const auto* target : {&existing, &record}) {
      ctx_.invalidation->Invalidate(cache::ConditionDefinitionChanged{record.campaign_id, cache::kAllBranches, record.id,
                                                                      target->entity_type, target->entity_id});
    }
    return ToProto(record);
  });
}

void AuthoringService::DeleteCondition(const DeleteRequest& req) {
  ObserveRpc("rulegraph.authoring.DeleteCondition", [&] {
    auto       record   = LoadCondition(req.id());
    const auto expected = ExpectedVersion(req.expected_version(), record.version);
    record.version       = expected + 1;
    record.deleted_at_ms = util::NowMillis();

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpdateCondition(*tx, record, expected), "delete condition");
    tx->Commit();

    ctx_.invalidation->Invalidate(cache::ConditionDefinitionChanged{record.campaign_id, cache::kAllBranches, record.id,
                                                                    record.entity_type, record.entity_id});
  });
}

// ------------------------------------------------------------
// State variables
// ------------------------------------------------------------

StateVariable AuthoringService::CreateVariable(const StateVariable& req) {
  return ObserveRpc("rulegraph.authoring.CreateVariable", [&] {
    auto record = FromProto(req);
    if (record.id.empty()) record.id = util::NewId();
    record.is_active = true;
    record.version   = 1;
    NormalizeVariable(record, ctx_.settings.max_depth);
    if (record.IsDerived()) ctx_.graphs->ValidateCandidate(record.campaign_id, record);

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->InsertVariable(*tx, record), "insert variable");
    tx->Commit();

    ctx_.invalidation->Invalidate(
        cache::VariableDefinitionChanged{record.campaign_id, cache::kAllBranches, record.scope, record.scope_id, record.key});
    return ToProto(record);
  });
}

StateVariable AuthoringService::UpdateVariable(const StateVariable& req) {
  return ObserveRpc("rulegraph.authoring.UpdateVariable", [&] {
    auto existing = LoadVariable(req.id());

    auto record        = FromProto(req);
    record.campaign_id = existing.campaign_id;
    record.created_seq = existing.created_seq;
    if (record.scope.empty()) {
      record.scope    = existing.scope;
      record.scope_id = existing.scope_id;
    }
    if (record.key.empty()) record.key = existing.key;
    NormalizeVariable(record, ctx_.settings.max_depth);
    if (record.IsDerived()) ctx_.graphs->ValidateCandidate(record.campaign_id, record);

    const auto expected = ExpectedVersion(req.version(), existing.version);
    record.version      = expected + 1;
    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpdateVariable(*tx, record, expected), "update variable");
    tx->Commit();

    // A plain value change keeps the graph; anything else reshapes it.
    const bool value_only = !record.IsDerived() && !existing.IsDerived() && record.is_active == existing.is_active &&
                            record.scope == existing.scope && record.scope_id == existing.scope_id && record.key == existing.key;
    if (value_only) {
      ctx_.invalidation->Invalidate(
          cache::VariableChanged{record.campaign_id, cache::kAllBranches, record.scope, record.scope_id, record.key});
    } else {
      for (const auto* v : {&existing, &record}) {
        ctx_.invalidation->Invalidate(
            cache::VariableDefinitionChanged{record.campaign_id, cache::kAllBranches, v->scope, v->scope_id, v->key});
      }
    }
    return ToProto(record);
  });
}

void AuthoringService::DeleteVariable(const DeleteRequest& req) {
  ObserveRpc("rulegraph.authoring.DeleteVariable", [&] {
    auto       record   = LoadVariable(req.id());
    const auto expected = ExpectedVersion(req.expected_version(), record.version);
    record.version       = expected + 1;
    record.deleted_at_ms = util::NowMillis();

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpdateVariable(*tx, record, expected), "delete variable");
    tx->Commit();

    ctx_.invalidation->Invalidate(
        cache::VariableDefinitionChanged{record.campaign_id, cache::kAllBranches, record.scope, record.scope_id, record.key});
  });
}

// ------------------------------------------------------------
// Effects
// ------------------------------------------------------------

Effect AuthoringService::CreateEffect(const Effect& req) {
  return ObserveRpc("rulegraph.authoring.CreateEffect", [&] {
    auto record = FromProto(req);
    if (record.id.empty()) record.id = util::NewId();
    if (record.timing == EFFECT_TIMING_UNSPECIFIED) record.timing = EFFECT_TIMING_ON_RESOLVE;
    record.is_active = true;
    record.version   = 1;
    ValidateEffect(record);
    ctx_.graphs->ValidateCandidate(record.campaign_id, record);

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->InsertEffect(*tx, record), "insert effect");
    tx->Commit();

    ctx_.invalidation->Invalidate(
        cache::EffectDefinitionChanged{record.campaign_id, cache::kAllBranches, record.id, record.entity_type, record.entity_id});
    return ToProto(record);
  });
}

Effect AuthoringService::UpdateEffect(const Effect& req) {
  return ObserveRpc("rulegraph.authoring.UpdateEffect", [&] {
    auto existing = LoadEffect(req.id());

    auto record        = FromProto(req);
    record.campaign_id = existing.campaign_id;
    record.created_seq = existing.created_seq;
    if (record.timing == EFFECT_TIMING_UNSPECIFIED) record.timing = existing.timing;
    ValidateEffect(record);
    ctx_.graphs->ValidateCandidate(record.campaign_id, record);

    const auto expected = ExpectedVersion(req.version(), existing.version);
    record.version      = expected + 1;
    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpdateEffect(*tx, record, expected), "update effect");
    tx->Commit();

    ctx_.invalidation->Invalidate(
        cache::EffectDefinitionChanged{record.campaign_id, cache::kAllBranches, record.id, record.entity_type, record.entity_id});
    return ToProto(record);
  });
}

void AuthoringService::DeleteEffect(const DeleteRequest& req) {
  ObserveRpc("rulegraph.authoring.DeleteEffect", [&] {
    auto       record   = LoadEffect(req.id());
    const auto expected = ExpectedVersion(req.expected_version(), record.version);
    record.version       = expected + 1;
    record.deleted_at_ms = util::NowMillis();

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->UpdateEffect(*tx, record, expected), "delete effect");
    tx->Commit();

    ctx_.invalidation->Invalidate(cache::EffectDefinitionChanged{record.campaign_id, cache::kAllBranches, record.id,
                                                                 record.entity_type, record.entity_id});
  });
}

} // namespace rulegraph::service
