#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace rulegraph::db::memory {

namespace {

std::string EntityKey(const std::string& entity_type, const std::string& id) {
  return entity_type + "#" + id;
}

template <typename Record>
bool Live(const Record& r) {
  return r.deleted_at_ms == 0;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result MemoryRepository::UpsertEntity(Transaction& t, const model::EntityRecord& r) {
  const auto key = EntityKey(r.entity_type, r.id);
  TX(t).Mutable(Table::kEntity, key).entities[key] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateEntity(Transaction& t, const model::EntityRecord& r, uint64_t expected_version) {
  const auto key = EntityKey(r.entity_type, r.id);
  const auto& s  = TX(t).View();
  auto        it = s.entities.find(key);
  if (it == s.entities.end() || !Live(it->second)) return Result::Err(ErrorCode::NotFound, "entity " + key);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "entity " + key + " version mismatch");
  TX(t).Mutable(Table::kEntity, key).entities[key] = r;
  return Result::Ok();
}

std::optional<model::EntityRecord> MemoryRepository::GetEntity(Transaction& t, const std::string& entity_type, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.entities.find(EntityKey(entity_type, id));
  if (it == s.entities.end() || !Live(it->second)) return std::nullopt;
  return it->second;
}

std::vector<model::EntityRecord> MemoryRepository::ListChildren(Transaction& t, const std::string& parent_type, const std::string& parent_id,
                                                                const std::string& child_type) {
  std::vector<model::EntityRecord> out;
  for (const auto& [_, r] : TX(t).View().entities) {
    if (Live(r) && r.parent_type == parent_type && r.parent_id == parent_id && (child_type.empty() || r.entity_type == child_type)) {
      out.push_back(r);
    }
  }
  return out;
}

// ------------------------------------------------------------------
// State variables
// ------------------------------------------------------------------

Result MemoryRepository::InsertVariable(Transaction& t, model::VariableRecord& r) {
  const auto& s = TX(t).View();
  if (s.variables.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "variable " + r.id);
  for (const auto& [_, existing] : s.variables) {
    if (Live(existing) && existing.scope == r.scope && existing.scope_id == r.scope_id && existing.key == r.key) {
      return Result::Err(ErrorCode::AlreadyExists, "variable " + r.scope + ":" + r.scope_id + ":" + r.key);
    }
  }
  r.created_seq = TX(t).NextSeq();
  TX(t).Mutable(Table::kVariable, r.id).variables[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateVariable(Transaction& t, const model::VariableRecord& r, uint64_t expected_version) {
  const auto& s  = TX(t).View();
  auto        it = s.variables.find(r.id);
  if (it == s.variables.end() || !Live(it->second)) return Result::Err(ErrorCode::NotFound, "variable " + r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "variable " + r.id + " version mismatch");
  TX(t).Mutable(Table::kVariable, r.id).variables[r.id] = r;
  return Result::Ok();
}

std::optional<model::VariableRecord> MemoryRepository::GetVariable(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.variables.find(id);
  if (it == s.variables.end() || !Live(it->second)) return std::nullopt;
  return it->second;
}

std::vector<model::VariableRecord> MemoryRepository::ListVariablesByScope(Transaction& t, const std::string& scope, const std::string& scope_id) {
  std::vector<model::VariableRecord> out;
  for (const auto& [_, r] : TX(t).View().variables) {
    if (Live(r) && r.scope == scope && r.scope_id == scope_id) out.push_back(r);
  }
  return out;
}

std::vector<model::VariableRecord> MemoryRepository::ListVariablesByCampaign(Transaction& t, const std::string& campaign_id) {
  std::vector<model::VariableRecord> out;
  for (const auto& [_, r] : TX(t).View().variables) {
    if (Live(r) && r.campaign_id == campaign_id) out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Conditions
// ------------------------------------------------------------------

Result MemoryRepository::InsertCondition(Transaction& t, model::ConditionRecord& r) {
  if (TX(t).View().conditions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "condition " + r.id);
  r.created_seq = TX(t).NextSeq();
  TX(t).Mutable(Table::kCondition, r.id).conditions[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateCondition(Transaction& t, const model::ConditionRecord& r, uint64_t expected_version) {
  const auto& s  = TX(t).View();
  auto        it = s.conditions.find(r.id);
  if (it == s.conditions.end() || !Live(it->second)) return Result::Err(ErrorCode::NotFound, "condition " + r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "condition " + r.id + " version mismatch");
  TX(t).Mutable(Table::kCondition, r.id).conditions[r.id] = r;
  return Result::Ok();
}

std::optional<model::ConditionRecord> MemoryRepository::GetCondition(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.conditions.find(id);
  if (it == s.conditions.end() || !Live(it->second)) return std::nullopt;
  return it->second;
}

std::vector<model::ConditionRecord> MemoryRepository::ListConditionsByCampaign(Transaction& t, const std::string& campaign_id) {
  std::vector<model::ConditionRecord> out;
  for (const auto& [_, r] : TX(t).View().conditions) {
    if (Live(r) && r.campaign_id == campaign_id) out.push_back(r);
  }
  return out;
}

std::vector<model::ConditionRecord> MemoryRepository::ListConditionsForEntity(Transaction& t, const std::string& campaign_id,
                                                                              const std::string& entity_type, const std::string& entity_id) {
  std::vector<model::ConditionRecord> out;
  for (const auto& [_, r] : TX(t).View().conditions) {
    if (!Live(r) || r.campaign_id != campaign_id || r.entity_type != entity_type) continue;
    if (r.entity_id.empty() || r.entity_id == entity_id) out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Effects
// ------------------------------------------------------------------

Result MemoryRepository::InsertEffect(Transaction& t, model::EffectRecord& r) {
  if (TX(t).View().effects.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "effect " + r.id);
  r.created_seq = TX(t).NextSeq();
  TX(t).Mutable(Table::kEffect, r.id).effects[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateEffect(Transaction& t, const model::EffectRecord& r, uint64_t expected_version) {
  const auto& s  = TX(t).View();
  auto        it = s.effects.find(r.id);
  if (it == s.effects.end() || !Live(it->second)) return Result::Err(ErrorCode::NotFound, "effect " + r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "effect " + r.id + " version mismatch");
  TX(t).Mutable(Table::kEffect, r.id).effects[r.id] = r;
  return Result::Ok();
}

std::optional<model::EffectRecord> MemoryRepository::GetEffect(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.effects.find(id);
  if (it == s.effects.end() || !Live(it->second)) return std::nullopt;
  return it->second;
}

std::vector<model::EffectRecord> MemoryRepository::ListEffectsByCampaign(Transaction& t, const std::string& campaign_id) {
  std::vector<model::EffectRecord> out;
  for (const auto& [_, r] : TX(t).View().effects) {
    if (Live(r) && r.campaign_id == campaign_id) out.push_back(r);
  }
  return out;
}

std::vector<model::EffectRecord> MemoryRepository::ListEffectsForEntity(Transaction& t, const std::string& entity_type, const std::string& entity_id) {
  std::vector<model::EffectRecord> out;
  for (const auto& [_, r] : TX(t).View().effects) {
    if (Live(r) && r.entity_type == entity_type && r.entity_id == entity_id) out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Effect executions
// ------------------------------------------------------------------

Result MemoryRepository::InsertEffectExecution(Transaction& t, const model::EffectExecutionRecord& r) {
  if (TX(t).View().executions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "execution " + r.id);
  TX(t).Mutable(Table::kExecution, r.id).executions[r.id] = r;
  return Result::Ok();
}

std::vector<model::EffectExecutionRecord> MemoryRepository::ListEffectExecutions(Transaction& t, const std::string& effect_id) {
  std::vector<model::EffectExecutionRecord> out;
  for (const auto& [_, r] : TX(t).View().executions) {
    if (r.effect_id == effect_id) out.push_back(r);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.executed_at_ms < b.executed_at_ms; });
  return out;
}

} // namespace rulegraph::db::memory
