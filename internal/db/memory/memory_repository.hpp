#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace rulegraph::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertEntity(Transaction&, const model::EntityRecord&) override;
  Result UpdateEntity(Transaction&, const model::EntityRecord&, uint64_t expected_version) override;
  std::optional<model::EntityRecord> GetEntity(Transaction&, const std::string& entity_type, const std::string& id) override;
  std::vector<model::EntityRecord> ListChildren(Transaction&, const std::string& parent_type, const std::string& parent_id,
                                                const std::string& child_type) override;

  Result InsertVariable(Transaction&, model::VariableRecord&) override;
  Result UpdateVariable(Transaction&, const model::VariableRecord&, uint64_t expected_version) override;
  std::optional<model::VariableRecord> GetVariable(Transaction&, const std::string& id) override;
  std::vector<model::VariableRecord> ListVariablesByScope(Transaction&, const std::string& scope, const std::string& scope_id) override;
  std::vector<model::VariableRecord> ListVariablesByCampaign(Transaction&, const std::string& campaign_id) override;

  Result InsertCondition(Transaction&, model::ConditionRecord&) override;
  Result UpdateCondition(Transaction&, const model::ConditionRecord&, uint64_t expected_version) override;
  std::optional<model::ConditionRecord> GetCondition(Transaction&, const std::string& id) override;
  std::vector<model::ConditionRecord> ListConditionsByCampaign(Transaction&, const std::string& campaign_id) override;
  std::vector<model::ConditionRecord> ListConditionsForEntity(Transaction&, const std::string& campaign_id,
                                                              const std::string& entity_type, const std::string& entity_id) override;

  Result InsertEffect(Transaction&, model::EffectRecord&) override;
  Result UpdateEffect(Transaction&, const model::EffectRecord&, uint64_t expected_version) override;
  std::optional<model::EffectRecord> GetEffect(Transaction&, const std::string& id) override;
  std::vector<model::EffectRecord> ListEffectsByCampaign(Transaction&, const std::string& campaign_id) override;
  std::vector<model::EffectRecord> ListEffectsForEntity(Transaction&, const std::string& entity_type, const std::string& entity_id) override;

  Result InsertEffectExecution(Transaction&, const model::EffectExecutionRecord&) override;
  std::vector<model::EffectExecutionRecord> ListEffectExecutions(Transaction&, const std::string& effect_id) override;

private:
  friend class MemoryTransaction;

  enum class Table { kEntity, kVariable, kCondition, kEffect, kExecution };

  // Ordered maps keep List* output deterministic.
  struct State {
    std::map<std::string, model::EntityRecord>          entities; // "type#id"
    std::map<std::string, model::VariableRecord>        variables;
    std::map<std::string, model::ConditionRecord>       conditions;
    std::map<std::string, model::EffectRecord>          effects;
    std::map<std::string, model::EffectExecutionRecord> executions;

    // "<table>/<key>" -> number of committed writes to that row
    std::unordered_map<std::string, uint64_t> revisions;
  };

  uint64_t NextSeq() {
    return next_seq_.fetch_add(1);
  }

  std::mutex            mutex_;
  State                 committed_;
  std::atomic<uint64_t> next_seq_{1};
};

} // namespace rulegraph::db::memory
