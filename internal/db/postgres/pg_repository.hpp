#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace rulegraph::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
