#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/condition_record.hpp"
#include "internal/db/model/effect_execution_record.hpp"
#include "internal/db/model/effect_record.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/variable_record.hpp"

namespace rulegraph::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Update* compares the stored version with expected_version and
    returns ErrorCode::Conflict on mismatch (nothing is written)
  - List* never return soft-deleted rows (deleted_at_ms != 0);
    callers filter is_active themselves
  - Insert* assign created_seq (monotonic per backend)

  The DB is the source of truth for:
    entities
    state variables
    conditions / effects
    effect execution audit trail
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Entities
  // ---------------------------------------------------------------------

  // Insert or overwrite without a version check.
  virtual Result UpsertEntity(Transaction&, const model::EntityRecord&) = 0;

  virtual Result UpdateEntity(Transaction&, const model::EntityRecord&, uint64_t expected_version) = 0;

  virtual std::optional<model::EntityRecord> GetEntity(Transaction&, const std::string& entity_type, const std::string& id) = 0;

  virtual std::vector<model::EntityRecord> ListChildren(Transaction&, const std::string& parent_type, const std::string& parent_id,
                                                        const std::string& child_type) = 0;

  // ---------------------------------------------------------------------
  // State variables
  // ---------------------------------------------------------------------

  // AlreadyExists when a live row has the same (scope, scope_id, key).
  virtual Result InsertVariable(Transaction&, model::VariableRecord&) = 0;

  virtual Result UpdateVariable(Transaction&, const model::VariableRecord&, uint64_t expected_version) = 0;

  virtual std::optional<model::VariableRecord> GetVariable(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::VariableRecord> ListVariablesByScope(Transaction&, const std::string& scope, const std::string& scope_id) = 0;

  virtual std::vector<model::VariableRecord> ListVariablesByCampaign(Transaction&, const std::string& campaign_id) = 0;

  // ---------------------------------------------------------------------
  // Conditions
  // ---------------------------------------------------------------------

  virtual Result InsertCondition(Transaction&, model::ConditionRecord&) = 0;

  virtual Result UpdateCondition(Transaction&, const model::ConditionRecord&, uint64_t expected_version) = 0;

  virtual std::optional<model::ConditionRecord> GetCondition(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::ConditionRecord> ListConditionsByCampaign(Transaction&, const std::string& campaign_id) = 0;

  // Conditions bound to (entity_type, entity_id) plus class-level
  // conditions of entity_type in the same campaign.
  virtual std::vector<model::ConditionRecord> ListConditionsForEntity(Transaction&, const std::string& campaign_id,
                                                                      const std::string& entity_type, const std::string& entity_id) = 0;

  // ---------------------------------------------------------------------
  // Effects
  // ---------------------------------------------------------------------

  virtual Result InsertEffect(Transaction&, model::EffectRecord&) = 0;

  virtual Result UpdateEffect(Transaction&, const model::EffectRecord&, uint64_t expected_version) = 0;

  virtual std::optional<model::EffectRecord> GetEffect(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::EffectRecord> ListEffectsByCampaign(Transaction&, const std::string& campaign_id) = 0;

  virtual std::vector<model::EffectRecord> ListEffectsForEntity(Transaction&, const std::string& entity_type, const std::string& entity_id) = 0;

  // ---------------------------------------------------------------------
  // Effect executions (append-only)
  // ---------------------------------------------------------------------

  virtual Result InsertEffectExecution(Transaction&, const model::EffectExecutionRecord&) = 0;

  virtual std::vector<model::EffectExecutionRecord> ListEffectExecutions(Transaction&, const std::string& effect_id) = 0;
};

} // namespace rulegraph::db
