#include "pg_repository.hpp"

#include <optional>

#include "internal/db/sql/json_columns.hpp"
#include "internal/observability/logging.hpp"

namespace rulegraph::db::postgres {

namespace {

constexpr const char* kEntityCols = "entity_type,id,campaign_id,parent_type,parent_id,fields::text,version,updated_at_ms,deleted_at_ms";
constexpr const char* kVariableCols =
    "seq,id,campaign_id,scope,scope_id,key,value::text,formula::text,is_active,version,deleted_at_ms";
constexpr const char* kConditionCols =
    "seq,id,campaign_id,entity_type,entity_id,field,expression::text,priority,is_active,version,deleted_at_ms";
constexpr const char* kEffectCols =
    "seq,id,campaign_id,entity_type,entity_id,source_type,source_id,payload::text,timing,priority,is_active,version,deleted_at_ms";
constexpr const char* kExecutionCols =
    "id,effect_id,entity_type,entity_id,executed_by,executed_at_ms,context::text,success,patch_applied::text,affected_fields::text,error,state";

template <typename Message>
void Json(const pqxx::field& f, Message* out, const std::string& row_id) {
  if (f.is_null()) return;
  if (!sql::FromJsonColumn(f.c_str(), out)) {
    RULEGRAPH_LOG_WARN("postgres: malformed JSON column", {observability::StringField("row", row_id)});
  }
}

std::optional<std::string> OptionalJson(const std::optional<google::protobuf::Value>& v) {
  if (!v) return std::nullopt;
  return sql::ToJsonColumn(*v);
}

model::EntityRecord ReadEntity(const pqxx::row& row) {
  model::EntityRecord r;
  r.entity_type = row[0].c_str();
  r.id          = row[1].c_str();
  r.campaign_id = row[2].c_str();
  r.parent_type = row[3].c_str();
  r.parent_id   = row[4].c_str();
  Json(row[5], &r.fields, r.id);
  r.version       = row[6].as<uint64_t>();
  r.updated_at_ms = row[7].as<uint64_t>();
  r.deleted_at_ms = row[8].as<uint64_t>();
  return r;
}

model::VariableRecord ReadVariable(const pqxx::row& row) {
  model::VariableRecord r;
  r.created_seq = row[0].as<uint64_t>();
  r.id          = row[1].c_str();
  r.campaign_id = row[2].c_str();
  r.scope       = row[3].c_str();
  r.scope_id    = row[4].c_str();
  r.key         = row[5].c_str();
  if (!row[6].is_null()) {
    r.value.emplace();
    Json(row[6], &*r.value, r.id);
  }
  if (!row[7].is_null()) {
    r.formula.emplace();
    Json(row[7], &*r.formula, r.id);
  }
  r.is_active     = row[8].as<bool>();
  r.version       = row[9].as<uint64_t>();
  r.deleted_at_ms = row[10].as<uint64_t>();
  return r;
}

model::ConditionRecord ReadCondition(const pqxx::row& row) {
  model::ConditionRecord r;
  r.created_seq = row[0].as<uint64_t>();
  r.id          = row[1].c_str();
  r.campaign_id = row[2].c_str();
  r.entity_type = row[3].c_str();
  r.entity_id   = row[4].c_str();
  r.field       = row[5].c_str();
  Json(row[6], &r.expression, r.id);
  r.priority      = row[7].as<int>();
  r.is_active     = row[8].as<bool>();
  r.version       = row[9].as<uint64_t>();
  r.deleted_at_ms = row[10].as<uint64_t>();
  return r;
}

model::EffectRecord ReadEffect(const pqxx::row& row) {
  model::EffectRecord r;
  r.created_seq = row[0].as<uint64_t>();
  r.id          = row[1].c_str();
  r.campaign_id = row[2].c_str();
  r.entity_type = row[3].c_str();
  r.entity_id   = row[4].c_str();
  r.source_type = row[5].c_str();
  r.source_id   = row[6].c_str();
  Json(row[7], &r.payload, r.id);
  r.timing        = static_cast<rulegraph::v1::EffectTiming>(row[8].as<int>());
  r.priority      = row[9].as<int>();
  r.is_active     = row[10].as<bool>();
  r.version       = row[11].as<uint64_t>();
  r.deleted_at_ms = row[12].as<uint64_t>();
  return r;
}

model::EffectExecutionRecord ReadExecution(const pqxx::row& row) {
  model::EffectExecutionRecord r;
  r.id             = row[0].c_str();
  r.effect_id      = row[1].c_str();
  r.entity_type    = row[2].c_str();
  r.entity_id      = row[3].c_str();
  r.executed_by    = row[4].c_str();
  r.executed_at_ms = row[5].as<uint64_t>();
  Json(row[6], &r.context, r.id);
  r.success = row[7].as<bool>();
  Json(row[8], &r.patch_applied, r.id);
  if (!sql::StringsFromJsonColumn(row[9].c_str(), &r.affected_fields)) {
    RULEGRAPH_LOG_WARN("postgres: malformed affected_fields", {observability::StringField("row", r.id)});
  }
  r.error = row[10].c_str();
  r.state = static_cast<rulegraph::v1::ExecutionState>(row[11].as<int>());
  return r;
}

template <typename Record>
std::vector<Record> ReadAll(const pqxx::result& res, Record (*read)(const pqxx::row&)) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(read(row));
  return out;
}

template <typename Record>
std::optional<Record> ReadFirst(const pqxx::result& res, Record (*read)(const pqxx::row&)) {
  if (res.empty()) return std::nullopt;
  return read(res[0]);
}

std::string Select(const char* cols, const char* rest) {
  return std::string("SELECT ") + cols + " " + rest;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result PgRepository::UpsertEntity(Transaction& t, const model::EntityRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO entities(entity_type,id,campaign_id,parent_type,parent_id,fields,version,updated_at_ms,deleted_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7,$8,$9) "
        "ON CONFLICT(entity_type,id) DO UPDATE SET campaign_id=EXCLUDED.campaign_id, parent_type=EXCLUDED.parent_type, "
        "parent_id=EXCLUDED.parent_id, fields=EXCLUDED.fields, version=EXCLUDED.version, "
        "updated_at_ms=EXCLUDED.updated_at_ms, deleted_at_ms=EXCLUDED.deleted_at_ms;",
        r.entity_type, r.id, r.campaign_id, r.parent_type, r.parent_id, sql::ToJsonColumn(r.fields), r.version, r.updated_at_ms,
        r.deleted_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateEntity(Transaction& t, const model::EntityRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE entities SET campaign_id=$3,parent_type=$4,parent_id=$5,fields=$6::jsonb,version=$7,updated_at_ms=$8,deleted_at_ms=$9 "
        "WHERE entity_type=$1 AND id=$2 AND deleted_at_ms=0 AND version=$10;",
        r.entity_type, r.id, r.campaign_id, r.parent_type, r.parent_id, sql::ToJsonColumn(r.fields), r.version, r.updated_at_ms,
        r.deleted_at_ms, expected_version);
    if (res.affected_rows() > 0) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
  if (!GetEntity(t, r.entity_type, r.id)) return Result::Err(ErrorCode::NotFound, "entity " + r.entity_type + "#" + r.id);
  return Result::Err(ErrorCode::Conflict, "entity " + r.entity_type + "#" + r.id + " version mismatch");
}

std::optional<model::EntityRecord> PgRepository::GetEntity(Transaction& t, const std::string& entity_type, const std::string& id) {
  return ReadFirst(TX(t).Work().exec_prepared("get_entity", entity_type, id), &ReadEntity);
}

std::vector<model::EntityRecord> PgRepository::ListChildren(Transaction& t, const std::string& parent_type, const std::string& parent_id,
                                                            const std::string& child_type) {
  auto res = TX(t).Work().exec_params(
      Select(kEntityCols,
             "FROM entities WHERE parent_type=$1 AND parent_id=$2 AND ($3='' OR entity_type=$3) AND deleted_at_ms=0 "
             "ORDER BY entity_type,id;"),
      parent_type, parent_id, child_type);
  return ReadAll(res, &ReadEntity);
}

// ------------------------------------------------------------------
// State variables
// ------------------------------------------------------------------

Result PgRepository::InsertVariable(Transaction& t, model::VariableRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO state_variables(id,campaign_id,scope,scope_id,key,value,formula,is_active,version,deleted_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7::jsonb,$8,$9,$10) RETURNING seq;",
        r.id, r.campaign_id, r.scope, r.scope_id, r.key, OptionalJson(r.value), OptionalJson(r.formula), r.is_active, r.version,
        r.deleted_at_ms);
    r.created_seq = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateVariable(Transaction& t, const model::VariableRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE state_variables SET campaign_id=$2,scope=$3,scope_id=$4,key=$5,value=$6::jsonb,formula=$7::jsonb,is_active=$8,"
        "version=$9,deleted_at_ms=$10 WHERE id=$1 AND deleted_at_ms=0 AND version=$11;",
        r.id, r.campaign_id, r.scope, r.scope_id, r.key, OptionalJson(r.value), OptionalJson(r.formula), r.is_active, r.version,
        r.deleted_at_ms, expected_version);
    if (res.affected_rows() > 0) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
  if (!GetVariable(t, r.id)) return Result::Err(ErrorCode::NotFound, "variable " + r.id);
  return Result::Err(ErrorCode::Conflict, "variable " + r.id + " version mismatch");
}

std::optional<model::VariableRecord> PgRepository::GetVariable(Transaction& t, const std::string& id) {
  return ReadFirst(TX(t).Work().exec_prepared("get_variable", id), &ReadVariable);
}

std::vector<model::VariableRecord> PgRepository::ListVariablesByScope(Transaction& t, const std::string& scope, const std::string& scope_id) {
  auto res = TX(t).Work().exec_params(
      Select(kVariableCols, "FROM state_variables WHERE scope=$1 AND scope_id=$2 AND deleted_at_ms=0 ORDER BY id;"), scope, scope_id);
  return ReadAll(res, &ReadVariable);
}

std::vector<model::VariableRecord> PgRepository::ListVariablesByCampaign(Transaction& t, const std::string& campaign_id) {
  auto res = TX(t).Work().exec_params(
      Select(kVariableCols, "FROM state_variables WHERE campaign_id=$1 AND deleted_at_ms=0 ORDER BY id;"), campaign_id);
  return ReadAll(res, &ReadVariable);
}

// ------------------------------------------------------------------
// Conditions
// ------------------------------------------------------------------

Result PgRepository::InsertCondition(Transaction& t, model::ConditionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO conditions(id,campaign_id,entity_type,entity_id,field,expression,priority,is_active,version,deleted_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7,$8,$9,$10) RETURNING seq;",
        r.id, r.campaign_id, r.entity_type, r.entity_id, r.field, sql::ToJsonColumn(r.expression), r.priority, r.is_active, r.version,
        r.deleted_at_ms);
    r.created_seq = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateCondition(Transaction& t, const model::ConditionRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE conditions SET campaign_id=$2,entity_type=$3,entity_id=$4,field=$5,expression=$6::jsonb,priority=$7,is_active=$8,"
        "version=$9,deleted_at_ms=$10 WHERE id=$1 AND deleted_at_ms=0 AND version=$11;",
        r.id, r.campaign_id, r.entity_type, r.entity_id, r.field, sql::ToJsonColumn(r.expression), r.priority, r.is_active, r.version,
        r.deleted_at_ms, expected_version);
    if (res.affected_rows() > 0) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
  if (!GetCondition(t, r.id)) return Result::Err(ErrorCode::NotFound, "condition " + r.id);
  return Result::Err(ErrorCode::Conflict, "condition " + r.id + " version mismatch");
}

std::optional<model::ConditionRecord> PgRepository::GetCondition(Transaction& t, const std::string& id) {
  return ReadFirst(TX(t).Work().exec_prepared("get_condition", id), &ReadCondition);
}

std::vector<model::ConditionRecord> PgRepository::ListConditionsByCampaign(Transaction& t, const std::string& campaign_id) {
  auto res = TX(t).Work().exec_params(
      Select(kConditionCols, "FROM conditions WHERE campaign_id=$1 AND deleted_at_ms=0 ORDER BY id;"), campaign_id);
  return ReadAll(res, &ReadCondition);
}

std::vector<model::ConditionRecord> PgRepository::ListConditionsForEntity(Transaction& t, const std::string& campaign_id,
                                                                          const std::string& entity_type, const std::string& entity_id) {
  auto res = TX(t).Work().exec_params(
      Select(kConditionCols,
             "FROM conditions WHERE campaign_id=$1 AND entity_type=$2 AND (entity_id='' OR entity_id=$3) AND deleted_at_ms=0 ORDER BY id;"),
      campaign_id, entity_type, entity_id);
  return ReadAll(res, &ReadCondition);
}

// ------------------------------------------------------------------
// Effects
// ------------------------------------------------------------------

Result PgRepository::InsertEffect(Transaction& t, model::EffectRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO effects(id,campaign_id,entity_type,entity_id,source_type,source_id,payload,timing,priority,is_active,version,"
        "deleted_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8,$9,$10,$11,$12) RETURNING seq;",
        r.id, r.campaign_id, r.entity_type, r.entity_id, r.source_type, r.source_id, sql::ToJsonColumn(r.payload),
        static_cast<int>(r.timing), r.priority, r.is_active, r.version, r.deleted_at_ms);
    r.created_seq = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateEffect(Transaction& t, const model::EffectRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE effects SET campaign_id=$2,entity_type=$3,entity_id=$4,source_type=$5,source_id=$6,payload=$7::jsonb,timing=$8,"
        "priority=$9,is_active=$10,version=$11,deleted_at_ms=$12 WHERE id=$1 AND deleted_at_ms=0 AND version=$13;",
        r.id, r.campaign_id, r.entity_type, r.entity_id, r.source_type, r.source_id, sql::ToJsonColumn(r.payload),
        static_cast<int>(r.timing), r.priority, r.is_active, r.version, r.deleted_at_ms, expected_version);
    if (res.affected_rows() > 0) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
  if (!GetEffect(t, r.id)) return Result::Err(ErrorCode::NotFound, "effect " + r.id);
  return Result::Err(ErrorCode::Conflict, "effect " + r.id + " version mismatch");
}

std::optional<model::EffectRecord> PgRepository::GetEffect(Transaction& t, const std::string& id) {
  return ReadFirst(TX(t).Work().exec_prepared("get_effect", id), &ReadEffect);
}

std::vector<model::EffectRecord> PgRepository::ListEffectsByCampaign(Transaction& t, const std::string& campaign_id) {
  auto res =
      TX(t).Work().exec_params(Select(kEffectCols, "FROM effects WHERE campaign_id=$1 AND deleted_at_ms=0 ORDER BY id;"), campaign_id);
  return ReadAll(res, &ReadEffect);
}

std::vector<model::EffectRecord> PgRepository::ListEffectsForEntity(Transaction& t, const std::string& entity_type, const std::string& entity_id) {
  auto res = TX(t).Work().exec_params(
      Select(kEffectCols, "FROM effects WHERE entity_type=$1 AND entity_id=$2 AND deleted_at_ms=0 ORDER BY id;"), entity_type, entity_id);
  return ReadAll(res, &ReadEffect);
}

// ------------------------------------------------------------------
// Effect executions
// ------------------------------------------------------------------

Result PgRepository::InsertEffectExecution(Transaction& t, const model::EffectExecutionRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO effect_executions(id,effect_id,entity_type,entity_id,executed_by,executed_at_ms,context,success,patch_applied,"
        "affected_fields,error,state) VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8,$9::jsonb,$10::jsonb,$11,$12);",
        r.id, r.effect_id, r.entity_type, r.entity_id, r.executed_by, r.executed_at_ms, sql::ToJsonColumn(r.context), r.success,
        sql::ToJsonColumn(r.patch_applied), sql::StringsToJsonColumn(r.affected_fields), r.error, static_cast<int>(r.state));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EffectExecutionRecord> PgRepository::ListEffectExecutions(Transaction& t, const std::string& effect_id) {
  auto res = TX(t).Work().exec_params(
      Select(kExecutionCols, "FROM effect_executions WHERE effect_id=$1 ORDER BY executed_at_ms,id;"), effect_id);
  return ReadAll(res, &ReadExecution);
}

} // namespace rulegraph::db::postgres
