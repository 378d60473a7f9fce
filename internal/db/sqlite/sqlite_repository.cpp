#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <functional>

#include "internal/db/sql/json_columns.hpp"
#include "internal/observability/logging.hpp"

namespace rulegraph::db::sqlite {

using rulegraph::db::ErrorCode;
using rulegraph::db::Result;

namespace {

constexpr const char* kEntityCols    = "entity_type,id,campaign_id,parent_type,parent_id,fields,version,updated_at_ms,deleted_at_ms";
constexpr const char* kVariableCols  = "seq,id,campaign_id,scope,scope_id,key,value,formula,is_active,version,deleted_at_ms";
constexpr const char* kConditionCols = "seq,id,campaign_id,entity_type,entity_id,field,expression,priority,is_active,version,deleted_at_ms";
constexpr const char* kEffectCols =
    "seq,id,campaign_id,entity_type,entity_id,source_type,source_id,payload,timing,priority,is_active,version,deleted_at_ms";
constexpr const char* kExecutionCols =
    "id,effect_id,entity_type,entity_id,executed_by,executed_at_ms,context,success,patch_applied,affected_fields,error,state";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

bool ColNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

template <typename Message>
void ColJson(sqlite3_stmt* st, int col, Message* out, const std::string& row_id) {
  if (!sql::FromJsonColumn(ColText(st, col), out)) {
    RULEGRAPH_LOG_WARN("sqlite: malformed JSON column", {observability::StringField("row", row_id), observability::IntField("column", col)});
  }
}

model::EntityRecord ReadEntity(sqlite3_stmt* st) {
  model::EntityRecord r;
  r.entity_type = ColText(st, 0);
  r.id          = ColText(st, 1);
  r.campaign_id = ColText(st, 2);
  r.parent_type = ColText(st, 3);
  r.parent_id   = ColText(st, 4);
  ColJson(st, 5, &r.fields, r.id);
  r.version       = ColU64(st, 6);
  r.updated_at_ms = ColU64(st, 7);
  r.deleted_at_ms = ColU64(st, 8);
  return r;
}

model::VariableRecord ReadVariable(sqlite3_stmt* st) {
  model::VariableRecord r;
  r.created_seq = ColU64(st, 0);
  r.id          = ColText(st, 1);
  r.campaign_id = ColText(st, 2);
  r.scope       = ColText(st, 3);
  r.scope_id    = ColText(st, 4);
  r.key         = ColText(st, 5);
  if (!ColNull(st, 6)) {
    r.value.emplace();
    ColJson(st, 6, &*r.value, r.id);
  }
  if (!ColNull(st, 7)) {
    r.formula.emplace();
    ColJson(st, 7, &*r.formula, r.id);
  }
  r.is_active     = ColI32(st, 8) != 0;
  r.version       = ColU64(st, 9);
  r.deleted_at_ms = ColU64(st, 10);
  return r;
}

model::ConditionRecord ReadCondition(sqlite3_stmt* st) {
  model::ConditionRecord r;
  r.created_seq = ColU64(st, 0);
  r.id          = ColText(st, 1);
  r.campaign_id = ColText(st, 2);
  r.entity_type = ColText(st, 3);
  r.entity_id   = ColText(st, 4);
  r.field       = ColText(st, 5);
  ColJson(st, 6, &r.expression, r.id);
  r.priority      = ColI32(st, 7);
  r.is_active     = ColI32(st, 8) != 0;
  r.version       = ColU64(st, 9);
  r.deleted_at_ms = ColU64(st, 10);
  return r;
}

model::EffectRecord ReadEffect(sqlite3_stmt* st) {
  model::EffectRecord r;
  r.created_seq = ColU64(st, 0);
  r.id          = ColText(st, 1);
  r.campaign_id = ColText(st, 2);
  r.entity_type = ColText(st, 3);
  r.entity_id   = ColText(st, 4);
  r.source_type = ColText(st, 5);
  r.source_id   = ColText(st, 6);
  ColJson(st, 7, &r.payload, r.id);
  r.timing        = static_cast<rulegraph::v1::EffectTiming>(ColI32(st, 8));
  r.priority      = ColI32(st, 9);
  r.is_active     = ColI32(st, 10) != 0;
  r.version       = ColU64(st, 11);
  r.deleted_at_ms = ColU64(st, 12);
  return r;
}

model::EffectExecutionRecord ReadExecution(sqlite3_stmt* st) {
  model::EffectExecutionRecord r;
  r.id             = ColText(st, 0);
  r.effect_id      = ColText(st, 1);
  r.entity_type    = ColText(st, 2);
  r.entity_id      = ColText(st, 3);
  r.executed_by    = ColText(st, 4);
  r.executed_at_ms = ColU64(st, 5);
  ColJson(st, 6, &r.context, r.id);
  r.success = ColI32(st, 7) != 0;
  ColJson(st, 8, &r.patch_applied, r.id);
  if (!sql::StringsFromJsonColumn(ColText(st, 9), &r.affected_fields)) {
    RULEGRAPH_LOG_WARN("sqlite: malformed affected_fields", {observability::StringField("row", r.id)});
  }
  r.error = ColText(st, 10);
  r.state = static_cast<rulegraph::v1::ExecutionState>(ColI32(st, 11));
  return r;
}

// Runs a SELECT and reads every row.
template <typename Record>
std::vector<Record> Query(sqlite3* db, const std::string& sql, const std::function<void(sqlite3_stmt*)>& bind,
                          Record (*read)(sqlite3_stmt*)) {
  std::vector<Record> out;
  sqlite3_stmt*       st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    RULEGRAPH_LOG_ERROR("sqlite prepare failed", {observability::StringField("error", sqlite3_errmsg(db))});
    return out;
  }
  bind(st);
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  sqlite3_finalize(st);
  return out;
}

template <typename Record>
std::optional<Record> QueryOne(sqlite3* db, const std::string& sql, const std::function<void(sqlite3_stmt*)>& bind,
                               Record (*read)(sqlite3_stmt*)) {
  auto rows = Query(db, sql, bind, read);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::MissedUpdate(sqlite3* db, const char* table, const std::string& id) {
  const std::string sql = std::string("SELECT 1 FROM ") + table + " WHERE id=? AND deleted_at_ms=0;";
  sqlite3_stmt*     st  = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st, 1, id);
  const bool exists = sqlite3_step(st) == SQLITE_ROW;
  sqlite3_finalize(st);
  if (!exists) return Result::Err(ErrorCode::NotFound, std::string(table) + " " + id);
  return Result::Err(ErrorCode::Conflict, std::string(table) + " " + id + " version mismatch");
}

static Result InsertResult(Result r) {
  if (r.code == ErrorCode::ConstraintViolation) r.code = ErrorCode::AlreadyExists;
  return r;
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result SqliteRepository::UpsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO entities(entity_type,id,campaign_id,parent_type,parent_id,fields,version,updated_at_ms,deleted_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(entity_type,id) DO UPDATE SET campaign_id=excluded.campaign_id, parent_type=excluded.parent_type, "
      "parent_id=excluded.parent_id, fields=excluded.fields, version=excluded.version, "
      "updated_at_ms=excluded.updated_at_ms, deleted_at_ms=excluded.deleted_at_ms;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.entity_type);
  BindText(st, 2, r.id);
  BindText(st, 3, r.campaign_id);
  BindText(st, 4, r.parent_type);
  BindText(st, 5, r.parent_id);
  BindText(st, 6, sql::ToJsonColumn(r.fields));
  BindU64(st, 7, r.version);
  BindU64(st, 8, r.updated_at_ms);
  BindU64(st, 9, r.deleted_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  return Translate(db, rc);
}

Result SqliteRepository::UpdateEntity(Transaction& t, const model::EntityRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE entities SET campaign_id=?,parent_type=?,parent_id=?,fields=?,version=?,updated_at_ms=?,deleted_at_ms=? "
      "WHERE entity_type=? AND id=? AND deleted_at_ms=0 AND version=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.campaign_id);
  BindText(st, 2, r.parent_type);
  BindText(st, 3, r.parent_id);
  BindText(st, 4, sql::ToJsonColumn(r.fields));
  BindU64(st, 5, r.version);
  BindU64(st, 6, r.updated_at_ms);
  BindU64(st, 7, r.deleted_at_ms);
  BindText(st, 8, r.entity_type);
  BindText(st, 9, r.id);
  BindU64(st, 10, expected_version);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (auto res = Translate(db, rc); !res) return res;
  if (sqlite3_changes(db) > 0) return Result::Ok();

  if (!GetEntity(t, r.entity_type, r.id)) return Result::Err(ErrorCode::NotFound, "entity " + r.entity_type + "#" + r.id);
  return Result::Err(ErrorCode::Conflict, "entity " + r.entity_type + "#" + r.id + " version mismatch");
}

std::optional<model::EntityRecord> SqliteRepository::GetEntity(Transaction& t, const std::string& entity_type, const std::string& id) {
  return QueryOne(
      TX(t).Handle(), std::string("SELECT ") + kEntityCols + " FROM entities WHERE entity_type=? AND id=? AND deleted_at_ms=0;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, entity_type);
        BindText(st, 2, id);
      },
      &ReadEntity);
}

std::vector<model::EntityRecord> SqliteRepository::ListChildren(Transaction& t, const std::string& parent_type, const std::string& parent_id,
                                                                const std::string& child_type) {
  return Query(
      TX(t).Handle(),
      std::string("SELECT ") + kEntityCols +
          " FROM entities WHERE parent_type=? AND parent_id=? AND (?='' OR entity_type=?) AND deleted_at_ms=0 ORDER BY entity_type,id;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, parent_type);
        BindText(st, 2, parent_id);
        BindText(st, 3, child_type);
        BindText(st, 4, child_type);
      },
      &ReadEntity);
}

// ------------------------------------------------------------------
// State variables
// ------------------------------------------------------------------

static void BindOptionalJson(sqlite3_stmt* st, int idx, const std::optional<google::protobuf::Value>& v) {
  if (v) {
    BindText(st, idx, sql::ToJsonColumn(*v));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

Result SqliteRepository::InsertVariable(Transaction& t, model::VariableRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO state_variables(id,campaign_id,scope,scope_id,key,value,formula,is_active,version,deleted_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.id);
  BindText(st, 2, r.campaign_id);
  BindText(st, 3, r.scope);
  BindText(st, 4, r.scope_id);
  BindText(st, 5, r.key);
  BindOptionalJson(st, 6, r.value);
  BindOptionalJson(st, 7, r.formula);
  BindI32(st, 8, r.is_active ? 1 : 0);
  BindU64(st, 9, r.version);
  BindU64(st, 10, r.deleted_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  auto res = InsertResult(Translate(db, rc));
  if (res) r.created_seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return res;
}

Result SqliteRepository::UpdateVariable(Transaction& t, const model::VariableRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE state_variables SET campaign_id=?,scope=?,scope_id=?,key=?,value=?,formula=?,is_active=?,version=?,deleted_at_ms=? "
      "WHERE id=? AND deleted_at_ms=0 AND version=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.campaign_id);
  BindText(st, 2, r.scope);
  BindText(st, 3, r.scope_id);
  BindText(st, 4, r.key);
  BindOptionalJson(st, 5, r.value);
  BindOptionalJson(st, 6, r.formula);
  BindI32(st, 7, r.is_active ? 1 : 0);
  BindU64(st, 8, r.version);
  BindU64(st, 9, r.deleted_at_ms);
  BindText(st, 10, r.id);
  BindU64(st, 11, expected_version);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (auto res = Translate(db, rc); !res) return res;
  if (sqlite3_changes(db) > 0) return Result::Ok();
  return MissedUpdate(db, "state_variables", r.id);
}

std::optional<model::VariableRecord> SqliteRepository::GetVariable(Transaction& t, const std::string& id) {
  return QueryOne(
      TX(t).Handle(), std::string("SELECT ") + kVariableCols + " FROM state_variables WHERE id=? AND deleted_at_ms=0;",
      [&](sqlite3_stmt* st) { BindText(st, 1, id); }, &ReadVariable);
}

std::vector<model::VariableRecord> SqliteRepository::ListVariablesByScope(Transaction& t, const std::string& scope, const std::string& scope_id) {
  return Query(
      TX(t).Handle(),
      std::string("SELECT ") + kVariableCols + " FROM state_variables WHERE scope=? AND scope_id=? AND deleted_at_ms=0 ORDER BY id;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, scope);
        BindText(st, 2, scope_id);
      },
      &ReadVariable);
}

std::vector<model::VariableRecord> SqliteRepository::ListVariablesByCampaign(Transaction& t, const std::string& campaign_id) {
  return Query(
      TX(t).Handle(), std::string("SELECT ") + kVariableCols + " FROM state_variables WHERE campaign_id=? AND deleted_at_ms=0 ORDER BY id;",
      [&](sqlite3_stmt* st) { BindText(st, 1, campaign_id); }, &ReadVariable);
}

// ------------------------------------------------------------------
// Conditions
// ------------------------------------------------------------------

Result SqliteRepository::InsertCondition(Transaction& t, model::ConditionRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO conditions(id,campaign_id,entity_type,entity_id,field,expression,priority,is_active,version,deleted_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.id);
  BindText(st, 2, r.campaign_id);
  BindText(st, 3, r.entity_type);
  BindText(st, 4, r.entity_id);
  BindText(st, 5, r.field);
  BindText(st, 6, sql::ToJsonColumn(r.expression));
  BindI32(st, 7, r.priority);
  BindI32(st, 8, r.is_active ? 1 : 0);
  BindU64(st, 9, r.version);
  BindU64(st, 10, r.deleted_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  auto res = InsertResult(Translate(db, rc));
  if (res) r.created_seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return res;
}

Result SqliteRepository::UpdateCondition(Transaction& t, const model::ConditionRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE conditions SET campaign_id=?,entity_type=?,entity_id=?,field=?,expression=?,priority=?,is_active=?,version=?,deleted_at_ms=? "
      "WHERE id=? AND deleted_at_ms=0 AND version=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.campaign_id);
  BindText(st, 2, r.entity_type);
  BindText(st, 3, r.entity_id);
  BindText(st, 4, r.field);
  BindText(st, 5, sql::ToJsonColumn(r.expression));
  BindI32(st, 6, r.priority);
  BindI32(st, 7, r.is_active ? 1 : 0);
  BindU64(st, 8, r.version);
  BindU64(st, 9, r.deleted_at_ms);
  BindText(st, 10, r.id);
  BindU64(st, 11, expected_version);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (auto res = Translate(db, rc); !res) return res;
  if (sqlite3_changes(db) > 0) return Result::Ok();
  return MissedUpdate(db, "conditions", r.id);
}

std::optional<model::ConditionRecord> SqliteRepository::GetCondition(Transaction& t, const std::string& id) {
  return QueryOne(
      TX(t).Handle(), std::string("SELECT ") + kConditionCols + " FROM conditions WHERE id=? AND deleted_at_ms=0;",
      [&](sqlite3_stmt* st) { BindText(st, 1, id); }, &ReadCondition);
}

std::vector<model::ConditionRecord> SqliteRepository::ListConditionsByCampaign(Transaction& t, const std::string& campaign_id) {
  return Query(
      TX(t).Handle(), std::string("SELECT ") + kConditionCols + " FROM conditions WHERE campaign_id=? AND deleted_at_ms=0 ORDER BY id;",
      [&](sqlite3_stmt* st) { BindText(st, 1, campaign_id); }, &ReadCondition);
}

std::vector<model::ConditionRecord> SqliteRepository::ListConditionsForEntity(Transaction& t, const std::string& campaign_id,
                                                                              const std::string& entity_type, const std::string& entity_id) {
  return Query(
      TX(t).Handle(),
      std::string("SELECT ") + kConditionCols +
          " FROM conditions WHERE campaign_id=? AND entity_type=? AND (entity_id='' OR entity_id=?) AND deleted_at_ms=0 ORDER BY id;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, campaign_id);
        BindText(st, 2, entity_type);
        BindText(st, 3, entity_id);
      },
      &ReadCondition);
}

// ------------------------------------------------------------------
// Effects
// ------------------------------------------------------------------

Result SqliteRepository::InsertEffect(Transaction& t, model::EffectRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO effects(id,campaign_id,entity_type,entity_id,source_type,source_id,payload,timing,priority,is_active,version,deleted_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.id);
  BindText(st, 2, r.campaign_id);
  BindText(st, 3, r.entity_type);
  BindText(st, 4, r.entity_id);
  BindText(st, 5, r.source_type);
  BindText(st, 6, r.source_id);
  BindText(st, 7, sql::ToJsonColumn(r.payload));
  BindI32(st, 8, static_cast<int>(r.timing));
  BindI32(st, 9, r.priority);
  BindI32(st, 10, r.is_active ? 1 : 0);
  BindU64(st, 11, r.version);
  BindU64(st, 12, r.deleted_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  auto res = InsertResult(Translate(db, rc));
  if (res) r.created_seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return res;
}

Result SqliteRepository::UpdateEffect(Transaction& t, const model::EffectRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE effects SET campaign_id=?,entity_type=?,entity_id=?,source_type=?,source_id=?,payload=?,timing=?,priority=?,"
      "is_active=?,version=?,deleted_at_ms=? WHERE id=? AND deleted_at_ms=0 AND version=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.campaign_id);
  BindText(st, 2, r.entity_type);
  BindText(st, 3, r.entity_id);
  BindText(st, 4, r.source_type);
  BindText(st, 5, r.source_id);
  BindText(st, 6, sql::ToJsonColumn(r.payload));
  BindI32(st, 7, static_cast<int>(r.timing));
  BindI32(st, 8, r.priority);
  BindI32(st, 9, r.is_active ? 1 : 0);
  BindU64(st, 10, r.version);
  BindU64(st, 11, r.deleted_at_ms);
  BindText(st, 12, r.id);
  BindU64(st, 13, expected_version);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (auto res = Translate(db, rc); !res) return res;
  if (sqlite3_changes(db) > 0) return Result::Ok();
  return MissedUpdate(db, "effects", r.id);
}

std::optional<model::EffectRecord> SqliteRepository::GetEffect(Transaction& t, const std::string& id) {
  return QueryOne(
      TX(t).Handle(), std::string("SELECT ") + kEffectCols + " FROM effects WHERE id=? AND deleted_at_ms=0;",
      [&](sqlite3_stmt* st) { BindText(st, 1, id); }, &ReadEffect);
}

std::vector<model::EffectRecord> SqliteRepository::ListEffectsByCampaign(Transaction& t, const std::string& campaign_id) {
  return Query(
      TX(t).Handle(), std::string("SELECT ") + kEffectCols + " FROM effects WHERE campaign_id=? AND deleted_at_ms=0 ORDER BY id;",
      [&](sqlite3_stmt* st) { BindText(st, 1, campaign_id); }, &ReadEffect);
}

std::vector<model::EffectRecord> SqliteRepository::ListEffectsForEntity(Transaction& t, const std::string& entity_type, const std::string& entity_id) {
  return Query(
      TX(t).Handle(),
      std::string("SELECT ") + kEffectCols + " FROM effects WHERE entity_type=? AND entity_id=? AND deleted_at_ms=0 ORDER BY id;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, entity_type);
        BindText(st, 2, entity_id);
      },
      &ReadEffect);
}

// ------------------------------------------------------------------
// Effect executions
// ------------------------------------------------------------------

Result SqliteRepository::InsertEffectExecution(Transaction& t, const model::EffectExecutionRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO effect_executions(id,effect_id,entity_type,entity_id,executed_by,executed_at_ms,context,success,patch_applied,"
      "affected_fields,error,state) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.id);
  BindText(st, 2, r.effect_id);
  BindText(st, 3, r.entity_type);
  BindText(st, 4, r.entity_id);
  BindText(st, 5, r.executed_by);
  BindU64(st, 6, r.executed_at_ms);
  BindText(st, 7, sql::ToJsonColumn(r.context));
  BindI32(st, 8, r.success ? 1 : 0);
  BindText(st, 9, sql::ToJsonColumn(r.patch_applied));
  BindText(st, 10, sql::StringsToJsonColumn(r.affected_fields));
  BindText(st, 11, r.error);
  BindI32(st, 12, static_cast<int>(r.state));

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  return InsertResult(Translate(db, rc));
}

std::vector<model::EffectExecutionRecord> SqliteRepository::ListEffectExecutions(Transaction& t, const std::string& effect_id) {
  return Query(
      TX(t).Handle(), std::string("SELECT ") + kExecutionCols + " FROM effect_executions WHERE effect_id=? ORDER BY executed_at_ms,id;",
      [&](sqlite3_stmt* st) { BindText(st, 1, effect_id); }, &ReadExecution);
}

} // namespace rulegraph::db::sqlite
