#pragma once

#include <string>
#include <vector>

namespace rulegraph::db::sql {

/*
  Bootstrap DDL per backend.

  seq columns give created_seq (insertion order tie-breaker).
  Struct / Value columns hold protobuf JSON text.
  Live rows have deleted_at_ms = 0.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS entities (entity_type TEXT NOT NULL, id TEXT NOT NULL, campaign_id TEXT NOT NULL, parent_type TEXT NOT NULL DEFAULT '', parent_id TEXT NOT NULL DEFAULT '', fields TEXT NOT NULL, version INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, deleted_at_ms INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (entity_type, id));",
      "CREATE INDEX IF NOT EXISTS entities_parent ON entities(parent_type, parent_id);",
      "CREATE TABLE IF NOT EXISTS state_variables (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, campaign_id TEXT NOT NULL, scope TEXT NOT NULL, scope_id TEXT NOT NULL, key TEXT NOT NULL, value TEXT, formula TEXT, is_active INTEGER NOT NULL, version INTEGER NOT NULL, deleted_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE UNIQUE INDEX IF NOT EXISTS state_variables_live_key ON state_variables(scope, scope_id, key) WHERE deleted_at_ms = 0;",
      "CREATE TABLE IF NOT EXISTS conditions (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, campaign_id TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, field TEXT NOT NULL, expression TEXT NOT NULL, priority INTEGER NOT NULL, is_active INTEGER NOT NULL, version INTEGER NOT NULL, deleted_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS effects (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, campaign_id TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, source_type TEXT NOT NULL, source_id TEXT NOT NULL, payload TEXT NOT NULL, timing INTEGER NOT NULL, priority INTEGER NOT NULL, is_active INTEGER NOT NULL, version INTEGER NOT NULL, deleted_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS effect_executions (id TEXT PRIMARY KEY, effect_id TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, executed_by TEXT NOT NULL, executed_at_ms INTEGER NOT NULL, context TEXT NOT NULL, success INTEGER NOT NULL, patch_applied TEXT NOT NULL, affected_fields TEXT NOT NULL, error TEXT NOT NULL, state INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS effect_executions_effect ON effect_executions(effect_id);"};
  return kSql;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS entities (entity_type TEXT NOT NULL, id TEXT NOT NULL, campaign_id TEXT NOT NULL, parent_type TEXT NOT NULL DEFAULT '', parent_id TEXT NOT NULL DEFAULT '', fields JSONB NOT NULL, version BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, deleted_at_ms BIGINT NOT NULL DEFAULT 0, PRIMARY KEY (entity_type, id));",
      "CREATE INDEX IF NOT EXISTS entities_parent ON entities(parent_type, parent_id);",
      "CREATE TABLE IF NOT EXISTS state_variables (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, campaign_id TEXT NOT NULL, scope TEXT NOT NULL, scope_id TEXT NOT NULL, key TEXT NOT NULL, value JSONB, formula JSONB, is_active BOOLEAN NOT NULL, version BIGINT NOT NULL, deleted_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE UNIQUE INDEX IF NOT EXISTS state_variables_live_key ON state_variables(scope, scope_id, key) WHERE deleted_at_ms = 0;",
      "CREATE TABLE IF NOT EXISTS conditions (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, campaign_id TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, field TEXT NOT NULL, expression JSONB NOT NULL, priority INTEGER NOT NULL, is_active BOOLEAN NOT NULL, version BIGINT NOT NULL, deleted_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS effects (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, campaign_id TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, source_type TEXT NOT NULL, source_id TEXT NOT NULL, payload JSONB NOT NULL, timing SMALLINT NOT NULL, priority INTEGER NOT NULL, is_active BOOLEAN NOT NULL, version BIGINT NOT NULL, deleted_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS effect_executions (id TEXT PRIMARY KEY, effect_id TEXT NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, executed_by TEXT NOT NULL, executed_at_ms BIGINT NOT NULL, context JSONB NOT NULL, success BOOLEAN NOT NULL, patch_applied JSONB NOT NULL, affected_fields JSONB NOT NULL, error TEXT NOT NULL, state SMALLINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS effect_executions_effect ON effect_executions(effect_id);"};
  return kSql;
}

} // namespace rulegraph::db::sql
