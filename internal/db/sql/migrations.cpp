#include "migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace engram::db::sql {

const std::string& SchemaTableDdl() {
  static const std::string kDdl = "CREATE TABLE IF NOT EXISTS engram_schema (version BIGINT PRIMARY KEY, name TEXT NOT NULL);";
  return kDdl;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations) {
  executor.ExecuteAtomically({SchemaTableDdl()});

  const int64_t applied = executor.AppliedVersion();
  const int64_t latest  = migrations.empty() ? 0 : migrations.back().version;
  if (applied > latest) {
    throw util::StorageError("database schema version " + std::to_string(applied) + " is newer than this build (" + std::to_string(latest) +
                             ")");
  }

  for (const auto& m : migrations) {
    if (m.version <= applied) continue;

    auto statements = m.statements;
    // names are fixed identifiers; nothing to escape
    statements.push_back("INSERT INTO engram_schema (version, name) VALUES (" + std::to_string(m.version) + ", '" + m.name + "');");
    executor.ExecuteAtomically(statements);

    ENGRAM_LOG_INFO("schema migration applied",
                    {observability::IntField("version", m.version), observability::StringField("name", m.name)});
  }
}

const std::vector<Migration>& SqliteSchema() {
  static const std::vector<Migration> kSchema = {
      {1,
       "branches_and_entities",
       {
           "CREATE TABLE IF NOT EXISTS branch (name TEXT PRIMARY KEY, agent TEXT NOT NULL, parent TEXT NOT NULL DEFAULT '', created_at_ms "
           "INTEGER NOT NULL);",
           "CREATE TABLE IF NOT EXISTS entity_pointer (branch TEXT NOT NULL REFERENCES branch(name) ON DELETE CASCADE, entity_type TEXT NOT "
           "NULL, entity_id TEXT NOT NULL, content_hash TEXT NOT NULL, version INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY "
           "(branch, entity_type, entity_id));",
           "CREATE TABLE IF NOT EXISTS entity_history (seq INTEGER PRIMARY KEY AUTOINCREMENT, branch TEXT NOT NULL REFERENCES branch(name) ON "
           "DELETE CASCADE, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, version INTEGER NOT NULL, content_hash TEXT NOT NULL, agent "
           "TEXT NOT NULL, recorded_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS entity_history_key ON entity_history (branch, entity_type, entity_id, seq);",
       }},
      {2,
       "sync_state",
       {
           "CREATE TABLE IF NOT EXISTS sync_base (branch TEXT NOT NULL REFERENCES branch(name) ON DELETE CASCADE, entity_type TEXT NOT NULL, "
           "entity_id TEXT NOT NULL, content_hash TEXT NOT NULL, generation INTEGER NOT NULL, PRIMARY KEY (branch, entity_type, entity_id));",
           "CREATE TABLE IF NOT EXISTS sync_conflict (fingerprint TEXT PRIMARY KEY, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, field "
           "TEXT NOT NULL, kind TEXT NOT NULL, strategy TEXT NOT NULL, detail_json TEXT NOT NULL, created_at_ms INTEGER NOT NULL, resolved "
           "INTEGER NOT NULL DEFAULT 0);",
       }},
  };
  return kSchema;
}

const std::vector<Migration>& PostgresSchema() {
  static const std::vector<Migration> kSchema = {
      {1,
       "branches_and_entities",
       {
           "CREATE TABLE IF NOT EXISTS branch (name TEXT PRIMARY KEY, agent TEXT NOT NULL, parent TEXT NOT NULL DEFAULT '', created_at_ms "
           "BIGINT NOT NULL);",
           "CREATE TABLE IF NOT EXISTS entity_pointer (branch TEXT NOT NULL REFERENCES branch(name) ON DELETE CASCADE, entity_type TEXT NOT "
           "NULL, entity_id TEXT NOT NULL, content_hash TEXT NOT NULL, version BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, PRIMARY KEY "
           "(branch, entity_type, entity_id));",
           "CREATE TABLE IF NOT EXISTS entity_history (seq BIGSERIAL PRIMARY KEY, branch TEXT NOT NULL REFERENCES branch(name) ON DELETE "
           "CASCADE, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, version BIGINT NOT NULL, content_hash TEXT NOT NULL, agent TEXT NOT "
           "NULL, recorded_at_ms BIGINT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS entity_history_key ON entity_history (branch, entity_type, entity_id, seq);",
       }},
      {2,
       "sync_state",
       {
           "CREATE TABLE IF NOT EXISTS sync_base (branch TEXT NOT NULL REFERENCES branch(name) ON DELETE CASCADE, entity_type TEXT NOT NULL, "
           "entity_id TEXT NOT NULL, content_hash TEXT NOT NULL, generation BIGINT NOT NULL, PRIMARY KEY (branch, entity_type, entity_id));",
           "CREATE TABLE IF NOT EXISTS sync_conflict (fingerprint TEXT PRIMARY KEY, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, field "
           "TEXT NOT NULL, kind TEXT NOT NULL, strategy TEXT NOT NULL, detail_json TEXT NOT NULL, created_at_ms BIGINT NOT NULL, resolved "
           "BOOLEAN NOT NULL DEFAULT FALSE);",
       }},
  };
  return kSchema;
}

} // namespace engram::db::sql
