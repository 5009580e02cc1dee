#include "sqlite_db.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace engram::db::sqlite {

namespace {

const char* kPragmas[] = {
    "PRAGMA journal_mode=WAL;",
    "PRAGMA synchronous=NORMAL;",
    "PRAGMA foreign_keys=ON;",
    "PRAGMA temp_store=MEMORY;",
};

} // namespace

SqliteDB::SqliteDB(std::string path, uint32_t busy_timeout_ms) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError("open sqlite database " + path_ + ": " + reason);
  }

  for (const char* pragma : kPragmas) Exec(pragma);
  if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_ms)) != SQLITE_OK) {
    throw util::StorageError("set sqlite busy timeout on " + path_ + ": " + sqlite3_errmsg(db_));
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) return;

  std::string reason = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  throw util::StorageError("sqlite " + path_ + ": " + reason);
}

void SqliteDB::ExecuteAtomically(const std::vector<std::string>& statements) {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& statement : statements) Exec(statement);
    Exec("COMMIT;");
  } catch (const util::StorageError& e) {
    if (sqlite3_get_autocommit(db_) == 0) {
      char* err = nullptr;
      if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        ENGRAM_LOG_WARN("sqlite rollback failed", {observability::StringField("error", err ? err : "unknown")});
      }
      sqlite3_free(err);
    }
    throw;
  }
}

int64_t SqliteDB::AppliedVersion() {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COALESCE(MAX(version), 0) FROM engram_schema;", -1, &stmt, nullptr) != SQLITE_OK) {
    throw util::StorageError("read schema version of " + path_ + ": " + sqlite3_errmsg(db_));
  }
  const int     rc      = sqlite3_step(stmt);
  const int64_t version = rc == SQLITE_ROW ? sqlite3_column_int64(stmt, 0) : 0;
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    throw util::StorageError("read schema version of " + path_ + ": " + sqlite3_errmsg(db_));
  }
  return version;
}

void SqliteDB::Bootstrap() {
  sql::RunMigrations(*this, sql::SqliteSchema());
}

} // namespace engram::db::sqlite
