#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace engram::db::sqlite {

/*
  Owns the one sqlite3 connection of an engram database file.

  Opened in serialized mode with WAL and foreign keys on (branch deletion
  cascades to pointers, history and sync bases). SqliteTransaction issues
  BEGIN IMMEDIATE under TransactionMutex(), so writers queue instead of
  failing mid-transaction. Failures are util::StorageError.
*/
class SqliteDB : public sql::MigrationExecutor {
 public:
  static constexpr uint32_t kDefaultBusyTimeoutMs = 5000;

  explicit SqliteDB(std::string path, uint32_t busy_timeout_ms = kDefaultBusyTimeoutMs);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // One or more statements without results.
  void Exec(const std::string& sql);

  // Applies pending schema migrations.
  void Bootstrap();

  void    ExecuteAtomically(const std::vector<std::string>& statements) override;
  int64_t AppliedVersion() override;

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace engram::db::sqlite
