#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace engram::db::sql {

// One schema step. Versions start at 1 and increase without gaps.
struct Migration {
  int64_t                  version = 0;
  std::string              name;
  std::vector<std::string> statements;
};

// What a backend provides to run migrations against its connection.
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  // Runs every statement or none of them.
  virtual void ExecuteAtomically(const std::vector<std::string>& statements) = 0;

  // Highest version recorded in engram_schema; 0 for a fresh database.
  virtual int64_t AppliedVersion() = 0;
};

/*
  Applies, in order, each migration above AppliedVersion() together with
  its engram_schema row, so a restart resumes after the last completed step.
  A database newer than the binary is util::StorageError.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations);

// Bookkeeping table, created before AppliedVersion() is read.
const std::string& SchemaTableDdl();

const std::vector<Migration>& SqliteSchema();
const std::vector<Migration>& PostgresSchema();

} // namespace engram::db::sql
