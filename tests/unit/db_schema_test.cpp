#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/db/api/db_errors.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

namespace {

using engram::db::ErrorCode;
using engram::db::Result;
using engram::db::sql::Migration;

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

// Records batches and tracks the version the inserted engram_schema rows imply.
class RecordingExecutor final : public engram::db::sql::MigrationExecutor {
 public:
  void ExecuteAtomically(const std::vector<std::string>& statements) override {
    batches.push_back(statements);
    for (const auto& s : statements) {
      const std::string prefix = "INSERT INTO engram_schema (version, name) VALUES (";
      if (s.rfind(prefix, 0) == 0) version = std::stoll(s.substr(prefix.size()));
    }
  }

  int64_t AppliedVersion() override {
    return version;
  }

  std::vector<std::vector<std::string>> batches;
  int64_t                               version = 0;
};

const std::vector<Migration>& TwoSteps() {
  static const std::vector<Migration> kSteps = {
      {1, "first", {"CREATE TABLE a (x INTEGER);"}},
      {2, "second", {"CREATE TABLE b (y INTEGER);", "CREATE INDEX b_y ON b (y);"}},
  };
  return kSteps;
}

void TestMigrationsApplyInOrderOnce() {
  RecordingExecutor executor;
  engram::db::sql::RunMigrations(executor, TwoSteps());

  // schema table, then one batch per step with its bookkeeping row
  assert(executor.batches.size() == 3);
  assert(executor.batches[0].size() == 1 && executor.batches[0][0] == engram::db::sql::SchemaTableDdl());
  assert(executor.batches[1].size() == 2 && executor.batches[1][0] == "CREATE TABLE a (x INTEGER);");
  assert(executor.batches[2].size() == 3 && executor.batches[2][1] == "CREATE INDEX b_y ON b (y);");
  assert(executor.version == 2);

  executor.batches.clear();
  engram::db::sql::RunMigrations(executor, TwoSteps());
  assert(executor.batches.size() == 1);
}

void TestMigrationsResumeAfterPartialUpgrade() {
  RecordingExecutor executor;
  executor.version = 1;
  engram::db::sql::RunMigrations(executor, TwoSteps());

  assert(executor.batches.size() == 2);
  assert(executor.batches[1][0] == "CREATE TABLE b (y INTEGER);");
  assert(executor.version == 2);
}

void TestNewerDatabaseIsRejected() {
  RecordingExecutor executor;
  executor.version = 3;
  assert(Throws<engram::util::StorageError>([&] { engram::db::sql::RunMigrations(executor, TwoSteps()); }));
  assert(executor.batches.size() == 1);
}

void TestBuiltInSchemasAreVersionedWithoutGaps() {
  for (const auto* schema : {&engram::db::sql::SqliteSchema(), &engram::db::sql::PostgresSchema()}) {
    assert(!schema->empty());
    for (size_t i = 0; i < schema->size(); ++i) {
      assert((*schema)[i].version == static_cast<int64_t>(i + 1));
      assert(!(*schema)[i].statements.empty());
    }
  }
  assert(engram::db::sql::SqliteSchema().size() == engram::db::sql::PostgresSchema().size());
}

void TestDbErrorsMapToPublicTaxonomy() {
  engram::db::ThrowIfDbError(Result::Ok(), "noop");

  assert(Throws<engram::util::NotFound>([] { engram::db::ThrowIfDbError(Result::Err(ErrorCode::NotFound), "get"); }));
  assert(Throws<engram::util::AlreadyExists>([] { engram::db::ThrowIfDbError(Result::Err(ErrorCode::AlreadyExists), "insert"); }));
  for (auto code : {ErrorCode::Conflict, ErrorCode::Busy, ErrorCode::SerializationFailure}) {
    assert(Result::Err(code).Retryable());
    assert(Throws<engram::util::Stale>([code] { engram::db::ThrowIfDbError(Result::Err(code), "swap"); }));
  }
  for (auto code : {ErrorCode::ConstraintViolation, ErrorCode::IOError, ErrorCode::Corruption, ErrorCode::InternalError}) {
    assert(!Result::Err(code).Retryable());
    assert(Throws<engram::util::StorageError>([code] { engram::db::ThrowIfDbError(Result::Err(code), "write"); }));
  }

  try {
    engram::db::ThrowIfDbError(Result::Err(ErrorCode::Corruption, "bad page"), "read pointer");
    assert(false);
  } catch (const engram::util::StorageError& e) {
    assert(std::string(e.what()) == "read pointer: corruption (bad page)");
  }
}

} // namespace

int main() {
  TestMigrationsApplyInOrderOnce();
  TestMigrationsResumeAfterPartialUpgrade();
  TestNewerDatabaseIsRejected();
  TestBuiltInSchemasAreVersionedWithoutGaps();
  TestDbErrorsMapToPublicTaxonomy();
  std::cout << "engram_unit_db_schema: pass\n";
  return 0;
}
