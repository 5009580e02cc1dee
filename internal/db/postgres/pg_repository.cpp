#include "pg_repository.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace engram::db::postgres {

namespace {

class WorkMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit WorkMigrationExecutor(pqxx::work& work) : work_(work) {
  }

  // The bootstrap work is already one transaction.
  void ExecuteAtomically(const std::vector<std::string>& statements) override {
    for (const auto& statement : statements) work_.exec(statement);
  }

  int64_t AppliedVersion() override {
    return work_.exec("SELECT COALESCE(MAX(version), 0) FROM engram_schema;")[0][0].as<int64_t>();
  }

 private:
  pqxx::work& work_;
};

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

model::BranchRecord ReadBranch(const pqxx::row& row) {
  model::BranchRecord r;
  r.name          = row[0].c_str();
  r.agent         = row[1].c_str();
  r.parent        = row[2].c_str();
  r.created_at_ms = row[3].as<uint64_t>();
  return r;
}

model::PointerRecord ReadPointer(const pqxx::row& row) {
  model::PointerRecord r;
  r.branch        = row[0].c_str();
  r.entity_type   = row[1].c_str();
  r.entity_id     = row[2].c_str();
  r.content_hash  = row[3].c_str();
  r.version       = row[4].as<uint64_t>();
  r.updated_at_ms = row[5].as<uint64_t>();
  return r;
}

model::ConflictRecord ReadConflict(const pqxx::row& row) {
  model::ConflictRecord r;
  r.fingerprint   = row[0].c_str();
  r.entity_type   = row[1].c_str();
  r.entity_id     = row[2].c_str();
  r.field         = row[3].c_str();
  r.kind          = row[4].c_str();
  r.strategy      = row[5].c_str();
  r.detail_json   = row[6].c_str();
  r.created_at_ms = row[7].as<uint64_t>();
  r.resolved      = row[8].as<bool>();
  return r;
}

constexpr const char* kConflictSelect =
    "SELECT fingerprint,entity_type,entity_id,field,kind,strategy,detail_json,created_at_ms,resolved FROM sync_conflict ";

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::Bootstrap() {
  PgTransaction         tx(pool_);
  WorkMigrationExecutor executor(tx.Work());
  sql::RunMigrations(executor, sql::PostgresSchema());
  tx.Commit();
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
// Branches
// ------------------------------------------------------------------

Result PgRepository::InsertBranch(Transaction& t, const model::BranchRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO branch(name,agent,parent,created_at_ms) VALUES($1,$2,$3,$4);", r.name, r.agent, r.parent,
                             r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BranchRecord> PgRepository::GetBranch(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_params("SELECT name,agent,parent,created_at_ms FROM branch WHERE name=$1;", name);
  if (res.empty()) return std::nullopt;
  return ReadBranch(res[0]);
}

std::vector<model::BranchRecord> PgRepository::ListBranches(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT name,agent,parent,created_at_ms FROM branch ORDER BY name;");

  std::vector<model::BranchRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadBranch(row));
  return out;
}

Result PgRepository::DeleteBranch(Transaction& t, const std::string& name) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM branch WHERE name=$1;", name);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "branch " + name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CopyBranchState(Transaction& t, const std::string& from, const std::string& to) {
  try {
    auto& w = TX(t).Work();
    w.exec_params(
        "INSERT INTO entity_pointer(branch,entity_type,entity_id,content_hash,version,updated_at_ms) "
        "SELECT $1,entity_type,entity_id,content_hash,version,updated_at_ms FROM entity_pointer WHERE branch=$2;",
        to, from);
    w.exec_params(
        "INSERT INTO entity_history(branch,entity_type,entity_id,version,content_hash,agent,recorded_at_ms) "
        "SELECT $1,entity_type,entity_id,version,content_hash,agent,recorded_at_ms FROM entity_history WHERE branch=$2 ORDER BY seq;",
        to, from);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Pointers
// ------------------------------------------------------------------

std::optional<model::PointerRecord> PgRepository::GetPointer(Transaction& t, const std::string& branch, const std::string& entity_type,
                                                             const std::string& entity_id) {
  auto res = TX(t).Work().exec_prepared("get_pointer", branch, entity_type, entity_id);
  if (res.empty()) return std::nullopt;
  return ReadPointer(res[0]);
}

std::vector<model::PointerRecord> PgRepository::ListPointers(Transaction& t, const std::string& branch, const std::string& entity_type) {
  auto res = TX(t).Work().exec_params(
      "SELECT branch,entity_type,entity_id,content_hash,version,updated_at_ms FROM entity_pointer "
      "WHERE branch=$1 AND ($2='' OR entity_type=$2) ORDER BY entity_type COLLATE \"C\", entity_id COLLATE \"C\";",
      branch, entity_type);

  std::vector<model::PointerRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadPointer(row));
  return out;
}

Result PgRepository::CompareAndSwapPointer(Transaction& t, const model::PointerRecord& next, const std::optional<std::string>& expected_hash) {
  try {
    auto&         w   = TX(t).Work();
    pqxx::result  res = expected_hash
                            ? w.exec_prepared("swap_pointer", next.branch, next.entity_type, next.entity_id, next.content_hash, next.updated_at_ms,
                                              *expected_hash)
                            : w.exec_prepared("insert_pointer", next.branch, next.entity_type, next.entity_id, next.content_hash, next.updated_at_ms);
    if (res.affected_rows() != 1) {
      return Result::Err(ErrorCode::Conflict, next.entity_type + "/" + next.entity_id + " on " + next.branch);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result PgRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
  try {
    TX(t).Work().exec_prepared("append_history", r.branch, r.entity_type, r.entity_id, r.version, r.content_hash, r.agent,
                               r.recorded_at_ms == 0 ? NowMs() : r.recorded_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::HistoryRecord> PgRepository::ListHistory(Transaction& t, const std::string& branch, const std::string& entity_type,
                                                            const std::string& entity_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT branch,entity_type,entity_id,version,content_hash,agent,recorded_at_ms FROM entity_history "
      "WHERE branch=$1 AND entity_type=$2 AND entity_id=$3 ORDER BY seq;",
      branch, entity_type, entity_id);

  std::vector<model::HistoryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::HistoryRecord r;
    r.branch         = row[0].c_str();
    r.entity_type    = row[1].c_str();
    r.entity_id      = row[2].c_str();
    r.version        = row[3].as<uint64_t>();
    r.content_hash   = row[4].c_str();
    r.agent          = row[5].c_str();
    r.recorded_at_ms = row[6].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Sync bases
// ------------------------------------------------------------------

Result PgRepository::UpsertSyncBase(Transaction& t, const model::SyncBaseRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO sync_base(branch,entity_type,entity_id,content_hash,generation) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(branch,entity_type,entity_id) DO UPDATE SET content_hash=EXCLUDED.content_hash, generation=EXCLUDED.generation;",
        r.branch, r.entity_type, r.entity_id, r.content_hash, r.generation);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SyncBaseRecord> PgRepository::ListSyncBases(Transaction& t, const std::string& branch) {
  auto res = TX(t).Work().exec_params(
      "SELECT branch,entity_type,entity_id,content_hash,generation FROM sync_base WHERE branch=$1 "
      "ORDER BY entity_type COLLATE \"C\", entity_id COLLATE \"C\";",
      branch);

  std::vector<model::SyncBaseRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::SyncBaseRecord r;
    r.branch       = row[0].c_str();
    r.entity_type  = row[1].c_str();
    r.entity_id    = row[2].c_str();
    r.content_hash = row[3].c_str();
    r.generation   = row[4].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

uint64_t PgRepository::MaxSyncGeneration(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT COALESCE(MAX(generation),0) FROM sync_base;");
  return res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------------

Result PgRepository::InsertConflict(Transaction& t, const model::ConflictRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO sync_conflict(fingerprint,entity_type,entity_id,field,kind,strategy,detail_json,created_at_ms,resolved) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) ON CONFLICT(fingerprint) DO NOTHING;",
        r.fingerprint, r.entity_type, r.entity_id, r.field, r.kind, r.strategy, r.detail_json, r.created_at_ms == 0 ? NowMs() : r.created_at_ms,
        r.resolved);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "conflict " + r.fingerprint);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ConflictRecord> PgRepository::GetConflict(Transaction& t, const std::string& fingerprint) {
  auto res = TX(t).Work().exec_params(std::string(kConflictSelect) + "WHERE fingerprint=$1;", fingerprint);
  if (res.empty()) return std::nullopt;
  return ReadConflict(res[0]);
}

std::vector<model::ConflictRecord> PgRepository::ListConflicts(Transaction& t, bool open_only) {
  auto res = TX(t).Work().exec_params(std::string(kConflictSelect) + "WHERE ($1 = FALSE OR resolved = FALSE) ORDER BY created_at_ms, fingerprint COLLATE \"C\";",
                                      open_only);

  std::vector<model::ConflictRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadConflict(row));
  return out;
}

Result PgRepository::ResolveConflicts(Transaction& t, const std::string& entity_type, const std::string& entity_id) {
  try {
    TX(t).Work().exec_params("UPDATE sync_conflict SET resolved=TRUE WHERE entity_type=$1 AND entity_id=$2;", entity_type, entity_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace engram::db::postgres
