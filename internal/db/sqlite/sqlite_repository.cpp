#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <chrono>

#include "internal/util/errors.hpp"

namespace engram::db::sqlite {

using engram::db::ErrorCode;
using engram::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(st, sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

model::PointerRecord ReadPointer(sqlite3_stmt* st) {
  model::PointerRecord r;
  r.branch        = ColText(st, 0);
  r.entity_type   = ColText(st, 1);
  r.entity_id     = ColText(st, 2);
  r.content_hash  = ColText(st, 3);
  r.version       = ColU64(st, 4);
  r.updated_at_ms = ColU64(st, 5);
  return r;
}

model::ConflictRecord ReadConflict(sqlite3_stmt* st) {
  model::ConflictRecord r;
  r.fingerprint   = ColText(st, 0);
  r.entity_type   = ColText(st, 1);
  r.entity_id     = ColText(st, 2);
  r.field         = ColText(st, 3);
  r.kind          = ColText(st, 4);
  r.strategy      = ColText(st, 5);
  r.detail_json   = ColText(st, 6);
  r.created_at_ms = ColU64(st, 7);
  r.resolved      = sqlite3_column_int(st, 8) != 0;
  return r;
}

constexpr const char* kPointerColumns = "branch,entity_type,entity_id,content_hash,version,updated_at_ms";

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

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Branches
// ------------------------------------------------------------------

Result SqliteRepository::InsertBranch(Transaction& t, const model::BranchRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO branch(name,agent,parent,created_at_ms) VALUES(?,?,?,?);");

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.agent);
  BindText(st.get(), 3, r.parent);
  BindU64(st.get(), 4, r.created_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "branch " + r.name);
  return Translate(db, rc);
}

std::optional<model::BranchRecord> SqliteRepository::GetBranch(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT name,agent,parent,created_at_ms FROM branch WHERE name=?;");
  BindText(st.get(), 1, name);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::BranchRecord r;
  r.name          = ColText(st.get(), 0);
  r.agent         = ColText(st.get(), 1);
  r.parent        = ColText(st.get(), 2);
  r.created_at_ms = ColU64(st.get(), 3);
  return r;
}

std::vector<model::BranchRecord> SqliteRepository::ListBranches(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT name,agent,parent,created_at_ms FROM branch ORDER BY name;");

  std::vector<model::BranchRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::BranchRecord r;
    r.name          = ColText(st.get(), 0);
    r.agent         = ColText(st.get(), 1);
    r.parent        = ColText(st.get(), 2);
    r.created_at_ms = ColU64(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::DeleteBranch(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM branch WHERE name=?;");
  BindText(st.get(), 1, name);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  // pointers, history and bases cascade
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "branch " + name);
  return Result::Ok();
}

Result SqliteRepository::CopyBranchState(Transaction& t, const std::string& from, const std::string& to) {
  auto* db = TX(t).Handle();

  auto pointers = Prepare(db,
                          "INSERT INTO entity_pointer(branch,entity_type,entity_id,content_hash,version,updated_at_ms) "
                          "SELECT ?,entity_type,entity_id,content_hash,version,updated_at_ms FROM entity_pointer WHERE branch=?;");
  BindText(pointers.get(), 1, to);
  BindText(pointers.get(), 2, from);
  int rc = sqlite3_step(pointers.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  auto history = Prepare(db,
                         "INSERT INTO entity_history(branch,entity_type,entity_id,version,content_hash,agent,recorded_at_ms) "
                         "SELECT ?,entity_type,entity_id,version,content_hash,agent,recorded_at_ms FROM entity_history WHERE branch=? ORDER BY seq;");
  BindText(history.get(), 1, to);
  BindText(history.get(), 2, from);
  return Translate(db, sqlite3_step(history.get()));
}

// ------------------------------------------------------------------
// Pointers
// ------------------------------------------------------------------

std::optional<model::PointerRecord> SqliteRepository::GetPointer(Transaction& t, const std::string& branch, const std::string& entity_type,
                                                                 const std::string& entity_id) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kPointerColumns + " FROM entity_pointer WHERE branch=? AND entity_type=? AND entity_id=?;";
  auto        st  = Prepare(db, sql.c_str());
  BindText(st.get(), 1, branch);
  BindText(st.get(), 2, entity_type);
  BindText(st.get(), 3, entity_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadPointer(st.get());
}

std::vector<model::PointerRecord> SqliteRepository::ListPointers(Transaction& t, const std::string& branch, const std::string& entity_type) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kPointerColumns +
                    " FROM entity_pointer WHERE branch=? AND (?='' OR entity_type=?) ORDER BY entity_type, entity_id;";
  auto st = Prepare(db, sql.c_str());
  BindText(st.get(), 1, branch);
  BindText(st.get(), 2, entity_type);
  BindText(st.get(), 3, entity_type);

  std::vector<model::PointerRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadPointer(st.get()));
  return out;
}

Result SqliteRepository::CompareAndSwapPointer(Transaction& t, const model::PointerRecord& next, const std::optional<std::string>& expected_hash) {
  auto* db = TX(t).Handle();

  if (!expected_hash) {
    auto st = Prepare(db,
                      "INSERT INTO entity_pointer(branch,entity_type,entity_id,content_hash,version,updated_at_ms) VALUES(?,?,?,?,1,?) "
                      "ON CONFLICT(branch,entity_type,entity_id) DO NOTHING;");
    BindText(st.get(), 1, next.branch);
    BindText(st.get(), 2, next.entity_type);
    BindText(st.get(), 3, next.entity_id);
    BindText(st.get(), 4, next.content_hash);
    BindU64(st.get(), 5, next.updated_at_ms);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  } else {
    auto st = Prepare(db,
                      "UPDATE entity_pointer SET content_hash=?, version=version+1, updated_at_ms=? "
                      "WHERE branch=? AND entity_type=? AND entity_id=? AND content_hash=?;");
    BindText(st.get(), 1, next.content_hash);
    BindU64(st.get(), 2, next.updated_at_ms);
    BindText(st.get(), 3, next.branch);
    BindText(st.get(), 4, next.entity_type);
    BindText(st.get(), 5, next.entity_id);
    BindText(st.get(), 6, *expected_hash);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }

  if (sqlite3_changes(db) != 1) {
    return Result::Err(ErrorCode::Conflict, next.entity_type + "/" + next.entity_id + " on " + next.branch);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
  auto* db = TX(t).Handle();
  // version is taken from the pointer row written in the same transaction
  auto st = Prepare(db,
                    "INSERT INTO entity_history(branch,entity_type,entity_id,version,content_hash,agent,recorded_at_ms) "
                    "VALUES(?1,?2,?3,COALESCE((SELECT version FROM entity_pointer WHERE branch=?1 AND entity_type=?2 AND entity_id=?3),?4),?5,?6,?7);");
  BindText(st.get(), 1, r.branch);
  BindText(st.get(), 2, r.entity_type);
  BindText(st.get(), 3, r.entity_id);
  BindU64(st.get(), 4, r.version);
  BindText(st.get(), 5, r.content_hash);
  BindText(st.get(), 6, r.agent);
  BindU64(st.get(), 7, r.recorded_at_ms == 0 ? NowMs() : r.recorded_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::HistoryRecord> SqliteRepository::ListHistory(Transaction& t, const std::string& branch, const std::string& entity_type,
                                                                const std::string& entity_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT branch,entity_type,entity_id,version,content_hash,agent,recorded_at_ms FROM entity_history "
                     "WHERE branch=? AND entity_type=? AND entity_id=? ORDER BY seq;");
  BindText(st.get(), 1, branch);
  BindText(st.get(), 2, entity_type);
  BindText(st.get(), 3, entity_id);

  std::vector<model::HistoryRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::HistoryRecord r;
    r.branch         = ColText(st.get(), 0);
    r.entity_type    = ColText(st.get(), 1);
    r.entity_id      = ColText(st.get(), 2);
    r.version        = ColU64(st.get(), 3);
    r.content_hash   = ColText(st.get(), 4);
    r.agent          = ColText(st.get(), 5);
    r.recorded_at_ms = ColU64(st.get(), 6);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Sync bases
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSyncBase(Transaction& t, const model::SyncBaseRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO sync_base(branch,entity_type,entity_id,content_hash,generation) VALUES(?,?,?,?,?) "
                     "ON CONFLICT(branch,entity_type,entity_id) DO UPDATE SET content_hash=excluded.content_hash, generation=excluded.generation;");
  BindText(st.get(), 1, r.branch);
  BindText(st.get(), 2, r.entity_type);
  BindText(st.get(), 3, r.entity_id);
  BindText(st.get(), 4, r.content_hash);
  BindU64(st.get(), 5, r.generation);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::SyncBaseRecord> SqliteRepository::ListSyncBases(Transaction& t, const std::string& branch) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT branch,entity_type,entity_id,content_hash,generation FROM sync_base WHERE branch=? "
                     "ORDER BY entity_type, entity_id;");
  BindText(st.get(), 1, branch);

  std::vector<model::SyncBaseRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::SyncBaseRecord r;
    r.branch       = ColText(st.get(), 0);
    r.entity_type  = ColText(st.get(), 1);
    r.entity_id    = ColText(st.get(), 2);
    r.content_hash = ColText(st.get(), 3);
    r.generation   = ColU64(st.get(), 4);
    out.push_back(std::move(r));
  }
  return out;
}

uint64_t SqliteRepository::MaxSyncGeneration(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COALESCE(MAX(generation),0) FROM sync_base;");
  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------------

Result SqliteRepository::InsertConflict(Transaction& t, const model::ConflictRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO sync_conflict(fingerprint,entity_type,entity_id,field,kind,strategy,detail_json,created_at_ms,resolved) "
                     "VALUES(?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.fingerprint);
  BindText(st.get(), 2, r.entity_type);
  BindText(st.get(), 3, r.entity_id);
  BindText(st.get(), 4, r.field);
  BindText(st.get(), 5, r.kind);
  BindText(st.get(), 6, r.strategy);
  BindText(st.get(), 7, r.detail_json);
  BindU64(st.get(), 8, r.created_at_ms == 0 ? NowMs() : r.created_at_ms);
  sqlite3_bind_int(st.get(), 9, r.resolved ? 1 : 0);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "conflict " + r.fingerprint);
  return Translate(db, rc);
}

std::optional<model::ConflictRecord> SqliteRepository::GetConflict(Transaction& t, const std::string& fingerprint) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT fingerprint,entity_type,entity_id,field,kind,strategy,detail_json,created_at_ms,resolved "
                     "FROM sync_conflict WHERE fingerprint=?;");
  BindText(st.get(), 1, fingerprint);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadConflict(st.get());
}

std::vector<model::ConflictRecord> SqliteRepository::ListConflicts(Transaction& t, bool open_only) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT fingerprint,entity_type,entity_id,field,kind,strategy,detail_json,created_at_ms,resolved "
                     "FROM sync_conflict WHERE (?=0 OR resolved=0) ORDER BY created_at_ms, fingerprint;");
  sqlite3_bind_int(st.get(), 1, open_only ? 1 : 0);

  std::vector<model::ConflictRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadConflict(st.get()));
  return out;
}

Result SqliteRepository::ResolveConflicts(Transaction& t, const std::string& entity_type, const std::string& entity_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE sync_conflict SET resolved=1 WHERE entity_type=? AND entity_id=?;");
  BindText(st.get(), 1, entity_type);
  BindText(st.get(), 2, entity_id);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace engram::db::sqlite
