#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/branch_record.hpp"
#include "internal/db/model/conflict_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/pointer_record.hpp"
#include "internal/db/model/sync_base_record.hpp"

namespace engram::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - CompareAndSwapPointer is atomic against concurrent transactions
  - Object bytes never live here; only content hashes

  The DB is the source of truth for:
    branches
    latest pointers and their history
    sync bases and recorded conflicts
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Branches
  // ---------------------------------------------------------------------

  virtual Result InsertBranch(Transaction&, const model::BranchRecord&) = 0;

  virtual std::optional<model::BranchRecord> GetBranch(Transaction&, const std::string& name) = 0;

  // ordered by name
  virtual std::vector<model::BranchRecord> ListBranches(Transaction&) = 0;

  // Removes the branch with its pointers, history and sync bases.
  virtual Result DeleteBranch(Transaction&, const std::string& name) = 0;

  // Copies pointers and history of `from` onto the (empty) branch `to`.
  virtual Result CopyBranchState(Transaction&, const std::string& from, const std::string& to) = 0;

  // ---------------------------------------------------------------------
  // Latest pointers
  // ---------------------------------------------------------------------

  virtual std::optional<model::PointerRecord> GetPointer(Transaction&, const std::string& branch, const std::string& entity_type,
                                                         const std::string& entity_id) = 0;

  // ordered by (entity_type, entity_id); empty type lists every type
  virtual std::vector<model::PointerRecord> ListPointers(Transaction&, const std::string& branch, const std::string& entity_type) = 0;

  /*
    Re-point (branch, type, id) to next.content_hash.

    expected_hash:
      std::nullopt -> the pointer must not exist yet
      value        -> the pointer must currently hold exactly this hash

    Returns ErrorCode::Conflict when the expectation does not hold.
    next.version is ignored; the stored version is incremented.
  */
  virtual Result CompareAndSwapPointer(Transaction&, const model::PointerRecord& next, const std::optional<std::string>& expected_hash) = 0;

  // ---------------------------------------------------------------------
  // History
  // ---------------------------------------------------------------------

  virtual Result AppendHistory(Transaction&, const model::HistoryRecord&) = 0;

  // oldest first
  virtual std::vector<model::HistoryRecord> ListHistory(Transaction&, const std::string& branch, const std::string& entity_type,
                                                        const std::string& entity_id) = 0;

  // ---------------------------------------------------------------------
  // Sync bases
  // ---------------------------------------------------------------------

  virtual Result UpsertSyncBase(Transaction&, const model::SyncBaseRecord&) = 0;

  virtual std::vector<model::SyncBaseRecord> ListSyncBases(Transaction&, const std::string& branch) = 0;

  virtual uint64_t MaxSyncGeneration(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Conflicts
  // ---------------------------------------------------------------------

  // AlreadyExists when the fingerprint is already recorded.
  virtual Result InsertConflict(Transaction&, const model::ConflictRecord&) = 0;

  virtual std::optional<model::ConflictRecord> GetConflict(Transaction&, const std::string& fingerprint) = 0;

  // ordered by (created_at_ms, fingerprint)
  virtual std::vector<model::ConflictRecord> ListConflicts(Transaction&, bool open_only) = 0;

  virtual Result ResolveConflicts(Transaction&, const std::string& entity_type, const std::string& entity_id) = 0;
};

} // namespace engram::db
