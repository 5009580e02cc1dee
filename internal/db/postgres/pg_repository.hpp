#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace engram::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  // Create tables if missing.
  void Bootstrap();

  std::unique_ptr<Transaction> Begin() override;

  Result                             InsertBranch(Transaction&, const model::BranchRecord&) override;
  std::optional<model::BranchRecord> GetBranch(Transaction&, const std::string&) override;
  std::vector<model::BranchRecord>   ListBranches(Transaction&) override;
  Result                             DeleteBranch(Transaction&, const std::string&) override;
  Result                             CopyBranchState(Transaction&, const std::string& from, const std::string& to) override;

  std::optional<model::PointerRecord> GetPointer(Transaction&, const std::string& branch, const std::string& entity_type,
                                                 const std::string& entity_id) override;
  std::vector<model::PointerRecord>   ListPointers(Transaction&, const std::string& branch, const std::string& entity_type) override;
  Result CompareAndSwapPointer(Transaction&, const model::PointerRecord& next, const std::optional<std::string>& expected_hash) override;

  Result                            AppendHistory(Transaction&, const model::HistoryRecord&) override;
  std::vector<model::HistoryRecord> ListHistory(Transaction&, const std::string& branch, const std::string& entity_type,
                                                const std::string& entity_id) override;

  Result                             UpsertSyncBase(Transaction&, const model::SyncBaseRecord&) override;
  std::vector<model::SyncBaseRecord> ListSyncBases(Transaction&, const std::string& branch) override;
  uint64_t                           MaxSyncGeneration(Transaction&) override;

  Result                               InsertConflict(Transaction&, const model::ConflictRecord&) override;
  std::optional<model::ConflictRecord> GetConflict(Transaction&, const std::string& fingerprint) override;
  std::vector<model::ConflictRecord>   ListConflicts(Transaction&, bool open_only) override;
  Result                               ResolveConflicts(Transaction&, const std::string& entity_type, const std::string& entity_id) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace engram::db::postgres
