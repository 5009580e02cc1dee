#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace engram::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // (branch, entity_type, entity_id)
  using Key = std::tuple<std::string, std::string, std::string>;

  struct State {
    std::map<std::string, model::BranchRecord>      branches;
    std::map<Key, model::PointerRecord>             pointers;
    std::map<Key, std::vector<model::HistoryRecord>> history;
    std::map<Key, model::SyncBaseRecord>            sync_bases;
    std::map<std::string, model::ConflictRecord>    conflicts;
  };

  // Immutable once published. Transactions share it until they write.
  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_;
};

} // namespace engram::db::memory
