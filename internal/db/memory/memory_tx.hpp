#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace engram::db::memory {

/*
  Transaction = snapshot + write log

  Reads see the snapshot taken at Begin() plus this transaction's own
  writes. Begin() only shares the committed state; the first write copies
  it into a private working state. Every write is recorded as a step; Commit() replays the steps on
  the latest committed state and re-checks each step's guard first, so a
  pointer swap that lost its race aborts the whole transaction while writes
  to unrelated keys from other transactions are preserved.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Op    = std::function<void(MemoryRepository::State&)>;
  using Check = std::function<bool(const MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  const MemoryRepository::State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

  // Apply to the working view now and replay on commit.
  void Apply(Op op);

  // Same, but at commit the step only runs if `check` holds on the latest
  // state; otherwise Commit() throws TransactionConflict(what).
  void ApplyGuarded(Check check, std::string what, Op op);

 private:
  struct Step {
    Check       check;
    std::string what;
    Op          op;
  };

  MemoryRepository::State& Working();

  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::unique_ptr<MemoryRepository::State>       working_;
  std::vector<Step>                              steps_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;
};

} // namespace engram::db::memory
