#include "memory_tx.hpp"

#include <stdexcept>

namespace engram::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Working() {
  if (!working_) working_ = std::make_unique<MemoryRepository::State>(*snapshot_);
  return *working_;
}

void MemoryTransaction::Apply(Op op) {
  op(Working());
  steps_.push_back(Step{nullptr, {}, std::move(op)});
}

void MemoryTransaction::ApplyGuarded(Check check, std::string what, Op op) {
  op(Working());
  steps_.push_back(Step{std::move(check), std::move(what), std::move(op)});
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  if (steps_.empty()) {
    committed_ = true;
    return;
  }

  // Nothing committed since Begin(): the working state is the next state.
  if (repo_.committed_ == snapshot_) {
    repo_.committed_ = std::shared_ptr<const MemoryRepository::State>(std::move(working_));
    committed_       = true;
    return;
  }

  auto next = std::make_shared<MemoryRepository::State>(*repo_.committed_);
  for (auto& step : steps_) {
    if (step.check && !step.check(*next)) {
      rolled_back_ = true;
      throw TransactionConflict(step.what);
    }
    step.op(*next);
  }

  repo_.committed_ = std::move(next);
  committed_       = true;
}

void MemoryTransaction::Rollback() {
  steps_.clear();
  working_.reset();
  rolled_back_ = true;
}

} // namespace engram::db::memory
