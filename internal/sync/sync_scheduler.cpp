#include "sync_scheduler.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace engram::sync {

void SyncScheduler::Enqueue(SyncTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) throw util::InvalidInput("sync scheduler is shut down");
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::future<SyncReport> SyncScheduler::Submit(std::vector<std::string> branches, std::string strategy, SyncOptions options) {
  SyncTask task;
  task.branches = std::move(branches);
  task.strategy = std::move(strategy);
  task.options  = options;
  task.result   = std::make_shared<std::promise<SyncReport>>();

  auto future = task.result->get_future();
  Enqueue(std::move(task));
  return future;
}

std::optional<SyncTask> SyncScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  SyncTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void SyncScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t SyncScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace engram::sync
