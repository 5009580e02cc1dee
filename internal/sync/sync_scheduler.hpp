#pragma once

#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

#include "sync_task.hpp"

namespace engram::sync {

/*
  Thread-safe blocking queue for the sync worker.
*/
class SyncScheduler {
 public:
  void Enqueue(SyncTask task);

  // Wraps the request in a task; the future resolves when a worker ran it.
  std::future<SyncReport> Submit(std::vector<std::string> branches, std::string strategy, SyncOptions options = {});

  // blocking wait
  std::optional<SyncTask> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<SyncTask>    queue_;
  bool                    shutdown_ = false;
};

} // namespace engram::sync
