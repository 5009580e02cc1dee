#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "sync_scheduler.hpp"

namespace engram::sync {

class SyncEngine;

/*
  Background worker that drains the scheduler one pass at a time.

  Agents keep writing their branches concurrently; merging itself stays
  single-threaded.
*/
class SyncWorker {
 public:
  SyncWorker(std::shared_ptr<SyncScheduler> scheduler, std::shared_ptr<SyncEngine> engine);
  ~SyncWorker();

  void Start();
  // Runs the tasks already queued, then joins.
  void Stop();

 private:
  void Run();

  std::shared_ptr<SyncScheduler> scheduler_;
  std::shared_ptr<SyncEngine>    engine_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace engram::sync
