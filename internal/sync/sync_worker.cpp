#include "sync_worker.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "sync_engine.hpp"

namespace engram::sync {

SyncWorker::SyncWorker(std::shared_ptr<SyncScheduler> scheduler, std::shared_ptr<SyncEngine> engine)
    : scheduler_(std::move(scheduler)), engine_(std::move(engine)) {
}

SyncWorker::~SyncWorker() {
  Stop();
}

void SyncWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&SyncWorker::Run, this);
}

void SyncWorker::Stop() {
  scheduler_->Shutdown();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void SyncWorker::Run() {
  while (true) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      task->result->set_value(engine_->Sync(task->branches, task->strategy, task->options));
    } catch (const std::exception& e) {
      ENGRAM_LOG_ERROR("sync task failed", {observability::StringField("error", e.what()),
                                            observability::IntField("branches", static_cast<std::int64_t>(task->branches.size()))});
      task->result->set_exception(std::current_exception());
    }
  }
}

} // namespace engram::sync
