#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>

#include "internal/branch/branch_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/entity/entity_codec.hpp"
#include "internal/entity/entity_registry.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/graph/graph_engine.hpp"
#include "internal/storage/ram/ram_object_store.hpp"
#include "internal/sync/sync_engine.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "internal/sync/sync_worker.hpp"
#include "internal/util/errors.hpp"

namespace {

using engram::sync::SyncScheduler;
using engram::sync::SyncWorker;

struct Fixture {
  std::shared_ptr<engram::db::memory::MemoryRepository> repository = std::make_shared<engram::db::memory::MemoryRepository>();
  std::shared_ptr<engram::entity::EntityRegistry>       registry   = std::make_shared<engram::entity::EntityRegistry>();
  std::shared_ptr<engram::entity::EntityStore>          store;
  std::shared_ptr<engram::sync::SyncEngine>             sync;
  std::shared_ptr<SyncScheduler>                        scheduler = std::make_shared<SyncScheduler>();
  engram::branch::BranchManager                         branches{repository, "main", "main-agent"};

  Fixture() {
    engram::graph::RegisterRelationshipType(*registry);
    store = std::make_shared<engram::entity::EntityStore>(repository, std::make_shared<engram::storage::RamObjectStore>(), registry);
    sync  = std::make_shared<engram::sync::SyncEngine>(store);
    branches.Bootstrap();
    branches.CreateBranch("alice", "alice", std::string("main"));
    branches.CreateBranch("bob", "bob", std::string("main"));
  }
};

void TestSubmitResolvesWithReport() {
  Fixture f;
  auto task = engram::entity::MakeEntity("task", "T", "alice");
  engram::entity::SetStringField(task, "title", "from alice");
  f.store->Store("alice", task);

  SyncWorker worker(f.scheduler, f.sync);
  worker.Start();

  auto future = f.scheduler->Submit({"alice", "bob"}, "latest_wins");
  assert(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);

  auto report = future.get();
  assert(report.entities_merged == 1);
  assert(f.store->Find("bob", "task", "T").has_value());

  worker.Stop();
}

void TestErrorsTravelThroughTheFuture() {
  Fixture f;
  SyncWorker worker(f.scheduler, f.sync);
  worker.Start();

  auto unknown = f.scheduler->Submit({"alice", "bob"}, "newest");
  auto missing = f.scheduler->Submit({"alice", "ghost"}, "latest_wins");

  bool unknown_thrown = false;
  try {
    unknown.get();
  } catch (const engram::util::UnknownStrategy&) {
    unknown_thrown = true;
  }
  assert(unknown_thrown);

  bool missing_thrown = false;
  try {
    missing.get();
  } catch (const engram::util::NotFound&) {
    missing_thrown = true;
  }
  assert(missing_thrown);

  // the worker keeps serving after a failed pass
  assert(f.scheduler->Submit({"alice", "bob"}, "intelligent_merge").get().conflicts.empty());
}

void TestStopDrainsQueuedTasks() {
  Fixture f;
  auto first  = f.scheduler->Submit({"alice", "bob"}, "latest_wins");
  auto second = f.scheduler->Submit({"alice"}, "latest_wins");
  assert(f.scheduler->Pending() == 2);

  SyncWorker worker(f.scheduler, f.sync);
  worker.Start();
  worker.Stop();

  assert(f.scheduler->Pending() == 0);
  assert(first.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
  assert(second.get().nothing_to_synchronize);

  bool rejected = false;
  try {
    f.scheduler->Submit({"alice", "bob"}, "latest_wins");
  } catch (const engram::util::InvalidInput&) {
    rejected = true;
  }
  assert(rejected);
}

void TestStopWithoutStart() {
  Fixture f;
  SyncWorker worker(f.scheduler, f.sync);
  worker.Stop();
  worker.Stop();
  assert(!f.scheduler->Dequeue().has_value());
}

} // namespace

int main() {
  TestSubmitResolvesWithReport();
  TestErrorsTravelThroughTheFuture();
  TestStopDrainsQueuedTasks();
  TestStopWithoutStart();

  std::cout << "engram_unit_sync_worker: pass\n";
  return 0;
}
