#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/branch/branch_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/entity/canonical_json.hpp"
#include "internal/entity/entity_codec.hpp"
#include "internal/entity/entity_registry.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/graph/graph_engine.hpp"
#include "internal/storage/ram/ram_object_store.hpp"
#include "internal/sync/merge_strategy.hpp"
#include "internal/sync/sync_engine.hpp"
#include "internal/util/errors.hpp"

namespace {

using engram::entity::GetStringField;
using engram::entity::MakeEntity;
using engram::entity::SetStringField;
using engram::sync::ConflictKind;
using engram::sync::SyncEngine;
using engram::sync::SyncReport;
using engram::v1::Entity;

// 2024-01-01T10:00:00Z and 10:05:00Z
constexpr uint64_t kTenAm     = 1704103200000;
constexpr uint64_t kTenOhFive = 1704103500000;

struct Fixture {
  std::shared_ptr<engram::db::memory::MemoryRepository> repository = std::make_shared<engram::db::memory::MemoryRepository>();
  std::shared_ptr<engram::entity::EntityRegistry>       registry   = std::make_shared<engram::entity::EntityRegistry>();
  std::shared_ptr<engram::entity::EntityStore>          store;
  std::shared_ptr<engram::graph::GraphEngine>           graph;
  std::shared_ptr<SyncEngine>                           sync;
  engram::branch::BranchManager                         branches{repository, "main", "main-agent"};

  Fixture() {
    engram::graph::RegisterRelationshipType(*registry);
    store = std::make_shared<engram::entity::EntityStore>(repository, std::make_shared<engram::storage::RamObjectStore>(), registry);
    graph = std::make_shared<engram::graph::GraphEngine>(store);
    sync  = std::make_shared<SyncEngine>(store, 3, graph);
    branches.Bootstrap();
  }

  void Fork(const std::string& name) {
    branches.CreateBranch(name, name, std::string("main"));
  }

  Entity Current(const std::string& branch, const std::string& type, const std::string& id) {
    return store->Get(branch, type, id);
  }

  std::string Hash(const std::string& branch, const std::string& type, const std::string& id) {
    return store->CurrentHash(branch, type, id).value_or("");
  }
};

Entity Task(const std::string& id, const std::string& agent, const std::string& title) {
  auto task = MakeEntity("task", id, agent);
  SetStringField(task, "title", title);
  return task;
}

// Stores a modified copy of the branch's current version.
std::string Edit(Fixture& f, const std::string& branch, const std::string& id, const std::string& field, const std::string& value,
                 uint64_t updated_at_ms = 0) {
  auto task = f.Current(branch, "task", id);
  task.set_agent(branch);
  task.set_updated_at_ms(updated_at_ms);
  SetStringField(task, field, value);
  return f.store->Store(branch, task);
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void SeedForkedTask(Fixture& f) {
  auto base = Task("T", "main-agent", "Ship sync");
  SetStringField(base, "description", "first cut");
  SetStringField(base, "priority", "low");
  SetStringField(base, "status", "todo");
  base.set_created_at_ms(kTenAm - 60000);
  base.set_updated_at_ms(kTenAm - 60000);
  f.store->Store("main", base);

  f.Fork("alice");
  f.Fork("bob");
}

void TestArgumentErrors() {
  Fixture f;
  f.Fork("alice");

  assert(Throws<engram::util::InvalidInput>([&] { f.sync->Sync({}, "latest_wins"); }));
  assert(Throws<engram::util::UnknownStrategy>([&] { f.sync->Sync({"alice", "main"}, "newest"); }));
  assert(Throws<engram::util::UnknownStrategy>([&] { f.sync->Sync({"alice", "main"}, "priority_wins:"); }));
  assert(Throws<engram::util::NotFound>([&] { f.sync->Sync({"alice", "ghost"}, "latest_wins"); }));
  assert(Throws<engram::util::NotFound>([&] { f.sync->Sync({"ghost"}, "latest_wins"); }));
}

void TestSingleAgentIsNothingToSynchronize() {
  Fixture f;
  f.Fork("alice");

  auto report = f.sync->Sync({"alice"}, "latest_wins");
  assert(report.nothing_to_synchronize);
  assert(report.conflicts.empty());
  assert(report.entities_merged == 0);

  // a repeated name is still one branch
  assert(f.sync->Sync({"alice", "alice"}, "intelligent_merge").nothing_to_synchronize);
}

void TestStrategyNames() {
  assert(engram::sync::ParseStrategy("Latest-Wins").kind == engram::sync::StrategyKind::kLatestWins);
  assert(engram::sync::ParseStrategy("merge-with-conflict-resolution").kind == engram::sync::StrategyKind::kMergeWithConflictResolution);

  auto priority = engram::sync::ParseStrategy("priority_wins:Bob");
  assert(priority.kind == engram::sync::StrategyKind::kPriorityWins);
  assert(priority.priority_agent == "Bob");
  assert(priority.Name() == "priority_wins:Bob");
}

void TestLatestWins() {
  Fixture f;
  SeedForkedTask(f);

  Edit(f, "alice", "T", "title", "alice title", kTenAm);
  const auto bob_hash = Edit(f, "bob", "T", "title", "bob title", kTenOhFive);

  auto report = f.sync->Sync({"alice", "bob"}, "latest_wins");
  assert(!report.nothing_to_synchronize);
  assert(report.conflicts.empty());
  assert(report.escalated.empty());
  assert(report.entities_merged == 1);
  assert(report.entities_updated == 1);

  assert(f.Hash("alice", "task", "T") == bob_hash);
  assert(f.Hash("bob", "task", "T") == bob_hash);
  assert(GetStringField(f.Current("alice", "task", "T"), "title") == "bob title");

  // branches outside the pass are untouched
  assert(GetStringField(f.Current("main", "task", "T"), "title") == "Ship sync");
}

void TestLatestWinsTieBreaksOnAgent() {
  Fixture f;
  f.branches.CreateBranch("zed", "zed");
  f.branches.CreateBranch("amy", "amy");

  auto zed = Task("T", "zed", "from zed");
  zed.set_created_at_ms(kTenAm);
  zed.set_updated_at_ms(kTenAm);
  f.store->Store("zed", zed);

  auto amy = Task("T", "amy", "from amy");
  amy.set_created_at_ms(kTenAm);
  amy.set_updated_at_ms(kTenAm);
  f.store->Store("amy", amy);

  // no common ancestor: both are candidates
  auto report = f.sync->Sync({"zed", "amy"}, "latest_wins");
  assert(report.conflicts.empty());
  assert(GetStringField(f.Current("zed", "task", "T"), "title") == "from amy");
}

void TestPriorityWins() {
  Fixture f;
  SeedForkedTask(f);

  const auto bob_hash = Edit(f, "bob", "T", "title", "bob title", kTenAm);
  Edit(f, "alice", "T", "title", "alice title", kTenOhFive);

  f.sync->Sync({"alice", "bob"}, "priority_wins:bob");
  assert(f.Hash("alice", "task", "T") == bob_hash);
}

void TestIntelligentMergeCombinesDisjointChanges() {
  Fixture f;
  SeedForkedTask(f);

  Edit(f, "alice", "T", "description", "second cut");
  Edit(f, "bob", "T", "priority", "high");

  auto report = f.sync->Sync({"alice", "bob"}, "intelligent_merge");
  assert(report.conflicts.empty());
  assert(report.entities_merged == 1);
  assert(report.entities_updated == 2);

  auto merged = f.Current("alice", "task", "T");
  assert(GetStringField(merged, "description") == "second cut");
  assert(GetStringField(merged, "priority") == "high");
  assert(GetStringField(merged, "status") == "todo");
  assert(f.Hash("alice", "task", "T") == f.Hash("bob", "task", "T"));

  // converged: a second pass writes nothing
  auto again = f.sync->Sync({"alice", "bob"}, "intelligent_merge");
  assert(again.conflicts.empty());
  assert(again.escalated.empty());
  assert(again.entities_updated == 0);
  assert(again.entities_merged == 0);
}

void TestIntelligentMergeReportsFieldConflict() {
  Fixture f;
  SeedForkedTask(f);

  Edit(f, "alice", "T", "status", "done");
  Edit(f, "alice", "T", "description", "alice notes");
  Edit(f, "bob", "T", "status", "blocked");

  auto report = f.sync->Sync({"alice", "bob"}, "intelligent_merge");
  assert(report.conflicts.size() == 1);
  assert(report.escalated.empty());

  const auto& conflict = report.conflicts[0];
  assert(conflict.entity_type == "task");
  assert(conflict.entity_id == "T");
  assert(conflict.field == "status");
  assert(conflict.kind == ConflictKind::kField);
  assert(!conflict.ancestor_hash.empty());
  assert(conflict.candidates.size() == 2);
  assert(conflict.candidates[0].branch == "alice");
  assert(conflict.candidates[0].value_json == "\"done\"");
  assert(conflict.candidates[1].value_json == "\"blocked\"");

  // the entity still merges; the disputed field keeps the ancestor value
  auto merged = f.Current("bob", "task", "T");
  assert(GetStringField(merged, "status") == "todo");
  assert(GetStringField(merged, "description") == "alice notes");
  assert(f.Hash("alice", "task", "T") == f.Hash("bob", "task", "T"));

  auto stored = f.sync->ListConflicts();
  assert(stored.size() == 1);
  assert(stored[0].fingerprint == conflict.fingerprint);
  assert(stored[0].strategy == "intelligent_merge");
  auto detail = engram::entity::ParseJson(stored[0].detail_json);
  assert(detail.struct_value().fields().at("candidates").list_value().values_size() == 2);

  // idempotent
  auto again = f.sync->Sync({"alice", "bob"}, "intelligent_merge");
  assert(again.conflicts.empty());
  assert(again.entities_updated == 0);
}

void TestMergeWithConflictResolutionEscalates() {
  Fixture f;
  SeedForkedTask(f);

  const auto alice_hash = Edit(f, "alice", "T", "status", "done");
  const auto bob_hash   = Edit(f, "bob", "T", "status", "blocked");

  auto report = f.sync->Sync({"alice", "bob"}, "merge_with_conflict_resolution");
  assert(report.conflicts.size() == 1);
  assert(report.conflicts[0].kind == ConflictKind::kEntity);
  assert(report.conflicts[0].field.empty());
  assert(report.escalated == std::vector<std::string>{"task/T"});
  assert(report.HasConflicts());

  // no automatic value: every branch keeps its own version
  assert(f.Hash("alice", "task", "T") == alice_hash);
  assert(f.Hash("bob", "task", "T") == bob_hash);

  // still escalated, but not reported as new
  auto again = f.sync->Sync({"alice", "bob"}, "merge_with_conflict_resolution");
  assert(again.conflicts.empty());
  assert(again.escalated.size() == 1);

  auto resolved = f.Current("alice", "task", "T");
  SetStringField(resolved, "status", "inprogress");
  resolved.set_agent("operator");
  resolved.set_updated_at_ms(0);
  const auto hash = f.sync->ResolveConflict({"alice", "bob"}, resolved);

  assert(f.Hash("alice", "task", "T") == hash);
  assert(f.Hash("bob", "task", "T") == hash);
  assert(f.sync->ListConflicts().empty());
  assert(f.sync->ListConflicts(false).size() == 1);

  auto after = f.sync->Sync({"alice", "bob"}, "merge_with_conflict_resolution");
  assert(!after.HasConflicts());
  assert(after.entities_updated == 0);
}

void TestMergeWithConflictResolutionMergesCleanChanges() {
  Fixture f;
  SeedForkedTask(f);

  Edit(f, "alice", "T", "description", "second cut");
  Edit(f, "bob", "T", "priority", "critical");

  auto report = f.sync->Sync({"alice", "bob"}, "merge_with_conflict_resolution");
  assert(!report.HasConflicts());
  auto merged = f.Current("bob", "task", "T");
  assert(GetStringField(merged, "description") == "second cut");
  assert(GetStringField(merged, "priority") == "critical");
}

void TestNewEntitiesPropagate() {
  Fixture f;
  SeedForkedTask(f);

  f.store->Store("alice", Task("A", "alice", "only on alice"));
  f.store->Store("bob", Task("B", "bob", "only on bob"));

  auto report = f.sync->Sync({"alice", "bob"}, "intelligent_merge");
  assert(report.conflicts.empty());
  assert(report.entities_examined == 3);
  assert(report.entities_merged == 2);

  assert(f.Hash("alice", "task", "B") == f.Hash("bob", "task", "B"));
  assert(f.Hash("alice", "task", "A") == f.Hash("bob", "task", "A"));
  assert(f.store->History("bob", "task", "A").size() == 1);
}

void TestLaterEditsMergeAgainstTheLastSync() {
  Fixture f;
  SeedForkedTask(f);
  f.Fork("carol");

  Edit(f, "alice", "T", "description", "alice v1");
  f.sync->Sync({"alice", "bob"}, "intelligent_merge");

  // only alice moves after the pass: bob takes it without a conflict
  Edit(f, "alice", "T", "priority", "medium");
  auto report = f.sync->Sync({"alice", "bob"}, "intelligent_merge");
  assert(report.conflicts.empty());
  assert(GetStringField(f.Current("bob", "task", "T"), "priority") == "medium");

  // carol never synced: her edit merges against the fork point
  Edit(f, "carol", "T", "status", "inprogress");
  auto three = f.sync->Sync({"alice", "bob", "carol"}, "intelligent_merge");
  assert(three.conflicts.empty());
  auto merged = f.Current("carol", "task", "T");
  assert(GetStringField(merged, "description") == "alice v1");
  assert(GetStringField(merged, "priority") == "medium");
  assert(GetStringField(merged, "status") == "inprogress");
  assert(f.Hash("alice", "task", "T") == f.Hash("carol", "task", "T"));
}

void TestArchiveMergesLikeAField() {
  Fixture f;
  SeedForkedTask(f);

  f.store->Archive("alice", "task", "T", "alice");
  Edit(f, "bob", "T", "priority", "high");

  auto report = f.sync->Sync({"alice", "bob"}, "intelligent_merge");
  assert(report.conflicts.empty());
  auto merged = f.Current("bob", "task", "T");
  assert(merged.archived());
  assert(GetStringField(merged, "priority") == "high");
}

void TestDryRunCommitsNothing() {
  Fixture f;
  SeedForkedTask(f);

  const auto alice_hash = Edit(f, "alice", "T", "status", "done");
  const auto bob_hash   = Edit(f, "bob", "T", "status", "blocked");

  engram::sync::SyncOptions options;
  options.dry_run = true;
  auto report     = f.sync->Sync({"alice", "bob"}, "intelligent_merge", options);
  assert(report.dry_run);
  assert(report.conflicts.size() == 1);
  assert(report.entities_updated == 2);

  assert(f.Hash("alice", "task", "T") == alice_hash);
  assert(f.Hash("bob", "task", "T") == bob_hash);
  assert(f.sync->ListConflicts().empty());

  // the real pass still reports the conflict as new
  assert(f.sync->Sync({"alice", "bob"}, "intelligent_merge").conflicts.size() == 1);
}

void TestInvalidMergeIsEscalated() {
  Fixture f;
  f.registry->Register("toggle", [](const Entity& e) {
    const auto& fields = e.fields().fields();
    if (fields.count("on") && fields.count("off")) {
      throw engram::util::ValidationError("on", "'on' and 'off' are exclusive");
    }
  });

  auto base = MakeEntity("toggle", "x", "main-agent");
  SetStringField(base, "label", "switch");
  f.store->Store("main", base);
  f.Fork("alice");
  f.Fork("bob");

  auto on = f.Current("alice", "toggle", "x");
  on.set_updated_at_ms(0);
  SetStringField(on, "on", "yes");
  const auto alice_hash = f.store->Store("alice", on);

  auto off = f.Current("bob", "toggle", "x");
  off.set_updated_at_ms(0);
  SetStringField(off, "off", "yes");
  f.store->Store("bob", off);

  auto report = f.sync->Sync({"alice", "bob"}, "intelligent_merge");
  assert(report.escalated == std::vector<std::string>{"toggle/x"});
  assert(report.conflicts.size() == 1);
  assert(report.conflicts[0].kind == ConflictKind::kEntity);
  assert(f.Hash("alice", "toggle", "x") == alice_hash);
}

void TestRelationshipConstraintsAreRevalidated() {
  Fixture f;
  for (const auto* id : {"a", "b"}) f.store->Store("main", Task(id, "main-agent", id));
  f.Fork("alice");
  f.Fork("bob");

  engram::graph::RelationshipSpec forward;
  forward.id                = "r1";
  forward.source            = {"task", "a"};
  forward.target            = {"task", "b"};
  forward.relationship_type = "depends_on";
  forward.agent             = "alice";
  f.graph->CreateRelationship("alice", forward);

  engram::graph::RelationshipSpec backward;
  backward.id                       = "r2";
  backward.source                   = {"task", "b"};
  backward.target                   = {"task", "a"};
  backward.relationship_type        = "depends_on";
  backward.agent                    = "bob";
  backward.constraints.allow_cycles = false;
  f.graph->CreateRelationship("bob", backward);

  auto report = f.sync->Sync({"alice", "bob"}, "intelligent_merge");
  assert(report.escalated == std::vector<std::string>{"relationship/r2"});
  assert(report.conflicts.size() == 1);
  assert(report.conflicts[0].kind == ConflictKind::kConstraint);

  // r1 is merged everywhere; r2 stays where it was created
  assert(f.store->Find("bob", engram::graph::kRelationshipType, "r1").has_value());
  assert(!f.store->Find("alice", engram::graph::kRelationshipType, "r2").has_value());

  auto stored = f.sync->ListConflicts();
  assert(stored.size() == 1);
  assert(stored[0].kind == "constraint");
}

engram::graph::RelationshipSpec Edge(const std::string& id, const std::string& from, const std::string& to, bool allow_cycles,
                                     const std::string& agent) {
  engram::graph::RelationshipSpec spec;
  spec.id                       = id;
  spec.source                   = {"task", from};
  spec.target                   = {"task", to};
  spec.relationship_type        = "depends_on";
  spec.agent                    = agent;
  spec.constraints.allow_cycles = allow_cycles;
  return spec;
}

void TestMetadataEditInsideAllowedCycleSyncs() {
  Fixture f;
  for (const auto* id : {"a", "b"}) f.store->Store("main", Task(id, "main-agent", id));
  // r2 may close the cycle; r1 was legal when created
  f.graph->CreateRelationship("main", Edge("r1", "a", "b", false, "main-agent"));
  f.graph->CreateRelationship("main", Edge("r2", "b", "a", true, "main-agent"));
  f.Fork("alice");

  auto r1 = f.Current("alice", engram::graph::kRelationshipType, "r1");
  r1.set_agent("alice");
  r1.set_updated_at_ms(0);
  SetStringField(r1, "description", "a needs b");
  f.store->Store("alice", r1);

  auto report = f.sync->Sync({"main", "alice"}, "latest_wins");
  assert(report.escalated.empty());
  assert(report.conflicts.empty());
  assert(report.entities_merged == 1);
  assert(GetStringField(f.Current("main", engram::graph::kRelationshipType, "r1"), "description") == "a needs b");

  // retargeting is a new edge and is checked again
  f.store->Store("main", Task("c", "main-agent", "c"));
  f.sync->Sync({"main", "alice"}, "latest_wins");
  auto moved = f.Current("alice", engram::graph::kRelationshipType, "r1");
  moved.set_updated_at_ms(0);
  SetStringField(moved, "target_id", "c");
  f.store->Store("alice", moved);
  assert(f.sync->Sync({"main", "alice"}, "latest_wins").escalated.empty());
  assert(GetStringField(f.Current("main", engram::graph::kRelationshipType, "r1"), "target_id") == "c");
}

void TestSyncWaitsForRelationshipWriters() {
  Fixture f;
  SeedForkedTask(f);
  Edit(f, "alice", "T", "title", "Ship sync v2");

  std::atomic<bool> done{false};
  std::thread       syncer;
  {
    // what CreateRelationship holds while it checks and writes bob
    auto locks = f.graph->LockBranches({"bob"});
    syncer     = std::thread([&] {
      f.sync->Sync({"alice", "bob"}, "latest_wins");
      done = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(!done);
    assert(GetStringField(f.Current("bob", "task", "T"), "title") == "Ship sync");
  }
  syncer.join();
  assert(done);
  assert(GetStringField(f.Current("bob", "task", "T"), "title") == "Ship sync v2");
}

} // namespace

int main() {
  TestArgumentErrors();
  TestSingleAgentIsNothingToSynchronize();
  TestStrategyNames();
  TestLatestWins();
  TestLatestWinsTieBreaksOnAgent();
  TestPriorityWins();
  TestIntelligentMergeCombinesDisjointChanges();
  TestIntelligentMergeReportsFieldConflict();
  TestMergeWithConflictResolutionEscalates();
  TestMergeWithConflictResolutionMergesCleanChanges();
  TestNewEntitiesPropagate();
  TestLaterEditsMergeAgainstTheLastSync();
  TestArchiveMergesLikeAField();
  TestDryRunCommitsNothing();
  TestInvalidMergeIsEscalated();
  TestRelationshipConstraintsAreRevalidated();
  TestMetadataEditInsideAllowedCycleSyncs();
  TestSyncWaitsForRelationshipWriters();

  std::cout << "engram_unit_sync_engine: pass\n";
  return 0;
}
