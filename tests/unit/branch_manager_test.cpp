#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/branch/branch_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/entity/entity_codec.hpp"
#include "internal/entity/entity_registry.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/storage/ram/ram_object_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using engram::branch::BranchManager;

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestBootstrapCreatesDefaultBranch() {
  auto          repo = std::make_shared<engram::db::memory::MemoryRepository>();
  BranchManager branches(repo, "main", "alice");
  branches.Bootstrap();

  assert(branches.Active() == "main");
  assert(branches.Exists("main"));
  assert(branches.Get("main").agent == "alice");

  // idempotent
  branches.Bootstrap();
  assert(branches.List().size() == 1);
}

void TestCreateSwitchAndList() {
  auto          repo = std::make_shared<engram::db::memory::MemoryRepository>();
  BranchManager branches(repo, "main", "alice");
  branches.Bootstrap();

  auto record = branches.CreateBranch("planner", "bob");
  assert(record.agent == "bob");
  assert(record.parent.empty());
  branches.CreateBranch("coder", "carol");

  auto all = branches.List();
  assert(all.size() == 3);
  assert(all[0].name == "coder");
  assert(all[1].name == "main");
  assert(all[2].name == "planner");

  branches.Switch("planner");
  assert(branches.Active() == "planner");
  assert(Throws<engram::util::NotFound>([&] { branches.Switch("ghost"); }));
  assert(branches.Active() == "planner");
}

void TestNameValidationAndDuplicates() {
  auto          repo = std::make_shared<engram::db::memory::MemoryRepository>();
  BranchManager branches(repo, "main", "alice");
  branches.Bootstrap();

  assert(Throws<engram::util::AlreadyExists>([&] { branches.CreateBranch("main", "bob"); }));
  assert(Throws<engram::util::InvalidInput>([&] { branches.CreateBranch("", "bob"); }));
  assert(Throws<engram::util::InvalidInput>([&] { branches.CreateBranch("has space", "bob"); }));
  assert(Throws<engram::util::InvalidInput>([&] { branches.CreateBranch("a/b", "bob"); }));
  assert(Throws<engram::util::InvalidInput>([&] { branches.CreateBranch(std::string(129, 'x'), "bob"); }));
  assert(Throws<engram::util::InvalidInput>([&] { branches.CreateBranch("ok", ""); }));
  assert(Throws<engram::util::NotFound>([&] { branches.CreateBranch("child", "bob", std::string("ghost")); }));

  branches.CreateBranch("release-1.0_rc", "bob");
  assert(branches.Exists("release-1.0_rc"));
}

void TestForkCopiesPointersHistoryAndBase() {
  auto repo     = std::make_shared<engram::db::memory::MemoryRepository>();
  auto registry = std::make_shared<engram::entity::EntityRegistry>();
  auto store    = std::make_shared<engram::entity::EntityStore>(repo, std::make_shared<engram::storage::RamObjectStore>(), registry);

  BranchManager branches(repo, "main", "alice");
  branches.Bootstrap();

  auto task = engram::entity::MakeEntity("task", "t1", "alice");
  engram::entity::SetStringField(task, "title", "v1");
  const auto h1 = store->Store("main", task);
  engram::entity::SetStringField(task, "title", "v2");
  const auto h2 = store->Store("main", task);

  auto child = branches.CreateBranch("child", "bob", std::string("main"));
  assert(child.parent == "main");

  assert(*store->CurrentHash("child", "task", "t1") == h2);
  auto history = store->History("child", "task", "t1");
  assert(history.size() == 2);
  assert(history[0] == h1);

  auto tx          = repo->Begin();
  auto child_bases = repo->ListSyncBases(*tx, "child");
  auto main_bases  = repo->ListSyncBases(*tx, "main");
  tx->Commit();

  assert(child_bases.size() == 1);
  assert(child_bases[0].content_hash == h2);
  assert(main_bases.size() == 1);
  assert(main_bases[0].content_hash == h2);
  assert(main_bases[0].generation == child_bases[0].generation);

  // writes after the fork stay isolated
  engram::entity::SetStringField(task, "title", "child edit");
  store->Store("child", task);
  assert(*store->CurrentHash("main", "task", "t1") == h2);
}

void TestDeleteBranch() {
  auto          repo = std::make_shared<engram::db::memory::MemoryRepository>();
  BranchManager branches(repo, "main", "alice");
  branches.Bootstrap();
  branches.CreateBranch("scratch", "bob");

  assert(Throws<engram::util::InvalidInput>([&] { branches.DeleteBranch("main"); }));
  assert(Throws<engram::util::NotFound>([&] { branches.DeleteBranch("ghost"); }));

  branches.DeleteBranch("scratch");
  assert(!branches.Exists("scratch"));
  assert(Throws<engram::util::NotFound>([&] { (void)branches.Get("scratch"); }));
}

} // namespace

int main() {
  TestBootstrapCreatesDefaultBranch();
  TestCreateSwitchAndList();
  TestNameValidationAndDuplicates();
  TestForkCopiesPointersHistoryAndBase();
  TestDeleteBranch();

  std::cout << "engram_unit_branch_manager: pass\n";
  return 0;
}
