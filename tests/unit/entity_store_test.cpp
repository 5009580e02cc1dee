#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/branch/branch_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/entity/entity_codec.hpp"
#include "internal/entity/entity_registry.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/storage/ram/ram_object_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using engram::entity::EntityStore;
using engram::entity::MakeEntity;
using engram::entity::SetNumberField;
using engram::entity::SetStringField;
using engram::v1::Entity;

struct Fixture {
  std::shared_ptr<engram::db::memory::MemoryRepository> repository = std::make_shared<engram::db::memory::MemoryRepository>();
  std::shared_ptr<engram::storage::RamObjectStore>      objects    = std::make_shared<engram::storage::RamObjectStore>();
  std::shared_ptr<engram::entity::EntityRegistry>       registry   = std::make_shared<engram::entity::EntityRegistry>();
  std::shared_ptr<EntityStore>                          store      = std::make_shared<EntityStore>(repository, objects, registry);
  engram::branch::BranchManager                         branches{repository, "main", "alice"};

  Fixture() {
    branches.Bootstrap();
    branches.CreateBranch("scratch", "bob");
  }
};

Entity Task(const std::string& id, const std::string& title, const std::string& agent = "alice") {
  auto task = MakeEntity("task", id, agent);
  SetStringField(task, "title", title);
  return task;
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

void TestStoreStampsAndVersions() {
  Fixture f;

  const auto h1 = f.store->Store("main", Task("t1", "draft"));
  auto       v1 = f.store->Get("main", "task", "t1");
  assert(v1.created_at_ms() > 0);
  assert(v1.updated_at_ms() >= v1.created_at_ms());
  assert(engram::entity::HashEntity(v1) == h1);

  auto next = Task("t1", "final");
  SetStringField(next, "status", "done");
  const auto h2 = f.store->Store("main", next);
  assert(h2 != h1);

  auto v2 = f.store->Get("main", "task", "t1");
  assert(engram::entity::GetStringField(v2, "title") == "final");
  // created_at_ms inherited from the first version
  assert(v2.created_at_ms() == v1.created_at_ms());

  auto history = f.store->History("main", "task", "t1");
  assert(history.size() == 2);
  assert(history[0] == h1);
  assert(history[1] == h2);
  assert(engram::entity::GetStringField(f.store->GetByHash(h1), "title") == "draft");
}

void TestCallerTimestampsArePreserved() {
  Fixture f;
  auto    task = Task("t1", "pinned");
  task.set_created_at_ms(100);
  task.set_updated_at_ms(200);

  const auto hash = f.store->Store("main", task);
  assert(hash == engram::entity::HashEntity(task));

  // identical bytes: no new version
  assert(f.store->Store("main", task) == hash);
  assert(f.store->History("main", "task", "t1").size() == 1);
}

void TestExpectedHashGuardsTheSwap() {
  Fixture f;
  const auto h1 = f.store->Store("main", Task("t1", "one"), std::string());

  assert(Throws<engram::util::Stale>([&] { f.store->Store("main", Task("t1", "again"), std::string()); }));

  const auto h2 = f.store->Store("main", Task("t1", "two"), h1);
  assert(Throws<engram::util::Stale>([&] { f.store->Store("main", Task("t1", "three"), h1); }));
  assert(*f.store->CurrentHash("main", "task", "t1") == h2);
}

void TestValidation() {
  Fixture f;

  assert(Throws<engram::util::ValidationError>([&] { f.store->Store("main", MakeEntity("task", "t1", "alice")); }));

  auto bad_status = Task("t2", "x");
  SetStringField(bad_status, "status", "someday");
  try {
    f.store->Store("main", bad_status);
    assert(false && "invalid status must be rejected");
  } catch (const engram::util::ValidationError& e) {
    assert(e.field() == "status");
  }

  auto unknown = MakeEntity("spaceship", "s1", "alice");
  try {
    f.store->Store("main", unknown);
    assert(false && "unregistered type must be rejected");
  } catch (const engram::util::ValidationError& e) {
    assert(e.field() == "entity_type");
  }

  assert(Throws<engram::util::ValidationError>([&] { f.store->Store("main", Task("a/b", "slash")); }));
  assert(Throws<engram::util::ValidationError>([&] { f.store->Store("main", Task("t3", "nobody", "")); }));

  auto reasoning = MakeEntity("reasoning", "r1", "alice");
  SetStringField(reasoning, "title", "why");
  SetStringField(reasoning, "task_id", "t1");
  SetNumberField(reasoning, "confidence", 1.5);
  assert(Throws<engram::util::ValidationError>([&] { f.store->Store("main", reasoning); }));

  // nothing persisted by rejected writes
  assert(f.store->List("main").empty());
  assert(f.objects->List().empty());
}

void TestRejectsMalformedUtf8() {
  Fixture f;

  try {
    f.store->Store("main", Task("t1", "bad \xff\xfe bytes"));
    assert(false && "invalid UTF-8 must be rejected");
  } catch (const engram::util::ValidationError& e) {
    assert(e.field() == "title");
  }

  // surrogate halves and overlong forms are not UTF-8 either
  assert(Throws<engram::util::ValidationError>([&] { f.store->Store("main", Task("t1", "\xed\xa0\x80")); }));
  assert(Throws<engram::util::ValidationError>([&] { f.store->Store("main", Task("t1", "\xc0\xaf")); }));
  assert(Throws<engram::util::ValidationError>([&] { f.store->Store("main", Task("t\xff", "id")); }));
  assert(Throws<engram::util::ValidationError>([&] { f.store->Store("main", Task("t1", "agent", "\x80")); }));

  auto nested = Task("t1", "nested");
  auto& meta  = *(*nested.mutable_fields()->mutable_fields())["meta"].mutable_struct_value()->mutable_fields();
  meta["tags"].mutable_list_value()->add_values()->set_string_value("ok\xf5");
  try {
    f.store->Store("main", nested);
    assert(false && "invalid UTF-8 inside a list must be rejected");
  } catch (const engram::util::ValidationError& e) {
    assert(e.field() == "meta");
  }

  auto bad_key = Task("t1", "key");
  (*bad_key.mutable_fields()->mutable_fields())["k\xfe"].set_string_value("v");
  assert(Throws<engram::util::ValidationError>([&] { f.store->Store("main", bad_key); }));

  assert(f.store->List("main").empty());
  assert(f.objects->List().empty());

  // multi-byte text round-trips
  f.store->Store("main", Task("t2", "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x90\x98"));
  assert(engram::entity::GetStringField(f.store->Get("main", "task", "t2"), "title") == "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x90\x98");
}

void TestCustomTypeRegistration() {
  Fixture f;
  f.registry->Register("spaceship", [](const Entity& e) { engram::entity::RequireString(e, "name"); });
  assert(Throws<engram::util::AlreadyExists>([&] { f.registry->Register("task", nullptr); }));
  assert(Throws<engram::util::InvalidInput>([&] { f.registry->Register("", nullptr); }));
  // "a:b" + "c" and "a" + "b:c" would render as the same ref
  assert(Throws<engram::util::InvalidInput>([&] { f.registry->Register("a:b", nullptr); }));

  auto ship = MakeEntity("spaceship", "s1", "alice");
  SetStringField(ship, "name", "Heart of Gold");
  f.store->Store("main", ship);
  assert(f.store->Find("main", "spaceship", "s1").has_value());
}

void TestUnknownBranchAndMissingEntity() {
  Fixture f;
  assert(Throws<engram::util::NotFound>([&] { f.store->Store("nope", Task("t1", "x")); }));
  assert(Throws<engram::util::NotFound>([&] { (void)f.store->Get("main", "task", "absent"); }));
  assert(!f.store->Find("main", "task", "absent").has_value());
  assert(Throws<engram::util::NotFound>([&] { (void)f.store->History("main", "task", "absent"); }));
}

void TestBranchIsolationAndSharedObjects() {
  Fixture f;
  auto    task = Task("t1", "shared");
  task.set_created_at_ms(1);
  task.set_updated_at_ms(1);

  const auto on_main    = f.store->Store("main", task);
  const auto on_scratch = f.store->Store("scratch", task);
  assert(on_main == on_scratch);
  assert(f.objects->List().size() == 1);

  f.store->Store("scratch", Task("t1", "scratch only"));
  assert(engram::entity::GetStringField(f.store->Get("main", "task", "t1"), "title") == "shared");
}

void TestListOrderingAndArchive() {
  Fixture f;
  f.store->Store("main", Task("b", "B"));
  f.store->Store("main", Task("a", "A"));

  auto note = MakeEntity("knowledge", "k1", "alice");
  SetStringField(note, "title", "T");
  SetStringField(note, "content", "C");
  f.store->Store("main", note);

  auto all = f.store->List("main");
  assert(all.size() == 3);
  assert(all[0].key().entity_type() == "knowledge");
  assert(all[1].key().entity_id() == "a");
  assert(all[2].key().entity_id() == "b");
  assert(f.store->List("main", "task").size() == 2);

  f.store->Archive("main", "task", "a", "bob");
  auto archived = f.store->Get("main", "task", "a");
  assert(archived.archived());
  assert(archived.agent() == "bob");
  assert(f.store->List("main", "task").size() == 1);
  assert(f.store->List("main", "task", true).size() == 2);
  assert(f.store->History("main", "task", "a").size() == 2);
}

void TestConcurrentUpdatesNeverLoseWrites() {
  Fixture f;
  auto    counter = Task("c", "counter");
  SetNumberField(counter, "n", 0);
  f.store->Store("main", counter);

  constexpr int            kThreads   = 4;
  constexpr int            kPerThread = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kPerThread; ++i) {
        f.store->Update(
            "main", "task", "c",
            [](Entity& e) { SetNumberField(e, "n", engram::entity::GetNumberField(e, "n") + 1); }, 10000);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(engram::entity::GetNumberField(f.store->Get("main", "task", "c"), "n") == kThreads * kPerThread);
}

} // namespace

int main() {
  TestStoreStampsAndVersions();
  TestCallerTimestampsArePreserved();
  TestExpectedHashGuardsTheSwap();
  TestValidation();
  TestRejectsMalformedUtf8();
  TestCustomTypeRegistration();
  TestUnknownBranchAndMissingEntity();
  TestBranchIsolationAndSharedObjects();
  TestListOrderingAndArchive();
  TestConcurrentUpdatesNeverLoseWrites();

  std::cout << "engram_unit_entity_store: pass\n";
  return 0;
}
