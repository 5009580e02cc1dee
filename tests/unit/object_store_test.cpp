#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/disk_object_store.hpp"
#include "internal/storage/ram/ram_object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace {

using engram::storage::ObjectStore;
using engram::storage::common::BufferFromString;
using engram::storage::common::View;

// sha256("hello")
constexpr const char* kHelloDigest = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";

std::filesystem::path TempRoot(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() / ("engram_object_store_" + name + "_" + std::to_string(stamp));
}

void VerifyPutGet(ObjectStore& store) {
  const auto digest = store.Put(BufferFromString("hello"));
  assert(digest == kHelloDigest);
  assert(engram::util::IsDigest(digest));
  assert(store.Contains(digest));
  assert(store.Size(digest) == 5);
  assert(View(*store.Get(digest)) == "hello");

  // idempotent
  assert(store.Put(BufferFromString("hello")) == digest);
  assert(store.List().size() == 1);

  const auto empty = store.Put(BufferFromString(""));
  assert(store.Get(empty)->size() == 0);

  auto all = store.List();
  assert(all.size() == 2);
  assert(all[0] < all[1]);
}

void VerifyMissingDigest(ObjectStore& store) {
  const std::string missing(64, '0');
  assert(!store.Contains(missing));

  bool threw = false;
  try {
    (void)store.Get(missing);
  } catch (const engram::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestRamObjectStore() {
  engram::storage::RamObjectStore store;
  assert(store.BackendName() == "ram");
  VerifyPutGet(store);
  VerifyMissingDigest(store);
}

void TestDiskObjectStoreLayoutAndPersistence() {
  const auto root = TempRoot("layout");
  {
    engram::storage::DiskObjectStore store(root, false);
    assert(store.BackendName() == "disk");
    VerifyPutGet(store);
    VerifyMissingDigest(store);

    const auto path = root / "objects" / "2c" / "f2" / kHelloDigest;
    assert(std::filesystem::exists(path));
  }

  // reopened store sees the same objects
  engram::storage::DiskObjectStore reopened(root, false);
  assert(reopened.Contains(kHelloDigest));
  assert(View(*reopened.Get(kHelloDigest)) == "hello");

  std::filesystem::remove_all(root);
}

void TestDiskObjectStoreDurablePuts() {
  const auto root = TempRoot("fsync");
  {
    engram::storage::DiskObjectStore store(root, true);
    VerifyPutGet(store);

    // a synced put leaves only final objects behind
    std::size_t files = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root / "objects")) {
      if (entry.is_regular_file()) {
        ++files;
        assert(engram::util::IsDigest(entry.path().filename().string()));
      }
    }
    assert(files == 2);
  }

  engram::storage::DiskObjectStore reopened(root, true);
  assert(View(*reopened.Get(kHelloDigest)) == "hello");

  std::filesystem::remove_all(root);
}

void TestDiskObjectStoreDetectsCorruption() {
  const auto                       root = TempRoot("corrupt");
  engram::storage::DiskObjectStore store(root, false);
  const auto                       digest = store.Put(BufferFromString("hello"));

  {
    std::ofstream out(root / "objects" / "2c" / "f2" / digest, std::ios::binary | std::ios::trunc);
    out << "jello";
  }

  bool threw = false;
  try {
    (void)store.Get(digest);
  } catch (const engram::util::StorageError&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestRamObjectStore();
  TestDiskObjectStoreLayoutAndPersistence();
  TestDiskObjectStoreDurablePuts();
  TestDiskObjectStoreDetectsCorruption();

  std::cout << "engram_unit_object_store: pass\n";
  return 0;
}
