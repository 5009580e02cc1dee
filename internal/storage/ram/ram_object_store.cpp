#include "ram_object_store.hpp"

#include <mutex>

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace engram::storage {

std::string RamObjectStore::Put(const std::shared_ptr<arrow::Buffer>& buffer) {
  auto digest = engram::util::Sha256Hex(buffer->data(), static_cast<std::size_t>(buffer->size()));

  std::unique_lock lock(mutex_);
  // First writer wins; later identical puts are no-ops.
  objects_.try_emplace(digest, buffer);
  return digest;
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamObjectStore::Get(const std::string& digest) {
  std::shared_lock lock(mutex_);

  auto it = objects_.find(digest);
  if (it == objects_.end()) throw engram::util::NotFound("object not found: " + digest);

  return it->second;
}

bool RamObjectStore::Contains(const std::string& digest) {
  std::shared_lock lock(mutex_);
  return objects_.contains(digest);
}

uint64_t RamObjectStore::Size(const std::string& digest) {
  return static_cast<uint64_t>(Get(digest)->size());
}

std::vector<std::string> RamObjectStore::List() {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> digests;
  digests.reserve(objects_.size());
  for (const auto& [digest, _] : objects_) {
    digests.push_back(digest);
  }
  return digests;
}

} // namespace engram::storage
