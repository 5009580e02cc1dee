#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace engram::storage {

/*
  Content-addressed object space.

  Every object is an immutable Arrow buffer addressed by the hex SHA-256 of
  its bytes. The space is append-only and shared by every branch.

  Guarantees for ALL implementations:
    - Put is idempotent: identical bytes yield the identical digest and a
      second Put performs no write.
    - A failed Put leaves no retrievable partial object.
    - Safe to call from multiple threads.

  Implementations:
    RAM   -> in-memory buffers (tests, ephemeral workspaces)
    DISK  -> Arrow file IO under a sharded objects/ directory
*/

class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // Persist bytes and return their digest. Throws util::StorageError on I/O
  // exhaustion.
  virtual std::string Put(const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  // Throws util::NotFound when the digest is absent.
  virtual std::shared_ptr<arrow::Buffer> Get(const std::string& digest) = 0;

  virtual bool Contains(const std::string& digest) = 0;

  virtual uint64_t Size(const std::string& digest) {
    return static_cast<uint64_t>(Get(digest)->size());
  }

  // All stored digests, sorted.
  virtual std::vector<std::string> List() = 0;

  virtual std::string BackendName() const = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace engram::storage
