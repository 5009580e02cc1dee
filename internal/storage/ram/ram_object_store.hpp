#pragma once

#include <arrow/buffer.h>

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

#include "internal/storage/object_store.hpp"

namespace engram::storage {

/*
  RAM object space.

  Provides zero-copy reads to callers.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamObjectStore final : public ObjectStore {
 public:
  RamObjectStore()           = default;
  ~RamObjectStore() override = default;

  std::string                    Put(const std::shared_ptr<arrow::Buffer>& buffer) override;
  std::shared_ptr<arrow::Buffer> Get(const std::string& digest) override;
  bool                           Contains(const std::string& digest) override;
  uint64_t                       Size(const std::string& digest) override;
  std::vector<std::string>       List() override;

  std::string BackendName() const override {
    return "ram";
  }

 private:
  mutable std::shared_mutex                             mutex_;
  std::map<std::string, std::shared_ptr<arrow::Buffer>> objects_;
};

} // namespace engram::storage
