#pragma once

#include <arrow/buffer.h>

#include <atomic>
#include <filesystem>

#include "internal/storage/object_store.hpp"

namespace engram::storage {

/*
  Durable object space using Arrow IO.

  Layout:
    <root>/objects/<aa>/<bb>/<digest>

  Properties:
    - atomic writes: unique tmp file -> flush -> rename
    - a failed write removes its tmp file, never leaving a partial object
    - existing objects short-circuit the write
    - reads re-hash and reject corrupt objects
*/

class DiskObjectStore final : public ObjectStore {
 public:
  explicit DiskObjectStore(std::filesystem::path root, bool fsync = true);

  std::string                    Put(const std::shared_ptr<arrow::Buffer>& buffer) override;
  std::shared_ptr<arrow::Buffer> Get(const std::string& digest) override;
  bool                           Contains(const std::string& digest) override;
  uint64_t                       Size(const std::string& digest) override;
  std::vector<std::string>       List() override;

  std::string BackendName() const override {
    return "disk";
  }

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path TempPath(const std::filesystem::path& final_path);

  std::filesystem::path root_;
  bool                  fsync_;
  std::atomic<uint64_t> tmp_counter_{0};
};

} // namespace engram::storage
