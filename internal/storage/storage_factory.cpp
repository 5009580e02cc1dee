#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_object_store.hpp"
#include "ram/ram_object_store.hpp"

namespace engram::storage {

ObjectStorePtr StorageFactory::Build(const engram::runtime::config::ObjectStoreConfig& cfg) {
  if (cfg.has_disk()) {
    std::filesystem::path root = cfg.disk().root_path().empty() ? std::filesystem::path{"/tmp/engram"} : std::filesystem::path{cfg.disk().root_path()};
    return std::make_shared<DiskObjectStore>(std::move(root), cfg.disk().fsync());
  }
  return std::make_shared<RamObjectStore>();
}

} // namespace engram::storage
