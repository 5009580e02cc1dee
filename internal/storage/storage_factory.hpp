#pragma once

#include "config/config.pb.h"
#include "object_store.hpp"

namespace engram::storage {

/*
  Builds the object space from configuration.

      auto objects = StorageFactory::Build(config.objects());
      auto digest  = objects->Put(buffer);
*/

class StorageFactory {
 public:
  static ObjectStorePtr Build(const engram::runtime::config::ObjectStoreConfig& cfg);
};

} // namespace engram::storage
