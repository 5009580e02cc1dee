#pragma once

#include <cstdint>
#include <string>

namespace engram::db::model {

/*
  Last agreed state of an entity on a branch.

  Written by a sync pass (or a fork) that included the branch. The base with
  the lowest generation among the branches holding the entity is their common
  ancestor for that entity.
*/

struct SyncBaseRecord {
  std::string branch;
  std::string entity_type;
  std::string entity_id;

  std::string content_hash;
  uint64_t    generation = 0;
};

} // namespace engram::db::model
