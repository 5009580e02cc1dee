#pragma once

#include <cstdint>
#include <string>

namespace engram::db::model {

/*
  Latest pointer: (branch, entity_type, entity_id) -> content hash.

  The only mutable per-entity state. Re-pointing is compare-and-swap on
  content_hash; version counts successful swaps on this branch.
*/

struct PointerRecord {
  std::string branch;
  std::string entity_type;
  std::string entity_id;

  std::string content_hash;

  uint64_t version       = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace engram::db::model
