#pragma once

#include <cstdint>
#include <string>

namespace engram::db::model {

/*
  Append-only history entry. One per successful pointer swap.
*/

struct HistoryRecord {
  std::string branch;
  std::string entity_type;
  std::string entity_id;

  // matches PointerRecord::version after the swap
  uint64_t version = 0;

  std::string content_hash;
  std::string agent;

  uint64_t recorded_at_ms = 0;
};

} // namespace engram::db::model
