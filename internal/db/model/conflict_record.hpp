#pragma once

#include <cstdint>
#include <string>

namespace engram::db::model {

/*
  Persisted sync conflict awaiting operator attention.

  fingerprint identifies the (key, field, candidate set) so repeated passes
  over unchanged divergence do not record it twice.
*/

struct ConflictRecord {
  std::string fingerprint;

  std::string entity_type;
  std::string entity_id;

  // empty when the whole entity is escalated
  std::string field;

  std::string kind;     // "field", "entity", "constraint"
  std::string strategy; // strategy name of the pass that found it

  // canonical JSON: candidates, ancestor, detail
  std::string detail_json;

  uint64_t created_at_ms = 0;
  bool     resolved      = false;
};

} // namespace engram::db::model
