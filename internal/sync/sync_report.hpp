#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace engram::sync {

struct SyncOptions {
  // compute the report, commit nothing
  bool dry_run = false;
};

enum class ConflictKind {
  kField,
  kEntity,
  kConstraint,
};

inline const char* ToString(ConflictKind kind) {
  switch (kind) {
    case ConflictKind::kField:
      return "field";
    case ConflictKind::kEntity:
      return "entity";
    case ConflictKind::kConstraint:
      return "constraint";
  }
  return "entity";
}

// One branch's divergent state of a key.
struct SyncCandidate {
  std::string branch;
  std::string agent;
  std::string content_hash;
  uint64_t    updated_at_ms = 0;
  // canonical JSON of the field value (field conflicts) or of the entity
  std::string value_json;
};

/*
  A disagreement the strategy did not settle on its own. Never thrown:
  a conflict is partial success and travels in the report.
*/
struct SyncConflict {
  std::string  entity_type;
  std::string  entity_id;
  std::string  field; // empty = whole entity
  ConflictKind kind = ConflictKind::kEntity;

  std::string                ancestor_hash; // empty = no common ancestor
  std::vector<SyncCandidate> candidates;

  std::string resolution;
  std::string detail;
  std::string fingerprint;
};

struct SyncReport {
  bool                     nothing_to_synchronize = false;
  std::vector<std::string> branches;
  std::string              strategy;

  uint64_t entities_examined = 0;
  // keys whose result differs from at least one branch
  uint64_t entities_merged = 0;
  // pointer swaps written
  uint64_t entities_updated = 0;

  // conflicts first recorded by this pass
  std::vector<SyncConflict> conflicts;
  // "type/id" keys left untouched pending operator resolution
  std::vector<std::string> escalated;

  bool     dry_run     = false;
  uint64_t generation  = 0;
  uint64_t duration_ms = 0;

  bool HasConflicts() const {
    return !conflicts.empty() || !escalated.empty();
  }
};

} // namespace engram::sync
