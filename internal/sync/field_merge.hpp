#pragma once

#include <string>
#include <vector>

#include "engram/v1/entity.pb.h"
#include "merge_strategy.hpp"

namespace engram::sync {

// The archived flag merges like a top-level field under this name.
inline constexpr const char* kArchivedField = "archived";

struct FieldMergeResult {
  engram::v1::Entity       merged;
  std::vector<std::string> conflicting_fields; // sorted
};

/*
  Three-way merge of top-level fields against `ancestor` (nullptr = none).

  Per field:
    unchanged by every candidate    -> ancestor value
    changed, all changes identical  -> the change (removal included)
    changed differently             -> conflict; ancestor value kept, or the
                                       latest candidate's value when there is
                                       no ancestor value
  Envelope: agent of the latest candidate, earliest created_at_ms, latest
  updated_at_ms.
*/
FieldMergeResult MergeFields(const engram::v1::Entity* ancestor, const std::vector<CandidateState>& candidates);

// Canonical JSON of one field ("null" when absent).
std::string FieldJson(const engram::v1::Entity& entity, const std::string& field);

} // namespace engram::sync
