#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "engram/v1/entity.pb.h"

namespace engram::sync {

enum class StrategyKind {
  kLatestWins,
  kPriorityWins,
  kIntelligentMerge,
  kMergeWithConflictResolution,
};

struct Strategy {
  StrategyKind kind = StrategyKind::kIntelligentMerge;
  // author preferred by priority_wins
  std::string priority_agent;

  std::string Name() const;
};

/*
  Accepts latest_wins, intelligent_merge, merge_with_conflict_resolution and
  priority_wins:<agent>; '-' may replace '_' and case is ignored (the agent
  keeps its case). Throws util::UnknownStrategy otherwise.
*/
Strategy ParseStrategy(const std::string& name);

struct CandidateState {
  std::string        branch;
  std::string        content_hash;
  engram::v1::Entity entity;
};

/*
  Winner among candidates for latest_wins: greatest updated_at_ms, then the
  lexicographically smaller agent, then the smaller branch name.
*/
std::size_t PickLatest(const std::vector<CandidateState>& candidates);

// priority_wins: latest among the preferred agent's candidates, else PickLatest.
std::size_t PickPreferred(const std::vector<CandidateState>& candidates, const std::string& agent);

} // namespace engram::sync
