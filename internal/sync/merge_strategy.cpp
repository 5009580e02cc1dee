#include "merge_strategy.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include "internal/util/errors.hpp"

namespace engram::sync {

namespace {

std::string Normalize(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    out.push_back(c == '-' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool Later(const CandidateState& a, const CandidateState& b) {
  if (a.entity.updated_at_ms() != b.entity.updated_at_ms()) return a.entity.updated_at_ms() > b.entity.updated_at_ms();
  if (a.entity.agent() != b.entity.agent()) return a.entity.agent() < b.entity.agent();
  return a.branch < b.branch;
}

} // namespace

std::string Strategy::Name() const {
  switch (kind) {
    case StrategyKind::kLatestWins:
      return "latest_wins";
    case StrategyKind::kPriorityWins:
      return "priority_wins:" + priority_agent;
    case StrategyKind::kIntelligentMerge:
      return "intelligent_merge";
    case StrategyKind::kMergeWithConflictResolution:
      return "merge_with_conflict_resolution";
  }
  return "intelligent_merge";
}

Strategy ParseStrategy(const std::string& name) {
  const auto colon = name.find(':');
  const auto head  = Normalize(name.substr(0, colon));

  Strategy strategy;
  if (colon != std::string::npos) {
    if (head != "priority_wins" || colon + 1 >= name.size()) {
      throw util::UnknownStrategy("unknown sync strategy '" + name + "'");
    }
    strategy.kind           = StrategyKind::kPriorityWins;
    strategy.priority_agent = name.substr(colon + 1);
    return strategy;
  }

  if (head == "latest_wins") {
    strategy.kind = StrategyKind::kLatestWins;
  } else if (head == "intelligent_merge") {
    strategy.kind = StrategyKind::kIntelligentMerge;
  } else if (head == "merge_with_conflict_resolution") {
    strategy.kind = StrategyKind::kMergeWithConflictResolution;
  } else {
    throw util::UnknownStrategy("unknown sync strategy '" + name +
                                "'; use latest_wins, intelligent_merge, merge_with_conflict_resolution or priority_wins:<agent>");
  }
  return strategy;
}

std::size_t PickLatest(const std::vector<CandidateState>& candidates) {
  std::size_t best = 0;
  for (std::size_t i = 1; i < candidates.size(); ++i) {
    if (Later(candidates[i], candidates[best])) best = i;
  }
  return best;
}

std::size_t PickPreferred(const std::vector<CandidateState>& candidates, const std::string& agent) {
  std::optional<std::size_t> best;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    if (candidates[i].entity.agent() != agent) continue;
    if (!best || Later(candidates[i], candidates[*best])) best = i;
  }
  return best ? *best : PickLatest(candidates);
}

} // namespace engram::sync
