#include "relationship_index.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <tuple>

namespace engram::graph {

namespace {

bool MatchesType(const Relationship& r, const std::string& type_filter) {
  return type_filter.empty() || r.relationship_type == type_filter;
}

bool InsertionOrder(const Relationship& a, const Relationship& b) {
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
  return a.id < b.id;
}

} // namespace

RelationshipIndex::RelationshipIndex(std::vector<Relationship> relationships) : relationships_(std::move(relationships)) {
  std::stable_sort(relationships_.begin(), relationships_.end(), InsertionOrder);
  for (const auto& r : relationships_) Link(r);
}

void RelationshipIndex::Link(const Relationship& r) {
  const size_t pos = static_cast<size_t>(&r - relationships_.data());
  if (!r.active) return;
  adjacency_[r.source].push_back(pos);
  if (r.Bidirectional()) adjacency_[r.target].push_back(pos);
}

void RelationshipIndex::Add(Relationship relationship) {
  relationships_.push_back(std::move(relationship));
  Link(relationships_.back());
}

const Relationship* RelationshipIndex::FindById(const std::string& id) const {
  for (const auto& r : relationships_) {
    if (r.id == id) return &r;
  }
  return nullptr;
}

std::vector<Relationship> RelationshipIndex::Touching(const EntityRef& ref, const std::string& type_filter, bool include_inactive) const {
  std::vector<Relationship> out;
  for (const auto& r : relationships_) {
    if (!include_inactive && !r.active) continue;
    if (!MatchesType(r, type_filter)) continue;
    if (r.source == ref || r.target == ref) out.push_back(r);
  }
  return out;
}

std::vector<Hop> RelationshipIndex::Hops(const EntityRef& ref, const std::string& type_filter) const {
  std::vector<Hop> out;
  auto             it = adjacency_.find(ref);
  if (it == adjacency_.end()) return out;

  for (size_t pos : it->second) {
    const auto& r = relationships_[pos];
    if (!MatchesType(r, type_filter)) continue;
    out.push_back({r.source == ref ? r.target : r.source, r.id, r.strength});
  }
  std::sort(out.begin(), out.end(), [](const Hop& a, const Hop& b) {
    return std::tie(a.node.type, a.node.id, a.relationship_id) < std::tie(b.node.type, b.node.id, b.relationship_id);
  });
  return out;
}

uint64_t RelationshipIndex::CountOutbound(const EntityRef& ref, const std::string& relationship_type) const {
  uint64_t n = 0;
  for (const auto& r : relationships_) {
    if (r.active && r.relationship_type == relationship_type && r.source == ref) ++n;
  }
  return n;
}

uint64_t RelationshipIndex::CountInbound(const EntityRef& ref, const std::string& relationship_type) const {
  uint64_t n = 0;
  for (const auto& r : relationships_) {
    if (r.active && r.relationship_type == relationship_type && r.target == ref) ++n;
  }
  return n;
}

bool RelationshipIndex::Reaches(const EntityRef& from, const EntityRef& to, const std::string& relationship_type) const {
  if (from == to) return true;

  std::set<EntityRef>    seen{from};
  std::deque<EntityRef> queue{from};
  while (!queue.empty()) {
    auto current = queue.front();
    queue.pop_front();
    for (const auto& hop : Hops(current, relationship_type)) {
      if (hop.node == to) return true;
      if (seen.insert(hop.node).second) queue.push_back(hop.node);
    }
  }
  return false;
}

GraphStats RelationshipIndex::Stats(const StatsScope& scope) const {
  GraphStats                      stats;
  std::map<EntityRef, uint64_t> degree;

  for (const auto& r : relationships_) {
    if (!r.active || !MatchesType(r, scope.relationship_type)) continue;
    if (!scope.entity_type.empty() && r.source.type != scope.entity_type && r.target.type != scope.entity_type) continue;

    ++stats.count;
    ++stats.by_type[r.relationship_type];
    if (r.Bidirectional()) ++stats.bidirectional_count;

    ++degree[r.source];
    ++degree[r.target];
  }

  stats.node_count = degree.size();
  for (const auto& [ref, d] : degree) {
    // map order makes the smaller ref win ties
    if (d > stats.most_connected_degree) {
      stats.most_connected_degree = d;
      stats.most_connected        = ref;
    }
  }

  if (stats.node_count > 1) {
    const double n = static_cast<double>(stats.node_count);
    stats.density  = static_cast<double>(stats.count) / (n * (n - 1));
  }
  if (stats.node_count > 0) {
    stats.average_connections = static_cast<double>(2 * stats.count) / static_cast<double>(stats.node_count);
  }
  return stats;
}

} // namespace engram::graph
