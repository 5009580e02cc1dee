#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "entity_ref.hpp"
#include "relationship_index.hpp"

namespace engram::graph {

enum class Algorithm {
  kBfs,
  kDfs,
  kDijkstra,
};

// "bfs", "dfs", "dijkstra"; util::InvalidInput otherwise.
Algorithm   ParseAlgorithm(const std::string& name);
const char* ToString(Algorithm algorithm);

struct TraversalOptions {
  // empty = follow every relationship type
  std::string relationship_type;
  // maximum number of hops; unset = unbounded
  std::optional<std::size_t> max_depth;
};

struct PathResult {
  std::vector<EntityRef>   entities;
  std::vector<std::string> relationship_ids;
  // hops for bfs/dfs, summed strength costs for dijkstra
  uint64_t total_cost = 0;
};

/*
  Path search over a RelationshipIndex.

  bfs      -> a shortest path by hop count
  dfs      -> the first path found visiting hops in ref order
  dijkstra -> a minimum-cost path, cost from TraversalCost(strength)
  Equal candidates resolve to the smaller (type, id).
  With max_depth set every search still finds a path whenever one within
  the bound exists, even if a deeper route reached a node first.
  No path is std::nullopt, not an error.
*/
std::optional<PathResult> FindPath(const RelationshipIndex& index, const EntityRef& source, const EntityRef& target, Algorithm algorithm,
                                   const TraversalOptions& options = {});

// Nodes reachable from start in visit order, start excluded.
std::vector<EntityRef> Reachable(const RelationshipIndex& index, const EntityRef& start, Algorithm algorithm, const TraversalOptions& options = {});

} // namespace engram::graph
