#include "path_finder.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <queue>
#include <tuple>
#include <utility>

#include "internal/util/errors.hpp"

namespace engram::graph {

namespace {

struct Visit {
  EntityRef   previous;
  std::string relationship_id;
  uint64_t    cost  = 0;
  std::size_t depth = 0;
};

// A node reached at a given hop count. With max_depth set a node can be
// reached again through a shallower path, so visits are kept per state.
using State = std::pair<EntityRef, std::size_t>;

struct Visits {
  std::map<State, Visit>          states;
  std::map<EntityRef, std::size_t> reached; // node -> depth of the state reported for it
};

bool WithinDepth(const TraversalOptions& options, std::size_t depth) {
  return !options.max_depth || depth <= *options.max_depth;
}

// Whether a node already reached at `depths` makes a new arrival at `depth` redundant.
bool Covered(const std::map<EntityRef, std::size_t>& depths, const TraversalOptions& options, const EntityRef& node, std::size_t depth) {
  auto it = depths.find(node);
  if (it == depths.end()) return false;
  return !options.max_depth || it->second <= depth;
}

PathResult Unwind(const Visits& visits, const EntityRef& source, const EntityRef& target) {
  PathResult result;
  State      current{target, visits.reached.at(target)};
  result.total_cost = visits.states.at(current).cost;

  while (current.first != source) {
    const auto& v = visits.states.at(current);
    result.entities.push_back(current.first);
    result.relationship_ids.push_back(v.relationship_id);
    current = {v.previous, v.depth - 1};
  }
  result.entities.push_back(source);

  std::reverse(result.entities.begin(), result.entities.end());
  std::reverse(result.relationship_ids.begin(), result.relationship_ids.end());
  return result;
}

// Each search stops early once `target` is settled; `order` receives
// nodes as they are first settled, start excluded.

Visits Bfs(const RelationshipIndex& index, const EntityRef& start, const EntityRef* target, const TraversalOptions& options,
           std::vector<EntityRef>* order) {
  Visits visits;
  visits.states.emplace(State{start, 0}, Visit{start, "", 0, 0});
  visits.reached.emplace(start, 0);
  std::deque<EntityRef> queue{start};

  // hop counts grow monotonically, so the first arrival is the shallowest
  while (!queue.empty()) {
    auto current = queue.front();
    queue.pop_front();
    const auto depth = visits.reached.at(current);
    if (target && current == *target) break;
    if (!WithinDepth(options, depth + 1)) continue;

    for (const auto& hop : index.Hops(current, options.relationship_type)) {
      if (visits.reached.contains(hop.node)) continue;
      visits.states.emplace(State{hop.node, depth + 1}, Visit{current, hop.relationship_id, depth + 1, depth + 1});
      visits.reached.emplace(hop.node, depth + 1);
      if (order) order->push_back(hop.node);
      queue.push_back(hop.node);
    }
  }
  return visits;
}

Visits Dfs(const RelationshipIndex& index, const EntityRef& start, const EntityRef* target, const TraversalOptions& options,
           std::vector<EntityRef>* order) {
  struct Frame {
    EntityRef node;
    Visit     via;
  };

  Visits             visits;
  std::vector<Frame> stack{{start, Visit{start, "", 0, 0}}};

  while (!stack.empty()) {
    auto frame = std::move(stack.back());
    stack.pop_back();
    const auto depth = frame.via.depth;
    if (Covered(visits.reached, options, frame.node, depth)) continue;

    const bool first = !visits.reached.contains(frame.node);
    visits.reached[frame.node] = depth;
    visits.states.emplace(State{frame.node, depth}, frame.via);
    if (first && order && frame.node != start) order->push_back(frame.node);
    if (target && frame.node == *target) break;
    if (!WithinDepth(options, depth + 1)) continue;

    auto hops = index.Hops(frame.node, options.relationship_type);
    // reversed so the smallest ref is explored first
    for (auto it = hops.rbegin(); it != hops.rend(); ++it) {
      if (Covered(visits.reached, options, it->node, depth + 1)) continue;
      stack.push_back({it->node, Visit{frame.node, it->relationship_id, depth + 1, depth + 1}});
    }
  }
  return visits;
}

Visits Dijkstra(const RelationshipIndex& index, const EntityRef& start, const EntityRef* target, const TraversalOptions& options,
                std::vector<EntityRef>* order) {
  using Entry = std::tuple<uint64_t, EntityRef, std::size_t>;
  auto later  = [](const Entry& a, const Entry& b) { return a > b; };

  // candidate costs per state; a node's reported state is the first one settled
  std::map<State, Visit>                                          best{{State{start, 0}, Visit{start, "", 0, 0}}};
  Visits                                                          visits;
  std::map<EntityRef, std::size_t>                                settled; // shallowest settled depth
  std::priority_queue<Entry, std::vector<Entry>, decltype(later)> queue(later);
  queue.emplace(0, start, 0);

  while (!queue.empty()) {
    auto [cost, current, depth] = queue.top();
    queue.pop();
    // a cheaper arrival that is no deeper already settled this node
    if (Covered(settled, options, current, depth)) continue;

    settled[current] = depth;
    if (visits.reached.emplace(current, depth).second && order && current != start) order->push_back(current);
    visits.states.emplace(State{current, depth}, best.at(State{current, depth}));
    if (target && current == *target) break;
    if (!WithinDepth(options, depth + 1)) continue;

    for (const auto& hop : index.Hops(current, options.relationship_type)) {
      const auto next_cost = cost + TraversalCost(hop.strength);
      if (Covered(settled, options, hop.node, depth + 1)) continue;

      State next{hop.node, depth + 1};
      auto  it = best.find(next);
      if (it != best.end() && it->second.cost <= next_cost) continue;
      best[next] = Visit{current, hop.relationship_id, next_cost, depth + 1};
      queue.emplace(next_cost, hop.node, depth + 1);
    }
  }
  return visits;
}

Visits Search(const RelationshipIndex& index, const EntityRef& start, const EntityRef* target, Algorithm algorithm,
                const TraversalOptions& options, std::vector<EntityRef>* order) {
  switch (algorithm) {
    case Algorithm::kBfs:
      return Bfs(index, start, target, options, order);
    case Algorithm::kDfs:
      return Dfs(index, start, target, options, order);
    case Algorithm::kDijkstra:
      return Dijkstra(index, start, target, options, order);
  }
  return Bfs(index, start, target, options, order);
}

} // namespace

Algorithm ParseAlgorithm(const std::string& name) {
  if (name == "bfs") return Algorithm::kBfs;
  if (name == "dfs") return Algorithm::kDfs;
  if (name == "dijkstra") return Algorithm::kDijkstra;
  throw util::InvalidInput("unknown traversal algorithm '" + name + "'; use bfs, dfs or dijkstra");
}

const char* ToString(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::kBfs:
      return "bfs";
    case Algorithm::kDfs:
      return "dfs";
    case Algorithm::kDijkstra:
      return "dijkstra";
  }
  return "bfs";
}

std::optional<PathResult> FindPath(const RelationshipIndex& index, const EntityRef& source, const EntityRef& target, Algorithm algorithm,
                                   const TraversalOptions& options) {
  if (source == target) {
    PathResult trivial;
    trivial.entities.push_back(source);
    return trivial;
  }

  auto visits = Search(index, source, &target, algorithm, options, nullptr);
  if (!visits.reached.contains(target)) return std::nullopt;
  return Unwind(visits, source, target);
}

std::vector<EntityRef> Reachable(const RelationshipIndex& index, const EntityRef& start, Algorithm algorithm, const TraversalOptions& options) {
  std::vector<EntityRef> order;
  Search(index, start, nullptr, algorithm, options, &order);
  return order;
}

} // namespace engram::graph
