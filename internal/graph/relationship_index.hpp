#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "entity_ref.hpp"
#include "relationship.hpp"

namespace engram::graph {

// One traversable hop out of a node.
struct Hop {
  EntityRef   node;
  std::string relationship_id;
  Strength    strength = Strength::kMedium;
};

struct StatsScope {
  // empty = every relationship type
  std::string relationship_type;
  // restrict to edges touching an entity of this type; empty = all
  std::string entity_type;
};

struct GraphStats {
  uint64_t                        count      = 0;
  uint64_t                        node_count = 0;
  std::map<std::string, uint64_t> by_type;
  std::optional<EntityRef>        most_connected;
  uint64_t                        most_connected_degree = 0;
  double                          density               = 0;
  uint64_t                        bidirectional_count   = 0;
  double                          average_connections   = 0;
};

/*
  Derived adjacency over relationship entities of one branch.

  Rebuilt from the latest pointers on demand; never a source of truth.
  Inactive relationships are kept for listing but ignored by traversal,
  constraint counting and stats.

  Traversal follows outbound edges plus inbound bidirectional edges.
  Hops are ordered by (node type, node id, relationship id).
*/
class RelationshipIndex {
 public:
  RelationshipIndex() = default;
  explicit RelationshipIndex(std::vector<Relationship> relationships);

  void Add(Relationship relationship);

  // insertion order: (created_at_ms, id)
  const std::vector<Relationship>& All() const {
    return relationships_;
  }

  const Relationship* FindById(const std::string& id) const;

  // Relationships with ref as source or target, insertion order.
  std::vector<Relationship> Touching(const EntityRef& ref, const std::string& type_filter, bool include_inactive) const;

  std::vector<Hop> Hops(const EntityRef& ref, const std::string& type_filter) const;

  // Active edges of relationship_type with ref as source / target.
  uint64_t CountOutbound(const EntityRef& ref, const std::string& relationship_type) const;
  uint64_t CountInbound(const EntityRef& ref, const std::string& relationship_type) const;

  // Whether `to` is reachable from `from` over active edges of one type.
  bool Reaches(const EntityRef& from, const EntityRef& to, const std::string& relationship_type) const;

  GraphStats Stats(const StatsScope& scope) const;

 private:
  void Link(const Relationship& relationship);

  std::vector<Relationship>                  relationships_;
  std::map<EntityRef, std::vector<size_t>> adjacency_; // relationship positions traversable from a node
};

} // namespace engram::graph
