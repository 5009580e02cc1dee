#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engram/v1/entity.pb.h"
#include "entity_ref.hpp"

namespace engram::entity {
class EntityRegistry;
}

namespace engram::graph {

inline constexpr const char* kRelationshipType = "relationship";

enum class Direction {
  kUnidirectional,
  kBidirectional,
};

// Ordinal: weak < medium < strong < critical.
enum class Strength {
  kWeak,
  kMedium,
  kStrong,
  kCritical,
};

/*
  Evaluated once, at creation, against the graph as it is then. Changing the
  constraints of later relationships never invalidates existing edges.
*/
struct Constraints {
  bool                     allow_cycles = true;
  std::optional<uint64_t>  max_outbound;
  std::optional<uint64_t>  max_inbound;
  std::vector<std::string> source_types;
  std::vector<std::string> target_types;
};

struct RelationshipSpec {
  EntityRef                source;
  EntityRef                target;
  std::string              relationship_type;
  Direction                direction = Direction::kUnidirectional;
  Strength                 strength  = Strength::kMedium;
  std::string              description;
  Constraints              constraints;
  google::protobuf::Struct metadata;

  std::string agent;

  // empty -> a fresh UUID
  std::string id;
};

// Decoded relationship entity.
struct Relationship {
  std::string              id;
  std::string              agent;
  EntityRef                source;
  EntityRef                target;
  std::string              relationship_type;
  Direction                direction = Direction::kUnidirectional;
  Strength                 strength  = Strength::kMedium;
  std::string              description;
  bool                     active = true;
  Constraints              constraints;
  google::protobuf::Struct metadata;
  uint64_t                 created_at_ms = 0;
  uint64_t                 updated_at_ms = 0;

  bool Bidirectional() const {
    return direction == Direction::kBidirectional;
  }
};

const char* ToString(Direction direction);
const char* ToString(Strength strength);

// Throw util::ValidationError for unknown names.
Direction ParseDirection(const std::string& name);
Strength  ParseStrength(const std::string& name);

// Both active with the same endpoints, type and direction. Edits that keep
// the edge (description, strength, metadata) are not re-checked against
// creation constraints.
bool SameEdge(const Relationship& a, const Relationship& b);

// Dijkstra edge cost: critical=1, strong=2, medium=3, weak=4.
uint64_t TraversalCost(Strength strength);

engram::v1::Entity ToEntity(const Relationship& relationship);

// Throws util::ValidationError when the entity is not a well-formed relationship.
Relationship FromEntity(const engram::v1::Entity& entity);

// Adds the "relationship" tag with the structural checks of FromEntity.
void RegisterRelationshipType(engram::entity::EntityRegistry& registry);

} // namespace engram::graph
