#pragma once

#include <string>
#include <tuple>

namespace engram::graph {

// (entity_type, entity_id) endpoint of a relationship.
struct EntityRef {
  std::string type;
  std::string id;

  // "type:id" for display; types never contain ':'
  std::string ToString() const {
    return type + ":" + id;
  }

  bool operator==(const EntityRef& other) const {
    return type == other.type && id == other.id;
  }

  bool operator!=(const EntityRef& other) const {
    return !(*this == other);
  }

  // (type, id), the tie-break order used by traversal
  bool operator<(const EntityRef& other) const {
    return std::tie(type, id) < std::tie(other.type, other.id);
  }
};

} // namespace engram::graph
