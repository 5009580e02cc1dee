#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "path_finder.hpp"
#include "relationship.hpp"
#include "relationship_index.hpp"

namespace engram::entity {
class EntityStore;
}

namespace engram::graph {

// A relationship a merged graph cannot accept.
struct Violation {
  std::string relationship_id;
  std::string reason;
};

/*
  Relationship graph over the entity layer.

  Relationships are ordinary entities of type "relationship"; this engine
  adds constraint enforcement on write and traversal over a
  RelationshipIndex rebuilt from the branch's latest pointers.

  The engine routes the store's relationship writes to StoreRelationship,
  so EntityStore::Store, Update and Archive of a relationship get the same
  checks as CreateRelationship. Writes are serialized per branch so the
  constraint checks and the pointer write observe one snapshot of the graph.

  Lock order: branch locks before any repository transaction.
*/
class GraphEngine {
 public:
  explicit GraphEngine(std::shared_ptr<entity::EntityStore> store);
  ~GraphEngine();

  GraphEngine(const GraphEngine&)            = delete;
  GraphEngine& operator=(const GraphEngine&) = delete;

  // Returns the relationship id.
  std::string CreateRelationship(const std::string& branch, const RelationshipSpec& spec);

  Relationship GetRelationship(const std::string& branch, const std::string& id);

  std::vector<Relationship> ListRelationships(const std::string& branch, const EntityRef& ref, const std::string& type_filter = {},
                                              bool include_inactive = false);

  // Soft delete: active=false in a new version.
  void DeleteRelationship(const std::string& branch, const std::string& id, const std::string& agent);

  /*
    EntityStore::Store contract for relationship entities. A version that
    adds an active edge, or changes one's endpoints, type or direction, must
    pass the endpoint and CheckConstraints checks against the rest of the
    branch; other edits and deactivation are stored as given.
  */
  std::string StoreRelationship(const std::string& branch, engram::v1::Entity entity, const std::optional<std::string>& expected_hash);

  /*
    Endpoint and constraint checks for writing `next` over the version at
    current_hash (std::nullopt = absent) on branch, inside tx. Skipped for
    inactive edges and for versions that keep the SameEdge of the current
    one. The caller holds the branch lock.
  */
  void GuardWrite(db::Transaction& tx, const std::string& branch, const Relationship& next, const std::optional<std::string>& current_hash);

  // Exclusive locks on `branches`, taken in name order. Held by writers that
  // persist relationships through EntityStore::Persist directly.
  std::vector<std::unique_lock<std::shared_mutex>> LockBranches(std::vector<std::string> branches);

  std::optional<PathResult> FindPath(const std::string& branch, const EntityRef& source, const EntityRef& target, Algorithm algorithm,
                                     const TraversalOptions& options = {});

  // Single-hop neighbours, sorted and unique.
  std::vector<EntityRef> Connected(const std::string& branch, const EntityRef& ref, const std::string& type_filter = {});

  std::vector<EntityRef> Reachable(const std::string& branch, const EntityRef& ref, Algorithm algorithm, const TraversalOptions& options = {});

  GraphStats Stats(const std::string& branch, const StatsScope& scope = {});

  RelationshipIndex LoadIndex(const std::string& branch);
  RelationshipIndex LoadIndex(db::Transaction& tx, const std::string& branch);

  /*
    Creation-time constraint checks against `index`:
      source_types / target_types -> util::ValidationError
      allow_cycles=false          -> util::CyclePrevented
      max_outbound / max_inbound  -> util::LimitExceeded
    Cycles are scoped to the candidate's relationship_type.
  */
  static void CheckConstraints(const RelationshipIndex& index, const Relationship& candidate);

  /*
    Re-validation of a merged graph. `changed` is accepted one by one in the
    given order on top of `accepted`; the ones that fail CheckConstraints
    are returned and left out.
  */
  static std::vector<Violation> ValidateGraph(RelationshipIndex accepted, const std::vector<Relationship>& changed);

 private:
  std::shared_ptr<std::shared_mutex> BranchMutex(const std::string& branch);

  // create: an existing id is util::AlreadyExists rather than an update.
  std::string Write(const std::string& branch, engram::v1::Entity entity, const std::optional<std::string>& expected_hash, bool create);

  std::shared_ptr<entity::EntityStore> store_;

  std::mutex                                                branch_mutexes_guard_;
  std::map<std::string, std::shared_ptr<std::shared_mutex>> branch_mutexes_;
};

} // namespace engram::graph
