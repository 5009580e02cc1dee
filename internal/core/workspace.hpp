#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engram/v1/entity.pb.h"
#include "internal/entity/entity_store.hpp"
#include "internal/graph/graph_engine.hpp"
#include "internal/service/service_context.hpp"
#include "internal/sync/sync_report.hpp"

namespace engram::core {

/*
  Agent-facing facade.

  Every entity and graph call lands on the branch that is active when the
  call starts; Switch moves later calls. Entities written without an agent
  are attributed to the active branch's owner.
*/
class Workspace {
 public:
  explicit Workspace(engram::service::ServiceContext ctx);

  // ---------------------------------------------------------------------
  // Branches
  // ---------------------------------------------------------------------

  std::string ActiveBranch() const;
  std::string ActiveAgent();

  // Creates `name` forked from the active branch and switches to it.
  void Fork(const std::string& name, const std::string& agent);
  void Switch(const std::string& name);

  // ---------------------------------------------------------------------
  // Entities
  // ---------------------------------------------------------------------

  std::string                       Store(engram::v1::Entity entity, const std::optional<std::string>& expected_hash = std::nullopt);
  engram::v1::Entity                Get(const std::string& entity_type, const std::string& entity_id);
  std::optional<engram::v1::Entity> Find(const std::string& entity_type, const std::string& entity_id);
  std::vector<engram::v1::Entity>   List(const std::string& entity_type = {}, bool include_archived = false);
  std::vector<std::string>          History(const std::string& entity_type, const std::string& entity_id);
  std::string                       Archive(const std::string& entity_type, const std::string& entity_id);
  std::string Update(const std::string& entity_type, const std::string& entity_id, const entity::EntityStore::Mutator& mutator);

  // ---------------------------------------------------------------------
  // Relationships
  // ---------------------------------------------------------------------

  std::string                      Relate(graph::RelationshipSpec spec);
  void                             Unrelate(const std::string& relationship_id);
  std::vector<graph::Relationship> Relationships(const graph::EntityRef& ref, const std::string& type_filter = {});
  std::optional<graph::PathResult> FindPath(const graph::EntityRef& source, const graph::EntityRef& target, graph::Algorithm algorithm,
                                            const graph::TraversalOptions& options = {});
  std::vector<graph::EntityRef>    Connected(const graph::EntityRef& ref, const std::string& type_filter = {});
  graph::GraphStats                Stats(const graph::StatsScope& scope = {});

  // ---------------------------------------------------------------------
  // Synchronization
  // ---------------------------------------------------------------------

  // Synchronizes the active branch with `others` on the sync worker.
  sync::SyncReport SyncWith(const std::vector<std::string>& others, const std::string& strategy, const sync::SyncOptions& options = {});

 private:
  engram::service::ServiceContext ctx_;
};

} // namespace engram::core
