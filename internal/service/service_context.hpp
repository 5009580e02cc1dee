#pragma once

#include <memory>

namespace engram::entity {
class EntityStore;
}
namespace engram::graph {
class GraphEngine;
}
namespace engram::branch {
class BranchManager;
}
namespace engram::sync {
class SyncEngine;
class SyncScheduler;
}

namespace engram::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<engram::entity::EntityStore>   store;
  std::shared_ptr<engram::graph::GraphEngine>    graph;
  std::shared_ptr<engram::branch::BranchManager> branches;
  std::shared_ptr<engram::sync::SyncEngine>      sync;
  std::shared_ptr<engram::sync::SyncScheduler>   scheduler;
};

} // namespace engram::service
