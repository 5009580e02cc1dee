#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/branch/branch_manager.hpp"
#include "internal/core/workspace.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/entity/entity_registry.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/graph/graph_engine.hpp"
#include "internal/service/export_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/validation_view.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/sync/sync_engine.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "internal/sync/sync_worker.hpp"

namespace engram::factory {

/*
  Application

  Owns all long-lived components of one store.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  storage::ObjectStorePtr                 objects;
  std::shared_ptr<db::Repository>         repository;
  std::shared_ptr<entity::EntityRegistry> registry;

  std::shared_ptr<entity::EntityStore>   store;
  std::shared_ptr<graph::GraphEngine>    graph;
  std::shared_ptr<branch::BranchManager> branches;
  std::shared_ptr<sync::SyncEngine>      sync;
  std::shared_ptr<sync::SyncScheduler>   scheduler;

  std::shared_ptr<core::Workspace>         workspace;
  std::shared_ptr<service::ValidationView> validation;
  std::shared_ptr<service::ExportService>  exports;

  // Keep ownership of workers so they live for process lifetime
  std::shared_ptr<sync::SyncWorker> sync_worker;

  service::ServiceContext Context() const;
};

/*
  Build

  Constructs the entire store based on runtime config: object space,
  repository (schema bootstrapped), registry with the relationship type,
  default branch, and a started sync worker.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete backend types.
*/
Application Build(const engram::runtime::config::RuntimeConfig& config);

} // namespace engram::factory
