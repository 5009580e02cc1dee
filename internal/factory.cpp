#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/relationship.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"
#if ENGRAM_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ENGRAM_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace engram::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const engram::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if ENGRAM_DB_SQLITE
    const auto busy_timeout_ms = database.sqlite().busy_timeout_ms() == 0 ? db::sqlite::SqliteDB::kDefaultBusyTimeoutMs : database.sqlite().busy_timeout_ms();
    auto       sqlite_db       = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), busy_timeout_ms);
    sqlite_db->Bootstrap();
    ENGRAM_LOG_INFO("sqlite repository ready", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidInput("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ENGRAM_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections,
                                                                std::chrono::milliseconds(database.postgres().acquire_timeout_ms()));
    auto       repository      = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    repository->Bootstrap();
    ENGRAM_LOG_INFO("postgres repository ready", {observability::IntField("max_connections", max_connections)});
    return repository;
#else
    throw util::InvalidInput("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

service::ServiceContext Application::Context() const {
  service::ServiceContext ctx;
  ctx.store     = store;
  ctx.graph     = graph;
  ctx.branches  = branches;
  ctx.sync      = sync;
  ctx.scheduler = scheduler;
  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const engram::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.objects    = storage::StorageFactory::Build(config.objects());
  app.repository = BuildRepository(config.database());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.registry = std::make_shared<entity::EntityRegistry>();
  graph::RegisterRelationshipType(*app.registry);

  app.store    = std::make_shared<entity::EntityStore>(app.repository, app.objects, app.registry);
  app.graph    = std::make_shared<graph::GraphEngine>(app.store);
  app.branches = std::make_shared<branch::BranchManager>(app.repository, config.branches().default_branch(), config.branches().default_agent());
  app.branches->Bootstrap();

  // ------------------------------------------------------------------
  // Sync system
  // ------------------------------------------------------------------
  app.sync        = std::make_shared<sync::SyncEngine>(app.store, static_cast<int>(config.sync().max_stale_retries()), app.graph);
  app.scheduler   = std::make_shared<sync::SyncScheduler>();
  app.sync_worker = std::make_shared<sync::SyncWorker>(app.scheduler, app.sync);
  app.sync_worker->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  const auto ctx = app.Context();
  app.workspace  = std::make_shared<core::Workspace>(ctx);
  app.validation = std::make_shared<service::ValidationView>(ctx);
  app.exports    = std::make_shared<service::ExportService>(ctx);

  ENGRAM_LOG_INFO("engram store ready", {observability::StringField("objects", app.objects->BackendName()),
                                         observability::StringField("branch", app.branches->Active())});
  return app;
}

} // namespace engram::factory
