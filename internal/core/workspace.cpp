#include "workspace.hpp"

#include <utility>

#include "internal/branch/branch_manager.hpp"
#include "internal/sync/sync_engine.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "internal/util/errors.hpp"

namespace engram::core {

Workspace::Workspace(engram::service::ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::string Workspace::ActiveBranch() const {
  return ctx_.branches->Active();
}

std::string Workspace::ActiveAgent() {
  return ctx_.branches->Get(ActiveBranch()).agent;
}

void Workspace::Fork(const std::string& name, const std::string& agent) {
  ctx_.branches->CreateBranch(name, agent, ActiveBranch());
  ctx_.branches->Switch(name);
}

void Workspace::Switch(const std::string& name) {
  ctx_.branches->Switch(name);
}

std::string Workspace::Store(engram::v1::Entity entity, const std::optional<std::string>& expected_hash) {
  const auto branch = ActiveBranch();
  if (entity.agent().empty()) entity.set_agent(ctx_.branches->Get(branch).agent);
  return ctx_.store->Store(branch, std::move(entity), expected_hash);
}

engram::v1::Entity Workspace::Get(const std::string& entity_type, const std::string& entity_id) {
  return ctx_.store->Get(ActiveBranch(), entity_type, entity_id);
}

std::optional<engram::v1::Entity> Workspace::Find(const std::string& entity_type, const std::string& entity_id) {
  return ctx_.store->Find(ActiveBranch(), entity_type, entity_id);
}

std::vector<engram::v1::Entity> Workspace::List(const std::string& entity_type, bool include_archived) {
  return ctx_.store->List(ActiveBranch(), entity_type, include_archived);
}

std::vector<std::string> Workspace::History(const std::string& entity_type, const std::string& entity_id) {
  return ctx_.store->History(ActiveBranch(), entity_type, entity_id);
}

std::string Workspace::Archive(const std::string& entity_type, const std::string& entity_id) {
  const auto branch = ActiveBranch();
  return ctx_.store->Archive(branch, entity_type, entity_id, ctx_.branches->Get(branch).agent);
}

std::string Workspace::Update(const std::string& entity_type, const std::string& entity_id, const entity::EntityStore::Mutator& mutator) {
  return ctx_.store->Update(ActiveBranch(), entity_type, entity_id, mutator);
}

std::string Workspace::Relate(graph::RelationshipSpec spec) {
  const auto branch = ActiveBranch();
  if (spec.agent.empty()) spec.agent = ctx_.branches->Get(branch).agent;
  return ctx_.graph->CreateRelationship(branch, spec);
}

void Workspace::Unrelate(const std::string& relationship_id) {
  const auto branch = ActiveBranch();
  ctx_.graph->DeleteRelationship(branch, relationship_id, ctx_.branches->Get(branch).agent);
}

std::vector<graph::Relationship> Workspace::Relationships(const graph::EntityRef& ref, const std::string& type_filter) {
  return ctx_.graph->ListRelationships(ActiveBranch(), ref, type_filter);
}

std::optional<graph::PathResult> Workspace::FindPath(const graph::EntityRef& source, const graph::EntityRef& target, graph::Algorithm algorithm,
                                                     const graph::TraversalOptions& options) {
  return ctx_.graph->FindPath(ActiveBranch(), source, target, algorithm, options);
}

std::vector<graph::EntityRef> Workspace::Connected(const graph::EntityRef& ref, const std::string& type_filter) {
  return ctx_.graph->Connected(ActiveBranch(), ref, type_filter);
}

graph::GraphStats Workspace::Stats(const graph::StatsScope& scope) {
  return ctx_.graph->Stats(ActiveBranch(), scope);
}

sync::SyncReport Workspace::SyncWith(const std::vector<std::string>& others, const std::string& strategy, const sync::SyncOptions& options) {
  if (others.empty()) throw util::InvalidInput("sync: name at least one branch to synchronize with");

  std::vector<std::string> branches{ActiveBranch()};
  branches.insert(branches.end(), others.begin(), others.end());

  if (ctx_.scheduler) return ctx_.scheduler->Submit(std::move(branches), strategy, options).get();
  return ctx_.sync->Sync(branches, strategy, options);
}

} // namespace engram::core
