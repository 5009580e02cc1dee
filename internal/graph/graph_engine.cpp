#include "graph_engine.hpp"

#include <algorithm>

#include "internal/db/api/db_errors.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace engram::graph {

namespace {

bool Allowed(const std::vector<std::string>& allow_list, const std::string& type) {
  return allow_list.empty() || std::find(allow_list.begin(), allow_list.end(), type) != allow_list.end();
}

// Archived relationship entities are inactive edges.
Relationship Decode(const engram::v1::Entity& entity) {
  auto r = FromEntity(entity);
  if (entity.archived()) r.active = false;
  return r;
}

std::vector<Relationship> Decode(entity::EntityStore& store, const std::vector<db::model::PointerRecord>& pointers) {
  std::vector<Relationship> out;
  out.reserve(pointers.size());
  for (const auto& p : pointers) out.push_back(Decode(store.Load(p.content_hash)));
  return out;
}

} // namespace

GraphEngine::GraphEngine(std::shared_ptr<entity::EntityStore> store) : store_(std::move(store)) {
  store_->Route(kRelationshipType, [this](const std::string& branch, engram::v1::Entity entity, const std::optional<std::string>& expected_hash) {
    return StoreRelationship(branch, std::move(entity), expected_hash);
  });
}

GraphEngine::~GraphEngine() {
  store_->Route(kRelationshipType, nullptr);
}

std::vector<std::unique_lock<std::shared_mutex>> GraphEngine::LockBranches(std::vector<std::string> branches) {
  std::sort(branches.begin(), branches.end());
  branches.erase(std::unique(branches.begin(), branches.end()), branches.end());

  std::vector<std::unique_lock<std::shared_mutex>> locks;
  locks.reserve(branches.size());
  // the map keeps every mutex alive for the engine's lifetime
  for (const auto& branch : branches) locks.emplace_back(*BranchMutex(branch));
  return locks;
}

std::shared_ptr<std::shared_mutex> GraphEngine::BranchMutex(const std::string& branch) {
  std::lock_guard<std::mutex> lock(branch_mutexes_guard_);
  auto&                       branch_mutex = branch_mutexes_[branch];
  if (!branch_mutex) {
    branch_mutex = std::make_shared<std::shared_mutex>();
  }
  return branch_mutex;
}

RelationshipIndex GraphEngine::LoadIndex(db::Transaction& tx, const std::string& branch) {
  store_->RequireBranch(tx, branch);
  auto pointers = store_->Repository().ListPointers(tx, branch, kRelationshipType);
  return RelationshipIndex(Decode(*store_, pointers));
}

RelationshipIndex GraphEngine::LoadIndex(const std::string& branch) {
  auto tx    = store_->Repository().Begin();
  auto index = LoadIndex(*tx, branch);
  tx->Commit();
  return index;
}

void GraphEngine::CheckConstraints(const RelationshipIndex& index, const Relationship& r) {
  const auto& c = r.constraints;

  if (!Allowed(c.source_types, r.source.type)) {
    throw util::ValidationError("source_type", "'" + r.source.type + "' not allowed for " + r.relationship_type);
  }
  if (!Allowed(c.target_types, r.target.type)) {
    throw util::ValidationError("target_type", "'" + r.target.type + "' not allowed for " + r.relationship_type);
  }

  if (!c.allow_cycles) {
    const bool closes = index.Reaches(r.target, r.source, r.relationship_type) ||
                        (r.Bidirectional() && index.Reaches(r.source, r.target, r.relationship_type));
    if (closes) {
      throw util::CyclePrevented(r.relationship_type + " " + r.source.ToString() + " -> " + r.target.ToString() + " would close a cycle");
    }
  }

  if (c.max_outbound && index.CountOutbound(r.source, r.relationship_type) >= *c.max_outbound) {
    throw util::LimitExceeded(r.source.ToString() + " already has " + std::to_string(*c.max_outbound) + " outbound " + r.relationship_type +
                              " relationships");
  }
  if (c.max_inbound && index.CountInbound(r.target, r.relationship_type) >= *c.max_inbound) {
    throw util::LimitExceeded(r.target.ToString() + " already has " + std::to_string(*c.max_inbound) + " inbound " + r.relationship_type +
                              " relationships");
  }
}

std::vector<Violation> GraphEngine::ValidateGraph(RelationshipIndex accepted, const std::vector<Relationship>& changed) {
  std::vector<Violation> violations;
  for (const auto& r : changed) {
    if (!r.active) {
      accepted.Add(r);
      continue;
    }
    try {
      CheckConstraints(accepted, r);
      accepted.Add(r);
    } catch (const util::CyclePrevented& e) {
      violations.push_back({r.id, e.what()});
    } catch (const util::LimitExceeded& e) {
      violations.push_back({r.id, e.what()});
    } catch (const util::ValidationError& e) {
      violations.push_back({r.id, e.what()});
    }
  }
  return violations;
}

std::string GraphEngine::CreateRelationship(const std::string& branch, const RelationshipSpec& spec) {
  observability::SpanScope span("GraphEngine.CreateRelationship", branch);
  span.SetAttribute("engram.relationship_type", spec.relationship_type);

  Relationship r;
  r.id                = spec.id.empty() ? util::GenerateUUIDString() : spec.id;
  r.agent             = spec.agent;
  r.source            = spec.source;
  r.target            = spec.target;
  r.relationship_type = spec.relationship_type;
  r.direction         = spec.direction;
  r.strength          = spec.strength;
  r.description       = spec.description;
  r.constraints       = spec.constraints;
  r.metadata          = spec.metadata;
  r.active            = true;

  Write(branch, ToEntity(r), std::nullopt, true);

  ENGRAM_LOG_INFO("relationship created",
                  {observability::StringField("branch", branch), observability::StringField("id", r.id),
                   observability::StringField("type", r.relationship_type), observability::StringField("source", r.source.ToString()),
                   observability::StringField("target", r.target.ToString())});
  return r.id;
}

void GraphEngine::GuardWrite(db::Transaction& tx, const std::string& branch, const Relationship& next,
                             const std::optional<std::string>& current_hash) {
  if (!next.active) return;
  if (current_hash && SameEdge(Decode(store_->Load(*current_hash)), next)) return;

  auto& repo = store_->Repository();
  for (const auto* end : {&next.source, &next.target}) {
    if (!repo.GetPointer(tx, branch, end->type, end->id)) {
      throw util::NotFound("relationship " + next.id + ": entity " + end->ToString() + " not found on " + branch);
    }
  }

  // checked against every relationship but its own prior version
  std::vector<Relationship> others;
  for (const auto& r : LoadIndex(tx, branch).All()) {
    if (r.id != next.id) others.push_back(r);
  }
  CheckConstraints(RelationshipIndex(std::move(others)), next);
}

std::string GraphEngine::StoreRelationship(const std::string& branch, engram::v1::Entity entity, const std::optional<std::string>& expected_hash) {
  return Write(branch, std::move(entity), expected_hash, false);
}

std::string GraphEngine::Write(const std::string& branch, engram::v1::Entity entity, const std::optional<std::string>& expected_hash,
                               bool create) {
  observability::SpanScope span("GraphEngine.StoreRelationship", branch);

  // structural checks before touching storage
  const auto next = Decode(entity);
  span.SetAttribute("engram.relationship_type", next.relationship_type);

  std::unique_lock<std::shared_mutex> lock(*BranchMutex(branch));
  try {
    auto  tx   = store_->Repository().Begin();
    auto& repo = store_->Repository();
    store_->RequireBranch(*tx, branch);

    std::optional<std::string> current;
    if (auto pointer = repo.GetPointer(*tx, branch, kRelationshipType, next.id)) current = pointer->content_hash;
    if (create && current) throw util::AlreadyExists("relationship " + next.id);
    if (expected_hash) {
      const bool matches = expected_hash->empty() ? !current.has_value() : current == *expected_hash;
      if (!matches) throw util::Stale("store relationship " + next.id + ": pointer moved since read; re-read and retry");
    }

    GuardWrite(*tx, branch, next, current);

    auto hash = store_->Persist(*tx, branch, std::move(entity), current);
    tx->Commit();
    return hash;
  } catch (const db::TransactionConflict& e) {
    span.RecordException(e.what());
    throw util::Stale("store relationship " + next.id + ": " + e.what());
  } catch (const util::CyclePrevented& e) {
    span.RecordException(e.what());
    ENGRAM_LOG_WARN("relationship rejected", {observability::StringField("branch", branch), observability::StringField("reason", e.what())});
    throw;
  } catch (const util::LimitExceeded& e) {
    span.RecordException(e.what());
    ENGRAM_LOG_WARN("relationship rejected", {observability::StringField("branch", branch), observability::StringField("reason", e.what())});
    throw;
  }
}

Relationship GraphEngine::GetRelationship(const std::string& branch, const std::string& id) {
  auto entity = store_->Find(branch, kRelationshipType, id);
  if (!entity) throw util::NotFound("relationship " + id + " not found on " + branch);
  return Decode(*entity);
}

std::vector<Relationship> GraphEngine::ListRelationships(const std::string& branch, const EntityRef& ref, const std::string& type_filter,
                                                         bool include_inactive) {
  return LoadIndex(branch).Touching(ref, type_filter, include_inactive);
}

void GraphEngine::DeleteRelationship(const std::string& branch, const std::string& id, const std::string& agent) {
  // Update re-enters through StoreRelationship, which takes the branch lock
  store_->Update(branch, kRelationshipType, id, [&](engram::v1::Entity& entity) {
    (*entity.mutable_fields()->mutable_fields())["active"].set_bool_value(false);
    entity.set_agent(agent);
  });

  ENGRAM_LOG_INFO("relationship deleted", {observability::StringField("branch", branch), observability::StringField("id", id)});
}

std::optional<PathResult> GraphEngine::FindPath(const std::string& branch, const EntityRef& source, const EntityRef& target, Algorithm algorithm,
                                                const TraversalOptions& options) {
  observability::SpanScope span("GraphEngine.FindPath", branch);
  span.SetAttribute("engram.algorithm", ToString(algorithm));

  std::shared_lock<std::shared_mutex> lock(*BranchMutex(branch));
  auto                                result = graph::FindPath(LoadIndex(branch), source, target, algorithm, options);
  span.SetAttribute("engram.path_found", static_cast<std::int64_t>(result.has_value()));
  return result;
}

std::vector<EntityRef> GraphEngine::Connected(const std::string& branch, const EntityRef& ref, const std::string& type_filter) {
  auto index = LoadIndex(branch);

  std::vector<EntityRef> out;
  for (const auto& hop : index.Hops(ref, type_filter)) {
    if (out.empty() || out.back() != hop.node) out.push_back(hop.node);
  }
  return out;
}

std::vector<EntityRef> GraphEngine::Reachable(const std::string& branch, const EntityRef& ref, Algorithm algorithm, const TraversalOptions& options) {
  return graph::Reachable(LoadIndex(branch), ref, algorithm, options);
}

GraphStats GraphEngine::Stats(const std::string& branch, const StatsScope& scope) {
  return LoadIndex(branch).Stats(scope);
}

} // namespace engram::graph
