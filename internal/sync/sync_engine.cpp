#include "sync_engine.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <utility>

#include "field_merge.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/entity/canonical_json.hpp"
#include "internal/entity/entity_codec.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/graph/graph_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"

namespace engram::sync {

namespace {

using Key = std::pair<std::string, std::string>; // (entity_type, entity_id)

std::string KeyString(const Key& key) {
  return key.first + "/" + key.second;
}

struct BranchView {
  std::string                              name;
  std::map<Key, std::string>               pointers;
  std::map<Key, db::model::SyncBaseRecord> bases;
};

struct KeyPlan {
  Key                         key;
  std::optional<std::string>  ancestor_hash;
  std::vector<CandidateState> candidates;

  std::optional<engram::v1::Entity> result;
  std::string                       result_hash;
  bool                              escalated = false;
  std::vector<SyncConflict>         conflicts;
};

std::vector<std::string> Dedupe(const std::vector<std::string>& branches) {
  std::vector<std::string> out;
  for (const auto& b : branches) {
    if (std::find(out.begin(), out.end(), b) == out.end()) out.push_back(b);
  }
  return out;
}

class EntityCache {
 public:
  explicit EntityCache(entity::EntityStore& store) : store_(store) {
  }

  const engram::v1::Entity& Get(const std::string& hash) {
    auto it = cache_.find(hash);
    if (it == cache_.end()) it = cache_.emplace(hash, store_.Load(hash)).first;
    return it->second;
  }

 private:
  entity::EntityStore&                      store_;
  std::map<std::string, engram::v1::Entity> cache_;
};

SyncConflict MakeConflict(const KeyPlan& plan, std::string field, ConflictKind kind, std::string resolution, std::string detail) {
  SyncConflict c;
  c.entity_type   = plan.key.first;
  c.entity_id     = plan.key.second;
  c.field         = std::move(field);
  c.kind          = kind;
  c.ancestor_hash = plan.ancestor_hash.value_or("");
  c.resolution    = std::move(resolution);
  c.detail        = std::move(detail);

  for (const auto& cand : plan.candidates) {
    SyncCandidate sc;
    sc.branch        = cand.branch;
    sc.agent         = cand.entity.agent();
    sc.content_hash  = cand.content_hash;
    sc.updated_at_ms = cand.entity.updated_at_ms();
    sc.value_json    = c.field.empty() ? entity::EncodeEntity(cand.entity) : FieldJson(cand.entity, c.field);
    c.candidates.push_back(std::move(sc));
  }

  // stable across passes while the candidate set is unchanged
  std::vector<std::string> lines;
  for (const auto& cand : c.candidates) lines.push_back(cand.branch + "=" + cand.content_hash);
  std::sort(lines.begin(), lines.end());
  std::string material = c.entity_type + "\n" + c.entity_id + "\n" + c.field + "\n" + ToString(kind) + "\n" + c.ancestor_hash;
  for (const auto& line : lines) material += "\n" + line;
  c.fingerprint = util::Sha256Hex(material);
  return c;
}

db::model::ConflictRecord ToRecord(const SyncConflict& c, const std::string& strategy) {
  google::protobuf::Struct detail;
  auto&                    f = *detail.mutable_fields();
  if (c.ancestor_hash.empty()) {
    f["ancestor_hash"].set_null_value(google::protobuf::NULL_VALUE);
  } else {
    f["ancestor_hash"].set_string_value(c.ancestor_hash);
  }
  f["resolution"].set_string_value(c.resolution);
  f["detail"].set_string_value(c.detail);

  auto* list = f["candidates"].mutable_list_value();
  for (const auto& cand : c.candidates) {
    auto& cf = *list->add_values()->mutable_struct_value()->mutable_fields();
    cf["branch"].set_string_value(cand.branch);
    cf["agent"].set_string_value(cand.agent);
    cf["content_hash"].set_string_value(cand.content_hash);
    cf["updated_at_ms"].set_number_value(static_cast<double>(cand.updated_at_ms));
    cf["value"] = entity::ParseJson(cand.value_json);
  }

  db::model::ConflictRecord r;
  r.fingerprint = c.fingerprint;
  r.entity_type = c.entity_type;
  r.entity_id   = c.entity_id;
  r.field       = c.field;
  r.kind        = ToString(c.kind);
  r.strategy    = strategy;
  r.detail_json   = entity::CanonicalJson(detail);
  r.created_at_ms = util::NowMillis();
  return r;
}

void Escalate(KeyPlan& plan, ConflictKind kind, const std::string& resolution, const std::string& detail) {
  plan.escalated = true;
  plan.result.reset();
  plan.result_hash.clear();
  plan.conflicts.clear();
  plan.conflicts.push_back(MakeConflict(plan, "", kind, resolution, detail));
}

graph::Relationship Decode(const engram::v1::Entity& entity) {
  auto r = graph::FromEntity(entity);
  if (entity.archived()) r.active = false;
  return r;
}

std::string JoinFields(const std::vector<std::string>& fields) {
  std::string out;
  for (const auto& f : fields) out += (out.empty() ? "" : ",") + f;
  return out;
}

} // namespace

SyncEngine::SyncEngine(std::shared_ptr<entity::EntityStore> store, int max_stale_retries, std::shared_ptr<graph::GraphEngine> graph)
    : store_(std::move(store)), graph_(std::move(graph)), max_stale_retries_(max_stale_retries < 0 ? 0 : max_stale_retries) {
}

SyncReport SyncEngine::Sync(const std::vector<std::string>& branches, const std::string& strategy_name, const SyncOptions& options) {
  if (branches.empty()) {
    throw util::InvalidInput("sync: no branches given; pass at least two branches to synchronize");
  }
  const auto strategy = ParseStrategy(strategy_name);
  const auto unique   = Dedupe(branches);

  observability::SpanScope span("SyncEngine.Sync");
  span.SetAttribute("engram.strategy", strategy.Name());
  span.SetAttribute("engram.branch_count", static_cast<std::int64_t>(unique.size()));

  std::lock_guard<std::mutex> lock(pass_mutex_);

  if (unique.size() == 1) {
    auto tx = store_->Repository().Begin();
    store_->RequireBranch(*tx, unique.front());
    tx->Commit();

    SyncReport report;
    report.nothing_to_synchronize = true;
    report.branches               = unique;
    report.strategy               = strategy.Name();
    report.dry_run                = options.dry_run;
    ENGRAM_LOG_INFO("sync: nothing to synchronize", {observability::StringField("branch", unique.front())});
    return report;
  }

  for (int attempt = 0;; ++attempt) {
    try {
      return Pass(unique, strategy, options);
    } catch (const util::Stale& e) {
      if (attempt >= max_stale_retries_) {
        span.RecordException(e.what());
        throw;
      }
      ENGRAM_LOG_WARN("sync pass raced a writer; restarting", {observability::IntField("attempt", attempt + 1)});
    } catch (const db::TransactionConflict& e) {
      if (attempt >= max_stale_retries_) {
        span.RecordException(e.what());
        throw util::Stale(std::string("sync: ") + e.what());
      }
      ENGRAM_LOG_WARN("sync pass raced a writer; restarting", {observability::IntField("attempt", attempt + 1)});
    }
  }
}

SyncReport SyncEngine::Pass(const std::vector<std::string>& branches, const Strategy& strategy, const SyncOptions& options) {
  const auto started_at = std::chrono::steady_clock::now();
  auto&      repo       = store_->Repository();

  SyncReport report;
  report.branches = branches;
  report.strategy = strategy.Name();
  report.dry_run  = options.dry_run;

  ENGRAM_LOG_INFO("sync pass started", {observability::StringField("strategy", report.strategy),
                                        observability::IntField("branches", static_cast<std::int64_t>(branches.size())),
                                        observability::BoolField("dry_run", options.dry_run)});

  std::vector<std::unique_lock<std::shared_mutex>> branch_locks;
  if (graph_) branch_locks = graph_->LockBranches(branches);
  auto tx = repo.Begin();

  // 1. snapshot
  std::vector<BranchView> views;
  std::set<Key>           keys;
  for (const auto& name : branches) {
    store_->RequireBranch(*tx, name);
    BranchView view;
    view.name = name;
    for (const auto& p : repo.ListPointers(*tx, name, "")) {
      Key key{p.entity_type, p.entity_id};
      view.pointers.emplace(key, p.content_hash);
      keys.insert(std::move(key));
    }
    for (const auto& b : repo.ListSyncBases(*tx, name)) {
      view.bases.emplace(Key{b.entity_type, b.entity_id}, b);
    }
    views.push_back(std::move(view));
  }
  report.generation = repo.MaxSyncGeneration(*tx) + 1;

  EntityCache cache(*store_);

  // 2-3. per-key plan
  std::vector<KeyPlan> plans;
  plans.reserve(keys.size());
  for (const auto& key : keys) {
    KeyPlan plan;
    plan.key = key;
    ++report.entities_examined;

    const db::model::SyncBaseRecord* lowest       = nullptr;
    bool                             has_ancestor = true;
    for (const auto& view : views) {
      if (!view.pointers.contains(key)) continue;
      auto base = view.bases.find(key);
      if (base == view.bases.end()) {
        has_ancestor = false;
        break;
      }
      if (!lowest || base->second.generation < lowest->generation) lowest = &base->second;
    }
    if (has_ancestor && lowest) plan.ancestor_hash = lowest->content_hash;

    std::set<std::string> distinct;
    for (const auto& view : views) {
      auto p = view.pointers.find(key);
      if (p == view.pointers.end() || p->second == plan.ancestor_hash) continue;
      plan.candidates.push_back({view.name, p->second, cache.Get(p->second)});
      distinct.insert(p->second);
    }

    if (plan.candidates.empty()) {
      plan.result_hash = *plan.ancestor_hash;
    } else if (distinct.size() == 1) {
      plan.result_hash = *distinct.begin();
    } else {
      switch (strategy.kind) {
        case StrategyKind::kLatestWins:
          plan.result_hash = plan.candidates[PickLatest(plan.candidates)].content_hash;
          break;
        case StrategyKind::kPriorityWins:
          plan.result_hash = plan.candidates[PickPreferred(plan.candidates, strategy.priority_agent)].content_hash;
          break;
        case StrategyKind::kIntelligentMerge:
        case StrategyKind::kMergeWithConflictResolution: {
          const engram::v1::Entity* ancestor = plan.ancestor_hash ? &cache.Get(*plan.ancestor_hash) : nullptr;
          auto                      merge    = MergeFields(ancestor, plan.candidates);

          if (!merge.conflicting_fields.empty() && strategy.kind == StrategyKind::kMergeWithConflictResolution) {
            Escalate(plan, ConflictKind::kEntity, "escalated; operator resolution required",
                     "fields changed differently: " + JoinFields(merge.conflicting_fields));
            break;
          }

          const std::string kept = ancestor ? "kept ancestor value" : "kept latest value; no common ancestor";
          for (const auto& field : merge.conflicting_fields) {
            plan.conflicts.push_back(MakeConflict(plan, field, ConflictKind::kField, kept, "field changed differently on several branches"));
          }

          try {
            store_->Registry().Validate(merge.merged);
          } catch (const util::ValidationError& e) {
            Escalate(plan, ConflictKind::kEntity, "escalated; merged entity is invalid", e.what());
            break;
          }
          plan.result_hash = entity::HashEntity(merge.merged);
          plan.result      = std::move(merge.merged);
          break;
        }
      }
    }

    if (!plan.escalated && !plan.result) plan.result = cache.Get(plan.result_hash);
    plans.push_back(std::move(plan));
  }

  // 4. graph constraints over the merged relationships
  {
    std::vector<graph::Relationship> accepted;
    std::vector<graph::Relationship> changed;
    std::map<std::string, KeyPlan*>  by_id;
    for (auto& plan : plans) {
      if (plan.key.first != graph::kRelationshipType || plan.escalated) continue;

      graph::Relationship r;
      try {
        r = Decode(*plan.result);
      } catch (const util::ValidationError& e) {
        Escalate(plan, ConflictKind::kConstraint, "escalated; merged relationship is malformed", e.what());
        continue;
      }

      // an edge every branch already carries adds nothing to any graph
      bool known = true;
      for (const auto& view : views) {
        auto p = view.pointers.find(plan.key);
        if (p == view.pointers.end()) {
          known = false;
        } else if (p->second != plan.result_hash) {
          try {
            known = known && graph::SameEdge(Decode(cache.Get(p->second)), r);
          } catch (const util::ValidationError&) {
            known = false;
          }
        }
      }

      by_id[r.id] = &plan;
      (known ? accepted : changed).push_back(std::move(r));
    }

    for (const auto& v : graph::GraphEngine::ValidateGraph(graph::RelationshipIndex(std::move(accepted)), changed)) {
      Escalate(*by_id.at(v.relationship_id), ConflictKind::kConstraint, "escalated; merged relationship violates graph constraints", v.reason);
    }
  }

  // 5. record conflicts, then apply
  for (auto& plan : plans) {
    if (plan.escalated) report.escalated.push_back(KeyString(plan.key));

    for (auto& conflict : plan.conflicts) {
      bool fresh = false;
      if (options.dry_run) {
        fresh = !repo.GetConflict(*tx, conflict.fingerprint).has_value();
      } else {
        auto result = repo.InsertConflict(*tx, ToRecord(conflict, report.strategy));
        fresh       = result.code != db::ErrorCode::AlreadyExists;
        if (fresh) db::ThrowIfDbError(result, "record sync conflict " + KeyString(plan.key));
      }
      if (!fresh) continue;

      ENGRAM_LOG_WARN("sync conflict", {observability::StringField("key", KeyString(plan.key)), observability::StringField("field", conflict.field),
                                        observability::StringField("kind", ToString(conflict.kind)),
                                        observability::StringField("detail", conflict.detail)});
      report.conflicts.push_back(std::move(conflict));
    }

    if (plan.escalated) continue;

    bool merged = false;
    for (const auto& view : views) {
      std::optional<std::string> current;
      if (auto p = view.pointers.find(plan.key); p != view.pointers.end()) current = p->second;

      if (current != plan.result_hash) {
        merged = true;
        ++report.entities_updated;
        if (!options.dry_run) store_->Persist(*tx, view.name, *plan.result, current);
      }

      auto base = view.bases.find(plan.key);
      if (!options.dry_run && (base == view.bases.end() || base->second.content_hash != plan.result_hash)) {
        db::model::SyncBaseRecord record;
        record.branch       = view.name;
        record.entity_type  = plan.key.first;
        record.entity_id    = plan.key.second;
        record.content_hash = plan.result_hash;
        record.generation   = report.generation;
        db::ThrowIfDbError(repo.UpsertSyncBase(*tx, record), "advance sync base " + KeyString(plan.key) + " on " + view.name);
      }
    }
    if (merged) ++report.entities_merged;
  }

  if (options.dry_run) {
    tx->Rollback();
  } else {
    tx->Commit();
  }

  report.duration_ms =
      static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());

  ENGRAM_LOG_INFO("sync pass finished", {observability::StringField("strategy", report.strategy),
                                         observability::IntField("examined", static_cast<std::int64_t>(report.entities_examined)),
                                         observability::IntField("merged", static_cast<std::int64_t>(report.entities_merged)),
                                         observability::IntField("updated", static_cast<std::int64_t>(report.entities_updated)),
                                         observability::IntField("conflicts", static_cast<std::int64_t>(report.conflicts.size())),
                                         observability::IntField("escalated", static_cast<std::int64_t>(report.escalated.size()))});
  return report;
}

std::string SyncEngine::ResolveConflict(const std::vector<std::string>& branches, engram::v1::Entity resolved) {
  if (branches.empty()) throw util::InvalidInput("resolve conflict: no branches given");
  const auto unique = Dedupe(branches);
  const auto key    = resolved.key().entity_type() + "/" + resolved.key().entity_id();

  std::lock_guard<std::mutex> lock(pass_mutex_);
  auto&                       repo = store_->Repository();

  std::optional<graph::Relationship> edge;
  if (resolved.key().entity_type() == graph::kRelationshipType) edge = Decode(resolved);

  for (int attempt = 0;; ++attempt) {
    std::vector<std::unique_lock<std::shared_mutex>> branch_locks;
    if (graph_) branch_locks = graph_->LockBranches(unique);
    try {
      auto tx = repo.Begin();

      std::map<std::string, std::optional<std::string>> current;
      for (const auto& name : unique) {
        store_->RequireBranch(*tx, name);
        auto p        = repo.GetPointer(*tx, name, resolved.key().entity_type(), resolved.key().entity_id());
        current[name] = p ? std::optional<std::string>(p->content_hash) : std::nullopt;
      }

      // stamp once so every branch receives identical bytes
      auto entity = resolved;
      if (entity.updated_at_ms() == 0) entity.set_updated_at_ms(util::NowMillis());
      if (entity.created_at_ms() == 0) {
        uint64_t created = entity.updated_at_ms();
        for (const auto& [_, hash] : current) {
          if (hash) created = std::min(created, store_->Load(*hash).created_at_ms());
        }
        entity.set_created_at_ms(created);
      }

      const auto generation = repo.MaxSyncGeneration(*tx) + 1;
      std::string hash;
      for (const auto& name : unique) {
        if (graph_ && edge) graph_->GuardWrite(*tx, name, *edge, current[name]);
        hash = store_->Persist(*tx, name, entity, current[name]);

        db::model::SyncBaseRecord base;
        base.branch       = name;
        base.entity_type  = entity.key().entity_type();
        base.entity_id    = entity.key().entity_id();
        base.content_hash = hash;
        base.generation   = generation;
        db::ThrowIfDbError(repo.UpsertSyncBase(*tx, base), "advance sync base " + key + " on " + name);
      }
      db::ThrowIfDbError(repo.ResolveConflicts(*tx, entity.key().entity_type(), entity.key().entity_id()), "resolve conflicts " + key);
      tx->Commit();

      ENGRAM_LOG_INFO("sync conflict resolved", {observability::StringField("key", key), observability::StringField("hash", hash)});
      return hash;
    } catch (const util::Stale&) {
      if (attempt >= max_stale_retries_) throw;
    } catch (const db::TransactionConflict& e) {
      if (attempt >= max_stale_retries_) throw util::Stale("resolve conflict " + key + ": " + e.what());
    }
  }
}

std::vector<db::model::ConflictRecord> SyncEngine::ListConflicts(bool open_only) {
  auto tx        = store_->Repository().Begin();
  auto conflicts = store_->Repository().ListConflicts(*tx, open_only);
  tx->Commit();
  return conflicts;
}

} // namespace engram::sync
