#include "entity_store.hpp"

#include <algorithm>

#include "entity_codec.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace engram::entity {

namespace {

std::string KeyOf(const std::string& entity_type, const std::string& entity_id) {
  return entity_type + "/" + entity_id;
}

} // namespace

EntityStore::EntityStore(std::shared_ptr<db::Repository> repository, storage::ObjectStorePtr objects, std::shared_ptr<EntityRegistry> registry)
    : repository_(std::move(repository)), objects_(std::move(objects)), registry_(std::move(registry)) {
}

void EntityStore::RequireBranch(db::Transaction& tx, const std::string& branch) {
  if (!repository_->GetBranch(tx, branch)) {
    throw util::NotFound("branch " + branch + " not found; create it first");
  }
}

engram::v1::Entity EntityStore::Load(const std::string& content_hash) {
  auto buffer = objects_->Get(content_hash);
  return DecodeEntity(storage::common::View(*buffer));
}

std::string EntityStore::Persist(db::Transaction& tx, const std::string& branch, engram::v1::Entity entity,
                                 const std::optional<std::string>& current_hash) {
  const auto& type = entity.key().entity_type();
  const auto& id   = entity.key().entity_id();

  if (entity.updated_at_ms() == 0) {
    entity.set_updated_at_ms(std::max<uint64_t>(util::NowMillis(), entity.created_at_ms()));
  }
  if (entity.created_at_ms() == 0) {
    uint64_t created = entity.updated_at_ms();
    if (current_hash) created = std::min(created, Load(*current_hash).created_at_ms());
    entity.set_created_at_ms(created);
  }

  registry_->Validate(entity);

  const auto bytes = EncodeEntity(entity);
  const auto hash  = objects_->Put(storage::common::BufferFromString(bytes));
  if (current_hash && *current_hash == hash) {
    return hash;
  }

  db::model::PointerRecord next;
  next.branch        = branch;
  next.entity_type   = type;
  next.entity_id     = id;
  next.content_hash  = hash;
  next.updated_at_ms = util::NowMillis();
  db::ThrowIfDbError(repository_->CompareAndSwapPointer(tx, next, current_hash), "store entity " + KeyOf(type, id) + " on " + branch);

  db::model::HistoryRecord history;
  history.branch         = branch;
  history.entity_type    = type;
  history.entity_id      = id;
  history.content_hash   = hash;
  history.agent          = entity.agent();
  history.recorded_at_ms = next.updated_at_ms;
  db::ThrowIfDbError(repository_->AppendHistory(tx, history), "append history " + KeyOf(type, id));

  return hash;
}

void EntityStore::Route(const std::string& entity_type, Writer writer) {
  std::unique_lock lock(routes_mutex_);
  if (writer) {
    routes_[entity_type] = std::move(writer);
  } else {
    routes_.erase(entity_type);
  }
}

std::string EntityStore::Store(const std::string& branch, engram::v1::Entity entity, const std::optional<std::string>& expected_hash) {
  Writer writer;
  {
    std::shared_lock lock(routes_mutex_);
    auto             it = routes_.find(entity.key().entity_type());
    if (it != routes_.end()) writer = it->second;
  }
  if (writer) return writer(branch, std::move(entity), expected_hash);

  observability::SpanScope span("EntityStore.Store", branch);
  span.SetAttribute("engram.entity_type", entity.key().entity_type());

  const auto key = KeyOf(entity.key().entity_type(), entity.key().entity_id());
  try {
    auto tx = repository_->Begin();
    RequireBranch(*tx, branch);

    auto                       pointer = repository_->GetPointer(*tx, branch, entity.key().entity_type(), entity.key().entity_id());
    std::optional<std::string> current;
    if (pointer) current = pointer->content_hash;

    if (expected_hash) {
      const bool matches = expected_hash->empty() ? !current.has_value() : current == *expected_hash;
      if (!matches) {
        throw util::Stale("store entity " + key + ": pointer moved since read; re-read and retry");
      }
    }

    auto hash = Persist(*tx, branch, std::move(entity), current);
    tx->Commit();

    ENGRAM_LOG_DEBUG("entity stored", {observability::StringField("branch", branch), observability::StringField("key", key),
                                       observability::StringField("hash", hash)});
    return hash;
  } catch (const db::TransactionConflict& e) {
    span.RecordException(e.what());
    ENGRAM_LOG_WARN("entity pointer swap lost", {observability::StringField("branch", branch), observability::StringField("key", key)});
    throw util::Stale("store entity " + key + ": " + e.what());
  } catch (const util::Stale& e) {
    span.RecordException(e.what());
    ENGRAM_LOG_WARN("entity pointer swap lost", {observability::StringField("branch", branch), observability::StringField("key", key)});
    throw;
  }
}

std::optional<engram::v1::Entity> EntityStore::Find(const std::string& branch, const std::string& entity_type, const std::string& entity_id) {
  auto hash = CurrentHash(branch, entity_type, entity_id);
  if (!hash) return std::nullopt;
  return Load(*hash);
}

engram::v1::Entity EntityStore::Get(const std::string& branch, const std::string& entity_type, const std::string& entity_id) {
  auto found = Find(branch, entity_type, entity_id);
  if (!found) throw util::NotFound("entity " + KeyOf(entity_type, entity_id) + " not found on " + branch);
  return *found;
}

std::optional<std::string> EntityStore::CurrentHash(const std::string& branch, const std::string& entity_type, const std::string& entity_id) {
  auto tx = repository_->Begin();
  RequireBranch(*tx, branch);
  auto pointer = repository_->GetPointer(*tx, branch, entity_type, entity_id);
  tx->Commit();

  if (!pointer) return std::nullopt;
  return pointer->content_hash;
}

engram::v1::Entity EntityStore::GetByHash(const std::string& content_hash) {
  return Load(content_hash);
}

std::vector<std::string> EntityStore::History(const std::string& branch, const std::string& entity_type, const std::string& entity_id) {
  auto tx = repository_->Begin();
  RequireBranch(*tx, branch);
  auto records = repository_->ListHistory(*tx, branch, entity_type, entity_id);
  tx->Commit();

  if (records.empty()) throw util::NotFound("entity " + KeyOf(entity_type, entity_id) + " has no history on " + branch);

  std::vector<std::string> out;
  out.reserve(records.size());
  for (const auto& r : records) out.push_back(r.content_hash);
  return out;
}

std::vector<engram::v1::Entity> EntityStore::List(const std::string& branch, const std::string& entity_type, bool include_archived) {
  auto tx = repository_->Begin();
  RequireBranch(*tx, branch);
  auto pointers = repository_->ListPointers(*tx, branch, entity_type);
  tx->Commit();

  std::vector<engram::v1::Entity> out;
  out.reserve(pointers.size());
  for (const auto& p : pointers) {
    auto entity = Load(p.content_hash);
    if (entity.archived() && !include_archived) continue;
    out.push_back(std::move(entity));
  }
  return out;
}

std::string EntityStore::Archive(const std::string& branch, const std::string& entity_type, const std::string& entity_id,
                                 const std::string& agent) {
  return Update(branch, entity_type, entity_id, [&](engram::v1::Entity& entity) {
    entity.set_archived(true);
    entity.set_agent(agent);
  });
}

std::string EntityStore::Update(const std::string& branch, const std::string& entity_type, const std::string& entity_id,
                                const Mutator& mutator, int max_retries) {
  for (int attempt = 0;; ++attempt) {
    auto hash = CurrentHash(branch, entity_type, entity_id);
    if (!hash) throw util::NotFound("update entity " + KeyOf(entity_type, entity_id) + ": not found on " + branch);

    auto entity = Load(*hash);
    mutator(entity);
    entity.mutable_key()->set_entity_type(entity_type);
    entity.mutable_key()->set_entity_id(entity_id);
    entity.set_updated_at_ms(0);

    try {
      return Store(branch, std::move(entity), *hash);
    } catch (const util::Stale&) {
      if (attempt >= max_retries) throw;
    }
  }
}

} // namespace engram::entity
