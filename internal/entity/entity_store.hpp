#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "engram/v1/entity.pb.h"
#include "entity_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/storage/object_store.hpp"

namespace engram::entity {

/*
  Entity layer.

  Versions are immutable content objects; the only mutable state is the
  latest pointer per (branch, entity_type, entity_id), re-pointed with
  compare-and-swap. A lost swap throws util::Stale and never partially
  persists.
*/
class EntityStore {
 public:
  using Mutator = std::function<void(engram::v1::Entity&)>;

  // Takes over Store for one entity type; same contract as Store.
  using Writer = std::function<std::string(const std::string& branch, engram::v1::Entity entity,
                                           const std::optional<std::string>& expected_hash)>;

  EntityStore(std::shared_ptr<db::Repository> repository, storage::ObjectStorePtr objects, std::shared_ptr<EntityRegistry> registry);

  /*
    Validate, persist and re-point. Returns the content hash.

    expected_hash:
      std::nullopt -> swap against whatever pointer is read in this call
      ""           -> the entity must not exist yet
      hash         -> the pointer must still hold this hash, else Stale

    created_at_ms / updated_at_ms are stamped only when zero; a zero
    created_at_ms inherits the previous version's value.
  */
  std::string Store(const std::string& branch, engram::v1::Entity entity, const std::optional<std::string>& expected_hash = std::nullopt);

  /*
    Hands every Store of entity_type (and so Update and Archive) to
    `writer`, which owns its transaction and persists through Persist.
    The graph layer routes relationships so no write skips its checks.
    An empty writer removes the route.
  */
  void Route(const std::string& entity_type, Writer writer);

  engram::v1::Entity                Get(const std::string& branch, const std::string& entity_type, const std::string& entity_id);
  std::optional<engram::v1::Entity> Find(const std::string& branch, const std::string& entity_type, const std::string& entity_id);
  std::optional<std::string>        CurrentHash(const std::string& branch, const std::string& entity_type, const std::string& entity_id);

  engram::v1::Entity GetByHash(const std::string& content_hash);

  // Content hashes, oldest first. NotFound for an entity never stored.
  std::vector<std::string> History(const std::string& branch, const std::string& entity_type, const std::string& entity_id);

  // Ordered by (entity_type, entity_id); empty type lists every type.
  std::vector<engram::v1::Entity> List(const std::string& branch, const std::string& entity_type = {}, bool include_archived = false);

  // Soft delete: a new version with archived=true.
  std::string Archive(const std::string& branch, const std::string& entity_type, const std::string& entity_id, const std::string& agent);

  // Read-modify-swap loop; retries on Stale up to max_retries times.
  std::string Update(const std::string& branch, const std::string& entity_type, const std::string& entity_id, const Mutator& mutator,
                     int max_retries = 3);

  /*
    Transaction-scoped building blocks used by the graph and sync layers.

    Persist validates, writes the object and swaps the pointer from
    current_hash (std::nullopt = absent) inside tx. Returns the new hash;
    an unchanged hash performs no write.
  */
  std::string        Persist(db::Transaction& tx, const std::string& branch, engram::v1::Entity entity,
                             const std::optional<std::string>& current_hash);
  engram::v1::Entity Load(const std::string& content_hash);
  void               RequireBranch(db::Transaction& tx, const std::string& branch);

  const EntityRegistry& Registry() const {
    return *registry_;
  }

  db::Repository& Repository() {
    return *repository_;
  }

  storage::ObjectStore& Objects() {
    return *objects_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  storage::ObjectStorePtr         objects_;
  std::shared_ptr<EntityRegistry> registry_;

  mutable std::shared_mutex     routes_mutex_;
  std::map<std::string, Writer> routes_;
};

} // namespace engram::entity
