#pragma once

#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "engram/v1/entity.pb.h"

namespace engram::entity {

/*
  Closed set of entity variants keyed by entity_type.

  Every variant shares one storage path; the registry only contributes a
  schema check per tag. Built-in tags:
    task, context, reasoning, knowledge, session, compliance, rule,
    standard, adr, workflow
  "relationship" is registered by the graph layer. Custom tags may be added
  at runtime.
*/
class EntityRegistry {
 public:
  // Throws util::ValidationError(field, reason).
  using Validator = std::function<void(const engram::v1::Entity&)>;

  // Registers the built-in tags.
  EntityRegistry();

  // Throws util::AlreadyExists for a tag already registered and
  // util::InvalidInput for an empty name or one containing ':'.
  void Register(const std::string& entity_type, Validator validator);

  bool Contains(const std::string& entity_type) const;

  // sorted
  std::vector<std::string> Types() const;

  // Common envelope checks, then the variant's own validator.
  void Validate(const engram::v1::Entity& entity) const;

 private:
  mutable std::shared_mutex        mutex_;
  std::map<std::string, Validator> validators_;
};

// Envelope rules shared by every variant. Every string in the entity,
// struct keys included, must be valid UTF-8.
void ValidateEnvelope(const engram::v1::Entity& entity);

// Building blocks for variant validators.
void RequireString(const engram::v1::Entity& entity, const std::string& field);
void RequireOneOf(const engram::v1::Entity& entity, const std::string& field, const std::vector<std::string>& allowed, bool optional);
void RequireRange(const engram::v1::Entity& entity, const std::string& field, double min, double max, bool optional);

} // namespace engram::entity
