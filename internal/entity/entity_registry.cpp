#include "entity_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/util/errors.hpp"
#include "internal/util/utf8.hpp"

namespace engram::entity {

namespace {

using google::protobuf::Value;

const Value* FindField(const engram::v1::Entity& entity, const std::string& field) {
  auto it = entity.fields().fields().find(field);
  if (it == entity.fields().fields().end() || it->second.kind_case() == Value::kNullValue) return nullptr;
  return &it->second;
}

EntityRegistry::Validator RequireFields(std::vector<std::string> fields) {
  return [fields = std::move(fields)](const engram::v1::Entity& entity) {
    for (const auto& f : fields) RequireString(entity, f);
  };
}

void RequireUtf8(const std::string& field, const std::string& value) {
  if (!util::IsValidUtf8(value)) throw util::ValidationError(field, "must be valid UTF-8");
}

// Struct keys and string leaves, at any nesting depth.
void RequireUtf8(const std::string& field, const Value& value) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      RequireUtf8(field, value.string_value());
      break;
    case Value::kStructValue:
      for (const auto& [key, nested] : value.struct_value().fields()) {
        RequireUtf8(field, key);
        RequireUtf8(field, nested);
      }
      break;
    case Value::kListValue:
      for (const auto& nested : value.list_value().values()) RequireUtf8(field, nested);
      break;
    default:
      break;
  }
}

} // namespace

void RequireString(const engram::v1::Entity& entity, const std::string& field) {
  const Value* v = FindField(entity, field);
  if (!v) throw util::ValidationError(field, "required");
  if (v->kind_case() != Value::kStringValue) throw util::ValidationError(field, "must be a string");
  if (v->string_value().empty()) throw util::ValidationError(field, "must not be empty");
}

void RequireOneOf(const engram::v1::Entity& entity, const std::string& field, const std::vector<std::string>& allowed, bool optional) {
  const Value* v = FindField(entity, field);
  if (!v) {
    if (optional) return;
    throw util::ValidationError(field, "required");
  }
  if (v->kind_case() != Value::kStringValue || std::find(allowed.begin(), allowed.end(), v->string_value()) == allowed.end()) {
    std::string list;
    for (const auto& a : allowed) list += (list.empty() ? "" : "|") + a;
    throw util::ValidationError(field, "must be one of " + list);
  }
}

void RequireRange(const engram::v1::Entity& entity, const std::string& field, double min, double max, bool optional) {
  const Value* v = FindField(entity, field);
  if (!v) {
    if (optional) return;
    throw util::ValidationError(field, "required");
  }
  if (v->kind_case() != Value::kNumberValue) throw util::ValidationError(field, "must be a number");
  if (v->number_value() < min || v->number_value() > max) {
    throw util::ValidationError(field, "out of range");
  }
}

void ValidateEnvelope(const engram::v1::Entity& entity) {
  const auto& type = entity.key().entity_type();
  const auto& id   = entity.key().entity_id();

  if (type.empty()) throw util::ValidationError("entity_type", "must not be empty");
  if (type.find(':') != std::string::npos) throw util::ValidationError("entity_type", "contains ':'");
  if (id.empty()) throw util::ValidationError("entity_id", "must not be empty");
  for (unsigned char c : id) {
    if (c == '/' || c < 0x20 || c == 0x7f) throw util::ValidationError("entity_id", "contains '/' or a control character");
  }
  if (entity.agent().empty()) throw util::ValidationError("agent", "must not be empty");
  RequireUtf8("entity_type", type);
  RequireUtf8("entity_id", id);
  RequireUtf8("agent", entity.agent());
  for (const auto& [name, value] : entity.fields().fields()) {
    RequireUtf8("fields", name);
    RequireUtf8(name, value);
  }
  if (entity.updated_at_ms() < entity.created_at_ms()) {
    throw util::ValidationError("updated_at", "earlier than created_at");
  }
}

EntityRegistry::EntityRegistry() {
  validators_["task"] = [](const engram::v1::Entity& e) {
    RequireString(e, "title");
    RequireOneOf(e, "status", {"todo", "inprogress", "done", "blocked", "cancelled"}, true);
    RequireOneOf(e, "priority", {"low", "medium", "high", "critical"}, true);
  };
  validators_["context"]   = RequireFields({"title", "content"});
  validators_["reasoning"] = [](const engram::v1::Entity& e) {
    RequireString(e, "title");
    RequireString(e, "task_id");
    RequireRange(e, "confidence", 0.0, 1.0, true);
  };
  validators_["knowledge"]  = RequireFields({"title", "content"});
  validators_["session"]    = RequireFields({"title"});
  validators_["compliance"] = RequireFields({"title"});
  validators_["rule"]       = RequireFields({"title"});
  validators_["standard"]   = RequireFields({"title", "description"});
  validators_["adr"]        = RequireFields({"title", "context"});
  validators_["workflow"]   = RequireFields({"title"});
}

void EntityRegistry::Register(const std::string& entity_type, Validator validator) {
  if (entity_type.empty()) throw util::InvalidInput("entity type name is empty");
  // refs render as "type:id"; a ':' in the type would make that ambiguous
  if (entity_type.find(':') != std::string::npos) throw util::InvalidInput("entity type name contains ':': " + entity_type);
  if (!util::IsValidUtf8(entity_type)) throw util::InvalidInput("entity type name is not valid UTF-8");

  std::unique_lock lock(mutex_);
  if (!validators_.try_emplace(entity_type, std::move(validator)).second) {
    throw util::AlreadyExists("entity type " + entity_type);
  }
}

bool EntityRegistry::Contains(const std::string& entity_type) const {
  std::shared_lock lock(mutex_);
  return validators_.contains(entity_type);
}

std::vector<std::string> EntityRegistry::Types() const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> out;
  out.reserve(validators_.size());
  for (const auto& [type, _] : validators_) out.push_back(type);
  return out;
}

void EntityRegistry::Validate(const engram::v1::Entity& entity) const {
  ValidateEnvelope(entity);

  Validator validator;
  {
    std::shared_lock lock(mutex_);
    auto             it = validators_.find(entity.key().entity_type());
    if (it == validators_.end()) {
      throw util::ValidationError("entity_type", "unregistered type " + entity.key().entity_type());
    }
    validator = it->second;
  }
  if (validator) validator(entity);
}

} // namespace engram::entity
