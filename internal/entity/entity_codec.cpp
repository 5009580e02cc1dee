#include "entity_codec.hpp"

#include <cmath>

#include "canonical_json.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace engram::entity {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

constexpr const char* kEnvelopeKeys[] = {"agent", "archived", "created_at_ms", "entity_id", "entity_type", "fields", "updated_at_ms"};

const Value& Require(const Struct& object, const char* key, Value::KindCase kind) {
  auto it = object.fields().find(key);
  if (it == object.fields().end()) {
    throw util::ValidationError(key, "missing from stored entity");
  }
  if (it->second.kind_case() != kind) {
    throw util::ValidationError(key, "unexpected JSON type in stored entity");
  }
  return it->second;
}

// 2^64; the cast below is only defined for values under it
constexpr double kUint64Limit = 18446744073709551616.0;

uint64_t RequireMillis(const Struct& object, const char* key) {
  double d = Require(object, key, Value::kNumberValue).number_value();
  if (!(d >= 0 && d < kUint64Limit) || d != std::trunc(d)) {
    throw util::ValidationError(key, "not a millisecond timestamp");
  }
  return static_cast<uint64_t>(d);
}

} // namespace

std::string EncodeEntity(const engram::v1::Entity& entity) {
  Struct envelope;
  auto&  f = *envelope.mutable_fields();

  f["agent"].set_string_value(entity.agent());
  f["archived"].set_bool_value(entity.archived());
  f["created_at_ms"].set_number_value(static_cast<double>(entity.created_at_ms()));
  f["entity_id"].set_string_value(entity.key().entity_id());
  f["entity_type"].set_string_value(entity.key().entity_type());
  *f["fields"].mutable_struct_value() = entity.fields();
  f["updated_at_ms"].set_number_value(static_cast<double>(entity.updated_at_ms()));

  return CanonicalJson(envelope);
}

engram::v1::Entity DecodeEntity(std::string_view bytes) {
  Value root = ParseJson(bytes);
  if (root.kind_case() != Value::kStructValue) {
    throw util::ValidationError("entity", "stored entity is not a JSON object");
  }
  const Struct& object = root.struct_value();

  for (const auto& [key, _] : object.fields()) {
    bool known = false;
    for (const char* k : kEnvelopeKeys) known = known || key == k;
    if (!known) throw util::ValidationError(key, "unknown key in stored entity");
  }

  engram::v1::Entity entity;
  entity.mutable_key()->set_entity_type(Require(object, "entity_type", Value::kStringValue).string_value());
  entity.mutable_key()->set_entity_id(Require(object, "entity_id", Value::kStringValue).string_value());
  entity.set_agent(Require(object, "agent", Value::kStringValue).string_value());
  entity.set_archived(Require(object, "archived", Value::kBoolValue).bool_value());
  entity.set_created_at_ms(RequireMillis(object, "created_at_ms"));
  entity.set_updated_at_ms(RequireMillis(object, "updated_at_ms"));
  *entity.mutable_fields() = Require(object, "fields", Value::kStructValue).struct_value();
  return entity;
}

std::string HashEntity(const engram::v1::Entity& entity) {
  return util::Sha256Hex(EncodeEntity(entity));
}

engram::v1::Entity MakeEntity(const std::string& entity_type, const std::string& entity_id, const std::string& agent) {
  engram::v1::Entity entity;
  entity.mutable_key()->set_entity_type(entity_type);
  entity.mutable_key()->set_entity_id(entity_id);
  entity.set_agent(agent);
  return entity;
}

std::string GetStringField(const engram::v1::Entity& entity, const std::string& name, const std::string& fallback) {
  auto it = entity.fields().fields().find(name);
  if (it == entity.fields().fields().end() || it->second.kind_case() != Value::kStringValue) return fallback;
  return it->second.string_value();
}

double GetNumberField(const engram::v1::Entity& entity, const std::string& name, double fallback) {
  auto it = entity.fields().fields().find(name);
  if (it == entity.fields().fields().end() || it->second.kind_case() != Value::kNumberValue) return fallback;
  return it->second.number_value();
}

bool GetBoolField(const engram::v1::Entity& entity, const std::string& name, bool fallback) {
  auto it = entity.fields().fields().find(name);
  if (it == entity.fields().fields().end() || it->second.kind_case() != Value::kBoolValue) return fallback;
  return it->second.bool_value();
}

void SetStringField(engram::v1::Entity& entity, const std::string& name, const std::string& value) {
  (*entity.mutable_fields()->mutable_fields())[name].set_string_value(value);
}

void SetNumberField(engram::v1::Entity& entity, const std::string& name, double value) {
  (*entity.mutable_fields()->mutable_fields())[name].set_number_value(value);
}

void SetBoolField(engram::v1::Entity& entity, const std::string& name, bool value) {
  (*entity.mutable_fields()->mutable_fields())[name].set_bool_value(value);
}

} // namespace engram::entity
