#include "relationship.hpp"

#include <cmath>

#include "internal/entity/entity_registry.hpp"
#include "internal/util/errors.hpp"

namespace engram::graph {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

const Value* Field(const Struct& s, const std::string& name) {
  auto it = s.fields().find(name);
  if (it == s.fields().end() || it->second.kind_case() == Value::kNullValue) return nullptr;
  return &it->second;
}

std::string RequiredString(const Struct& s, const std::string& name) {
  const Value* v = Field(s, name);
  if (!v) throw util::ValidationError(name, "required");
  if (v->kind_case() != Value::kStringValue || v->string_value().empty()) {
    throw util::ValidationError(name, "must be a non-empty string");
  }
  return v->string_value();
}

std::string OptionalString(const Struct& s, const std::string& name, const std::string& fallback) {
  const Value* v = Field(s, name);
  if (!v) return fallback;
  if (v->kind_case() != Value::kStringValue) throw util::ValidationError(name, "must be a string");
  return v->string_value();
}

std::optional<uint64_t> OptionalCount(const Struct& s, const std::string& name) {
  const Value* v = Field(s, name);
  if (!v) return std::nullopt;
  // NaN and values past 2^64 fail the range test
  if (v->kind_case() != Value::kNumberValue || !(v->number_value() >= 0 && v->number_value() < 18446744073709551616.0) ||
      std::trunc(v->number_value()) != v->number_value()) {
    throw util::ValidationError("constraints." + name, "must be a non-negative integer");
  }
  return static_cast<uint64_t>(v->number_value());
}

std::vector<std::string> OptionalList(const Struct& s, const std::string& name) {
  const Value* v = Field(s, name);
  if (!v) return {};
  if (v->kind_case() != Value::kListValue) throw util::ValidationError("constraints." + name, "must be a list of strings");

  std::vector<std::string> out;
  for (const auto& item : v->list_value().values()) {
    if (item.kind_case() != Value::kStringValue) throw util::ValidationError("constraints." + name, "must be a list of strings");
    out.push_back(item.string_value());
  }
  return out;
}

void ValidateTypeName(const std::string& name) {
  for (char c : name) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!ok) throw util::ValidationError("relationship_type", "must be lowercase letters, digits, '_' or '-'");
  }
}

Value StringList(const std::vector<std::string>& items) {
  Value v;
  auto* list = v.mutable_list_value();
  for (const auto& item : items) list->add_values()->set_string_value(item);
  return v;
}

} // namespace

const char* ToString(Direction direction) {
  return direction == Direction::kBidirectional ? "bidirectional" : "unidirectional";
}

const char* ToString(Strength strength) {
  switch (strength) {
    case Strength::kWeak:
      return "weak";
    case Strength::kMedium:
      return "medium";
    case Strength::kStrong:
      return "strong";
    case Strength::kCritical:
      return "critical";
  }
  return "medium";
}

Direction ParseDirection(const std::string& name) {
  if (name == "unidirectional") return Direction::kUnidirectional;
  if (name == "bidirectional") return Direction::kBidirectional;
  throw util::ValidationError("direction", "must be unidirectional or bidirectional");
}

Strength ParseStrength(const std::string& name) {
  if (name == "weak") return Strength::kWeak;
  if (name == "medium") return Strength::kMedium;
  if (name == "strong") return Strength::kStrong;
  if (name == "critical") return Strength::kCritical;
  throw util::ValidationError("strength", "must be weak, medium, strong or critical");
}

bool SameEdge(const Relationship& a, const Relationship& b) {
  return a.active && b.active && a.source == b.source && a.target == b.target && a.relationship_type == b.relationship_type &&
         a.direction == b.direction;
}

uint64_t TraversalCost(Strength strength) {
  switch (strength) {
    case Strength::kCritical:
      return 1;
    case Strength::kStrong:
      return 2;
    case Strength::kMedium:
      return 3;
    case Strength::kWeak:
      return 4;
  }
  return 4;
}

engram::v1::Entity ToEntity(const Relationship& r) {
  engram::v1::Entity entity;
  entity.mutable_key()->set_entity_type(kRelationshipType);
  entity.mutable_key()->set_entity_id(r.id);
  entity.set_agent(r.agent);
  entity.set_created_at_ms(r.created_at_ms);
  entity.set_updated_at_ms(r.updated_at_ms);

  auto& f = *entity.mutable_fields()->mutable_fields();
  f["source_type"].set_string_value(r.source.type);
  f["source_id"].set_string_value(r.source.id);
  f["target_type"].set_string_value(r.target.type);
  f["target_id"].set_string_value(r.target.id);
  f["relationship_type"].set_string_value(r.relationship_type);
  f["direction"].set_string_value(ToString(r.direction));
  f["strength"].set_string_value(ToString(r.strength));
  f["description"].set_string_value(r.description);
  f["active"].set_bool_value(r.active);

  auto& c = *f["constraints"].mutable_struct_value()->mutable_fields();
  c["allow_cycles"].set_bool_value(r.constraints.allow_cycles);
  if (r.constraints.max_outbound) {
    c["max_outbound"].set_number_value(static_cast<double>(*r.constraints.max_outbound));
  } else {
    c["max_outbound"].set_null_value(google::protobuf::NULL_VALUE);
  }
  if (r.constraints.max_inbound) {
    c["max_inbound"].set_number_value(static_cast<double>(*r.constraints.max_inbound));
  } else {
    c["max_inbound"].set_null_value(google::protobuf::NULL_VALUE);
  }
  c["source_types"] = StringList(r.constraints.source_types);
  c["target_types"] = StringList(r.constraints.target_types);

  *f["metadata"].mutable_struct_value() = r.metadata;
  return entity;
}

Relationship FromEntity(const engram::v1::Entity& entity) {
  if (entity.key().entity_type() != kRelationshipType) {
    throw util::ValidationError("entity_type", "not a relationship");
  }
  const Struct& f = entity.fields();

  Relationship r;
  r.id                = entity.key().entity_id();
  r.agent             = entity.agent();
  r.created_at_ms     = entity.created_at_ms();
  r.updated_at_ms     = entity.updated_at_ms();
  r.source            = {RequiredString(f, "source_type"), RequiredString(f, "source_id")};
  r.target            = {RequiredString(f, "target_type"), RequiredString(f, "target_id")};
  r.relationship_type = RequiredString(f, "relationship_type");
  ValidateTypeName(r.relationship_type);
  r.direction   = ParseDirection(OptionalString(f, "direction", "unidirectional"));
  r.strength    = ParseStrength(OptionalString(f, "strength", "medium"));
  r.description = OptionalString(f, "description", "");

  if (const Value* active = Field(f, "active")) {
    if (active->kind_case() != Value::kBoolValue) throw util::ValidationError("active", "must be a boolean");
    r.active = active->bool_value();
  }

  if (const Value* c = Field(f, "constraints")) {
    if (c->kind_case() != Value::kStructValue) throw util::ValidationError("constraints", "must be an object");
    const Struct& cs = c->struct_value();
    if (const Value* cycles = Field(cs, "allow_cycles")) {
      if (cycles->kind_case() != Value::kBoolValue) throw util::ValidationError("constraints.allow_cycles", "must be a boolean");
      r.constraints.allow_cycles = cycles->bool_value();
    }
    r.constraints.max_outbound = OptionalCount(cs, "max_outbound");
    r.constraints.max_inbound  = OptionalCount(cs, "max_inbound");
    r.constraints.source_types = OptionalList(cs, "source_types");
    r.constraints.target_types = OptionalList(cs, "target_types");
  }

  if (const Value* m = Field(f, "metadata")) {
    if (m->kind_case() != Value::kStructValue) throw util::ValidationError("metadata", "must be an object");
    r.metadata = m->struct_value();
  }

  if (r.source == r.target) {
    throw util::ValidationError("target", "self-relationships are not allowed");
  }
  return r;
}

void RegisterRelationshipType(engram::entity::EntityRegistry& registry) {
  registry.Register(kRelationshipType, [](const engram::v1::Entity& entity) {
    FromEntity(entity);
  });
}

} // namespace engram::graph
