#include "field_merge.hpp"

#include <algorithm>
#include <optional>
#include <set>

#include "internal/entity/canonical_json.hpp"

namespace engram::sync {

namespace {

using google::protobuf::Value;

std::optional<Value> Lookup(const engram::v1::Entity& entity, const std::string& field) {
  if (field == kArchivedField) {
    Value v;
    v.set_bool_value(entity.archived());
    return v;
  }
  auto it = entity.fields().fields().find(field);
  if (it == entity.fields().fields().end()) return std::nullopt;
  return it->second;
}

// absent and present never compare equal
std::string Fingerprint(const std::optional<Value>& v) {
  return v ? entity::CanonicalJson(*v) : std::string();
}

void Assign(engram::v1::Entity& entity, const std::string& field, const std::optional<Value>& v) {
  if (field == kArchivedField) {
    entity.set_archived(v && v->bool_value());
    return;
  }
  auto& fields = *entity.mutable_fields()->mutable_fields();
  if (v) {
    fields[field] = *v;
  } else {
    fields.erase(field);
  }
}

} // namespace

std::string FieldJson(const engram::v1::Entity& entity, const std::string& field) {
  auto v = Lookup(entity, field);
  return v ? entity::CanonicalJson(*v) : "null";
}

FieldMergeResult MergeFields(const engram::v1::Entity* ancestor, const std::vector<CandidateState>& candidates) {
  const auto& latest = candidates[PickLatest(candidates)].entity;

  FieldMergeResult result;
  result.merged = ancestor ? *ancestor : latest;
  result.merged.mutable_fields()->Clear();

  std::set<std::string> names{kArchivedField};
  if (ancestor) {
    for (const auto& [name, _] : ancestor->fields().fields()) names.insert(name);
  }
  for (const auto& c : candidates) {
    for (const auto& [name, _] : c.entity.fields().fields()) names.insert(name);
  }

  for (const auto& name : names) {
    const auto base     = ancestor ? Lookup(*ancestor, name) : std::nullopt;
    const auto base_key = Fingerprint(base);

    std::optional<std::string>          change_key;
    std::optional<std::optional<Value>> change;
    bool                                conflict = false;
    for (const auto& c : candidates) {
      auto v   = Lookup(c.entity, name);
      auto key = Fingerprint(v);
      if (key == base_key) continue;
      if (!change_key) {
        change_key = key;
        change     = v;
      } else if (*change_key != key) {
        conflict = true;
      }
    }

    if (conflict) {
      result.conflicting_fields.push_back(name);
      Assign(result.merged, name, ancestor ? base : Lookup(latest, name));
    } else if (change) {
      Assign(result.merged, name, *change);
    } else {
      Assign(result.merged, name, base);
    }
  }

  uint64_t created = ancestor && ancestor->created_at_ms() > 0 ? ancestor->created_at_ms() : latest.created_at_ms();
  uint64_t updated = 0;
  for (const auto& c : candidates) {
    if (c.entity.created_at_ms() > 0) created = std::min(created, c.entity.created_at_ms());
    updated = std::max(updated, c.entity.updated_at_ms());
  }

  *result.merged.mutable_key() = latest.key();
  result.merged.set_agent(latest.agent());
  result.merged.set_created_at_ms(created);
  result.merged.set_updated_at_ms(std::max(updated, created));
  return result;
}

} // namespace engram::sync
