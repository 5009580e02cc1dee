#pragma once

#include <string>
#include <string_view>

#include "engram/v1/entity.pb.h"

namespace engram::entity {

/*
  Entity <-> content object bytes.

  Canonical form is the JSON object
    {"agent","archived","created_at_ms","entity_id","entity_type","fields","updated_at_ms"}
  rendered by CanonicalJson. The content hash of a version is the SHA-256 of
  these bytes.
*/

std::string EncodeEntity(const engram::v1::Entity& entity);

// Throws util::ValidationError when the bytes are not a canonical entity.
engram::v1::Entity DecodeEntity(std::string_view bytes);

std::string HashEntity(const engram::v1::Entity& entity);

engram::v1::Entity MakeEntity(const std::string& entity_type, const std::string& entity_id, const std::string& agent);

// Field accessors over Entity::fields; a missing or differently typed field
// yields the fallback.
std::string GetStringField(const engram::v1::Entity& entity, const std::string& name, const std::string& fallback = {});
double      GetNumberField(const engram::v1::Entity& entity, const std::string& name, double fallback = 0);
bool        GetBoolField(const engram::v1::Entity& entity, const std::string& name, bool fallback = false);

void SetStringField(engram::v1::Entity& entity, const std::string& name, const std::string& value);
void SetNumberField(engram::v1::Entity& entity, const std::string& name, double value);
void SetBoolField(engram::v1::Entity& entity, const std::string& name, bool value);

} // namespace engram::entity
