#include "export_service.hpp"

#include <algorithm>
#include <utility>

#include "internal/branch/branch_manager.hpp"
#include "internal/entity/canonical_json.hpp"
#include "internal/entity/entity_codec.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/graph/relationship.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace engram::service {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

bool Wanted(const ExportService::ExportRequest& req, const std::string& type) {
  if (type == graph::kRelationshipType) return req.include_relationships;
  return req.entity_types.empty() || std::find(req.entity_types.begin(), req.entity_types.end(), type) != req.entity_types.end();
}

std::string Record(entity::EntityStore& store, const std::string& branch, const engram::v1::Entity& e) {
  Struct record;
  auto&  f = *record.mutable_fields();

  f["content_hash"].set_string_value(entity::HashEntity(e));
  f["entity"] = entity::ParseJson(entity::EncodeEntity(e));

  auto* history = f["history"].mutable_list_value();
  for (const auto& hash : store.History(branch, e.key().entity_type(), e.key().entity_id())) {
    history->add_values()->set_string_value(hash);
  }
  return entity::CanonicalJson(record);
}

struct ParsedRecord {
  std::string        content_hash;
  engram::v1::Entity entity;
};

ParsedRecord ParseRecord(const std::string& line) {
  const auto value = entity::ParseJson(line);
  if (value.kind_case() != Value::kStructValue) throw util::ValidationError("record", "must be a JSON object");

  const auto& f    = value.struct_value().fields();
  auto        hash = f.find("content_hash");
  auto        body = f.find("entity");
  if (hash == f.end() || hash->second.kind_case() != Value::kStringValue) {
    throw util::ValidationError("content_hash", "missing");
  }
  if (body == f.end() || body->second.kind_case() != Value::kStructValue) {
    throw util::ValidationError("entity", "missing");
  }

  ParsedRecord parsed;
  parsed.content_hash = hash->second.string_value();
  parsed.entity       = entity::DecodeEntity(entity::CanonicalJson(body->second));
  if (entity::HashEntity(parsed.entity) != parsed.content_hash) {
    throw util::ValidationError("content_hash", "does not match the entity");
  }
  return parsed;
}

} // namespace

ExportService::ExportService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::vector<std::string> ExportService::Export(const ExportRequest& req) {
  observability::SpanScope span("ExportService.Export", req.branch);

  std::vector<std::string>        entities;
  std::vector<engram::v1::Entity> relationships;
  for (auto& e : ctx_.store->List(req.branch, {}, req.include_archived)) {
    const auto& type = e.key().entity_type();
    if (!Wanted(req, type)) continue;
    if (type == graph::kRelationshipType) {
      relationships.push_back(std::move(e));
    } else {
      entities.push_back(Record(*ctx_.store, req.branch, e));
    }
  }

  // creation order, so a restore re-checks constraints in the order they first passed
  std::stable_sort(relationships.begin(), relationships.end(), [](const engram::v1::Entity& a, const engram::v1::Entity& b) {
    if (a.created_at_ms() != b.created_at_ms()) return a.created_at_ms() < b.created_at_ms();
    return a.key().entity_id() < b.key().entity_id();
  });
  for (const auto& r : relationships) entities.push_back(Record(*ctx_.store, req.branch, r));

  ENGRAM_LOG_INFO("branch exported",
                  {observability::StringField("branch", req.branch), observability::IntField("records", static_cast<std::int64_t>(entities.size()))});
  return entities;
}

ExportService::ImportSummary ExportService::Import(const std::string& branch, const std::string& agent, const std::vector<std::string>& records) {
  observability::SpanScope span("ExportService.Import", branch);

  // a missing branch fails the whole import rather than every record
  if (!ctx_.branches->Exists(branch)) throw util::NotFound("import: branch " + branch + " not found; create it first");

  ImportSummary summary;
  auto          reject = [&](std::size_t i, const std::exception& e) {
    summary.failures.push_back({i + 1, e.what()});
    ENGRAM_LOG_WARN("import record rejected", {observability::StringField("branch", branch),
                                               observability::IntField("line", static_cast<std::int64_t>(i + 1)),
                                               observability::StringField("error", e.what())});
  };

  for (std::size_t i = 0; i < records.size(); ++i) {
    try {
      auto parsed = ParseRecord(records[i]);
      if (!agent.empty()) parsed.entity.set_agent(agent);

      const auto& key     = parsed.entity.key();
      auto        current = ctx_.store->CurrentHash(branch, key.entity_type(), key.entity_id());
      auto        stored  = ctx_.store->Store(branch, parsed.entity, current.value_or(""));
      if (current && *current == stored) {
        ++summary.unchanged;
      } else {
        ++summary.imported;
      }
    } catch (const util::ValidationError& e) {
      reject(i, e);
    } catch (const util::Stale& e) {
      reject(i, e);
    } catch (const util::CyclePrevented& e) {
      reject(i, e);
    } catch (const util::LimitExceeded& e) {
      reject(i, e);
    } catch (const util::NotFound& e) {
      // relationship endpoints absent from the branch
      reject(i, e);
    }
  }

  ENGRAM_LOG_INFO("branch imported", {observability::StringField("branch", branch),
                                      observability::IntField("imported", static_cast<std::int64_t>(summary.imported)),
                                      observability::IntField("unchanged", static_cast<std::int64_t>(summary.unchanged)),
                                      observability::IntField("failed", static_cast<std::int64_t>(summary.failures.size()))});
  return summary;
}

} // namespace engram::service
