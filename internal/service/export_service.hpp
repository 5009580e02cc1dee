#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "service_context.hpp"

namespace engram::service {

/*
  Backup and restore of one branch as canonical JSON lines.

  One record per entity:
    {"content_hash":..., "entity":{...}, "history":[hash, ...]}
  Relationships follow every other entity so a restore sees their
  endpoints first, in creation order.
*/
class ExportService {
 public:
  explicit ExportService(ServiceContext ctx);

  struct ExportRequest {
    std::string              branch;
    std::vector<std::string> entity_types; // empty = every type
    bool                     include_relationships = true;
    bool                     include_archived      = true;
  };

  std::vector<std::string> Export(const ExportRequest& req);

  struct ImportFailure {
    std::size_t line = 0; // 1-based position in the input
    std::string error;
  };

  struct ImportSummary {
    std::size_t                imported  = 0;
    std::size_t                unchanged = 0;
    std::vector<ImportFailure> failures;
  };

  // Each record is validated and stored on its own. A record that is
  // malformed, invalid, stale or rejected by the graph is reported and
  // skipped; an unknown branch (util::NotFound) or a storage failure
  // aborts the import.
  ImportSummary Import(const std::string& branch, const std::string& agent, const std::vector<std::string>& records);

 private:
  ServiceContext ctx_;
};

} // namespace engram::service
