#pragma once

#include <optional>
#include <string>
#include <vector>

#include "service_context.hpp"

namespace engram::service {

/*
  Read-only questions a commit validator asks about one branch.
  Archived tasks count as absent.
*/
class ValidationView {
 public:
  explicit ValidationView(ServiceContext ctx);

  bool TaskExists(const std::string& branch, const std::string& task_id);

  // std::nullopt when the task does not exist or carries no status.
  std::optional<std::string> TaskStatus(const std::string& branch, const std::string& task_id);

  // True when an active relationship of one of `types` touches the task,
  // in either direction.
  bool HasRelationshipsOfTypes(const std::string& branch, const std::string& task_id, const std::vector<std::string>& types);

 private:
  ServiceContext ctx_;
};

} // namespace engram::service
