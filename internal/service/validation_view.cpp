#include "validation_view.hpp"

#include <utility>

#include "internal/entity/entity_codec.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/graph/graph_engine.hpp"

namespace engram::service {

namespace {

constexpr const char* kTaskType = "task";

} // namespace

ValidationView::ValidationView(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

bool ValidationView::TaskExists(const std::string& branch, const std::string& task_id) {
  auto task = ctx_.store->Find(branch, kTaskType, task_id);
  return task && !task->archived();
}

std::optional<std::string> ValidationView::TaskStatus(const std::string& branch, const std::string& task_id) {
  auto task = ctx_.store->Find(branch, kTaskType, task_id);
  if (!task || task->archived()) return std::nullopt;

  auto status = entity::GetStringField(*task, "status");
  if (status.empty()) return std::nullopt;
  return status;
}

bool ValidationView::HasRelationshipsOfTypes(const std::string& branch, const std::string& task_id, const std::vector<std::string>& types) {
  const graph::EntityRef task{kTaskType, task_id};
  for (const auto& type : types) {
    if (!ctx_.graph->ListRelationships(branch, task, type).empty()) return true;
  }
  return false;
}

} // namespace engram::service
