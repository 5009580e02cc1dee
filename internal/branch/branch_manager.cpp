#include "branch_manager.hpp"

#include <set>
#include <utility>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace engram::branch {

BranchManager::BranchManager(std::shared_ptr<db::Repository> repository, std::string default_branch, std::string default_agent)
    : repository_(std::move(repository)), default_branch_(std::move(default_branch)), default_agent_(std::move(default_agent)) {
}

void BranchManager::ValidateName(const std::string& name) {
  if (name.empty() || name.size() > 128) {
    throw util::InvalidInput("branch name must be 1-128 characters");
  }
  for (char c : name) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    if (!ok) throw util::InvalidInput("branch name '" + name + "' may only contain letters, digits, '.', '_' and '-'");
  }
}

void BranchManager::Bootstrap() {
  ValidateName(default_branch_);

  auto tx = repository_->Begin();
  if (!repository_->GetBranch(*tx, default_branch_)) {
    db::model::BranchRecord record;
    record.name          = default_branch_;
    record.agent         = default_agent_;
    record.created_at_ms = util::NowMillis();
    db::ThrowIfDbError(repository_->InsertBranch(*tx, record), "bootstrap branch " + default_branch_);
    ENGRAM_LOG_INFO("default branch created", {observability::StringField("branch", default_branch_)});
  }
  tx->Commit();

  std::lock_guard lock(active_mutex_);
  active_ = default_branch_;
}

db::model::BranchRecord BranchManager::CreateBranch(const std::string& name, const std::string& agent, const std::optional<std::string>& from) {
  ValidateName(name);
  if (agent.empty()) throw util::InvalidInput("create branch " + name + ": agent is empty");

  db::model::BranchRecord record;
  record.name          = name;
  record.agent         = agent;
  record.parent        = from.value_or("");
  record.created_at_ms = util::NowMillis();

  auto tx = repository_->Begin();
  if (from && !repository_->GetBranch(*tx, *from)) {
    throw util::NotFound("create branch " + name + ": parent branch " + *from + " not found");
  }
  db::ThrowIfDbError(repository_->InsertBranch(*tx, record), "create branch " + name);

  if (from) {
    db::ThrowIfDbError(repository_->CopyBranchState(*tx, *from, name), "fork branch " + name + " from " + *from);

    std::set<std::pair<std::string, std::string>> parent_bases;
    for (const auto& base : repository_->ListSyncBases(*tx, *from)) {
      parent_bases.emplace(base.entity_type, base.entity_id);
    }

    // the fork point is the child's base; the parent only gains bases it lacks
    const auto generation = repository_->MaxSyncGeneration(*tx) + 1;
    for (const auto& pointer : repository_->ListPointers(*tx, name, "")) {
      db::model::SyncBaseRecord base;
      base.branch       = name;
      base.entity_type  = pointer.entity_type;
      base.entity_id    = pointer.entity_id;
      base.content_hash = pointer.content_hash;
      base.generation   = generation;
      db::ThrowIfDbError(repository_->UpsertSyncBase(*tx, base), "record fork base for " + name);

      if (!parent_bases.contains({pointer.entity_type, pointer.entity_id})) {
        base.branch = *from;
        db::ThrowIfDbError(repository_->UpsertSyncBase(*tx, base), "record fork base for " + *from);
      }
    }
  }
  tx->Commit();

  ENGRAM_LOG_INFO("branch created", {observability::StringField("branch", name), observability::StringField("agent", agent),
                                     observability::StringField("from", record.parent)});
  return record;
}

void BranchManager::Switch(const std::string& name) {
  if (!Exists(name)) throw util::NotFound("switch branch: " + name + " not found");

  std::lock_guard lock(active_mutex_);
  active_ = name;
}

std::string BranchManager::Active() const {
  std::lock_guard lock(active_mutex_);
  return active_;
}

db::model::BranchRecord BranchManager::Get(const std::string& name) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetBranch(*tx, name);
  tx->Commit();

  if (!record) throw util::NotFound("branch " + name + " not found");
  return *record;
}

bool BranchManager::Exists(const std::string& name) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetBranch(*tx, name);
  tx->Commit();
  return record.has_value();
}

std::vector<db::model::BranchRecord> BranchManager::List() {
  auto tx       = repository_->Begin();
  auto branches = repository_->ListBranches(*tx);
  tx->Commit();
  return branches;
}

void BranchManager::DeleteBranch(const std::string& name) {
  if (name == Active()) {
    throw util::InvalidInput("delete branch " + name + ": branch is active; switch to another branch first");
  }

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteBranch(*tx, name), "delete branch " + name);
  tx->Commit();

  ENGRAM_LOG_INFO("branch deleted", {observability::StringField("branch", name)});
}

} // namespace engram::branch
