#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/branch_record.hpp"

namespace engram::branch {

/*
  Agent branches.

  A branch is a named latest-pointer set over the shared object space, owned
  by one agent identity. Writes on a branch are invisible to others until a
  sync pass includes both.

  The active branch is process-local state; it only decides where facade
  calls write.
*/
class BranchManager {
 public:
  BranchManager(std::shared_ptr<db::Repository> repository, std::string default_branch, std::string default_agent);

  // Creates the default branch if missing and makes it active.
  void Bootstrap();

  /*
    Fails util::AlreadyExists when the name is taken, util::InvalidInput for
    a malformed name, util::NotFound for an unknown `from`.

    With `from`, the new branch starts with the parent's pointers and
    history, and records them as its sync base.
  */
  db::model::BranchRecord CreateBranch(const std::string& name, const std::string& agent, const std::optional<std::string>& from = std::nullopt);

  void        Switch(const std::string& name);
  std::string Active() const;

  db::model::BranchRecord              Get(const std::string& name);
  bool                                 Exists(const std::string& name);
  std::vector<db::model::BranchRecord> List();

  // Refuses the active branch (util::InvalidInput).
  void DeleteBranch(const std::string& name);

  const std::string& DefaultAgent() const {
    return default_agent_;
  }

  // Letters, digits, '.', '_', '-'; 1-128 characters.
  static void ValidateName(const std::string& name);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     default_branch_;
  std::string                     default_agent_;

  mutable std::mutex active_mutex_;
  std::string        active_;
};

} // namespace engram::branch
