#pragma once

#include <cstdint>
#include <string>

namespace engram::db::model {

/*
  One isolated line of history owned by an agent identity.
*/

struct BranchRecord {
  std::string name;
  std::string agent;

  // branch this one was forked from, empty for a root branch
  std::string parent;

  uint64_t created_at_ms = 0;
};

} // namespace engram::db::model
