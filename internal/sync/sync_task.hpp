#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "sync_report.hpp"

namespace engram::sync {

/*
  A queued synchronization request.

  The worker fulfils `result` with the pass report, or with the exception
  the pass raised.
*/
struct SyncTask {
  std::vector<std::string> branches;
  std::string              strategy;
  SyncOptions              options;

  std::shared_ptr<std::promise<SyncReport>> result;
};

} // namespace engram::sync
