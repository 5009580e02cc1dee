#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "engram/v1/entity.pb.h"
#include "internal/db/model/conflict_record.hpp"
#include "merge_strategy.hpp"
#include "sync_report.hpp"

namespace engram::entity {
class EntityStore;
}

namespace engram::graph {
class GraphEngine;
}

namespace engram::sync {

/*
  Synchronization engine.

  One pass reconciles the latest pointers of N branches:

    1. snapshot pointers and sync bases of every branch (one transaction)
    2. per key: common ancestor = lowest-generation base among the branches
       holding the key; candidates = branches whose pointer differs from it
    3. one distinct candidate -> taken; several -> strategy
    4. relationships whose edge is new to some branch (absent there, or with
       other endpoints, type or direction) are re-validated against the
       merged graph; violations are escalated instead of applied
    5. every non-escalated result is swapped onto every branch and becomes
       the new sync base (fresh generation)

  Passes are serialized. With a graph engine, a pass holds the graph's
  branch locks so no relationship write lands between validation and apply.
  A pointer race during apply restarts the pass, at most max_stale_retries
  times, then util::Stale surfaces.
  Re-running over a converged state writes nothing and reports no conflicts.
*/
class SyncEngine {
 public:
  SyncEngine(std::shared_ptr<entity::EntityStore> store, int max_stale_retries = 3, std::shared_ptr<graph::GraphEngine> graph = nullptr);

  /*
    Errors:
      util::InvalidInput    -> empty branch list
      util::UnknownStrategy -> unrecognized strategy name
      util::NotFound        -> unknown branch
    A single (distinct) branch yields nothing_to_synchronize.
  */
  SyncReport Sync(const std::vector<std::string>& branches, const std::string& strategy, const SyncOptions& options = {});

  // Operator resolution: writes `resolved` to every branch, advances their
  // bases and marks recorded conflicts of the key resolved. Returns the hash.
  // A resolved relationship still passes the graph's write checks.
  std::string ResolveConflict(const std::vector<std::string>& branches, engram::v1::Entity resolved);

  std::vector<db::model::ConflictRecord> ListConflicts(bool open_only = true);

 private:
  SyncReport Pass(const std::vector<std::string>& branches, const Strategy& strategy, const SyncOptions& options);

  std::shared_ptr<entity::EntityStore> store_;
  std::shared_ptr<graph::GraphEngine>  graph_;
  int                                  max_stale_retries_;
  std::mutex                           pass_mutex_;
};

} // namespace engram::sync
