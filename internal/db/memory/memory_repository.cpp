#include "memory_repository.hpp"

#include <algorithm>
#include <chrono>

#include "memory_tx.hpp"

namespace engram::db::memory {

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

template <typename Map>
void EraseBranch(Map& map, const std::string& branch) {
  for (auto it = map.begin(); it != map.end();) {
    if (std::get<0>(it->first) == branch) {
      it = map.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Branches
// ------------------------------------------------------------------

Result MemoryRepository::InsertBranch(Transaction& t, const model::BranchRecord& r) {
  auto& tx = TX(t);
  if (tx.View().branches.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "branch " + r.name);

  tx.ApplyGuarded([name = r.name](const State& s) { return !s.branches.contains(name); }, "branch " + r.name + " created concurrently",
                  [r](State& s) { s.branches[r.name] = r; });
  return Result::Ok();
}

std::optional<model::BranchRecord> MemoryRepository::GetBranch(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.branches.find(name);
  if (it == s.branches.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BranchRecord> MemoryRepository::ListBranches(Transaction& t) {
  std::vector<model::BranchRecord> out;
  for (const auto& [_, record] : TX(t).View().branches) out.push_back(record);
  return out;
}

Result MemoryRepository::DeleteBranch(Transaction& t, const std::string& name) {
  auto& tx = TX(t);
  if (!tx.View().branches.contains(name)) return Result::Err(ErrorCode::NotFound, "branch " + name);

  tx.Apply([name](State& s) {
    s.branches.erase(name);
    EraseBranch(s.pointers, name);
    EraseBranch(s.history, name);
    EraseBranch(s.sync_bases, name);
  });
  return Result::Ok();
}

Result MemoryRepository::CopyBranchState(Transaction& t, const std::string& from, const std::string& to) {
  auto&       tx = TX(t);
  const auto& s  = tx.View();
  if (!s.branches.contains(from)) return Result::Err(ErrorCode::NotFound, "branch " + from);

  // Copy what this transaction sees so the caller's follow-up writes agree with it.
  std::vector<model::PointerRecord>              pointers;
  std::vector<std::pair<Key, std::vector<model::HistoryRecord>>> history;
  for (const auto& [key, pointer] : s.pointers) {
    if (std::get<0>(key) != from) continue;
    auto copy   = pointer;
    copy.branch = to;
    pointers.push_back(std::move(copy));
  }
  for (const auto& [key, entries] : s.history) {
    if (std::get<0>(key) != from) continue;
    auto copied = entries;
    for (auto& entry : copied) entry.branch = to;
    history.emplace_back(Key{to, std::get<1>(key), std::get<2>(key)}, std::move(copied));
  }

  tx.Apply([pointers = std::move(pointers), history = std::move(history)](State& state) {
    for (const auto& pointer : pointers) {
      state.pointers[Key{pointer.branch, pointer.entity_type, pointer.entity_id}] = pointer;
    }
    for (const auto& [key, entries] : history) {
      state.history[key] = entries;
    }
  });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Pointers
// ------------------------------------------------------------------

std::optional<model::PointerRecord> MemoryRepository::GetPointer(Transaction& t, const std::string& branch, const std::string& entity_type,
                                                                 const std::string& entity_id) {
  const auto& s  = TX(t).View();
  auto        it = s.pointers.find(Key{branch, entity_type, entity_id});
  if (it == s.pointers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PointerRecord> MemoryRepository::ListPointers(Transaction& t, const std::string& branch, const std::string& entity_type) {
  const auto&                       s = TX(t).View();
  std::vector<model::PointerRecord> out;
  // keys sort by (branch, type, id), so one branch is a contiguous range
  for (auto it = s.pointers.lower_bound(Key{branch, entity_type, ""}); it != s.pointers.end(); ++it) {
    if (std::get<0>(it->first) != branch) break;
    if (!entity_type.empty() && std::get<1>(it->first) != entity_type) break;
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::CompareAndSwapPointer(Transaction& t, const model::PointerRecord& next, const std::optional<std::string>& expected_hash) {
  auto&     tx  = TX(t);
  const Key key{next.branch, next.entity_type, next.entity_id};

  auto holds = [key, expected_hash](const State& s) {
    auto it = s.pointers.find(key);
    if (!expected_hash) return it == s.pointers.end();
    return it != s.pointers.end() && it->second.content_hash == *expected_hash;
  };

  if (!holds(tx.View())) {
    return Result::Err(ErrorCode::Conflict, next.entity_type + "/" + next.entity_id + " on " + next.branch);
  }

  tx.ApplyGuarded(holds, "pointer " + next.entity_type + "/" + next.entity_id + " on " + next.branch + " changed concurrently",
                  [key, next](State& s) {
                    auto& slot         = s.pointers[key];
                    const auto version = slot.version + 1;
                    slot               = next;
                    slot.version       = version;
                  });
  return Result::Ok();
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result MemoryRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
  TX(t).Apply([r](State& s) {
    const Key key{r.branch, r.entity_type, r.entity_id};
    auto      entry = r;
    if (auto it = s.pointers.find(key); it != s.pointers.end()) {
      entry.version = it->second.version;
    }
    if (entry.recorded_at_ms == 0) entry.recorded_at_ms = NowMs();
    s.history[key].push_back(std::move(entry));
  });
  return Result::Ok();
}

std::vector<model::HistoryRecord> MemoryRepository::ListHistory(Transaction& t, const std::string& branch, const std::string& entity_type,
                                                                const std::string& entity_id) {
  const auto& s  = TX(t).View();
  auto        it = s.history.find(Key{branch, entity_type, entity_id});
  if (it == s.history.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Sync bases
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSyncBase(Transaction& t, const model::SyncBaseRecord& r) {
  TX(t).Apply([r](State& s) { s.sync_bases[Key{r.branch, r.entity_type, r.entity_id}] = r; });
  return Result::Ok();
}

std::vector<model::SyncBaseRecord> MemoryRepository::ListSyncBases(Transaction& t, const std::string& branch) {
  const auto&                        s = TX(t).View();
  std::vector<model::SyncBaseRecord> out;
  for (auto it = s.sync_bases.lower_bound(Key{branch, "", ""}); it != s.sync_bases.end() && std::get<0>(it->first) == branch; ++it) {
    out.push_back(it->second);
  }
  return out;
}

uint64_t MemoryRepository::MaxSyncGeneration(Transaction& t) {
  uint64_t max_generation = 0;
  for (const auto& [_, base] : TX(t).View().sync_bases) max_generation = std::max(max_generation, base.generation);
  return max_generation;
}

// ------------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------------

Result MemoryRepository::InsertConflict(Transaction& t, const model::ConflictRecord& r) {
  auto& tx = TX(t);
  if (tx.View().conflicts.contains(r.fingerprint)) return Result::Err(ErrorCode::AlreadyExists, "conflict " + r.fingerprint);

  tx.Apply([r](State& s) {
    auto record = r;
    if (record.created_at_ms == 0) record.created_at_ms = NowMs();
    s.conflicts.try_emplace(record.fingerprint, std::move(record));
  });
  return Result::Ok();
}

std::optional<model::ConflictRecord> MemoryRepository::GetConflict(Transaction& t, const std::string& fingerprint) {
  const auto& s  = TX(t).View();
  auto        it = s.conflicts.find(fingerprint);
  if (it == s.conflicts.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ConflictRecord> MemoryRepository::ListConflicts(Transaction& t, bool open_only) {
  std::vector<model::ConflictRecord> out;
  for (const auto& [_, record] : TX(t).View().conflicts) {
    if (open_only && record.resolved) continue;
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.fingerprint < b.fingerprint;
  });
  return out;
}

Result MemoryRepository::ResolveConflicts(Transaction& t, const std::string& entity_type, const std::string& entity_id) {
  TX(t).Apply([entity_type, entity_id](State& s) {
    for (auto& [_, record] : s.conflicts) {
      if (record.entity_type == entity_type && record.entity_id == entity_id) record.resolved = true;
    }
  });
  return Result::Ok();
}

} // namespace engram::db::memory
