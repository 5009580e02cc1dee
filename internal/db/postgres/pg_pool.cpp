#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace engram::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      acquire_timeout_(acquire_timeout.count() <= 0 ? kDefaultAcquireTimeout : acquire_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  for (;;) {
    const bool ready = slot_free_.wait_for(lock, acquire_timeout_, [this] {
      return !idle_.empty() || live_ < max_connections_;
    });
    if (!ready) {
      throw util::StorageError("postgres pool exhausted: " + std::to_string(max_connections_) + " connections busy for " +
                               std::to_string(acquire_timeout_.count()) + "ms");
    }

    if (idle_.empty()) break;

    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) return Lend(std::move(conn));

    --live_;
    ENGRAM_LOG_WARN("dropping closed postgres connection", {observability::IntField("live", live_)});
  }

  ++live_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = Connect();
  } catch (const util::StorageError&) {
    std::lock_guard relock(mutex_);
    --live_;
    slot_free_.notify_one();
    throw;
  }
  return Lend(std::move(conn));
}

std::size_t PgPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_;
}

std::unique_ptr<pqxx::connection> PgPool::Connect() {
  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareEntityStatements(*conn);
    return conn;
  } catch (const pqxx::failure& e) {
    throw util::StorageError(std::string("postgres connect: ") + e.what());
  }
}

void PgPool::PrepareEntityStatements(pqxx::connection& conn) {
  conn.prepare("get_pointer",
               "SELECT branch, entity_type, entity_id, content_hash, version, updated_at_ms "
               "FROM entity_pointer WHERE branch=$1 AND entity_type=$2 AND entity_id=$3");

  conn.prepare("insert_pointer",
               "INSERT INTO entity_pointer(branch,entity_type,entity_id,content_hash,version,updated_at_ms) "
               "VALUES($1,$2,$3,$4,1,$5) ON CONFLICT (branch,entity_type,entity_id) DO NOTHING");

  conn.prepare("swap_pointer",
               "UPDATE entity_pointer SET content_hash=$4, version=version+1, updated_at_ms=$5 "
               "WHERE branch=$1 AND entity_type=$2 AND entity_id=$3 AND content_hash=$6");

  conn.prepare("append_history",
               "INSERT INTO entity_history(branch,entity_type,entity_id,version,content_hash,agent,recorded_at_ms) "
               "VALUES($1,$2,$3,COALESCE((SELECT version FROM entity_pointer WHERE branch=$1 AND entity_type=$2 AND entity_id=$3),$4),$5,$6,$7)");
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* returned) {
    if (auto self = pool.lock()) {
      self->Return(returned);
      return;
    }
    delete returned;
  });
}

void PgPool::Return(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --live_;
    }
  }
  slot_free_.notify_one();
}

} // namespace engram::db::postgres
