#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace engram::db::postgres {

/*
  Connections shared by every PgRepository transaction.

  A pqxx::connection is not thread-safe, so each transaction checks one
  out for its whole lifetime and hands it back when the returned
  shared_ptr drops. The entity pointer statements are prepared once per
  connection. Connections found closed on return or on checkout are
  discarded and their slot freed.

  Acquire() waits up to acquire_timeout for a free slot and then throws
  util::StorageError, as it does when a new connection cannot be opened.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  static constexpr std::chrono::milliseconds kDefaultAcquireTimeout{30000};

  PgPool(std::string conninfo, std::size_t max_connections = 16, std::chrono::milliseconds acquire_timeout = kDefaultAcquireTimeout);

  std::shared_ptr<pqxx::connection> Acquire();

  // Checked-out plus idle connections.
  std::size_t LiveConnections() const;

 private:
  static void                       PrepareEntityStatements(pqxx::connection& conn);
  std::unique_ptr<pqxx::connection> Connect();
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              Return(pqxx::connection* conn);

  const std::string               conninfo_;
  const std::size_t               max_connections_;
  const std::chrono::milliseconds acquire_timeout_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        slot_free_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_ = 0;
};

} // namespace engram::db::postgres
