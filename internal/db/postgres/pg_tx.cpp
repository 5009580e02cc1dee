#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace engram::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    ENGRAM_LOG_WARN("postgres rollback failed", {engram::observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw TransactionConflict(e.what());
  }
  finished_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  finished_ = true;
}

} // namespace engram::db::postgres
