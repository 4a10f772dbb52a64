#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace datahub::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<SerializableWork>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    DATAHUB_LOG_WARN("postgres rollback failed", {datahub::observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    finished_ = true;
    throw util::TransactionConflict(e.what());
  }
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  tx_->abort();
  finished_ = true;
}

}
