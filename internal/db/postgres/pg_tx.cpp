#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace systock::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<pqxx::connection> conn)
    : conn_(std::move(conn))
{
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try { tx_->abort(); }
    catch (const std::exception& e) {
      SYSTOCK_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  finished_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
