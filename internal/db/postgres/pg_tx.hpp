#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/session.hpp"
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace systock::db::postgres {

class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<pqxx::connection> conn);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool finished_ = false;
};

// Holds one pooled connection until destroyed.
class PgSession final : public db::Session {
public:
  explicit PgSession(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()) {}

  std::unique_ptr<Transaction> Begin() override {
    return std::make_unique<PgTransaction>(conn_);
  }

private:
  std::shared_ptr<pqxx::connection> conn_;
};

}
