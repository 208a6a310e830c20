#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"

namespace systock::db {

/*
  One warehouse connection held for the duration of a load.

  Postgres: a pooled pqxx::connection, returned to the pool on destruction.
  SQLite:   the shared database handle.
  Memory:   a view of the repository state.

  Only one transaction may be open per session at a time.
*/
class Session {
 public:
  virtual ~Session() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;
};

} // namespace systock::db
