#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/session.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/table_spec.hpp"

namespace systock::db {

/*
  Warehouse repository abstraction.

  GUARANTEES:

  - All reads and writes run inside a Transaction obtained from a
    Session of this repository
  - Reads inside a transaction see its writes
  - UpsertRows is insert-or-update on the TableSpec's key columns; with a
    load-timestamp column an existing row is only replaced by a row
    carrying a strictly newer timestamp
  - Rows are never deleted

  Rows are laid out in TableSpec::columns order. Dates and timestamps
  are exchanged as fixed-width text.
*/

class WarehouseRepository {
 public:
  virtual ~WarehouseRepository() = default;

  // "memory", "sqlite" or "postgres"
  virtual std::string Backend() const = 0;

  // ---------------------------------------------------------------------
  // Sessions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Session> Connect() = 0;

  // ---------------------------------------------------------------------
  // Schema
  // ---------------------------------------------------------------------

  // CREATE TABLE IF NOT EXISTS (and the schema, where the backend has one).
  virtual Result EnsureTable(Transaction&, const sql::TableSpec& spec) = 0;

  // ---------------------------------------------------------------------
  // Rows
  // ---------------------------------------------------------------------

  // `affected` receives the number of rows inserted or updated; rows
  // rejected by the load-timestamp guard are not counted.
  virtual Result UpsertRows(Transaction&, const sql::TableSpec& spec, const std::vector<sql::Row>& rows, uint64_t* affected) = 0;

  // `key` holds one value per spec.key_columns entry.
  virtual std::optional<sql::Row> FindByKey(Transaction&, const sql::TableSpec& spec, const sql::Row& key) = 0;

  // Ordered by key.
  virtual std::vector<sql::Row> ListRows(Transaction&, const sql::TableSpec& spec) = 0;

  virtual uint64_t CountRows(Transaction&, const sql::TableSpec& spec) = 0;
};

} // namespace systock::db
