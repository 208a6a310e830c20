#pragma once

#include <memory>

#include "internal/db/api/warehouse_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace systock::db::sqlite {

class SqliteRepository final : public db::WarehouseRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::string Backend() const override { return "sqlite"; }

  std::unique_ptr<Session> Connect() override;

  Result EnsureTable(Transaction&, const sql::TableSpec&) override;

  Result UpsertRows(Transaction&, const sql::TableSpec&, const std::vector<sql::Row>&, uint64_t* affected) override;
  std::optional<sql::Row> FindByKey(Transaction&, const sql::TableSpec&, const sql::Row& key) override;
  std::vector<sql::Row> ListRows(Transaction&, const sql::TableSpec&) override;
  uint64_t CountRows(Transaction&, const sql::TableSpec&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
