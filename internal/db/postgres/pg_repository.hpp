#pragma once

#include <string>

#include "internal/db/api/warehouse_repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace systock::db::postgres {

class PgRepository final : public db::WarehouseRepository {
public:
  // `schema` qualifies every warehouse table; empty uses the search_path.
  PgRepository(std::shared_ptr<PgPool> pool, std::string schema);

  std::string Backend() const override { return "postgres"; }

  std::unique_ptr<Session> Connect() override;

  Result EnsureTable(Transaction&, const sql::TableSpec&) override;

  Result UpsertRows(Transaction&, const sql::TableSpec&, const std::vector<sql::Row>&, uint64_t* affected) override;
  std::optional<sql::Row> FindByKey(Transaction&, const sql::TableSpec&, const sql::Row& key) override;
  std::vector<sql::Row> ListRows(Transaction&, const sql::TableSpec&) override;
  uint64_t CountRows(Transaction&, const sql::TableSpec&) override;

private:
  std::shared_ptr<PgPool> pool_;
  std::string schema_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
