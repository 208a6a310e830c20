#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/warehouse_repository.hpp"

namespace systock::db::memory {

class MemoryTransaction;

/*
  In-process warehouse used by tests and by runs without a configured
  backend. Follows the same upsert and guard rules as the SQL backends.
*/
class MemoryRepository final : public db::WarehouseRepository {
public:
  MemoryRepository();

  std::string Backend() const override { return "memory"; }

  std::unique_ptr<Session> Connect() override;

  Result EnsureTable(Transaction&, const sql::TableSpec&) override;

  Result UpsertRows(Transaction&, const sql::TableSpec&, const std::vector<sql::Row>&, uint64_t* affected) override;
  std::optional<sql::Row> FindByKey(Transaction&, const sql::TableSpec&, const sql::Row& key) override;
  std::vector<sql::Row> ListRows(Transaction&, const sql::TableSpec&) override;
  uint64_t CountRows(Transaction&, const sql::TableSpec&) override;

private:
  friend class MemoryTransaction;

  using Rows = std::map<sql::Row, sql::Row, sql::RowLess>;

  struct State {
    std::map<std::string, Rows> tables;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
