#pragma once

#include <arrow/table.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "internal/db/api/warehouse_repository.hpp"
#include "internal/db/sql/table_spec.hpp"

namespace systock::load {

struct MergeOptions {
  std::size_t batch_size{1000};
};

struct MergeResult {
  uint64_t input_rows{0};
  uint64_t duplicates_collapsed{0};
  uint64_t skipped_null_keys{0};
  uint64_t inserted_or_updated{0};
  uint64_t batches{0};
};

/*
  MergeLoader

  Upserts an intermediate table into its warehouse table on the
  TableSpec's natural key. Rows sharing a key are collapsed first (last
  occurrence wins) and rows with a null key part are skipped.

  Each batch is one statement sequence inside one transaction. A
  failing batch is rolled back and reported as util::LoadError;
  batches committed before it stay. The session is held for the
  duration of one Merge() call.
*/
class MergeLoader {
 public:
  explicit MergeLoader(std::shared_ptr<db::WarehouseRepository> repository, MergeOptions options = {});

  MergeResult Merge(const db::sql::TableSpec& spec, const arrow::Table& table) const;

  // Creates missing warehouse tables in one transaction. Throws util::LoadError.
  void EnsureTables(const std::vector<db::sql::TableSpec>& specs) const;

  // One warehouse row per table row, in spec column order.
  // Throws util::ValidationError when a mapped column is missing.
  static std::vector<db::sql::Row> ToRows(const db::sql::TableSpec& spec, const arrow::Table& table);

  const std::shared_ptr<db::WarehouseRepository>& repository() const {
    return repository_;
  }

 private:
  std::shared_ptr<db::WarehouseRepository> repository_;
  MergeOptions                             options_;
};

} // namespace systock::load
