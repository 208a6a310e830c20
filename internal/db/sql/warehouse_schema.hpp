#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/sql/table_spec.hpp"

namespace systock::db::sql {

/*
  Warehouse layout: one TableSpec per intermediate star-schema table.

  Dimensions and facts carry a data_carga guard so a merge never
  overwrites a row with an older load. dim_tempo has none and is
  overwritten on every merge.
*/
const std::vector<TableSpec>& WarehouseTables();

// Spec whose source_table is `intermediate_table`, or nullopt.
std::optional<TableSpec> FindWarehouseTable(const std::string& intermediate_table);

} // namespace systock::db::sql
