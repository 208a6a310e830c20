#pragma once

#include <arrow/table.h>

#include <memory>
#include <vector>

#include "internal/model/dimension_rows.hpp"
#include "internal/model/fact_rows.hpp"

namespace systock::model {

/*
  Typed rows -> Arrow tables.

  Column names match the intermediate star-schema layout that
  db::sql::WarehouseTables() maps onto warehouse columns.
  Load timestamps are timestamp[us], calendar dates are date32.
*/
std::shared_ptr<arrow::Table> ToTable(const std::vector<ClientDimRow>& rows);
std::shared_ptr<arrow::Table> ToTable(const std::vector<ProductDimRow>& rows);
std::shared_ptr<arrow::Table> ToTable(const std::vector<StoreDimRow>& rows);
std::shared_ptr<arrow::Table> ToTable(const std::vector<CalendarDayRow>& rows);
std::shared_ptr<arrow::Table> ToTable(const std::vector<SalesLineRow>& rows);
std::shared_ptr<arrow::Table> ToTable(const std::vector<InventoryDeltaRow>& rows);
std::shared_ptr<arrow::Table> ToTable(const std::vector<DistributionLineRow>& rows);

} // namespace systock::model
