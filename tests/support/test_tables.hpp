#pragma once

#include <arrow/table.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace systock::testing {

template <typename T>
using Column = std::vector<std::optional<T>>;

struct SaleItem {
  std::optional<int64_t> product_id;
  std::optional<int64_t> quantity;
  std::optional<double>  unit_price;
  std::optional<double>  total_price;
};

struct DistributionItem {
  std::optional<int64_t> product_id;
  std::optional<int64_t> quantity;
};

// Fresh, empty directory under the system temp dir.
std::filesystem::path MakeTempDir(const std::string& name);

// A clock that always returns the given ISO timestamp.
util::ClockFn FixedClock(const std::string& iso_timestamp);

/*
  Column-by-column construction of raw snapshot tables. All columns
  must have the same length.
*/
class TableBuilder {
 public:
  TableBuilder& Int64(const std::string& name, const Column<int64_t>& values);
  TableBuilder& Double(const std::string& name, const Column<double>& values);
  TableBuilder& Utf8(const std::string& name, const Column<std::string>& values);
  TableBuilder& Bool(const std::string& name, const Column<bool>& values);
  // ISO strings parsed into timestamp[us, UTC].
  TableBuilder& Timestamp(const std::string& name, const Column<std::string>& iso_values);
  // list<struct<product_id, quantity, unit_price, total_price>>; nullopt is a null list.
  TableBuilder& SaleItems(const std::string& name, const std::vector<std::optional<std::vector<SaleItem>>>& values);
  // list<struct<product_id, quantity>>
  TableBuilder& DistributionItems(const std::string& name, const std::vector<std::optional<std::vector<DistributionItem>>>& values);

  std::shared_ptr<arrow::Table> Build() const;

 private:
  std::vector<std::shared_ptr<arrow::Field>> fields_;
  std::vector<std::shared_ptr<arrow::Array>> arrays_;
};

// Writes <bronze_dir>/<entity>/<file_name> as Parquet.
std::filesystem::path WriteSnapshot(const std::filesystem::path& bronze_dir, const std::string& entity, const arrow::Table& table,
                                    const std::string& file_name = "snapshot.parquet");

} // namespace systock::testing
