#pragma once

#include <arrow/array.h>
#include <arrow/table.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "internal/util/time.hpp"

namespace systock::storage::common {

/*
  Typed, null-aware access to one column of a raw snapshot.

  Raw feeds are loosely typed: ids may arrive as int32 or int64,
  prices as double or decimal, dates as date32, timestamp or text.
  Each accessor accepts every physical type that can represent the
  requested value and returns nullopt for nulls and for values that
  cannot be interpreted.
*/
class ColumnReader {
 public:
  ColumnReader(std::shared_ptr<arrow::Array> array, std::string name);

  // nullopt when the table has no such column.
  static std::optional<ColumnReader> Find(const arrow::Table& table, std::string_view name);

  // Throws util::ValidationError naming the entity when the column is missing.
  static ColumnReader Require(const arrow::Table& table, std::string_view name, std::string_view entity);

  const std::string& name() const {
    return name_;
  }
  int64_t length() const {
    return array_->length();
  }
  bool IsNull(int64_t i) const {
    return array_->IsNull(i);
  }

  std::optional<int64_t>     Int(int64_t i) const;
  std::optional<double>      Double(int64_t i) const;
  std::optional<std::string> String(int64_t i) const;
  std::optional<bool>        Bool(int64_t i) const;
  std::optional<util::Days>  Date(int64_t i) const;
  std::optional<util::TimePoint> Timestamp(int64_t i) const;

  // List columns: the flattened child values and the [begin, end) slice of row i.
  bool                         IsList() const;
  ColumnReader                 ListValues() const;
  std::pair<int64_t, int64_t>  ListRange(int64_t i) const;

  // Struct columns: one named field, nullopt when the struct lacks it.
  bool                        IsStruct() const;
  std::optional<ColumnReader> Field(std::string_view field_name) const;

  std::string TypeName() const;

 private:
  std::shared_ptr<arrow::Array> array_;
  std::string                   name_;
};

} // namespace systock::storage::common
