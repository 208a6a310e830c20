#include "column_reader.hpp"

#include <arrow/array/concatenate.h>
#include <arrow/array/util.h>
#include <arrow/memory_pool.h>
#include <arrow/scalar.h>
#include <arrow/type.h>
#include <arrow/util/decimal.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace systock::storage::common {

namespace {

template <typename ArrayType>
auto ValueAt(const arrow::Array& array, int64_t i) {
  return static_cast<const ArrayType&>(array).Value(i);
}

std::string StringAt(const arrow::Array& array, int64_t i) {
  if (array.type_id() == arrow::Type::LARGE_STRING) {
    return static_cast<const arrow::LargeStringArray&>(array).GetString(i);
  }
  return static_cast<const arrow::StringArray&>(array).GetString(i);
}

bool IsStringType(arrow::Type::type id) {
  return id == arrow::Type::STRING || id == arrow::Type::LARGE_STRING;
}

std::optional<int64_t> ParseInt(const std::string& text) {
  int64_t     value = 0;
  const char* begin = text.data();
  const char* end   = text.data() + text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(*begin))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) --end;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || begin == end) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> ParseDouble(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char*        endptr = nullptr;
  const double value  = std::strtod(text.c_str(), &endptr);
  while (endptr && *endptr != '\0' && std::isspace(static_cast<unsigned char>(*endptr))) ++endptr;
  if (!endptr || *endptr != '\0' || endptr == text.c_str()) {
    return std::nullopt;
  }
  return value;
}

std::chrono::microseconds ToMicros(int64_t value, arrow::TimeUnit::type unit) {
  switch (unit) {
    case arrow::TimeUnit::SECOND:
      return std::chrono::seconds(value);
    case arrow::TimeUnit::MILLI:
      return std::chrono::milliseconds(value);
    case arrow::TimeUnit::MICRO:
      return std::chrono::microseconds(value);
    case arrow::TimeUnit::NANO:
    default:
      return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::nanoseconds(value));
  }
}

} // namespace

ColumnReader::ColumnReader(std::shared_ptr<arrow::Array> array, std::string name) : array_(std::move(array)), name_(std::move(name)) {
}

std::optional<ColumnReader> ColumnReader::Find(const arrow::Table& table, std::string_view name) {
  auto column = table.GetColumnByName(std::string(name));
  if (!column) {
    return std::nullopt;
  }

  std::shared_ptr<arrow::Array> array;
  if (column->num_chunks() == 0) {
    array = Unwrap(arrow::MakeArrayOfNull(column->type(), 0));
  } else if (column->num_chunks() == 1) {
    array = column->chunk(0);
  } else {
    array = Unwrap(arrow::Concatenate(column->chunks(), arrow::default_memory_pool()));
  }
  return ColumnReader(std::move(array), std::string(name));
}

ColumnReader ColumnReader::Require(const arrow::Table& table, std::string_view name, std::string_view entity) {
  auto reader = Find(table, name);
  if (!reader) {
    throw util::ValidationError(std::string(entity) + ": missing required column '" + std::string(name) + "'");
  }
  return std::move(*reader);
}

std::optional<int64_t> ColumnReader::Int(int64_t i) const {
  if (array_->IsNull(i)) {
    return std::nullopt;
  }

  const auto& a = *array_;
  switch (a.type_id()) {
    case arrow::Type::INT8:
      return ValueAt<arrow::Int8Array>(a, i);
    case arrow::Type::INT16:
      return ValueAt<arrow::Int16Array>(a, i);
    case arrow::Type::INT32:
      return ValueAt<arrow::Int32Array>(a, i);
    case arrow::Type::INT64:
      return ValueAt<arrow::Int64Array>(a, i);
    case arrow::Type::UINT8:
      return ValueAt<arrow::UInt8Array>(a, i);
    case arrow::Type::UINT16:
      return ValueAt<arrow::UInt16Array>(a, i);
    case arrow::Type::UINT32:
      return ValueAt<arrow::UInt32Array>(a, i);
    case arrow::Type::UINT64:
      return static_cast<int64_t>(ValueAt<arrow::UInt64Array>(a, i));
    case arrow::Type::FLOAT:
    case arrow::Type::DOUBLE: {
      // float-typed ids appear when a source column contained nulls
      const double value = *Double(i);
      if (!std::isfinite(value) || value != std::trunc(value)) {
        return std::nullopt;
      }
      return static_cast<int64_t>(value);
    }
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
      return ParseInt(StringAt(a, i));
    default:
      return std::nullopt;
  }
}

std::optional<double> ColumnReader::Double(int64_t i) const {
  if (array_->IsNull(i)) {
    return std::nullopt;
  }

  const auto& a = *array_;
  switch (a.type_id()) {
    case arrow::Type::FLOAT:
      return ValueAt<arrow::FloatArray>(a, i);
    case arrow::Type::DOUBLE:
      return ValueAt<arrow::DoubleArray>(a, i);
    case arrow::Type::DECIMAL128: {
      const auto&             type = static_cast<const arrow::Decimal128Type&>(*a.type());
      const arrow::Decimal128 value(static_cast<const arrow::Decimal128Array&>(a).GetValue(i));
      return value.ToDouble(type.scale());
    }
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
      return ParseDouble(StringAt(a, i));
    case arrow::Type::INT8:
    case arrow::Type::INT16:
    case arrow::Type::INT32:
    case arrow::Type::INT64:
    case arrow::Type::UINT8:
    case arrow::Type::UINT16:
    case arrow::Type::UINT32:
    case arrow::Type::UINT64:
      return static_cast<double>(*Int(i));
    default:
      return std::nullopt;
  }
}

std::optional<std::string> ColumnReader::String(int64_t i) const {
  if (array_->IsNull(i)) {
    return std::nullopt;
  }
  if (IsStringType(array_->type_id())) {
    return StringAt(*array_, i);
  }

  auto scalar = array_->GetScalar(i);
  if (!scalar.ok()) {
    return std::nullopt;
  }
  return (*scalar)->ToString();
}

std::optional<bool> ColumnReader::Bool(int64_t i) const {
  if (array_->IsNull(i)) {
    return std::nullopt;
  }

  if (array_->type_id() == arrow::Type::BOOL) {
    return ValueAt<arrow::BooleanArray>(*array_, i);
  }

  if (IsStringType(array_->type_id())) {
    std::string text = StringAt(*array_, i);
    for (auto& c : text) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (text == "true" || text == "t" || text == "1" || text == "yes") return true;
    if (text == "false" || text == "f" || text == "0" || text == "no") return false;
    return std::nullopt;
  }

  if (auto value = Int(i)) {
    return *value != 0;
  }
  return std::nullopt;
}

std::optional<util::Days> ColumnReader::Date(int64_t i) const {
  if (array_->IsNull(i)) {
    return std::nullopt;
  }

  switch (array_->type_id()) {
    case arrow::Type::DATE32:
      return util::Days{std::chrono::days(ValueAt<arrow::Date32Array>(*array_, i))};
    case arrow::Type::DATE64:
      return std::chrono::floor<std::chrono::days>(util::Days{} + std::chrono::milliseconds(ValueAt<arrow::Date64Array>(*array_, i)));
    case arrow::Type::TIMESTAMP: {
      auto ts = Timestamp(i);
      if (!ts) return std::nullopt;
      return std::chrono::floor<std::chrono::days>(*ts);
    }
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING: {
      // day of the UTC instant, same as the TIMESTAMP branch
      auto ts = util::ParseTimestamp(StringAt(*array_, i));
      if (!ts) return std::nullopt;
      return std::chrono::floor<std::chrono::days>(*ts);
    }
    default:
      return std::nullopt;
  }
}

std::optional<util::TimePoint> ColumnReader::Timestamp(int64_t i) const {
  if (array_->IsNull(i)) {
    return std::nullopt;
  }

  switch (array_->type_id()) {
    case arrow::Type::TIMESTAMP: {
      const auto& type = static_cast<const arrow::TimestampType&>(*array_->type());
      return util::FromUnixMicros(ToMicros(ValueAt<arrow::TimestampArray>(*array_, i), type.unit()).count());
    }
    case arrow::Type::DATE32:
    case arrow::Type::DATE64: {
      auto day = Date(i);
      if (!day) return std::nullopt;
      return util::TimePoint{*day};
    }
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
      return util::ParseTimestamp(StringAt(*array_, i));
    default:
      return std::nullopt;
  }
}

bool ColumnReader::IsList() const {
  return array_->type_id() == arrow::Type::LIST || array_->type_id() == arrow::Type::LARGE_LIST;
}

ColumnReader ColumnReader::ListValues() const {
  if (array_->type_id() == arrow::Type::LARGE_LIST) {
    return ColumnReader(static_cast<const arrow::LargeListArray&>(*array_).values(), name_ + ".item");
  }
  if (array_->type_id() == arrow::Type::LIST) {
    return ColumnReader(static_cast<const arrow::ListArray&>(*array_).values(), name_ + ".item");
  }
  throw util::ValidationError("column '" + name_ + "' is not a list (" + TypeName() + ")");
}

std::pair<int64_t, int64_t> ColumnReader::ListRange(int64_t i) const {
  if (array_->IsNull(i)) {
    return {0, 0};
  }
  if (array_->type_id() == arrow::Type::LARGE_LIST) {
    const auto& list = static_cast<const arrow::LargeListArray&>(*array_);
    return {list.value_offset(i), list.value_offset(i) + list.value_length(i)};
  }
  if (array_->type_id() == arrow::Type::LIST) {
    const auto& list = static_cast<const arrow::ListArray&>(*array_);
    return {list.value_offset(i), list.value_offset(i) + list.value_length(i)};
  }
  throw util::ValidationError("column '" + name_ + "' is not a list (" + TypeName() + ")");
}

bool ColumnReader::IsStruct() const {
  return array_->type_id() == arrow::Type::STRUCT;
}

std::optional<ColumnReader> ColumnReader::Field(std::string_view field_name) const {
  if (!IsStruct()) {
    throw util::ValidationError("column '" + name_ + "' is not a struct (" + TypeName() + ")");
  }
  auto child = static_cast<const arrow::StructArray&>(*array_).GetFieldByName(std::string(field_name));
  if (!child) {
    return std::nullopt;
  }
  return ColumnReader(std::move(child), name_ + "." + std::string(field_name));
}

std::string ColumnReader::TypeName() const {
  return array_->type()->ToString();
}

} // namespace systock::storage::common
