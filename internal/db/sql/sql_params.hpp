#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace systock::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both bind in column order, so one Row serves both. Dates and
  timestamps travel as their fixed-width text form.
*/

using Value = std::variant<std::nullptr_t, int64_t, double, bool, std::string>;

using Row = std::vector<Value>;

inline bool IsNull(const Value& v) {
  return std::holds_alternative<std::nullptr_t>(v);
}

// Total order: null < integer < double < bool < text, then by value.
int CompareValues(const Value& lhs, const Value& rhs);

struct RowLess {
  bool operator()(const Row& lhs, const Row& rhs) const;
};

std::string ToString(const Value& v);
std::string ToString(const Row& row);

} // namespace systock::db::sql
