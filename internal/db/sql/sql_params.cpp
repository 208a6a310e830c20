#include "sql_params.hpp"

#include <algorithm>
#include <sstream>

namespace systock::db::sql {

namespace {

template <typename T>
int ThreeWay(const T& lhs, const T& rhs) {
  if (lhs < rhs) return -1;
  if (rhs < lhs) return 1;
  return 0;
}

} // namespace

int CompareValues(const Value& lhs, const Value& rhs) {
  if (lhs.index() != rhs.index()) {
    return lhs.index() < rhs.index() ? -1 : 1;
  }
  switch (lhs.index()) {
    case 0:
      return 0;
    case 1:
      return ThreeWay(std::get<int64_t>(lhs), std::get<int64_t>(rhs));
    case 2:
      return ThreeWay(std::get<double>(lhs), std::get<double>(rhs));
    case 3:
      return ThreeWay(std::get<bool>(lhs), std::get<bool>(rhs));
    default:
      return ThreeWay(std::get<std::string>(lhs), std::get<std::string>(rhs));
  }
}

bool RowLess::operator()(const Row& lhs, const Row& rhs) const {
  const auto n = std::min(lhs.size(), rhs.size());
  for (std::size_t i = 0; i < n; ++i) {
    if (int c = CompareValues(lhs[i], rhs[i]); c != 0) {
      return c < 0;
    }
  }
  return lhs.size() < rhs.size();
}

std::string ToString(const Value& v) {
  struct Visitor {
    std::string operator()(std::nullptr_t) const {
      return "NULL";
    }
    std::string operator()(int64_t x) const {
      return std::to_string(x);
    }
    std::string operator()(double x) const {
      std::ostringstream out;
      out << x;
      return out.str();
    }
    std::string operator()(bool x) const {
      return x ? "true" : "false";
    }
    std::string operator()(const std::string& x) const {
      return "'" + x + "'";
    }
  };
  return std::visit(Visitor{}, v);
}

std::string ToString(const Row& row) {
  std::string out = "(";
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i > 0) out += ", ";
    out += ToString(row[i]);
  }
  return out + ")";
}

} // namespace systock::db::sql
