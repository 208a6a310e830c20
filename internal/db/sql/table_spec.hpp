#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace systock::db::sql {

enum class ColumnType {
  kInteger,
  kDouble,
  kText,
  kBoolean,
  kDate,      // "YYYY-MM-DD"
  kTimestamp, // "YYYY-MM-DD HH:MM:SS.ffffff", UTC
};

struct ColumnSpec {
  std::string source; // intermediate (star-schema) column
  std::string name;   // warehouse column
  ColumnType  type{ColumnType::kText};
};

/*
  Mapping of one intermediate table onto its warehouse table.

  Rows exchanged with a repository hold one value per entry of
  `columns`, in that order. Key and load-timestamp columns are named
  by their warehouse names.
*/
struct TableSpec {
  std::string                source_table;
  std::string                name;
  std::vector<ColumnSpec>    columns;
  std::vector<std::string>   key_columns;
  std::optional<std::string> load_timestamp_column;

  std::optional<std::size_t> IndexOf(const std::string& column) const {
    for (std::size_t i = 0; i < columns.size(); ++i) {
      if (columns[i].name == column) return i;
    }
    return std::nullopt;
  }

  // Positions of key_columns within columns; unknown names are skipped.
  std::vector<std::size_t> KeyIndexes() const {
    std::vector<std::size_t> out;
    for (const auto& key : key_columns) {
      if (auto i = IndexOf(key)) out.push_back(*i);
    }
    return out;
  }

  bool IsKey(const std::string& column) const {
    for (const auto& key : key_columns) {
      if (key == column) return true;
    }
    return false;
  }
};

} // namespace systock::db::sql
