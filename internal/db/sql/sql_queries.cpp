#include "sql_queries.hpp"

namespace systock::db::sql {

namespace {

std::string Placeholder(Dialect dialect, std::size_t ordinal, ColumnType type) {
  if (dialect == Dialect::kSqlite) {
    return "?";
  }
  // Explicit casts keep multi-row VALUES from resolving parameters as text.
  return "$" + std::to_string(ordinal) + "::" + ColumnTypeSql(dialect, type);
}

// Dates and timestamps are read back in the same fixed-width text they are written in.
std::string SelectExpression(Dialect dialect, const ColumnSpec& column) {
  if (dialect == Dialect::kPostgres) {
    if (column.type == ColumnType::kDate) {
      return "to_char(" + column.name + ", 'YYYY-MM-DD')";
    }
    if (column.type == ColumnType::kTimestamp) {
      return "to_char(" + column.name + ", 'YYYY-MM-DD HH24:MI:SS.US')";
    }
  }
  return column.name;
}

std::string SelectList(Dialect dialect, const TableSpec& spec) {
  std::string out;
  for (std::size_t i = 0; i < spec.columns.size(); ++i) {
    if (i > 0) out += ", ";
    out += SelectExpression(dialect, spec.columns[i]);
  }
  return out;
}

std::string KeyList(const TableSpec& spec) {
  std::string out;
  for (std::size_t i = 0; i < spec.key_columns.size(); ++i) {
    if (i > 0) out += ", ";
    out += spec.key_columns[i];
  }
  return out;
}

} // namespace

std::string QualifiedName(Dialect dialect, const std::string& schema, const std::string& table) {
  if (dialect == Dialect::kSqlite || schema.empty()) {
    return table;
  }
  return schema + "." + table;
}

std::string ColumnTypeSql(Dialect dialect, ColumnType type) {
  const bool pg = dialect == Dialect::kPostgres;
  switch (type) {
    case ColumnType::kInteger:
      return pg ? "BIGINT" : "INTEGER";
    case ColumnType::kDouble:
      return pg ? "DOUBLE PRECISION" : "REAL";
    case ColumnType::kText:
      return "TEXT";
    case ColumnType::kBoolean:
      return pg ? "BOOLEAN" : "INTEGER";
    case ColumnType::kDate:
      return pg ? "DATE" : "TEXT";
    case ColumnType::kTimestamp:
      return pg ? "TIMESTAMP" : "TEXT";
  }
  return "TEXT";
}

std::string CreateSchemaSql(const std::string& schema) {
  return "CREATE SCHEMA IF NOT EXISTS " + schema + ";";
}

std::string CreateTableSql(Dialect dialect, const std::string& schema, const TableSpec& spec) {
  std::string sql = "CREATE TABLE IF NOT EXISTS " + QualifiedName(dialect, schema, spec.name) + " (";
  for (const auto& column : spec.columns) {
    sql += column.name + " " + ColumnTypeSql(dialect, column.type);
    if (spec.IsKey(column.name)) {
      sql += " NOT NULL";
    }
    sql += ", ";
  }
  sql += "PRIMARY KEY (" + KeyList(spec) + "));";
  return sql;
}

std::string UpsertSql(Dialect dialect, const std::string& schema, const TableSpec& spec, std::size_t row_count) {
  std::string sql = "INSERT INTO " + QualifiedName(dialect, schema, spec.name) + " AS target (";
  for (std::size_t i = 0; i < spec.columns.size(); ++i) {
    if (i > 0) sql += ", ";
    sql += spec.columns[i].name;
  }
  sql += ") VALUES ";

  std::size_t ordinal = 1;
  for (std::size_t r = 0; r < row_count; ++r) {
    if (r > 0) sql += ", ";
    sql += "(";
    for (std::size_t i = 0; i < spec.columns.size(); ++i) {
      if (i > 0) sql += ", ";
      sql += Placeholder(dialect, ordinal++, spec.columns[i].type);
    }
    sql += ")";
  }

  sql += " ON CONFLICT (" + KeyList(spec) + ") DO ";

  std::string assignments;
  for (const auto& column : spec.columns) {
    if (spec.IsKey(column.name)) continue;
    if (!assignments.empty()) assignments += ", ";
    assignments += column.name + " = excluded." + column.name;
  }
  if (assignments.empty()) {
    return sql + "NOTHING;";
  }

  sql += "UPDATE SET " + assignments;
  if (spec.load_timestamp_column) {
    const auto& ts = *spec.load_timestamp_column;
    sql += " WHERE target." + ts + " < excluded." + ts;
  }
  return sql + ";";
}

std::string SelectByKeySql(Dialect dialect, const std::string& schema, const TableSpec& spec) {
  std::string sql = "SELECT " + SelectList(dialect, spec) + " FROM " + QualifiedName(dialect, schema, spec.name) + " WHERE ";
  std::size_t ordinal = 1;
  for (std::size_t i = 0; i < spec.key_columns.size(); ++i) {
    if (i > 0) sql += " AND ";
    const auto index = spec.IndexOf(spec.key_columns[i]);
    const auto type  = index ? spec.columns[*index].type : ColumnType::kText;
    sql += spec.key_columns[i] + " = " + Placeholder(dialect, ordinal++, type);
  }
  return sql + ";";
}

std::string SelectAllSql(Dialect dialect, const std::string& schema, const TableSpec& spec) {
  return "SELECT " + SelectList(dialect, spec) + " FROM " + QualifiedName(dialect, schema, spec.name) + " ORDER BY " + KeyList(spec) + ";";
}

std::string CountSql(Dialect dialect, const std::string& schema, const TableSpec& spec) {
  return "SELECT COUNT(*) FROM " + QualifiedName(dialect, schema, spec.name) + ";";
}

} // namespace systock::db::sql
