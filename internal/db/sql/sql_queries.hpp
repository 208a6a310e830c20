#pragma once

#include <cstddef>
#include <string>

#include "internal/db/sql/table_spec.hpp"

namespace systock::db::sql {

/*
  SQL text for the warehouse tables, generated from a TableSpec.

  Both engines accept the same upsert shape:

    INSERT INTO t AS target (cols) VALUES (...), (...)
    ON CONFLICT (keys) DO UPDATE SET c = excluded.c, ...
    WHERE target.<load_ts> < excluded.<load_ts>

  They differ in placeholders, column types, schema qualification
  and in how dates and timestamps are read back as text.
*/

enum class Dialect {
  kSqlite,
  kPostgres,
};

// SQLite ignores the schema.
std::string QualifiedName(Dialect dialect, const std::string& schema, const std::string& table);

std::string ColumnTypeSql(Dialect dialect, ColumnType type);

std::string CreateSchemaSql(const std::string& schema);

std::string CreateTableSql(Dialect dialect, const std::string& schema, const TableSpec& spec);

// Upsert of `row_count` rows with one placeholder per column per row.
std::string UpsertSql(Dialect dialect, const std::string& schema, const TableSpec& spec, std::size_t row_count);

// All columns of the row whose key columns equal the bound values.
std::string SelectByKeySql(Dialect dialect, const std::string& schema, const TableSpec& spec);

// All rows ordered by key.
std::string SelectAllSql(Dialect dialect, const std::string& schema, const TableSpec& spec);

std::string CountSql(Dialect dialect, const std::string& schema, const TableSpec& spec);

} // namespace systock::db::sql
