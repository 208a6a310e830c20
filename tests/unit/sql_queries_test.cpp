#include "internal/db/sql/sql_queries.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/warehouse_schema.hpp"

namespace {

using namespace systock::db::sql;

TableSpec GuardedTable() {
  return TableSpec{
      "src",
      "t",
      {{"id", "id", ColumnType::kInteger}, {"name", "name", ColumnType::kText}, {"data_carga", "data_carga", ColumnType::kTimestamp}},
      {"id"},
      std::string("data_carga"),
  };
}

void TestCreateTable() {
  const auto spec = GuardedTable();
  assert(CreateTableSql(Dialect::kSqlite, "analytics", spec) ==
         "CREATE TABLE IF NOT EXISTS t (id INTEGER NOT NULL, name TEXT, data_carga TEXT, PRIMARY KEY (id));");
  assert(CreateTableSql(Dialect::kPostgres, "analytics", spec) ==
         "CREATE TABLE IF NOT EXISTS analytics.t (id BIGINT NOT NULL, name TEXT, data_carga TIMESTAMP, PRIMARY KEY (id));");
  assert(CreateSchemaSql("analytics") == "CREATE SCHEMA IF NOT EXISTS analytics;");
}

void TestQualifiedName() {
  assert(QualifiedName(Dialect::kSqlite, "analytics", "t") == "t");
  assert(QualifiedName(Dialect::kPostgres, "analytics", "t") == "analytics.t");
  assert(QualifiedName(Dialect::kPostgres, "", "t") == "t");
}

void TestGuardedUpsert() {
  const auto spec = GuardedTable();

  assert(UpsertSql(Dialect::kSqlite, "", spec, 1) ==
         "INSERT INTO t AS target (id, name, data_carga) VALUES (?, ?, ?) "
         "ON CONFLICT (id) DO UPDATE SET name = excluded.name, data_carga = excluded.data_carga "
         "WHERE target.data_carga < excluded.data_carga;");

  assert(UpsertSql(Dialect::kPostgres, "analytics", spec, 2) ==
         "INSERT INTO analytics.t AS target (id, name, data_carga) VALUES "
         "($1::BIGINT, $2::TEXT, $3::TIMESTAMP), ($4::BIGINT, $5::TEXT, $6::TIMESTAMP) "
         "ON CONFLICT (id) DO UPDATE SET name = excluded.name, data_carga = excluded.data_carga "
         "WHERE target.data_carga < excluded.data_carga;");
}

void TestUnguardedAndKeyOnlyUpserts() {
  auto spec = GuardedTable();
  spec.load_timestamp_column.reset();
  assert(UpsertSql(Dialect::kSqlite, "", spec, 1) ==
         "INSERT INTO t AS target (id, name, data_carga) VALUES (?, ?, ?) "
         "ON CONFLICT (id) DO UPDATE SET name = excluded.name, data_carga = excluded.data_carga;");

  const TableSpec pairs{"src", "p", {{"a", "a", ColumnType::kInteger}, {"b", "b", ColumnType::kInteger}}, {"a", "b"}, std::nullopt};
  assert(UpsertSql(Dialect::kSqlite, "", pairs, 2) == "INSERT INTO p AS target (a, b) VALUES (?, ?), (?, ?) ON CONFLICT (a, b) DO NOTHING;");
}

void TestSelects() {
  const auto spec = GuardedTable();
  assert(SelectByKeySql(Dialect::kSqlite, "", spec) == "SELECT id, name, data_carga FROM t WHERE id = ?;");
  assert(SelectByKeySql(Dialect::kPostgres, "analytics", spec) ==
         "SELECT id, name, to_char(data_carga, 'YYYY-MM-DD HH24:MI:SS.US') FROM analytics.t WHERE id = $1::BIGINT;");
  assert(SelectAllSql(Dialect::kSqlite, "", spec) == "SELECT id, name, data_carga FROM t ORDER BY id;");
  assert(CountSql(Dialect::kPostgres, "analytics", spec) == "SELECT COUNT(*) FROM analytics.t;");

  const TableSpec days{"src", "d", {{"id", "id", ColumnType::kInteger}, {"dia", "dia", ColumnType::kDate}}, {"id"}, std::nullopt};
  assert(SelectAllSql(Dialect::kPostgres, "", days) == "SELECT id, to_char(dia, 'YYYY-MM-DD') FROM d ORDER BY id;");
}

void TestWarehouseLayout() {
  const auto& tables = WarehouseTables();
  assert(tables.size() == 7);
  for (const auto& spec : tables) {
    assert(!spec.key_columns.empty());
    assert(spec.KeyIndexes().size() == spec.key_columns.size());
    if (spec.load_timestamp_column) {
      assert(spec.IndexOf(*spec.load_timestamp_column));
    }
  }

  auto sales = FindWarehouseTable("fact_vendas");
  assert(sales);
  assert(sales->name == "fato_vendas");
  assert((sales->key_columns == std::vector<std::string>{"id_venda_api", "id_produto"}));
  assert(sales->load_timestamp_column == "data_carga");

  auto calendar = FindWarehouseTable("dim_tempo");
  assert(calendar);
  assert(!calendar->load_timestamp_column);

  auto inventory = FindWarehouseTable("fact_estoque");
  assert(inventory);
  const auto entradas = inventory->IndexOf("entradas");
  assert(entradas);
  assert(inventory->columns[*entradas].source == "entrada");

  assert(!FindWarehouseTable("fact_unknown"));
}

void TestValueOrdering() {
  const Value null_value = nullptr;
  const Value one        = int64_t{1};
  const Value two        = int64_t{2};
  const Value text       = std::string("a");

  assert(CompareValues(null_value, one) < 0);
  assert(CompareValues(one, two) < 0);
  assert(CompareValues(two, one) > 0);
  assert(CompareValues(one, one) == 0);
  assert(CompareValues(two, text) < 0);

  assert(RowLess{}(Row{one, text}, Row{two, null_value}));
  assert(!RowLess{}(Row{one, text}, Row{one, text}));
  assert(RowLess{}(Row{one}, Row{one, text}));

  assert(ToString(Row{one, null_value, text, Value{true}}) == "(1, NULL, 'a', true)");
}

} // namespace

int main() {
  TestCreateTable();
  TestQualifiedName();
  TestGuardedUpsert();
  TestUnguardedAndKeyOnlyUpserts();
  TestSelects();
  TestWarehouseLayout();
  TestValueOrdering();

  std::cout << "systock_unit_sql_queries: pass\n";
  return 0;
}
