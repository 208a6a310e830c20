#include "internal/transform/fact_builder.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "internal/util/errors.hpp"
#include "tests/support/test_tables.hpp"

namespace {

using namespace systock;
using testing::DistributionItem;
using testing::SaleItem;
using testing::TableBuilder;
using transform::FactBuilder;
using transform::TransformOptions;

constexpr const char* kLoadTime = "2024-06-01T12:00:00Z";

std::shared_ptr<const storage::SnapshotReader> ReaderFor(const std::filesystem::path& bronze) {
  return std::make_shared<const storage::SnapshotReader>(storage::SnapshotReaderOptions{bronze.string()});
}

bool Near(const std::optional<double>& actual, double expected) {
  return actual && std::fabs(*actual - expected) < 1e-9;
}

void WriteProducts(const std::filesystem::path& bronze) {
  testing::WriteSnapshot(bronze, "produtos",
                         *TableBuilder()
                              .Int64("id", {100, 101})
                              .Utf8("name", {"Caneta", "Lapis"})
                              .Utf8("description", {"azul", "HB"})
                              .Int64("category_id", {10, 10})
                              .Double("sale_price", {12.0, 5.0})
                              .Double("cost_price", {7.0, 2.0})
                              .Bool("active", {true, true})
                              .Build());
}

void WriteSales(const std::filesystem::path& bronze) {
  std::vector<std::optional<std::vector<SaleItem>>> items = {
      std::vector<SaleItem>{
          {100, 3, 10.0, 6.0},
          {101, 2, std::nullopt, std::nullopt},
          {102, 1, std::nullopt, std::nullopt},
          {103, 5, 0.0, 0.0},
      },
      std::nullopt,
      std::vector<SaleItem>{{100, 1, 10.0, 6.0}},
      std::vector<SaleItem>{},
  };
  testing::WriteSnapshot(bronze, "vendas",
                         *TableBuilder()
                              .Int64("id", {1, 2, 3, 4})
                              .Utf8("sale_date", {"2024-03-05T10:00:00", "2024-03-06", std::nullopt, "2024-03-07"})
                              .Int64("store_id", {1, 1, 2, 2})
                              .Int64("client_id", {7, 8, std::nullopt, 9})
                              .SaleItems("items", items)
                              .Build());
}

void TestSalesLinesAndMeasures() {
  const auto bronze = testing::MakeTempDir("facts_sales");
  WriteProducts(bronze);
  WriteSales(bronze);

  FactBuilder builder(ReaderFor(bronze), TransformOptions{}, testing::FixedClock(kLoadTime));
  const auto  rows = builder.BuildSales();

  // null and empty item lists produce no lines
  assert(rows.size() == 5);

  const auto& priced = rows[0];
  assert(priced.id_venda == 1);
  assert(priced.id_tempo == 20240305);
  assert(priced.id_loja == 1);
  assert(priced.id_cliente == 7);
  assert(priced.id_produto == 100);
  assert(priced.quantidade == 3);
  assert(Near(priced.valor_unitario, 10.0));
  assert(Near(priced.custo_unitario, 6.0));
  assert(Near(priced.valor_total, 30.0));
  assert(Near(priced.custo_total, 18.0));
  assert(Near(priced.lucro, 12.0));
  assert(Near(priced.margem_lucro, 0.4));
  assert(priced.data_carga == *util::ParseTimestamp(kLoadTime));

  // missing item prices are taken from the product
  const auto& coalesced = rows[1];
  assert(coalesced.id_produto == 101);
  assert(Near(coalesced.valor_unitario, 5.0));
  assert(Near(coalesced.custo_unitario, 2.0));
  assert(Near(coalesced.valor_total, 10.0));
  assert(Near(coalesced.lucro, 6.0));
  assert(Near(coalesced.margem_lucro, 0.6));

  // unknown product: nothing to coalesce with
  const auto& unknown = rows[2];
  assert(unknown.id_produto == 102);
  assert(!unknown.valor_unitario);
  assert(!unknown.valor_total);
  assert(!unknown.lucro);
  assert(!unknown.margem_lucro);

  // zero revenue has no margin
  const auto& free = rows[3];
  assert(Near(free.valor_total, 0.0));
  assert(Near(free.lucro, 0.0));
  assert(!free.margem_lucro);

  const auto& undated = rows[4];
  assert(undated.id_venda == 3);
  assert(!undated.id_tempo);
  assert(!undated.id_cliente);
}

void TestSalesWithoutCostFieldUseProductCost() {
  const auto bronze = testing::MakeTempDir("facts_sales_cost_field");
  WriteProducts(bronze);
  WriteSales(bronze);

  TransformOptions options;
  options.item_cost_field = "unit_cost";

  FactBuilder builder(ReaderFor(bronze), options, testing::FixedClock(kLoadTime));
  const auto  rows = builder.BuildSales();

  assert(rows.size() == 5);
  assert(Near(rows[0].custo_unitario, 7.0));
  assert(Near(rows[0].custo_total, 21.0));
  assert(Near(rows[0].lucro, 9.0));
}

void TestSalesWithoutProducts() {
  const auto bronze = testing::MakeTempDir("facts_sales_no_products");
  WriteSales(bronze);

  FactBuilder builder(ReaderFor(bronze), TransformOptions{}, testing::FixedClock(kLoadTime));
  const auto  rows = builder.BuildSales();

  assert(rows.size() == 5);
  assert(Near(rows[0].valor_total, 30.0));
  assert(!rows[1].valor_unitario);
  assert(!rows[1].custo_unitario);
}

void TestSalesRejectMalformedItems() {
  const auto bronze = testing::MakeTempDir("facts_sales_bad_items");
  testing::WriteSnapshot(bronze, "vendas",
                         *TableBuilder()
                              .Int64("id", {1})
                              .Utf8("sale_date", {"2024-03-05"})
                              .Int64("store_id", {1})
                              .Int64("client_id", {1})
                              .Utf8("items", {"[{\"product_id\": 1}]"})
                              .Build());

  FactBuilder builder(ReaderFor(bronze), TransformOptions{}, testing::FixedClock(kLoadTime));
  bool        threw = false;
  try {
    builder.BuildSales();
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestStringTimesKeyOnUtcDay() {
  const auto bronze = testing::MakeTempDir("facts_string_offsets");
  WriteProducts(bronze);
  testing::WriteSnapshot(bronze, "vendas",
                         *TableBuilder()
                              .Int64("id", {1})
                              .Utf8("sale_date", {"2024-02-02T23:00:00-03:00"})
                              .Int64("store_id", {1})
                              .Int64("client_id", {7})
                              .SaleItems("items", {std::vector<SaleItem>{{100, 1, 10.0, 6.0}}})
                              .Build());
  // 23:00 at -03:00 is 02:00 UTC, after the 01:00Z reading
  testing::WriteSnapshot(bronze, "estoque",
                         *TableBuilder()
                              .Int64("id", {1, 2})
                              .Int64("store_id", {1, 1})
                              .Int64("product_id", {100, 100})
                              .Utf8("updated_at", {"2024-02-02T23:00:00-03:00", "2024-02-03T01:00:00Z"})
                              .Int64("quantity", {5, 8})
                              .Build());

  FactBuilder builder(ReaderFor(bronze), TransformOptions{}, testing::FixedClock(kLoadTime));

  const auto sales = builder.BuildSales();
  assert(sales.size() == 1);
  assert(sales[0].id_tempo == 20240203);

  const auto inventory = builder.BuildInventory();
  assert(inventory.size() == 2);
  assert(inventory[0].id_tempo == 20240203);
  assert(inventory[1].id_tempo == 20240203);
  assert(inventory[1].quantidade_inicial == 0);
  assert(inventory[1].quantidade_final == 8);
  assert(inventory[0].quantidade_inicial == 8);
  assert(inventory[0].quantidade_final == 5);
  assert(inventory[0].saida == 3);
}

void TestInventoryDeltas() {
  const auto bronze = testing::MakeTempDir("facts_inventory");
  WriteProducts(bronze);
  testing::WriteSnapshot(bronze, "estoque",
                         *TableBuilder()
                              .Int64("id", {1, 2, 3, 4, 5, 6})
                              .Int64("store_id", {1, 1, 2, 1, std::nullopt, 1})
                              .Int64("product_id", {100, 100, 100, 100, 100, 101})
                              .Timestamp("updated_at", {"2024-03-02T00:00:00Z", "2024-03-01T00:00:00Z", "2024-03-01", std::nullopt,
                                                        "2024-03-01", "2024-03-03"})
                              .Int64("quantity", {15, 10, 4, 12, 1, std::nullopt})
                              .Build());

  FactBuilder builder(ReaderFor(bronze), TransformOptions{}, testing::FixedClock(kLoadTime));
  const auto  rows = builder.BuildInventory();

  // readings without store or quantity are dropped; the rest keep snapshot order
  assert(rows.size() == 4);
  assert(rows[0].id_estoque == 1);
  assert(rows[1].id_estoque == 2);
  assert(rows[2].id_estoque == 3);
  assert(rows[3].id_estoque == 4);

  // (1, 100) ordered by time: id 2, id 1, then the undated id 4
  assert(rows[1].quantidade_inicial == 0);
  assert(rows[1].quantidade_final == 10);
  assert(rows[1].entrada == 10);
  assert(rows[1].saida == 0);

  assert(rows[0].id_tempo == 20240302);
  assert(rows[0].quantidade_inicial == 10);
  assert(rows[0].quantidade_final == 15);
  assert(rows[0].delta_quantidade == 5);
  assert(rows[0].entrada == 5);
  assert(std::fabs(rows[0].valor_inicial - 70.0) < 1e-9);
  assert(std::fabs(rows[0].valor_final - 105.0) < 1e-9);

  assert(!rows[3].id_tempo);
  assert(rows[3].quantidade_inicial == 15);
  assert(rows[3].quantidade_final == 12);
  assert(rows[3].delta_quantidade == -3);
  assert(rows[3].entrada == 0);
  assert(rows[3].saida == 3);

  // another store starts its own sequence
  assert(rows[2].id_loja == 2);
  assert(rows[2].quantidade_inicial == 0);
  assert(rows[2].delta_quantidade == 4);
}

void TestInventoryWithoutProductsHasZeroValue() {
  const auto bronze = testing::MakeTempDir("facts_inventory_no_products");
  testing::WriteSnapshot(bronze, "estoque",
                         *TableBuilder()
                              .Int64("id", {1})
                              .Int64("store_id", {1})
                              .Int64("product_id", {100})
                              .Timestamp("updated_at", {"2024-03-01"})
                              .Int64("quantity", {8})
                              .Build());

  FactBuilder builder(ReaderFor(bronze), TransformOptions{}, testing::FixedClock(kLoadTime));
  const auto  rows = builder.BuildInventory();

  assert(rows.size() == 1);
  assert(rows[0].valor_inicial == 0.0);
  assert(rows[0].valor_final == 0.0);
  assert(rows[0].entrada == 8);
}

void TestDistributionsJoinLinesToHeaders() {
  const auto bronze = testing::MakeTempDir("facts_distributions");

  std::vector<std::optional<std::vector<DistributionItem>>> items = {
      std::vector<DistributionItem>{{100, 5}, {101, 1}},
      std::nullopt,
      std::vector<DistributionItem>{},
      std::vector<DistributionItem>{{100, 1}},
      std::vector<DistributionItem>{{102, 2}},
      std::vector<DistributionItem>{{103, 3}},
  };
  testing::WriteSnapshot(bronze, "distribuicao_interna",
                         *TableBuilder()
                              .Int64("id", {50, 51, 52, std::nullopt, 53, 53})
                              .Int64("from_store_id", {1, 1, 1, 1, 2, 2})
                              .Int64("to_store_id", {2, 3, 3, 3, 1, 4})
                              .Utf8("distribution_date", {"2024-03-04", "2024-03-04", "2024-03-05", "2024-03-05", "2024-03-06", "nope"})
                              .Utf8("status", {"enviado", "pendente", "pendente", "pendente", "recebido", std::nullopt})
                              .DistributionItems("items", items)
                              .Build());

  FactBuilder builder(ReaderFor(bronze), TransformOptions{}, testing::FixedClock(kLoadTime));
  const auto  rows = builder.BuildDistributions();

  // 2 lines for 50; 53 appears twice, so each header gets both of its lines
  assert(rows.size() == 6);

  assert(rows[0].id_distribuicao == 50);
  assert(rows[0].id_produto == 100);
  assert(rows[0].quantidade == 5);
  assert(rows[0].id_loja_origem == 1);
  assert(rows[0].id_loja_destino == 2);
  assert(rows[0].id_tempo == 20240304);
  assert(rows[0].status_distribuicao == "enviado");
  assert(rows[1].id_produto == 101);

  assert(rows[2].id_distribuicao == 53);
  assert(rows[2].id_loja_destino == 1);
  assert(rows[2].id_produto == 102);
  assert(rows[3].id_produto == 103);
  assert(rows[4].id_loja_destino == 4);
  assert(rows[4].id_produto == 102);
  assert(!rows[4].id_tempo);
  assert(!rows[4].status_distribuicao);
}

void TestFactsRequirePrimarySnapshot() {
  const auto  bronze = testing::MakeTempDir("facts_missing");
  FactBuilder builder(ReaderFor(bronze), TransformOptions{}, testing::FixedClock(kLoadTime));

  int missing = 0;
  try {
    builder.BuildSales();
  } catch (const util::MissingSourceError&) {
    ++missing;
  }
  try {
    builder.BuildInventory();
  } catch (const util::MissingSourceError&) {
    ++missing;
  }
  try {
    builder.BuildDistributions();
  } catch (const util::MissingSourceError&) {
    ++missing;
  }
  assert(missing == 3);
}

} // namespace

int main() {
  TestSalesLinesAndMeasures();
  TestSalesWithoutCostFieldUseProductCost();
  TestSalesWithoutProducts();
  TestSalesRejectMalformedItems();
  TestStringTimesKeyOnUtcDay();
  TestInventoryDeltas();
  TestInventoryWithoutProductsHasZeroValue();
  TestDistributionsJoinLinesToHeaders();
  TestFactsRequirePrimarySnapshot();

  std::cout << "systock_unit_fact_builder: pass\n";
  return 0;
}
