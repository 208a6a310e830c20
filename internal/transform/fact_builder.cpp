#include "fact_builder.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/column_reader.hpp"
#include "internal/util/errors.hpp"

namespace systock::transform {

using observability::IntField;
using observability::StringField;
using storage::common::ColumnReader;

namespace {

ColumnReader RequireItemValues(const arrow::Table& table, const std::string& entity) {
  const auto items = ColumnReader::Require(table, "items", entity);
  if (!items.IsList() || !items.ListValues().IsStruct()) {
    throw util::ValidationError(entity + ".items must be a list of structs, got " + items.TypeName());
  }
  return items;
}

ColumnReader RequireField(const ColumnReader& values, std::string_view field, const std::string& entity) {
  auto column = values.Field(field);
  if (!column) {
    throw util::ValidationError(entity + ".items has no field '" + std::string(field) + "'");
  }
  return std::move(*column);
}

std::optional<int64_t> DayKeyAt(const ColumnReader& column, int64_t i) {
  auto day = column.Date(i);
  if (!day) {
    return std::nullopt;
  }
  return util::DayKey(*day);
}

// Orders inventory readings by (store, product, updated_at) with null times last.
struct Reading {
  std::optional<int64_t>         id;
  int64_t                        store{0};
  int64_t                        product{0};
  int64_t                        quantity{0};
  std::optional<util::TimePoint> updated_at;
  std::optional<int64_t>         day_key;
};

bool ReadingLess(const Reading& lhs, const Reading& rhs) {
  if (lhs.store != rhs.store) return lhs.store < rhs.store;
  if (lhs.product != rhs.product) return lhs.product < rhs.product;
  if (lhs.updated_at && rhs.updated_at) return *lhs.updated_at < *rhs.updated_at;
  return lhs.updated_at.has_value() && !rhs.updated_at.has_value();
}

} // namespace

FactBuilder::FactBuilder(std::shared_ptr<const storage::SnapshotReader> reader, TransformOptions options, util::ClockFn clock)
    : reader_(std::move(reader)), options_(std::move(options)), clock_(std::move(clock)) {
}

std::map<int64_t, FactBuilder::ProductPrices> FactBuilder::LoadProductPrices() const {
  std::map<int64_t, ProductPrices> prices;

  auto snapshot = reader_->Read(kRawProdutos);
  if (!snapshot) {
    SYSTOCK_LOG_INFO("products unavailable; price enrichment skipped");
    return prices;
  }

  const auto& table      = *snapshot->table;
  const auto  id         = ColumnReader::Require(table, "id", kRawProdutos);
  const auto  sale_price = ColumnReader::Require(table, "sale_price", kRawProdutos);
  const auto  cost_price = ColumnReader::Require(table, "cost_price", kRawProdutos);

  for (int64_t i = 0; i < table.num_rows(); ++i) {
    if (auto key = id.Int(i)) {
      prices.insert_or_assign(*key, ProductPrices{sale_price.Double(i), cost_price.Double(i)});
    }
  }
  return prices;
}

std::vector<model::SalesLineRow> FactBuilder::BuildSales() const {
  const auto  snapshot = reader_->Require(kRawVendas);
  const auto& table    = *snapshot.table;

  const auto id        = ColumnReader::Require(table, "id", kRawVendas);
  const auto sale_date = ColumnReader::Require(table, "sale_date", kRawVendas);
  const auto store_id  = ColumnReader::Require(table, "store_id", kRawVendas);
  const auto client_id = ColumnReader::Require(table, "client_id", kRawVendas);
  const auto items     = RequireItemValues(table, kRawVendas);

  const auto values     = items.ListValues();
  const auto product_id = RequireField(values, "product_id", kRawVendas);
  const auto quantity   = RequireField(values, "quantity", kRawVendas);
  const auto unit_price = RequireField(values, "unit_price", kRawVendas);
  const auto unit_cost  = values.Field(options_.item_cost_field);
  if (!unit_cost) {
    SYSTOCK_LOG_WARN("sale item cost field absent; product cost used", {StringField("field", options_.item_cost_field)});
  }

  const auto prices    = LoadProductPrices();
  const auto loaded_at = clock_();

  std::vector<model::SalesLineRow> rows;
  int64_t                          undated = 0;

  for (int64_t i = 0; i < table.num_rows(); ++i) {
    const auto [begin, end] = items.ListRange(i);
    const auto day_key      = DayKeyAt(sale_date, i);
    if (!day_key && begin < end) {
      ++undated;
    }

    for (int64_t j = begin; j < end; ++j) {
      if (values.IsNull(j)) {
        continue;
      }

      model::SalesLineRow row;
      row.id_venda       = id.Int(i);
      row.id_tempo       = day_key;
      row.id_loja        = store_id.Int(i);
      row.id_cliente     = client_id.Int(i);
      row.id_produto     = product_id.Int(j);
      row.quantidade     = quantity.Int(j);
      row.valor_unitario = unit_price.Double(j);
      if (unit_cost) {
        row.custo_unitario = unit_cost->Double(j);
      }

      if (row.id_produto) {
        if (auto it = prices.find(*row.id_produto); it != prices.end()) {
          if (!row.valor_unitario) row.valor_unitario = it->second.sale_price;
          if (!row.custo_unitario) row.custo_unitario = it->second.cost_price;
        }
      }

      if (row.quantidade && row.valor_unitario) {
        row.valor_total = static_cast<double>(*row.quantidade) * *row.valor_unitario;
      }
      if (row.quantidade && row.custo_unitario) {
        row.custo_total = static_cast<double>(*row.quantidade) * *row.custo_unitario;
      }
      if (row.valor_total && row.custo_total) {
        row.lucro = *row.valor_total - *row.custo_total;
      }
      if (row.lucro && *row.valor_total > 0.0) {
        row.margem_lucro = *row.lucro / *row.valor_total;
      }

      row.data_carga = loaded_at;
      rows.push_back(std::move(row));
    }
  }

  if (undated > 0) {
    SYSTOCK_LOG_WARN("sales without a usable sale_date", {IntField("sales", undated)});
  }
  SYSTOCK_LOG_INFO("sales fact built", {IntField("sales", table.num_rows()), IntField("rows", static_cast<int64_t>(rows.size()))});
  return rows;
}

std::vector<model::InventoryDeltaRow> FactBuilder::BuildInventory() const {
  const auto  snapshot = reader_->Require(kRawEstoque);
  const auto& table    = *snapshot.table;

  const auto id         = ColumnReader::Require(table, "id", kRawEstoque);
  const auto store_id   = ColumnReader::Require(table, "store_id", kRawEstoque);
  const auto product_id = ColumnReader::Require(table, "product_id", kRawEstoque);
  const auto updated_at = ColumnReader::Require(table, "updated_at", kRawEstoque);
  const auto quantity   = ColumnReader::Require(table, "quantity", kRawEstoque);

  std::vector<Reading> readings;
  readings.reserve(static_cast<std::size_t>(table.num_rows()));
  int64_t dropped = 0;

  for (int64_t i = 0; i < table.num_rows(); ++i) {
    const auto store   = store_id.Int(i);
    const auto product = product_id.Int(i);
    const auto qty     = quantity.Int(i);
    if (!store || !product || !qty) {
      ++dropped;
      continue;
    }
    readings.push_back(Reading{id.Int(i), *store, *product, *qty, updated_at.Timestamp(i), DayKeyAt(updated_at, i)});
  }

  if (dropped > 0) {
    SYSTOCK_LOG_WARN("inventory readings without store, product or quantity dropped", {IntField("dropped", dropped)});
  }

  std::vector<std::size_t> order(readings.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) { return ReadingLess(readings[lhs], readings[rhs]); });

  const auto prices    = LoadProductPrices();
  const auto loaded_at = clock_();

  std::vector<model::InventoryDeltaRow> rows(readings.size());
  const Reading*                        previous = nullptr;

  for (auto index : order) {
    const auto& reading = readings[index];
    const bool  same_partition =
        previous != nullptr && previous->store == reading.store && previous->product == reading.product;

    double unit_cost = 0.0;
    if (auto it = prices.find(reading.product); it != prices.end() && it->second.cost_price) {
      unit_cost = *it->second.cost_price;
    }

    auto& row              = rows[index];
    row.id_estoque         = reading.id;
    row.id_tempo           = reading.day_key;
    row.id_loja            = reading.store;
    row.id_produto         = reading.product;
    row.quantidade_inicial = same_partition ? previous->quantity : 0;
    row.quantidade_final   = reading.quantity;
    row.delta_quantidade   = row.quantidade_final - row.quantidade_inicial;
    row.entrada            = std::max<int64_t>(row.delta_quantidade, 0);
    row.saida              = std::max<int64_t>(-row.delta_quantidade, 0);
    row.valor_inicial      = static_cast<double>(row.quantidade_inicial) * unit_cost;
    row.valor_final        = static_cast<double>(row.quantidade_final) * unit_cost;
    row.data_carga         = loaded_at;

    previous = &reading;
  }

  SYSTOCK_LOG_INFO("inventory fact built", {IntField("rows", static_cast<int64_t>(rows.size()))});
  return rows;
}

std::vector<model::DistributionLineRow> FactBuilder::BuildDistributions() const {
  const auto  snapshot = reader_->Require(kRawDistribuicao);
  const auto& table    = *snapshot.table;

  const auto id            = ColumnReader::Require(table, "id", kRawDistribuicao);
  const auto from_store_id = ColumnReader::Require(table, "from_store_id", kRawDistribuicao);
  const auto to_store_id   = ColumnReader::Require(table, "to_store_id", kRawDistribuicao);
  const auto date          = ColumnReader::Require(table, "distribution_date", kRawDistribuicao);
  const auto status        = ColumnReader::Require(table, "status", kRawDistribuicao);
  const auto items         = RequireItemValues(table, kRawDistribuicao);

  const auto values     = items.ListValues();
  const auto product_id = RequireField(values, "product_id", kRawDistribuicao);
  const auto quantity   = RequireField(values, "quantity", kRawDistribuicao);

  struct Line {
    std::optional<int64_t> product;
    std::optional<int64_t> quantity;
  };

  // Line projection keyed by distribution id, in snapshot order.
  std::map<int64_t, std::vector<Line>> lines;
  for (int64_t i = 0; i < table.num_rows(); ++i) {
    const auto key = id.Int(i);
    if (!key) {
      continue;
    }
    const auto [begin, end] = items.ListRange(i);
    for (int64_t j = begin; j < end; ++j) {
      if (!values.IsNull(j)) {
        lines[*key].push_back(Line{product_id.Int(j), quantity.Int(j)});
      }
    }
  }

  const auto loaded_at = clock_();

  std::vector<model::DistributionLineRow> rows;
  for (int64_t i = 0; i < table.num_rows(); ++i) {
    const auto key = id.Int(i);
    if (!key) {
      continue;
    }
    auto it = lines.find(*key);
    if (it == lines.end()) {
      continue;
    }

    for (const auto& line : it->second) {
      model::DistributionLineRow row;
      row.id_distribuicao     = key;
      row.id_loja_origem      = from_store_id.Int(i);
      row.id_loja_destino     = to_store_id.Int(i);
      row.id_tempo            = DayKeyAt(date, i);
      row.id_produto          = line.product;
      row.quantidade          = line.quantity;
      row.status_distribuicao = status.String(i);
      row.data_carga          = loaded_at;
      rows.push_back(std::move(row));
    }
  }

  SYSTOCK_LOG_INFO("distribution fact built", {IntField("headers", table.num_rows()), IntField("rows", static_cast<int64_t>(rows.size()))});
  return rows;
}

} // namespace systock::transform
