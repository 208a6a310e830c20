#include "dimension_builder.hpp"

#include <map>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/column_reader.hpp"
#include "internal/util/dedupe.hpp"
#include "internal/util/errors.hpp"

namespace systock::transform {

using observability::IntField;
using observability::StringField;
using storage::common::ColumnReader;

namespace {

// Code points, not bytes: documents may carry accented separators.
std::size_t Utf8Length(const std::string& text) {
  std::size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

struct CategoryInfo {
  std::optional<std::string> name;
  std::optional<std::string> description;
};

} // namespace

DimensionBuilder::DimensionBuilder(std::shared_ptr<const storage::SnapshotReader> reader, TransformOptions options, util::ClockFn clock)
    : reader_(std::move(reader)), options_(std::move(options)), clock_(std::move(clock)) {
}

std::string DimensionBuilder::ClassifyDocument(const std::optional<std::string>& document) {
  if (!document) {
    return model::kNaoClassificado;
  }
  switch (Utf8Length(*document)) {
    case 11:
      return model::kPessoaFisica;
    case 14:
      return model::kPessoaJuridica;
    default:
      return model::kNaoClassificado;
  }
}

std::vector<model::ClientDimRow> DimensionBuilder::BuildClients() const {
  const auto  snapshot = reader_->Require(kRawClientes);
  const auto& table    = *snapshot.table;

  const auto id       = ColumnReader::Require(table, "id", kRawClientes);
  const auto name     = ColumnReader::Require(table, "name", kRawClientes);
  const auto document = ColumnReader::Require(table, "cpf_cnpj", kRawClientes);
  const auto email    = ColumnReader::Require(table, "email", kRawClientes);
  const auto phone    = ColumnReader::Require(table, "phone", kRawClientes);
  const auto address  = ColumnReader::Require(table, "address", kRawClientes);

  const auto loaded_at = clock_();

  std::vector<model::ClientDimRow> rows;
  rows.reserve(static_cast<std::size_t>(table.num_rows()));
  for (int64_t i = 0; i < table.num_rows(); ++i) {
    model::ClientDimRow row;
    row.id_cliente   = id.Int(i);
    row.nome_cliente = name.String(i);
    row.cpf_cnpj     = document.String(i);
    row.email        = email.String(i);
    row.telefone     = phone.String(i);
    row.endereco     = address.String(i);
    row.tipo_cliente = ClassifyDocument(row.cpf_cnpj);
    row.data_carga   = loaded_at;
    rows.push_back(std::move(row));
  }

  const auto raw_rows = rows.size();
  rows = util::KeepLastByKey(std::move(rows), [](const model::ClientDimRow& r) { return std::make_pair(r.id_cliente, r.cpf_cnpj); });

  SYSTOCK_LOG_INFO("client dimension built", {IntField("raw_rows", static_cast<int64_t>(raw_rows)), IntField("rows", static_cast<int64_t>(rows.size()))});
  return rows;
}

std::vector<model::ProductDimRow> DimensionBuilder::BuildProducts() const {
  const auto  snapshot = reader_->Require(kRawProdutos);
  const auto& table    = *snapshot.table;

  const auto id          = ColumnReader::Require(table, "id", kRawProdutos);
  const auto name        = ColumnReader::Require(table, "name", kRawProdutos);
  const auto description = ColumnReader::Require(table, "description", kRawProdutos);
  const auto category_id = ColumnReader::Require(table, "category_id", kRawProdutos);
  const auto sale_price  = ColumnReader::Require(table, "sale_price", kRawProdutos);
  const auto cost_price  = ColumnReader::Require(table, "cost_price", kRawProdutos);
  const auto active      = ColumnReader::Require(table, "active", kRawProdutos);

  std::map<int64_t, CategoryInfo> categories;
  if (auto category_snapshot = reader_->Read(kRawCategorias)) {
    const auto& category_table = *category_snapshot->table;
    const auto  category_key   = ColumnReader::Require(category_table, "id", kRawCategorias);
    const auto  category_name  = ColumnReader::Require(category_table, "name", kRawCategorias);
    const auto  category_desc  = ColumnReader::Require(category_table, "description", kRawCategorias);
    for (int64_t i = 0; i < category_table.num_rows(); ++i) {
      if (auto key = category_key.Int(i)) {
        categories.insert_or_assign(*key, CategoryInfo{category_name.String(i), category_desc.String(i)});
      }
    }
  } else {
    SYSTOCK_LOG_INFO("categories unavailable; category columns left empty");
  }

  const auto loaded_at = clock_();

  std::vector<model::ProductDimRow> rows;
  rows.reserve(static_cast<std::size_t>(table.num_rows()));
  for (int64_t i = 0; i < table.num_rows(); ++i) {
    model::ProductDimRow row;
    row.id_produto        = id.Int(i);
    row.nome_produto      = name.String(i);
    row.descricao_produto = description.String(i);
    row.id_categoria      = category_id.Int(i);
    row.preco_venda       = sale_price.Double(i);
    row.custo_fornecedor  = cost_price.Double(i);
    row.ativo             = active.Bool(i);
    row.data_carga        = loaded_at;

    if (row.id_categoria) {
      if (auto it = categories.find(*row.id_categoria); it != categories.end()) {
        row.nome_categoria      = it->second.name;
        row.descricao_categoria = it->second.description;
      }
    }
    rows.push_back(std::move(row));
  }

  SYSTOCK_LOG_INFO("product dimension built", {IntField("rows", static_cast<int64_t>(rows.size())), IntField("categories", static_cast<int64_t>(categories.size()))});
  return rows;
}

std::vector<model::StoreDimRow> DimensionBuilder::BuildStores() const {
  const auto  snapshot = reader_->Require(kRawLojas);
  const auto& table    = *snapshot.table;

  const auto id      = ColumnReader::Require(table, "id", kRawLojas);
  const auto name    = ColumnReader::Require(table, "name", kRawLojas);
  const auto address = ColumnReader::Require(table, "address", kRawLojas);

  const auto loaded_at = clock_();

  std::vector<model::StoreDimRow> rows;
  rows.reserve(static_cast<std::size_t>(table.num_rows()));
  for (int64_t i = 0; i < table.num_rows(); ++i) {
    rows.push_back(model::StoreDimRow{id.Int(i), name.String(i), address.String(i), loaded_at});
  }

  rows = util::KeepLastByKey(std::move(rows), [](const model::StoreDimRow& r) { return r.id_loja; });

  SYSTOCK_LOG_INFO("store dimension built", {IntField("rows", static_cast<int64_t>(rows.size()))});
  return rows;
}

std::vector<model::CalendarDayRow> DimensionBuilder::BuildCalendar() const {
  std::optional<util::Days> first;
  std::optional<util::Days> last;

  for (const auto& source : options_.calendar_sources) {
    auto snapshot = reader_->Read(source.entity);
    if (!snapshot) {
      continue;
    }

    for (const auto& column_name : source.columns) {
      auto column = ColumnReader::Find(*snapshot->table, column_name);
      if (!column) {
        SYSTOCK_LOG_DEBUG("temporal column absent", {StringField("entity", source.entity), StringField("column", column_name)});
        continue;
      }

      int64_t dropped = 0;
      for (int64_t i = 0; i < column->length(); ++i) {
        if (column->IsNull(i)) {
          continue;
        }
        auto day = column->Date(i);
        if (!day) {
          ++dropped;
          continue;
        }
        if (!first || *day < *first) first = day;
        if (!last || *day > *last) last = day;
      }

      if (dropped > 0) {
        SYSTOCK_LOG_WARN("unparsable dates dropped",
                         {StringField("entity", source.entity), StringField("column", column_name), IntField("dropped", dropped)});
      }
    }
  }

  if (!first) {
    first = options_.fallback_start;
    last  = options_.fallback_end.value_or(std::chrono::floor<std::chrono::days>(clock_()));
    SYSTOCK_LOG_INFO("no source dates found; using fallback calendar window",
                     {StringField("start", util::FormatDate(*first)), StringField("end", util::FormatDate(*last))});
  }

  auto rows = CalendarRange(*first, *last);
  SYSTOCK_LOG_INFO("calendar dimension built", {StringField("start", util::FormatDate(*first)), StringField("end", util::FormatDate(*last)),
                                                IntField("rows", static_cast<int64_t>(rows.size()))});
  return rows;
}

std::vector<model::CalendarDayRow> DimensionBuilder::CalendarRange(util::Days first, util::Days last) {
  std::vector<model::CalendarDayRow> rows;
  if (last < first) {
    return rows;
  }

  rows.reserve(static_cast<std::size_t>((last - first).count() + 1));
  for (auto day = first; day <= last; day += std::chrono::days(1)) {
    const std::chrono::year_month_day ymd{day};

    model::CalendarDayRow row;
    row.id_tempo      = util::DayKey(day);
    row.data_completa = day;
    row.ano           = static_cast<int>(ymd.year());
    row.mes           = static_cast<int32_t>(static_cast<unsigned>(ymd.month()));
    row.dia           = static_cast<int32_t>(static_cast<unsigned>(ymd.day()));
    row.trimestre     = static_cast<int32_t>(util::Quarter(day));
    row.semana        = static_cast<int32_t>(util::IsoWeek(day));
    row.dia_semana    = static_cast<int32_t>(util::IsoWeekday(day));
    row.eh_fim_semana = row.dia_semana >= 6;
    rows.push_back(row);
  }
  return rows;
}

} // namespace systock::transform
