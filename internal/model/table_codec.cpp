#include "table_codec.hpp"

#include <arrow/builder.h>
#include <arrow/type.h>

#include <optional>
#include <string>

#include "internal/util/errors.hpp"

namespace systock::model {

namespace {

void Check(const arrow::Status& status) {
  if (!status.ok()) {
    throw util::TransformError("failed to build star-schema table: " + status.ToString());
  }
}

template <typename Builder, typename T>
arrow::Status AppendValue(Builder& builder, const std::optional<T>& value) {
  return value ? builder.Append(*value) : builder.AppendNull();
}

template <typename Builder, typename T>
arrow::Status AppendValue(Builder& builder, const T& value) {
  return builder.Append(value);
}

int64_t Micros(util::TimePoint tp) {
  return util::ToUnixMicros(tp);
}

int32_t EpochDays(util::Days day) {
  return static_cast<int32_t>(day.time_since_epoch().count());
}

class TableAssembler {
 public:
  template <typename Row, typename Get>
  TableAssembler& Int64(const std::string& name, const std::vector<Row>& rows, Get get) {
    arrow::Int64Builder builder;
    return Add(name, arrow::int64(), builder, rows, get);
  }

  template <typename Row, typename Get>
  TableAssembler& Int32(const std::string& name, const std::vector<Row>& rows, Get get) {
    arrow::Int32Builder builder;
    return Add(name, arrow::int32(), builder, rows, get);
  }

  template <typename Row, typename Get>
  TableAssembler& Double(const std::string& name, const std::vector<Row>& rows, Get get) {
    arrow::DoubleBuilder builder;
    return Add(name, arrow::float64(), builder, rows, get);
  }

  template <typename Row, typename Get>
  TableAssembler& Utf8(const std::string& name, const std::vector<Row>& rows, Get get) {
    arrow::StringBuilder builder;
    return Add(name, arrow::utf8(), builder, rows, get);
  }

  template <typename Row, typename Get>
  TableAssembler& Bool(const std::string& name, const std::vector<Row>& rows, Get get) {
    arrow::BooleanBuilder builder;
    return Add(name, arrow::boolean(), builder, rows, get);
  }

  template <typename Row, typename Get>
  TableAssembler& Date32(const std::string& name, const std::vector<Row>& rows, Get get) {
    arrow::Date32Builder builder;
    return Add(name, arrow::date32(), builder, rows, get);
  }

  template <typename Row, typename Get>
  TableAssembler& Timestamp(const std::string& name, const std::vector<Row>& rows, Get get) {
    auto                   type = arrow::timestamp(arrow::TimeUnit::MICRO);
    arrow::TimestampBuilder builder(type, arrow::default_memory_pool());
    return Add(name, type, builder, rows, get);
  }

  std::shared_ptr<arrow::Table> Finish() {
    return arrow::Table::Make(arrow::schema(fields_), columns_);
  }

 private:
  template <typename Builder, typename Row, typename Get>
  TableAssembler& Add(const std::string& name, std::shared_ptr<arrow::DataType> type, Builder& builder, const std::vector<Row>& rows, Get get) {
    Check(builder.Reserve(static_cast<int64_t>(rows.size())));
    for (const auto& row : rows) {
      Check(AppendValue(builder, get(row)));
    }
    std::shared_ptr<arrow::Array> array;
    Check(builder.Finish(&array));

    fields_.push_back(arrow::field(name, std::move(type)));
    columns_.push_back(std::move(array));
    return *this;
  }

  std::vector<std::shared_ptr<arrow::Field>> fields_;
  std::vector<std::shared_ptr<arrow::Array>> columns_;
};

} // namespace

std::shared_ptr<arrow::Table> ToTable(const std::vector<ClientDimRow>& rows) {
  return TableAssembler()
      .Int64("id_cliente", rows, [](const ClientDimRow& r) { return r.id_cliente; })
      .Utf8("nome_cliente", rows, [](const ClientDimRow& r) { return r.nome_cliente; })
      .Utf8("cpf_cnpj", rows, [](const ClientDimRow& r) { return r.cpf_cnpj; })
      .Utf8("email", rows, [](const ClientDimRow& r) { return r.email; })
      .Utf8("telefone", rows, [](const ClientDimRow& r) { return r.telefone; })
      .Utf8("endereco", rows, [](const ClientDimRow& r) { return r.endereco; })
      .Utf8("tipo_cliente", rows, [](const ClientDimRow& r) { return r.tipo_cliente; })
      .Timestamp("data_carga", rows, [](const ClientDimRow& r) { return Micros(r.data_carga); })
      .Finish();
}

std::shared_ptr<arrow::Table> ToTable(const std::vector<ProductDimRow>& rows) {
  return TableAssembler()
      .Int64("id_produto", rows, [](const ProductDimRow& r) { return r.id_produto; })
      .Utf8("nome_produto", rows, [](const ProductDimRow& r) { return r.nome_produto; })
      .Utf8("descricao_produto", rows, [](const ProductDimRow& r) { return r.descricao_produto; })
      .Int64("id_categoria", rows, [](const ProductDimRow& r) { return r.id_categoria; })
      .Double("preco_venda", rows, [](const ProductDimRow& r) { return r.preco_venda; })
      .Double("custo_fornecedor", rows, [](const ProductDimRow& r) { return r.custo_fornecedor; })
      .Bool("ativo", rows, [](const ProductDimRow& r) { return r.ativo; })
      .Utf8("nome_categoria", rows, [](const ProductDimRow& r) { return r.nome_categoria; })
      .Utf8("descricao_categoria", rows, [](const ProductDimRow& r) { return r.descricao_categoria; })
      .Timestamp("data_carga", rows, [](const ProductDimRow& r) { return Micros(r.data_carga); })
      .Finish();
}

std::shared_ptr<arrow::Table> ToTable(const std::vector<StoreDimRow>& rows) {
  return TableAssembler()
      .Int64("id_loja", rows, [](const StoreDimRow& r) { return r.id_loja; })
      .Utf8("nome_loja", rows, [](const StoreDimRow& r) { return r.nome_loja; })
      .Utf8("endereco_loja", rows, [](const StoreDimRow& r) { return r.endereco_loja; })
      .Timestamp("data_carga", rows, [](const StoreDimRow& r) { return Micros(r.data_carga); })
      .Finish();
}

std::shared_ptr<arrow::Table> ToTable(const std::vector<CalendarDayRow>& rows) {
  return TableAssembler()
      .Int64("id_tempo", rows, [](const CalendarDayRow& r) { return r.id_tempo; })
      .Date32("data_completa", rows, [](const CalendarDayRow& r) { return EpochDays(r.data_completa); })
      .Int32("ano", rows, [](const CalendarDayRow& r) { return r.ano; })
      .Int32("mes", rows, [](const CalendarDayRow& r) { return r.mes; })
      .Int32("dia", rows, [](const CalendarDayRow& r) { return r.dia; })
      .Int32("trimestre", rows, [](const CalendarDayRow& r) { return r.trimestre; })
      .Int32("semana", rows, [](const CalendarDayRow& r) { return r.semana; })
      .Int32("dia_semana", rows, [](const CalendarDayRow& r) { return r.dia_semana; })
      .Bool("eh_fim_semana", rows, [](const CalendarDayRow& r) { return r.eh_fim_semana; })
      .Finish();
}

std::shared_ptr<arrow::Table> ToTable(const std::vector<SalesLineRow>& rows) {
  return TableAssembler()
      .Int64("id_venda", rows, [](const SalesLineRow& r) { return r.id_venda; })
      .Int64("id_tempo", rows, [](const SalesLineRow& r) { return r.id_tempo; })
      .Int64("id_loja", rows, [](const SalesLineRow& r) { return r.id_loja; })
      .Int64("id_cliente", rows, [](const SalesLineRow& r) { return r.id_cliente; })
      .Int64("id_produto", rows, [](const SalesLineRow& r) { return r.id_produto; })
      .Int64("quantidade", rows, [](const SalesLineRow& r) { return r.quantidade; })
      .Double("valor_unitario", rows, [](const SalesLineRow& r) { return r.valor_unitario; })
      .Double("custo_unitario", rows, [](const SalesLineRow& r) { return r.custo_unitario; })
      .Double("valor_total", rows, [](const SalesLineRow& r) { return r.valor_total; })
      .Double("custo_total", rows, [](const SalesLineRow& r) { return r.custo_total; })
      .Double("lucro", rows, [](const SalesLineRow& r) { return r.lucro; })
      .Double("margem_lucro", rows, [](const SalesLineRow& r) { return r.margem_lucro; })
      .Timestamp("data_carga", rows, [](const SalesLineRow& r) { return Micros(r.data_carga); })
      .Finish();
}

std::shared_ptr<arrow::Table> ToTable(const std::vector<InventoryDeltaRow>& rows) {
  return TableAssembler()
      .Int64("id_estoque", rows, [](const InventoryDeltaRow& r) { return r.id_estoque; })
      .Int64("id_tempo", rows, [](const InventoryDeltaRow& r) { return r.id_tempo; })
      .Int64("id_loja", rows, [](const InventoryDeltaRow& r) { return r.id_loja; })
      .Int64("id_produto", rows, [](const InventoryDeltaRow& r) { return r.id_produto; })
      .Int64("quantidade_inicial", rows, [](const InventoryDeltaRow& r) { return r.quantidade_inicial; })
      .Int64("quantidade_final", rows, [](const InventoryDeltaRow& r) { return r.quantidade_final; })
      .Int64("delta_quantidade", rows, [](const InventoryDeltaRow& r) { return r.delta_quantidade; })
      .Int64("entrada", rows, [](const InventoryDeltaRow& r) { return r.entrada; })
      .Int64("saida", rows, [](const InventoryDeltaRow& r) { return r.saida; })
      .Double("valor_inicial", rows, [](const InventoryDeltaRow& r) { return r.valor_inicial; })
      .Double("valor_final", rows, [](const InventoryDeltaRow& r) { return r.valor_final; })
      .Timestamp("data_carga", rows, [](const InventoryDeltaRow& r) { return Micros(r.data_carga); })
      .Finish();
}

std::shared_ptr<arrow::Table> ToTable(const std::vector<DistributionLineRow>& rows) {
  return TableAssembler()
      .Int64("id_distribuicao", rows, [](const DistributionLineRow& r) { return r.id_distribuicao; })
      .Int64("id_loja_origem", rows, [](const DistributionLineRow& r) { return r.id_loja_origem; })
      .Int64("id_loja_destino", rows, [](const DistributionLineRow& r) { return r.id_loja_destino; })
      .Int64("id_tempo", rows, [](const DistributionLineRow& r) { return r.id_tempo; })
      .Int64("id_produto", rows, [](const DistributionLineRow& r) { return r.id_produto; })
      .Int64("quantidade", rows, [](const DistributionLineRow& r) { return r.quantidade; })
      .Utf8("status_distribuicao", rows, [](const DistributionLineRow& r) { return r.status_distribuicao; })
      .Timestamp("data_carga", rows, [](const DistributionLineRow& r) { return Micros(r.data_carga); })
      .Finish();
}

} // namespace systock::model
