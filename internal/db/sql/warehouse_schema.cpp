#include "warehouse_schema.hpp"

#include "internal/model/star_schema.hpp"

namespace systock::db::sql {

namespace {

constexpr const char* kLoadTimestamp = "data_carga";

ColumnSpec Int(const char* source, const char* name = nullptr) {
  return {source, name ? name : source, ColumnType::kInteger};
}
ColumnSpec Real(const char* source, const char* name = nullptr) {
  return {source, name ? name : source, ColumnType::kDouble};
}
ColumnSpec Text(const char* source, const char* name = nullptr) {
  return {source, name ? name : source, ColumnType::kText};
}
ColumnSpec Bool(const char* source) {
  return {source, source, ColumnType::kBoolean};
}
ColumnSpec Date(const char* source) {
  return {source, source, ColumnType::kDate};
}
ColumnSpec LoadedAt() {
  return {kLoadTimestamp, kLoadTimestamp, ColumnType::kTimestamp};
}

std::vector<TableSpec> BuildTables() {
  std::vector<TableSpec> tables;

  tables.push_back(TableSpec{
      model::kDimClientes,
      "dim_cliente",
      {Int("id_cliente", "id_cliente_api"), Text("nome_cliente"), Text("cpf_cnpj"), Text("email"), Text("telefone"), Text("endereco"),
       Text("tipo_cliente"), LoadedAt()},
      {"id_cliente_api"},
      kLoadTimestamp,
  });

  tables.push_back(TableSpec{
      model::kDimLojas,
      "dim_loja",
      {Int("id_loja", "id_loja_api"), Text("nome_loja"), Text("endereco_loja"), LoadedAt()},
      {"id_loja_api"},
      kLoadTimestamp,
  });

  tables.push_back(TableSpec{
      model::kDimProdutos,
      "dim_produto",
      {Int("id_produto", "id_produto_api"), Text("nome_produto"), Text("descricao_produto"), Int("id_categoria"), Real("preco_venda"),
       Real("custo_fornecedor"), Bool("ativo"), Text("nome_categoria"), Text("descricao_categoria"), LoadedAt()},
      {"id_produto_api"},
      kLoadTimestamp,
  });

  tables.push_back(TableSpec{
      model::kDimTempo,
      "dim_tempo",
      {Int("id_tempo"), Date("data_completa"), Int("ano"), Int("mes"), Int("dia"), Int("trimestre"), Int("semana"), Int("dia_semana"),
       Bool("eh_fim_semana")},
      {"id_tempo"},
      std::nullopt,
  });

  tables.push_back(TableSpec{
      model::kFactVendas,
      "fato_vendas",
      {Int("id_venda", "id_venda_api"), Int("id_tempo"), Int("id_loja"), Int("id_cliente"), Int("id_produto"), Int("quantidade"),
       Real("valor_unitario"), Real("custo_unitario"), Real("valor_total"), Real("custo_total"), Real("lucro"), Real("margem_lucro"),
       LoadedAt()},
      {"id_venda_api", "id_produto"},
      kLoadTimestamp,
  });

  tables.push_back(TableSpec{
      model::kFactEstoque,
      "fato_estoque",
      {Int("id_estoque", "id_estoque_api"), Int("id_tempo"), Int("id_loja"), Int("id_produto"), Int("quantidade_inicial"),
       Int("quantidade_final"), Real("valor_inicial", "valor_estoque_inicial"), Real("valor_final", "valor_estoque_final"),
       Int("entrada", "entradas"), Int("saida", "saidas"), LoadedAt()},
      {"id_estoque_api"},
      kLoadTimestamp,
  });

  tables.push_back(TableSpec{
      model::kFactDistribuicoes,
      "fato_distribuicoes",
      {Int("id_distribuicao", "id_distribuicao_api"), Int("id_loja_origem"), Int("id_loja_destino"), Int("id_tempo"), Int("id_produto"),
       Int("quantidade"), Text("status_distribuicao", "status"), LoadedAt()},
      {"id_distribuicao_api", "id_produto"},
      kLoadTimestamp,
  });

  return tables;
}

} // namespace

const std::vector<TableSpec>& WarehouseTables() {
  static const std::vector<TableSpec> tables = BuildTables();
  return tables;
}

std::optional<TableSpec> FindWarehouseTable(const std::string& intermediate_table) {
  for (const auto& spec : WarehouseTables()) {
    if (spec.source_table == intermediate_table) {
      return spec;
    }
  }
  return std::nullopt;
}

} // namespace systock::db::sql
