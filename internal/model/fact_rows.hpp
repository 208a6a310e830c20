#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace systock::model {

// One row per (sale, item).
struct SalesLineRow {
  std::optional<int64_t> id_venda;
  std::optional<int64_t> id_tempo;
  std::optional<int64_t> id_loja;
  std::optional<int64_t> id_cliente;
  std::optional<int64_t> id_produto;
  std::optional<int64_t> quantidade;
  std::optional<double>  valor_unitario;
  std::optional<double>  custo_unitario;
  std::optional<double>  valor_total;
  std::optional<double>  custo_total;
  std::optional<double>  lucro;
  std::optional<double>  margem_lucro;
  util::TimePoint        data_carga;
};

// One row per inventory reading.
struct InventoryDeltaRow {
  std::optional<int64_t> id_estoque;
  std::optional<int64_t> id_tempo;
  int64_t                id_loja{0};
  int64_t                id_produto{0};
  int64_t                quantidade_inicial{0};
  int64_t                quantidade_final{0};
  int64_t                delta_quantidade{0};
  int64_t                entrada{0};
  int64_t                saida{0};
  double                 valor_inicial{0.0};
  double                 valor_final{0.0};
  util::TimePoint        data_carga;
};

// One row per (distribution, item).
struct DistributionLineRow {
  std::optional<int64_t>     id_distribuicao;
  std::optional<int64_t>     id_loja_origem;
  std::optional<int64_t>     id_loja_destino;
  std::optional<int64_t>     id_tempo;
  std::optional<int64_t>     id_produto;
  std::optional<int64_t>     quantidade;
  std::optional<std::string> status_distribuicao;
  util::TimePoint            data_carga;
};

} // namespace systock::model
