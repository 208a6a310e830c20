#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace systock::runtime::config {
class TransformConfig;
}

namespace systock::transform {

// Raw entity names as laid out under the bronze directory.
inline constexpr const char* kRawClientes     = "clientes";
inline constexpr const char* kRawProdutos     = "produtos";
inline constexpr const char* kRawCategorias   = "categorias";
inline constexpr const char* kRawLojas        = "lojas";
inline constexpr const char* kRawVendas       = "vendas";
inline constexpr const char* kRawEstoque      = "estoque";
inline constexpr const char* kRawDistribuicao = "distribuicao_interna";
inline constexpr const char* kRawEntradas     = "entradas";

struct TemporalSource {
  std::string              entity;
  std::vector<std::string> columns;
};

std::vector<TemporalSource> DefaultCalendarSources();

struct TransformOptions {
  std::vector<TemporalSource> calendar_sources{DefaultCalendarSources()};
  util::Days                  fallback_start{std::chrono::year{2023} / std::chrono::January / 1};
  std::optional<util::Days>   fallback_end; // nullopt: the load date
  std::string                 item_cost_field{"total_price"};
};

// Empty config fields keep the defaults above. Throws util::ValidationError on bad dates.
TransformOptions TransformOptionsFromConfig(const systock::runtime::config::TransformConfig& config);

} // namespace systock::transform
