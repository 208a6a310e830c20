#pragma once

#include <string>

namespace systock::model {

/*
  Intermediate star-schema tables, as written by the transform stage
  and read back by the load stage.
*/

enum class TableKind {
  kDimension,
  kFact,
};

inline constexpr const char* kDimClientes       = "dim_clientes";
inline constexpr const char* kDimProdutos       = "dim_produtos";
inline constexpr const char* kDimLojas          = "dim_lojas";
inline constexpr const char* kDimTempo          = "dim_tempo";
inline constexpr const char* kFactVendas        = "fact_vendas";
inline constexpr const char* kFactEstoque       = "fact_estoque";
inline constexpr const char* kFactDistribuicoes = "fact_distribuicoes";

inline std::string KindDirectory(TableKind kind) {
  return kind == TableKind::kDimension ? "dims" : "facts";
}

} // namespace systock::model
