#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace systock::model {

inline constexpr const char* kPessoaFisica     = "Pessoa Física";
inline constexpr const char* kPessoaJuridica   = "Pessoa Jurídica";
inline constexpr const char* kNaoClassificado  = "Não Classificado";

struct ClientDimRow {
  std::optional<int64_t>     id_cliente;
  std::optional<std::string> nome_cliente;
  std::optional<std::string> cpf_cnpj;
  std::optional<std::string> email;
  std::optional<std::string> telefone;
  std::optional<std::string> endereco;
  std::string                tipo_cliente;
  util::TimePoint            data_carga;
};

struct ProductDimRow {
  std::optional<int64_t>     id_produto;
  std::optional<std::string> nome_produto;
  std::optional<std::string> descricao_produto;
  std::optional<int64_t>     id_categoria;
  std::optional<double>      preco_venda;
  std::optional<double>      custo_fornecedor;
  std::optional<bool>        ativo;
  std::optional<std::string> nome_categoria;
  std::optional<std::string> descricao_categoria;
  util::TimePoint            data_carga;
};

struct StoreDimRow {
  std::optional<int64_t>     id_loja;
  std::optional<std::string> nome_loja;
  std::optional<std::string> endereco_loja;
  util::TimePoint            data_carga;
};

// id_tempo is YYYYMMDD; semana and dia_semana follow ISO-8601.
struct CalendarDayRow {
  int64_t    id_tempo{0};
  util::Days data_completa;
  int32_t    ano{0};
  int32_t    mes{0};
  int32_t    dia{0};
  int32_t    trimestre{0};
  int32_t    semana{0};
  int32_t    dia_semana{0};
  bool       eh_fim_semana{false};
};

} // namespace systock::model
