#include "pg_repository.hpp"

#include <algorithm>
#include <optional>

#include "internal/db/sql/sql_queries.hpp"

namespace systock::db::postgres {

namespace {

constexpr auto        kDialect         = sql::Dialect::kPostgres;
constexpr std::size_t kMaxBindVariables = 65535;

void Append(pqxx::params& params, const sql::Value& v) {
  struct Visitor {
    pqxx::params& params;
    void operator()(std::nullptr_t) const {
      params.append(std::optional<std::string>{});
    }
    void operator()(int64_t x) const {
      params.append(x);
    }
    void operator()(double x) const {
      params.append(x);
    }
    void operator()(bool x) const {
      params.append(x);
    }
    void operator()(const std::string& x) const {
      params.append(x);
    }
  };
  std::visit(Visitor{params}, v);
}

sql::Value Column(const pqxx::field& field, sql::ColumnType type) {
  if (field.is_null()) {
    return nullptr;
  }
  switch (type) {
    case sql::ColumnType::kInteger:
      return field.as<int64_t>();
    case sql::ColumnType::kDouble:
      return field.as<double>();
    case sql::ColumnType::kBoolean:
      return field.as<bool>();
    default:
      return std::string(field.c_str());
  }
}

sql::Row ReadRow(const pqxx::row& row, const sql::TableSpec& spec) {
  sql::Row out;
  out.reserve(spec.columns.size());
  for (std::size_t i = 0; i < spec.columns.size(); ++i) {
    out.push_back(Column(row[static_cast<pqxx::row::size_type>(i)], spec.columns[i].type));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, std::string schema)
    : pool_(std::move(pool)), schema_(std::move(schema)) {
}

std::unique_ptr<db::Session> PgRepository::Connect() {
  return std::make_unique<PgSession>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::undefined_table*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::EnsureTable(Transaction& t, const sql::TableSpec& spec) {
  try {
    if (!schema_.empty()) {
      TX(t).Work().exec(sql::CreateSchemaSql(schema_));
    }
    TX(t).Work().exec(sql::CreateTableSql(kDialect, schema_, spec));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertRows(Transaction& t, const sql::TableSpec& spec, const std::vector<sql::Row>& rows, uint64_t* affected) {
  const std::size_t width         = std::max<std::size_t>(spec.columns.size(), 1);
  const std::size_t per_statement = std::max<std::size_t>(1, kMaxBindVariables / width);

  try {
    uint64_t changed = 0;
    for (std::size_t begin = 0; begin < rows.size(); begin += per_statement) {
      const std::size_t count = std::min(per_statement, rows.size() - begin);

      pqxx::params params;
      for (std::size_t r = begin; r < begin + count; ++r) {
        if (rows[r].size() != spec.columns.size()) {
          return Result::Err(ErrorCode::InternalError, "row width does not match table " + spec.name);
        }
        for (const auto& v : rows[r]) {
          Append(params, v);
        }
      }

      auto res = TX(t).Work().exec_params(sql::UpsertSql(kDialect, schema_, spec, count), params);
      changed += static_cast<uint64_t>(res.affected_rows());
    }

    if (affected) *affected = changed;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<sql::Row> PgRepository::FindByKey(Transaction& t, const sql::TableSpec& spec, const sql::Row& key) {
  pqxx::params params;
  for (const auto& v : key) {
    Append(params, v);
  }

  auto res = TX(t).Work().exec_params(sql::SelectByKeySql(kDialect, schema_, spec), params);
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0], spec);
}

std::vector<sql::Row> PgRepository::ListRows(Transaction& t, const sql::TableSpec& spec) {
  auto res = TX(t).Work().exec(sql::SelectAllSql(kDialect, schema_, spec));

  std::vector<sql::Row> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRow(row, spec));
  }
  return out;
}

uint64_t PgRepository::CountRows(Transaction& t, const sql::TableSpec& spec) {
  auto res = TX(t).Work().exec(sql::CountSql(kDialect, schema_, spec));
  return res[0][0].as<uint64_t>();
}

}
