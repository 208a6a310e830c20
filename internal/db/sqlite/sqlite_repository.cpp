#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>

#include "internal/db/sql/sql_queries.hpp"

namespace systock::db::sqlite {

using systock::db::ErrorCode;
using systock::db::Result;

namespace {

constexpr auto kDialect = sql::Dialect::kSqlite;

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    st = nullptr;
  }
  return Statement(st, &sqlite3_finalize);
}

int Bind(sqlite3_stmt* st, int idx, const sql::Value& v) {
  struct Visitor {
    sqlite3_stmt* st;
    int           idx;
    int operator()(std::nullptr_t) const {
      return sqlite3_bind_null(st, idx);
    }
    int operator()(int64_t x) const {
      return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(x));
    }
    int operator()(double x) const {
      return sqlite3_bind_double(st, idx, x);
    }
    int operator()(bool x) const {
      return sqlite3_bind_int(st, idx, x ? 1 : 0);
    }
    int operator()(const std::string& x) const {
      return sqlite3_bind_text(st, idx, x.c_str(), static_cast<int>(x.size()), SQLITE_TRANSIENT);
    }
  };
  return std::visit(Visitor{st, idx}, v);
}

sql::Value Column(sqlite3_stmt* st, int col, sql::ColumnType type) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) {
    return nullptr;
  }
  switch (type) {
    case sql::ColumnType::kInteger:
      return static_cast<int64_t>(sqlite3_column_int64(st, col));
    case sql::ColumnType::kDouble:
      return sqlite3_column_double(st, col);
    case sql::ColumnType::kBoolean:
      return sqlite3_column_int64(st, col) != 0;
    default: {
      const unsigned char* t = sqlite3_column_text(st, col);
      return std::string(t ? reinterpret_cast<const char*>(t) : "");
    }
  }
}

sql::Row ReadRow(sqlite3_stmt* st, const sql::TableSpec& spec) {
  sql::Row row;
  row.reserve(spec.columns.size());
  for (std::size_t i = 0; i < spec.columns.size(); ++i) {
    row.push_back(Column(st, static_cast<int>(i), spec.columns[i].type));
  }
  return row;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Session> SqliteRepository::Connect() {
    return std::make_unique<SqliteSession>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Schema
// ------------------------------------------------------------------

Result SqliteRepository::EnsureTable(Transaction& t, const sql::TableSpec& spec) {
    auto* db = TX(t).Handle();
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql::CreateTableSql(kDialect, "", spec).c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        return Result::Err(ErrorCode::InternalError, msg);
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Rows
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRows(Transaction& t, const sql::TableSpec& spec, const std::vector<sql::Row>& rows, uint64_t* affected) {
    auto* db = TX(t).Handle();
    const std::size_t width = spec.columns.size();
    const std::size_t per_statement =
        std::max<std::size_t>(1, static_cast<std::size_t>(TX(t).DB().MaxVariables()) / std::max<std::size_t>(width, 1));

    uint64_t changed = 0;
    for (std::size_t begin = 0; begin < rows.size(); begin += per_statement) {
        const std::size_t count = std::min(per_statement, rows.size() - begin);

        auto st = Prepare(db, sql::UpsertSql(kDialect, "", spec, count));
        if (!st) return Translate(db, sqlite3_errcode(db));

        int idx = 1;
        for (std::size_t r = begin; r < begin + count; ++r) {
            if (rows[r].size() != width) {
                return Result::Err(ErrorCode::InternalError, "row width does not match table " + spec.name);
            }
            for (const auto& v : rows[r]) {
                int rc = Bind(st.get(), idx++, v);
                if (rc != SQLITE_OK) return Translate(db, rc);
            }
        }

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
        changed += static_cast<uint64_t>(sqlite3_changes(db));
    }

    if (affected) *affected = changed;
    return Result::Ok();
}

std::optional<sql::Row>
SqliteRepository::FindByKey(Transaction& t, const sql::TableSpec& spec, const sql::Row& key) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::SelectByKeySql(kDialect, "", spec));
    if (!st) return std::nullopt;

    for (std::size_t i = 0; i < key.size(); ++i) {
        if (Bind(st.get(), static_cast<int>(i + 1), key[i]) != SQLITE_OK) return std::nullopt;
    }

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadRow(st.get(), spec);
}

std::vector<sql::Row> SqliteRepository::ListRows(Transaction& t, const sql::TableSpec& spec) {
    auto* db = TX(t).Handle();
    std::vector<sql::Row> out;

    auto st = Prepare(db, sql::SelectAllSql(kDialect, "", spec));
    if (!st) return out;

    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadRow(st.get(), spec));
    }
    return out;
}

uint64_t SqliteRepository::CountRows(Transaction& t, const sql::TableSpec& spec) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::CountSql(kDialect, "", spec));
    if (!st) return 0;
    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return static_cast<uint64_t>(sqlite3_column_int64(st.get(), 0));
}

} // namespace systock::db::sqlite
