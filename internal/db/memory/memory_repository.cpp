#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace systock::db::memory {

namespace {

sql::Row KeyOf(const sql::TableSpec& spec, const sql::Row& row) {
  sql::Row key;
  for (auto index : spec.KeyIndexes()) {
    key.push_back(row[index]);
  }
  return key;
}

bool AnyNull(const sql::Row& row) {
  for (const auto& v : row) {
    if (sql::IsNull(v)) return true;
  }
  return false;
}

// SQL semantics of `target.ts < excluded.ts`: false when either side is NULL.
bool IsNewer(const sql::Value& incoming, const sql::Value& stored) {
  if (sql::IsNull(incoming) || sql::IsNull(stored)) return false;
  return sql::CompareValues(stored, incoming) < 0;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Session> MemoryRepository::Connect() {
  return std::make_unique<MemorySession>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::EnsureTable(Transaction& t, const sql::TableSpec& spec) {
  if (spec.KeyIndexes().size() != spec.key_columns.size() || spec.key_columns.empty()) {
    return Result::Err(ErrorCode::InternalError, "table " + spec.name + " has key columns outside its column list");
  }
  TX(t).Mutable().tables.try_emplace(spec.name);
  return Result::Ok();
}

Result MemoryRepository::UpsertRows(Transaction& t, const sql::TableSpec& spec, const std::vector<sql::Row>& rows, uint64_t* affected) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tables.find(spec.name);
  if (it == s.tables.end()) return Result::Err(ErrorCode::NotFound, "no such table: " + spec.name);

  const auto guard       = spec.load_timestamp_column ? spec.IndexOf(*spec.load_timestamp_column) : std::nullopt;
  const bool key_only    = spec.key_columns.size() == spec.columns.size();
  uint64_t   changed     = 0;
  auto       working     = it->second;

  for (const auto& row : rows) {
    if (row.size() != spec.columns.size()) {
      return Result::Err(ErrorCode::InternalError, "row width does not match table " + spec.name);
    }
    auto key = KeyOf(spec, row);
    if (AnyNull(key)) {
      return Result::Err(ErrorCode::ConstraintViolation, "NULL key for table " + spec.name);
    }

    auto existing = working.find(key);
    if (existing == working.end()) {
      working.emplace(std::move(key), row);
      ++changed;
      continue;
    }
    if (key_only) continue;
    if (guard && !IsNewer(row[*guard], existing->second[*guard])) continue;

    existing->second = row;
    ++changed;
  }

  it->second = std::move(working);
  if (affected) *affected = changed;
  return Result::Ok();
}

std::optional<sql::Row> MemoryRepository::FindByKey(Transaction& t, const sql::TableSpec& spec, const sql::Row& key) {
  const auto& s     = TX(t).View();
  auto        table = s.tables.find(spec.name);
  if (table == s.tables.end()) return std::nullopt;

  auto it = table->second.find(key);
  if (it == table->second.end()) return std::nullopt;
  return it->second;
}

std::vector<sql::Row> MemoryRepository::ListRows(Transaction& t, const sql::TableSpec& spec) {
  std::vector<sql::Row> out;
  const auto&           s     = TX(t).View();
  auto                  table = s.tables.find(spec.name);
  if (table == s.tables.end()) return out;

  out.reserve(table->second.size());
  for (const auto& [_, row] : table->second) {
    out.push_back(row);
  }
  return out;
}

uint64_t MemoryRepository::CountRows(Transaction& t, const sql::TableSpec& spec) {
  const auto& s     = TX(t).View();
  auto        table = s.tables.find(spec.name);
  return table == s.tables.end() ? 0 : table->second.size();
}

} // namespace systock::db::memory
