#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/warehouse_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/warehouse_schema.hpp"
#include "internal/model/star_schema.hpp"

#if SYSTOCK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SYSTOCK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using systock::db::WarehouseRepository;
using systock::db::memory::MemoryRepository;
using systock::db::sql::FindWarehouseTable;
using systock::db::sql::Row;
using systock::db::sql::TableSpec;
using systock::db::sql::Value;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                             name;
  std::function<std::shared_ptr<WarehouseRepository>()>   make_repository;
  std::function<bool()>                                   supports_restart;
  std::function<void(std::shared_ptr<WarehouseRepository>&)> restart;
  std::function<void()>                                   cleanup;
};

TableSpec Spec(const char* intermediate) {
  auto spec = FindWarehouseTable(intermediate);
  if (!spec) {
    throw std::runtime_error(std::string("no warehouse table for ") + intermediate);
  }
  return *spec;
}

Value I(int64_t v) {
  return Value{v};
}
Value S(const std::string& v) {
  return Value{v};
}

Row Store(int64_t id, const std::string& name, const std::string& loaded_at) {
  return Row{I(id), S(name), Value{nullptr}, S(loaded_at)};
}

uint64_t Upsert(WarehouseRepository& repo, const TableSpec& spec, const std::vector<Row>& rows) {
  auto     session  = repo.Connect();
  auto     tx       = session->Begin();
  uint64_t affected = 0;
  auto     result   = repo.UpsertRows(*tx, spec, rows, &affected);
  assert(result);
  tx->Commit();
  return affected;
}

std::optional<Row> Find(WarehouseRepository& repo, const TableSpec& spec, const Row& key) {
  auto session = repo.Connect();
  auto tx      = session->Begin();
  auto row     = repo.FindByKey(*tx, spec, key);
  tx->Commit();
  return row;
}

uint64_t Count(WarehouseRepository& repo, const TableSpec& spec) {
  auto session = repo.Connect();
  auto tx      = session->Begin();
  auto count   = repo.CountRows(*tx, spec);
  tx->Commit();
  return count;
}

void VerifyEnsureTablesIsIdempotent(WarehouseRepository& repo) {
  for (int round = 0; round < 2; ++round) {
    auto session = repo.Connect();
    auto tx      = session->Begin();
    for (const auto& spec : systock::db::sql::WarehouseTables()) {
      auto result = repo.EnsureTable(*tx, spec);
      assert(result);
    }
    tx->Commit();
  }
  for (const auto& spec : systock::db::sql::WarehouseTables()) {
    assert(Count(repo, spec) == 0);
  }
}

void VerifyValuesRoundTrip(WarehouseRepository& repo) {
  const auto& products = Spec(systock::model::kDimProdutos);
  const Row   product{I(100),       S("Caneta"),   Value{nullptr}, I(10),   Value{2.5}, Value{1.25}, Value{true},
                      S("Escrita"), Value{nullptr}, S("2024-06-01 12:00:00.123456")};
  assert(Upsert(repo, products, {product}) == 1);

  auto read = Find(repo, products, Row{I(100)});
  assert(read.has_value());
  assert(*read == product);
  assert(!Find(repo, products, Row{I(999)}).has_value());

  const auto& calendar = Spec(systock::model::kDimTempo);
  const Row   saturday{I(20240106), S("2024-01-06"), I(2024), I(1), I(6), I(1), I(1), I(6), Value{true}};
  assert(Upsert(repo, calendar, {saturday}) == 1);
  assert(*Find(repo, calendar, Row{I(20240106)}) == saturday);
}

void VerifyLoadTimestampGuard(WarehouseRepository& repo) {
  const auto& stores = Spec(systock::model::kDimLojas);

  assert(Upsert(repo, stores, {Store(1, "first", "2024-06-04 08:00:00.000000")}) == 1);
  assert(Upsert(repo, stores, {Store(1, "same", "2024-06-04 08:00:00.000000")}) == 0);
  assert(Upsert(repo, stores, {Store(1, "older", "2024-06-03 08:00:00.000000")}) == 0);
  assert(std::get<std::string>((*Find(repo, stores, Row{I(1)}))[1]) == "first");

  assert(Upsert(repo, stores, {Store(1, "newer", "2024-06-04 08:00:00.000001"), Store(2, "other", "2024-06-01 00:00:00.000000")}) == 2);
  assert(std::get<std::string>((*Find(repo, stores, Row{I(1)}))[1]) == "newer");

  // no guard on the calendar: every merge overwrites
  const auto& calendar = Spec(systock::model::kDimTempo);
  const Row   day{I(20240107), S("2024-01-07"), I(2024), I(1), I(7), I(1), I(1), I(7), Value{true}};
  assert(Upsert(repo, calendar, {day}) == 1);
  assert(Upsert(repo, calendar, {day}) == 1);
}

void VerifyCompositeKeys(WarehouseRepository& repo) {
  const auto& sales = Spec(systock::model::kFactVendas);
  auto        line  = [](int64_t sale, int64_t product, int64_t quantity) {
    return Row{I(sale),          I(20240305),     I(1),            I(7),           I(product),
               I(quantity),      Value{10.0},     Value{6.0},      Value{10.0 * quantity}, Value{6.0 * quantity},
               Value{4.0 * quantity}, Value{0.4}, S("2024-06-01 12:00:00.000000")};
  };

  assert(Upsert(repo, sales, {line(1, 100, 3), line(1, 101, 1), line(2, 100, 2)}) == 3);
  assert(Count(repo, sales) == 3);

  auto read = Find(repo, sales, Row{I(1), I(101)});
  assert(read.has_value());
  assert(std::get<int64_t>((*read)[5]) == 1);

  auto session = repo.Connect();
  auto tx      = session->Begin();
  auto rows    = repo.ListRows(*tx, sales);
  tx->Commit();
  assert(rows.size() == 3);
  assert(std::get<int64_t>(rows[0][0]) == 1 && std::get<int64_t>(rows[0][4]) == 100);
  assert(std::get<int64_t>(rows[1][0]) == 1 && std::get<int64_t>(rows[1][4]) == 101);
  assert(std::get<int64_t>(rows[2][0]) == 2);
}

void VerifyRollbackBehavior(WarehouseRepository& repo) {
  const auto& clients = Spec(systock::model::kDimClientes);
  const Row   client{I(1), S("Ana"), S("12345678901"), Value{nullptr}, Value{nullptr}, Value{nullptr}, S("Pessoa Física"),
                     S("2024-06-01 12:00:00.000000")};
  {
    auto     session  = repo.Connect();
    auto     tx       = session->Begin();
    uint64_t affected = 0;
    assert(repo.UpsertRows(*tx, clients, {client}, &affected));
    assert(repo.FindByKey(*tx, clients, Row{I(1)}).has_value());
    tx->Rollback();
  }
  assert(!Find(repo, clients, Row{I(1)}).has_value());

  {
    auto     session  = repo.Connect();
    auto     tx       = session->Begin();
    uint64_t affected = 0;
    assert(repo.UpsertRows(*tx, clients, {client}, &affected));
    // destroyed without commit
  }
  assert(!Find(repo, clients, Row{I(1)}).has_value());

  assert(Count(repo, clients) == 0);
}

void VerifyLargeBatches(WarehouseRepository& repo) {
  const auto&      distributions = Spec(systock::model::kFactDistribuicoes);
  std::vector<Row> rows;
  for (int64_t i = 0; i < 20000; ++i) {
    rows.push_back(Row{I(i / 4), I(1), I(2), I(20240304), I(i % 4), I(i), S("enviado"), S("2024-06-01 12:00:00.000000")});
  }
  assert(Upsert(repo, distributions, rows) == rows.size());
  assert(Count(repo, distributions) == rows.size());
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto        repo   = backend.make_repository();
  const auto& stores = Spec(systock::model::kDimLojas);
  Upsert(*repo, stores, {Store(42, "durable", "2030-01-01 00:00:00.000000")});

  backend.restart(repo);

  auto read = Find(*repo, stores, Row{I(42)});
  assert(read.has_value());
  assert(std::get<std::string>((*read)[1]) == "durable");
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<WarehouseRepository>&) {},
      .cleanup          = []() {},
  };
}

#if SYSTOCK_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("systock_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<systock::db::sqlite::SqliteDB>(db_path);
    return std::make_shared<systock::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<WarehouseRepository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
// A key with more parts than the statement has placeholders cannot bind.
void VerifySqliteUnboundKeyFindsNothing() {
  auto db_path = (std::filesystem::temp_directory_path() / ("systock_integration_sqlite_bind_" + std::to_string(NowMs()) + ".db")).string();
  {
    auto repo   = std::make_shared<systock::db::sqlite::SqliteRepository>(std::make_shared<systock::db::sqlite::SqliteDB>(db_path));
    const auto stores = Spec(systock::model::kDimLojas);

    auto session = repo->Connect();
    auto tx      = session->Begin();
    assert(repo->EnsureTable(*tx, stores));
    uint64_t affected = 0;
    assert(repo->UpsertRows(*tx, stores, {Store(1, "Centro", "2024-06-01 12:00:00.000000")}, &affected));

    assert(repo->FindByKey(*tx, stores, Row{I(1)}).has_value());
    assert(!repo->FindByKey(*tx, stores, Row{I(1), I(2)}).has_value());
    tx->Commit();
  }
  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
}
#endif

#if SYSTOCK_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SYSTOCK_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SYSTOCK_TEST_PG_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto schema    = "systock_parity_" + std::to_string(NowMs());
  auto make_repo = [conninfo, schema]() {
    auto pool = std::make_shared<systock::db::postgres::PgPool>(conninfo);
    return std::make_shared<systock::db::postgres::PgRepository>(std::move(pool), schema);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<WarehouseRepository>& repo) { repo = make_repo(); },
      .cleanup =
          [conninfo, schema]() {
            pqxx::connection conn(conninfo);
            pqxx::work       tx(conn);
            tx.exec("DROP SCHEMA IF EXISTS " + schema + " CASCADE;");
            tx.commit();
          },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyEnsureTablesIsIdempotent(*repo);
  VerifyValuesRoundTrip(*repo);
  VerifyLoadTimestampGuard(*repo);
  VerifyCompositeKeys(*repo);
  VerifyRollbackBehavior(*repo);
  VerifyLargeBatches(*repo);

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SYSTOCK_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
  VerifySqliteUnboundKeyFindsNothing();
#endif

#if SYSTOCK_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "systock_integration_warehouse_parity: pass\n";
  return 0;
}
