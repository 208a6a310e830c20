#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/warehouse_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/transform/transform_options.hpp"
#include "internal/util/errors.hpp"
#if SYSTOCK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SYSTOCK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace systock::factory {

using observability::StringField;

namespace {

constexpr const char* kDefaultPostgresSchema = "analytics";

storage::SnapshotReaderOptions SnapshotOptions(const systock::runtime::config::SnapshotConfig& config) {
  if (config.bronze_dir().empty()) {
    throw util::ValidationError("snapshots.bronze_dir is required");
  }

  storage::SnapshotReaderOptions options;
  options.bronze_dir = config.bronze_dir();
  options.selection  = config.selection() == systock::runtime::config::SNAPSHOT_SELECTION_INGESTION_TIMESTAMP
                           ? storage::SnapshotSelection::kIngestionTimestamp
                           : storage::SnapshotSelection::kModificationTime;
  if (!config.ingestion_timestamp_column().empty()) {
    options.ingestion_timestamp_column = config.ingestion_timestamp_column();
  }
  return options;
}

} // namespace

std::shared_ptr<db::WarehouseRepository> BuildWarehouse(const systock::runtime::config::WarehouseConfig& config) {
  if (config.has_sqlite()) {
#if SYSTOCK_DB_SQLITE
    if (config.sqlite().path().empty()) {
      throw util::ValidationError("warehouse.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(config.sqlite().path(), config.sqlite().wal_mode());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ValidationError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (config.has_postgres()) {
#if SYSTOCK_DB_POSTGRES
    const auto& pg = config.postgres();
    if (pg.connection_uri().empty()) {
      throw util::ValidationError("warehouse.postgres.connection_uri is required");
    }
    auto pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() == 0 ? 4 : pg.max_connections());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool), pg.schema().empty() ? kDefaultPostgresSchema : pg.schema());
#else
    throw util::ValidationError("postgres backend requested but not enabled at build time");
#endif
  }

  SYSTOCK_LOG_WARN("no warehouse backend configured; merging into an in-memory warehouse");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full pipeline dependency graph
*/
Application Build(const systock::runtime::config::RuntimeConfig& config, util::ClockFn clock) {
  Application app;

  // ------------------------------------------------------------------
  // Raw snapshots and builders
  // ------------------------------------------------------------------
  app.snapshots = std::make_shared<storage::SnapshotReader>(SnapshotOptions(config.snapshots()));

  const auto transform_options = transform::TransformOptionsFromConfig(config.transform());
  app.dimensions               = std::make_shared<transform::DimensionBuilder>(app.snapshots, transform_options, clock);
  app.facts                    = std::make_shared<transform::FactBuilder>(app.snapshots, transform_options, clock);

  // ------------------------------------------------------------------
  // Star-schema store
  // ------------------------------------------------------------------
  const auto& star_schema = config.star_schema();
  if (!star_schema.silver_dir().empty()) {
    storage::StarSchemaStoreOptions store_options;
    store_options.silver_dir  = star_schema.silver_dir();
    store_options.compression = storage::common::ResolveCompression(star_schema.compression());
    app.store                 = std::make_shared<storage::StarSchemaStore>(std::move(store_options));
  } else {
    SYSTOCK_LOG_WARN("star_schema.silver_dir not set; star-schema tables will not be written");
  }

  // ------------------------------------------------------------------
  // Warehouse
  // ------------------------------------------------------------------
  const auto& warehouse = config.warehouse();
  app.warehouse         = BuildWarehouse(warehouse);

  load::MergeOptions merge_options;
  if (warehouse.batch_size() > 0) {
    merge_options.batch_size = warehouse.batch_size();
  }
  app.loader = std::make_shared<load::MergeLoader>(app.warehouse, merge_options);

  if (!warehouse.has_bootstrap_schema() || warehouse.bootstrap_schema()) {
    app.loader->EnsureTables(db::sql::WarehouseTables());
  }

  // ------------------------------------------------------------------
  // Coordinator
  // ------------------------------------------------------------------
  const auto&              pipeline = config.pipeline();
  core::CoordinatorOptions options;
  options.write_star_schema = !pipeline.has_write_star_schema() || pipeline.write_star_schema();
  options.load_warehouse    = !pipeline.has_load_warehouse() || pipeline.load_warehouse();

  app.coordinator = std::make_shared<core::TransformCoordinator>(app.dimensions, app.facts, app.store, app.loader, options);

  SYSTOCK_LOG_INFO("pipeline assembled", {StringField("bronze_dir", config.snapshots().bronze_dir()),
                                          StringField("silver_dir", star_schema.silver_dir()), StringField("warehouse", app.warehouse->Backend())});
  return app;
}

} // namespace systock::factory
