#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/transform_coordinator.hpp"
#include "internal/db/api/warehouse_repository.hpp"
#include "internal/load/merge_loader.hpp"
#include "internal/storage/snapshot_reader.hpp"
#include "internal/storage/star_schema_store.hpp"
#include "internal/transform/dimension_builder.hpp"
#include "internal/transform/fact_builder.hpp"
#include "internal/util/time.hpp"

namespace systock::factory {

/*
  Application

  Owns every component of one pipeline run.
*/
struct Application {
  std::shared_ptr<storage::SnapshotReader>     snapshots;
  std::shared_ptr<transform::DimensionBuilder> dimensions;
  std::shared_ptr<transform::FactBuilder>      facts;
  std::shared_ptr<storage::StarSchemaStore>    store; // null without star_schema.silver_dir
  std::shared_ptr<db::WarehouseRepository>     warehouse;
  std::shared_ptr<load::MergeLoader>           loader;
  std::shared_ptr<core::TransformCoordinator>  coordinator;
};

/*
  BuildWarehouse

  SQLite or PostgreSQL per config, in-memory when neither is set.

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::WarehouseRepository> BuildWarehouse(const systock::runtime::config::WarehouseConfig& config);

/*
  Build

  Composition root. Throws util::ValidationError for unusable config
  and util::LoadError when warehouse bootstrap fails.
*/
Application Build(const systock::runtime::config::RuntimeConfig& config, util::ClockFn clock = util::Now);

} // namespace systock::factory
