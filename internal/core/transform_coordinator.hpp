#pragma once

#include <arrow/table.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/load/merge_loader.hpp"
#include "internal/model/star_schema.hpp"
#include "internal/storage/star_schema_store.hpp"
#include "internal/transform/dimension_builder.hpp"
#include "internal/transform/fact_builder.hpp"

namespace systock::core {

struct CoordinatorOptions {
  bool write_star_schema{true};
  bool load_warehouse{true};
};

struct EntityOutcome {
  std::string entity;
  std::string table;
  int64_t     rows{0};
  uint64_t    merged{0};
  bool        succeeded{false};
  std::string error;
};

/*
  TransformCoordinator

  Runs the per-entity pipeline: build the star-schema table, write it
  to the store, merge it into the warehouse. Dimensions run before
  facts:

    clientes, produtos, lojas, tempo, vendas, estoque, distribuicoes

  The store and the loader are optional; a null one skips its step.
*/
class TransformCoordinator {
 public:
  TransformCoordinator(std::shared_ptr<const transform::DimensionBuilder> dimensions, std::shared_ptr<const transform::FactBuilder> facts,
                       std::shared_ptr<storage::StarSchemaStore> store, std::shared_ptr<load::MergeLoader> loader,
                       CoordinatorOptions options = {});

  // Every entity in order. A failing entity is logged and recorded as 0
  // rows; the remaining entities still run.
  std::map<std::string, int64_t> RunAll();

  // One entity; its error propagates. Throws util::ValidationError for unknown names.
  int64_t RunEntity(const std::string& entity);

  // Merges stored star-schema tables without rebuilding them. Empty
  // selection means every entity. Failures are recorded as 0 rows.
  std::map<std::string, int64_t> LoadAll(const std::vector<std::string>& entities = {});

  // Outcomes of the most recent RunAll/RunEntity/LoadAll call, in run order.
  const std::vector<EntityOutcome>& LastOutcomes() const {
    return outcomes_;
  }

  bool LastRunSucceeded() const;

  static std::vector<std::string> EntityNames();

 private:
  struct Handler {
    std::string                                    entity;
    std::string                                    table;
    model::TableKind                               kind;
    std::function<std::shared_ptr<arrow::Table>()> build;
  };

  const Handler& Find(const std::string& entity) const;

  void Execute(const Handler& handler, EntityOutcome& outcome) const;
  void Load(const Handler& handler, EntityOutcome& outcome) const;

  std::shared_ptr<const transform::DimensionBuilder> dimensions_;
  std::shared_ptr<const transform::FactBuilder>      facts_;
  std::shared_ptr<storage::StarSchemaStore>          store_;
  std::shared_ptr<load::MergeLoader>                 loader_;
  CoordinatorOptions                                 options_;

  std::vector<Handler>       handlers_;
  std::vector<EntityOutcome> outcomes_;
};

} // namespace systock::core
