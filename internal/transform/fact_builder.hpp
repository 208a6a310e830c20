#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "internal/model/fact_rows.hpp"
#include "internal/storage/snapshot_reader.hpp"
#include "internal/transform/transform_options.hpp"
#include "internal/util/time.hpp"

namespace systock::transform {

/*
  FactBuilder

  Sales, inventory and distribution facts from raw snapshots. Raw
  produtos is an optional enrichment source for all three: when it is
  absent prices are not filled in and inventory values fall to zero.

  Errors:
    util::MissingSourceError  primary snapshot absent
    util::ValidationError     required column absent, or items not a list of structs
*/
class FactBuilder {
 public:
  FactBuilder(std::shared_ptr<const storage::SnapshotReader> reader, TransformOptions options, util::ClockFn clock = util::Now);

  // One row per (sale, item); item prices are coalesced with the product's.
  std::vector<model::SalesLineRow> BuildSales() const;

  // One row per reading, in snapshot order, with deltas against the
  // previous reading of the same (store, product).
  std::vector<model::InventoryDeltaRow> BuildInventory() const;

  // One row per (distribution header, item), joined on distribution id.
  std::vector<model::DistributionLineRow> BuildDistributions() const;

 private:
  struct ProductPrices {
    std::optional<double> sale_price;
    std::optional<double> cost_price;
  };

  // Empty when raw produtos is absent.
  std::map<int64_t, ProductPrices> LoadProductPrices() const;

  std::shared_ptr<const storage::SnapshotReader> reader_;
  TransformOptions                               options_;
  util::ClockFn                                  clock_;
};

} // namespace systock::transform
