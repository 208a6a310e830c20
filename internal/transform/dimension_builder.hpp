#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/dimension_rows.hpp"
#include "internal/storage/snapshot_reader.hpp"
#include "internal/transform/transform_options.hpp"
#include "internal/util/time.hpp"

namespace systock::transform {

/*
  DimensionBuilder

  Client, product, store and calendar dimensions from raw snapshots.
  Every row produced by one Build* call carries the same load
  timestamp, taken once from the injected clock.

  Errors:
    util::MissingSourceError  primary snapshot absent
    util::ValidationError     required column absent from a present snapshot
*/
class DimensionBuilder {
 public:
  DimensionBuilder(std::shared_ptr<const storage::SnapshotReader> reader, TransformOptions options, util::ClockFn clock = util::Now);

  // Deduplicated on (id, document); last occurrence wins.
  std::vector<model::ClientDimRow> BuildClients() const;

  // Left join with categorias; category columns are null when it is absent.
  std::vector<model::ProductDimRow> BuildProducts() const;

  // Deduplicated on id; last occurrence wins.
  std::vector<model::StoreDimRow> BuildStores() const;

  // One row per day between the earliest and latest date found in the
  // configured temporal columns, or over the fallback window when none is found.
  std::vector<model::CalendarDayRow> BuildCalendar() const;

  // 11 characters: individual, 14: company, anything else: unclassified.
  static std::string ClassifyDocument(const std::optional<std::string>& document);

  static std::vector<model::CalendarDayRow> CalendarRange(util::Days first, util::Days last);

 private:
  std::shared_ptr<const storage::SnapshotReader> reader_;
  TransformOptions                               options_;
  util::ClockFn                                  clock_;
};

} // namespace systock::transform
