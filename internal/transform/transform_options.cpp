#include "transform_options.hpp"

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace systock::transform {

namespace {

util::Days ParseConfiguredDate(const std::string& field, const std::string& value) {
  auto day = util::ParseDate(value);
  if (!day) {
    throw util::ValidationError("transform.calendar." + field + " is not an ISO date: '" + value + "'");
  }
  return *day;
}

} // namespace

std::vector<TemporalSource> DefaultCalendarSources() {
  return {
      {kRawVendas, {"sale_date", "predicted_delivery", "delivered_at"}},
      {kRawDistribuicao, {"distribution_date"}},
      {kRawEstoque, {"updated_at"}},
      {kRawEntradas, {"entry_date"}},
  };
}

TransformOptions TransformOptionsFromConfig(const systock::runtime::config::TransformConfig& config) {
  TransformOptions options;

  const auto& calendar = config.calendar();
  if (!calendar.fallback_start().empty()) {
    options.fallback_start = ParseConfiguredDate("fallback_start", calendar.fallback_start());
  }
  if (!calendar.fallback_end().empty()) {
    options.fallback_end = ParseConfiguredDate("fallback_end", calendar.fallback_end());
  }
  if (options.fallback_end && *options.fallback_end < options.fallback_start) {
    throw util::ValidationError("transform.calendar.fallback_end precedes fallback_start");
  }

  if (calendar.sources_size() > 0) {
    options.calendar_sources.clear();
    for (const auto& source : calendar.sources()) {
      if (source.entity().empty()) {
        throw util::ValidationError("transform.calendar.sources entry without entity");
      }
      options.calendar_sources.push_back({source.entity(), {source.columns().begin(), source.columns().end()}});
    }
  }

  if (!config.sales().item_cost_field().empty()) {
    options.item_cost_field = config.sales().item_cost_field();
  }

  return options;
}

} // namespace systock::transform
