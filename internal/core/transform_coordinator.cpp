#include "transform_coordinator.hpp"

#include <algorithm>
#include <chrono>

#include "internal/db/sql/warehouse_schema.hpp"
#include "internal/model/table_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace systock::core {

using observability::IntField;
using observability::StringField;

namespace {

db::sql::TableSpec RequireWarehouseTable(const std::string& table) {
  auto spec = db::sql::FindWarehouseTable(table);
  if (!spec) {
    throw util::ValidationError("no warehouse table mapped for " + table);
  }
  return *spec;
}

} // namespace

TransformCoordinator::TransformCoordinator(std::shared_ptr<const transform::DimensionBuilder> dimensions,
                                           std::shared_ptr<const transform::FactBuilder> facts, std::shared_ptr<storage::StarSchemaStore> store,
                                           std::shared_ptr<load::MergeLoader> loader, CoordinatorOptions options)
    : dimensions_(std::move(dimensions)),
      facts_(std::move(facts)),
      store_(std::move(store)),
      loader_(std::move(loader)),
      options_(options) {
  if (!dimensions_ || !facts_) {
    throw util::ValidationError("transform coordinator requires dimension and fact builders");
  }

  const auto* dims = dimensions_.get();
  const auto* fcts = facts_.get();
  handlers_ = {
      {"clientes", model::kDimClientes, model::TableKind::kDimension, [dims] { return model::ToTable(dims->BuildClients()); }},
      {"produtos", model::kDimProdutos, model::TableKind::kDimension, [dims] { return model::ToTable(dims->BuildProducts()); }},
      {"lojas", model::kDimLojas, model::TableKind::kDimension, [dims] { return model::ToTable(dims->BuildStores()); }},
      {"tempo", model::kDimTempo, model::TableKind::kDimension, [dims] { return model::ToTable(dims->BuildCalendar()); }},
      {"vendas", model::kFactVendas, model::TableKind::kFact, [fcts] { return model::ToTable(fcts->BuildSales()); }},
      {"estoque", model::kFactEstoque, model::TableKind::kFact, [fcts] { return model::ToTable(fcts->BuildInventory()); }},
      {"distribuicoes", model::kFactDistribuicoes, model::TableKind::kFact, [fcts] { return model::ToTable(fcts->BuildDistributions()); }},
  };
}

std::vector<std::string> TransformCoordinator::EntityNames() {
  return {"clientes", "produtos", "lojas", "tempo", "vendas", "estoque", "distribuicoes"};
}

const TransformCoordinator::Handler& TransformCoordinator::Find(const std::string& entity) const {
  auto it = std::find_if(handlers_.begin(), handlers_.end(), [&](const Handler& h) { return h.entity == entity; });
  if (it == handlers_.end()) {
    throw util::ValidationError("unknown entity '" + entity + "'");
  }
  return *it;
}

void TransformCoordinator::Execute(const Handler& handler, EntityOutcome& outcome) const {
  observability::SpanScope span("systock.entity");
  span.SetAttribute("entity", handler.entity);
  const auto start = std::chrono::steady_clock::now();

  SYSTOCK_LOG_INFO("entity transform started", {StringField("entity", handler.entity), StringField("table", handler.table)});

  auto table   = handler.build();
  outcome.rows = table->num_rows();
  observability::Metrics::Instance().AddRowsTransformed(handler.entity, static_cast<uint64_t>(outcome.rows));

  if (options_.write_star_schema && store_) {
    store_->Write(handler.table, handler.kind, *table);
  }

  if (options_.load_warehouse && loader_) {
    outcome.merged = loader_->Merge(RequireWarehouseTable(handler.table), *table).inserted_or_updated;
  }

  const auto elapsed = observability::ElapsedMs(start);
  observability::Metrics::Instance().ObserveStageDurationMs("transform", elapsed);
  span.SetAttribute("rows", outcome.rows);

  SYSTOCK_LOG_INFO("entity transform finished", {StringField("entity", handler.entity), IntField("rows", outcome.rows),
                                                 IntField("merged", static_cast<int64_t>(outcome.merged)),
                                                 IntField("elapsed_ms", static_cast<int64_t>(elapsed))});
}

void TransformCoordinator::Load(const Handler& handler, EntityOutcome& outcome) const {
  observability::SpanScope span("systock.load");
  span.SetAttribute("entity", handler.entity);
  const auto start = std::chrono::steady_clock::now();

  auto table = store_->Read(handler.table, handler.kind);
  if (!table) {
    throw util::MissingSourceError("star-schema table " + handler.table + " has not been written");
  }

  outcome.rows   = (*table)->num_rows();
  outcome.merged = loader_->Merge(RequireWarehouseTable(handler.table), **table).inserted_or_updated;

  observability::Metrics::Instance().ObserveStageDurationMs("load", observability::ElapsedMs(start));
}

std::map<std::string, int64_t> TransformCoordinator::RunAll() {
  outcomes_.clear();
  std::map<std::string, int64_t> results;

  for (const auto& handler : handlers_) {
    EntityOutcome outcome{handler.entity, handler.table};
    try {
      Execute(handler, outcome);
      outcome.succeeded = true;
    } catch (const std::exception& e) {
      outcome.rows   = 0;
      outcome.merged = 0;
      outcome.error  = e.what();
      SYSTOCK_LOG_ERROR("entity transform failed", {StringField("entity", handler.entity), StringField("error", outcome.error)});
    }

    observability::Metrics::Instance().RecordEntityRun(handler.entity, outcome.succeeded);
    results[handler.entity] = outcome.rows;
    outcomes_.push_back(std::move(outcome));
  }

  const auto failed = std::count_if(outcomes_.begin(), outcomes_.end(), [](const EntityOutcome& o) { return !o.succeeded; });
  SYSTOCK_LOG_INFO("transform run complete", {IntField("entities", static_cast<int64_t>(outcomes_.size())), IntField("failed", failed)});
  return results;
}

int64_t TransformCoordinator::RunEntity(const std::string& entity) {
  const auto& handler = Find(entity);
  outcomes_.clear();

  EntityOutcome outcome{handler.entity, handler.table};
  try {
    Execute(handler, outcome);
    outcome.succeeded = true;
  } catch (const std::exception& e) {
    outcome.error = e.what();
    observability::Metrics::Instance().RecordEntityRun(handler.entity, false);
    outcomes_.push_back(outcome);
    throw;
  }

  observability::Metrics::Instance().RecordEntityRun(handler.entity, true);
  outcomes_.push_back(outcome);
  return outcome.rows;
}

std::map<std::string, int64_t> TransformCoordinator::LoadAll(const std::vector<std::string>& entities) {
  if (!store_ || !loader_) {
    throw util::ValidationError("load stage requires a star-schema store and a warehouse loader");
  }

  std::vector<const Handler*> selected;
  if (entities.empty()) {
    for (const auto& handler : handlers_) selected.push_back(&handler);
  } else {
    for (const auto& entity : entities) selected.push_back(&Find(entity));
  }

  outcomes_.clear();
  std::map<std::string, int64_t> results;

  for (const auto* handler : selected) {
    EntityOutcome outcome{handler->entity, handler->table};
    try {
      Load(*handler, outcome);
      outcome.succeeded = true;
    } catch (const std::exception& e) {
      outcome.rows   = 0;
      outcome.merged = 0;
      outcome.error  = e.what();
      SYSTOCK_LOG_ERROR("entity load failed", {StringField("entity", handler->entity), StringField("error", outcome.error)});
    }

    observability::Metrics::Instance().RecordEntityRun(handler->entity, outcome.succeeded);
    results[handler->entity] = outcome.rows;
    outcomes_.push_back(std::move(outcome));
  }
  return results;
}

bool TransformCoordinator::LastRunSucceeded() const {
  return std::all_of(outcomes_.begin(), outcomes_.end(), [](const EntityOutcome& o) { return o.succeeded; });
}

} // namespace systock::core
