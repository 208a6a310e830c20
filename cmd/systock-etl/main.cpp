#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace {

constexpr int kExitOk           = 0;
constexpr int kExitUsage        = 1;
constexpr int kExitFatal        = 2;
constexpr int kExitEntityFailed = 3;

void PrintUsage() {
  std::cerr << "Usage: systock-etl --config <config.yaml> <command> [entity...]\n"
            << "\n"
            << "Commands:\n"
            << "  transform   build star-schema tables from raw snapshots\n"
            << "  load        merge stored star-schema tables into the warehouse\n"
            << "  run         transform and merge in one pass\n"
            << "  report      print star-schema table statistics\n"
            << "\n"
            << "Entities: clientes produtos lojas tempo vendas estoque distribuicoes\n";
}

void PrintOutcomes(const std::vector<systock::core::EntityOutcome>& outcomes) {
  std::printf("%-14s %-20s %10s %10s  %s\n", "entity", "table", "rows", "merged", "status");
  for (const auto& o : outcomes) {
    std::printf("%-14s %-20s %10lld %10llu  %s\n", o.entity.c_str(), o.table.c_str(), static_cast<long long>(o.rows),
                static_cast<unsigned long long>(o.merged), o.succeeded ? "ok" : ("failed: " + o.error).c_str());
  }
}

void Shutdown() {
  systock::observability::ShutdownLogging();
  systock::observability::ShutdownMetrics();
  systock::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string              config_path;
  std::string              command;
  std::vector<std::string> entities;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return kExitOk;
    } else if (command.empty()) {
      command = arg;
    } else {
      entities.push_back(arg);
    }
  }

  const bool known_command = command == "transform" || command == "load" || command == "run" || command == "report";
  if (config_path.empty() || !known_command || (command == "report" && !entities.empty())) {
    PrintUsage();
    return kExitUsage;
  }

  const auto known_entities = systock::core::TransformCoordinator::EntityNames();
  for (const auto& entity : entities) {
    if (std::find(known_entities.begin(), known_entities.end(), entity) == known_entities.end()) {
      std::cerr << "unknown entity: " << entity << "\n";
      PrintUsage();
      return kExitUsage;
    }
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = systock::config::ConfigLoader::LoadFromYaml(config_path);

    systock::observability::InitializeTracing(config);
    systock::observability::InitializeMetrics(config);
    systock::observability::InitializeLogging(config);

    // transform and report never touch the warehouse
    if (command == "transform" || command == "report") {
      config.mutable_pipeline()->set_load_warehouse(false);
      config.mutable_warehouse()->set_bootstrap_schema(false);
    }
    if (command == "transform") {
      config.mutable_pipeline()->set_write_star_schema(true);
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = systock::factory::Build(config);

    if (command == "report") {
      if (!app.store) {
        throw std::runtime_error("report requires star_schema.silver_dir");
      }
      std::cout << app.store->RenderReport();
      Shutdown();
      return kExitOk;
    }

    std::vector<systock::core::EntityOutcome> outcomes;
    if (command == "load") {
      app.coordinator->LoadAll(entities);
      outcomes = app.coordinator->LastOutcomes();
    } else if (entities.empty()) {
      app.coordinator->RunAll();
      outcomes = app.coordinator->LastOutcomes();
    } else {
      for (const auto& entity : entities) {
        try {
          app.coordinator->RunEntity(entity);
        } catch (const std::exception& e) {
          SYSTOCK_LOG_ERROR("entity failed", {systock::observability::StringField("entity", entity),
                                              systock::observability::StringField("error", e.what())});
        }
        const auto& last = app.coordinator->LastOutcomes();
        outcomes.insert(outcomes.end(), last.begin(), last.end());
      }
    }

    PrintOutcomes(outcomes);

    bool all_ok = true;
    for (const auto& o : outcomes) all_ok = all_ok && o.succeeded;

    SYSTOCK_LOG_INFO("systock-etl finished", {systock::observability::StringField("command", command),
                                              systock::observability::BoolField("succeeded", all_ok)});
    Shutdown();
    return all_ok ? kExitOk : kExitEntityFailed;
  } catch (const std::exception& e) {
    SYSTOCK_LOG_ERROR("Fatal error", {systock::observability::StringField("error", e.what())});
    Shutdown();
    return kExitFatal;
  }
}
