#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/transform/transform_options.hpp"
#include "internal/util/errors.hpp"

namespace {

using systock::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "systock_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullPipelineConfig() {
  const auto yaml_path = WriteYaml("full", R"(logging:
  level: debug
snapshots:
  bronze_dir: /data/bronze
  selection: SNAPSHOT_SELECTION_INGESTION_TIMESTAMP
star_schema:
  silver_dir: /data/silver
  compression: COMPRESSION_ZSTD
transform:
  calendar:
    fallback_start: "2022-06-01"
    sources:
      - entity: vendas
        columns: [sale_date]
  sales:
    item_cost_field: unit_cost
warehouse:
  postgres:
    connection_uri: "postgresql://etl@localhost/dw"
    schema: analytics
    max_connections: 2
  batch_size: 500
  bootstrap_schema: false
pipeline:
  load_warehouse: false
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.snapshots().bronze_dir() == "/data/bronze");
  assert(config.snapshots().selection() == systock::runtime::config::SNAPSHOT_SELECTION_INGESTION_TIMESTAMP);
  assert(config.star_schema().compression() == systock::runtime::config::COMPRESSION_ZSTD);
  assert(config.transform().calendar().sources_size() == 1);
  assert(config.transform().calendar().sources(0).columns(0) == "sale_date");
  assert(config.warehouse().has_postgres());
  assert(config.warehouse().postgres().max_connections() == 2);
  assert(config.warehouse().batch_size() == 500);
  assert(config.warehouse().has_bootstrap_schema() && !config.warehouse().bootstrap_schema());
  assert(config.pipeline().has_load_warehouse() && !config.pipeline().load_warehouse());
  assert(!config.pipeline().has_write_star_schema());

  auto options = systock::transform::TransformOptionsFromConfig(config.transform());
  assert(systock::util::FormatDate(options.fallback_start) == "2022-06-01");
  assert(!options.fallback_end.has_value());
  assert(options.calendar_sources.size() == 1);
  assert(options.item_cost_field == "unit_cost");
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(snapshots:
  bronze_dir: "2024"
warehouse:
  sqlite:
    path: "C:\\dw\\\"quoted\"\\warehouse.db"
)");
  assert(config.snapshots().bronze_dir() == "2024");
  assert(config.warehouse().sqlite().path() == "C:\\dw\\\"quoted\"\\warehouse.db");
}

void TestEmptyDocumentGivesDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.snapshots().bronze_dir().empty());
  assert(!config.warehouse().has_sqlite() && !config.warehouse().has_postgres());

  auto options = systock::transform::TransformOptionsFromConfig(config.transform());
  assert(systock::util::FormatDate(options.fallback_start) == "2023-01-01");
  assert(options.calendar_sources.size() == 4);
  assert(options.item_cost_field == "total_price");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(snapshots:
  bronze_dir: /data/bronze
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInvalidCalendarWindowIsRejected() {
  auto config = ConfigLoader::LoadFromYamlString(R"(transform:
  calendar:
    fallback_start: "2024-02-01"
    fallback_end: "2024-01-01"
)");

  bool threw = false;
  try {
    (void)systock::transform::TransformOptionsFromConfig(config.transform());
  } catch (const systock::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  config = ConfigLoader::LoadFromYamlString(R"(transform:
  calendar:
    fallback_start: "yesterday"
)");
  threw = false;
  try {
    (void)systock::transform::TransformOptionsFromConfig(config.transform());
  } catch (const systock::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullPipelineConfig();
  TestQuotedScalarsStayStrings();
  TestEmptyDocumentGivesDefaults();
  TestUnknownFieldsAreRejected();
  TestInvalidCalendarWindowIsRejected();

  std::cout << "systock_unit_config_loader: pass\n";
  return 0;
}
