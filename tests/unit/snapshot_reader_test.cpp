#include "internal/storage/snapshot_reader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "internal/storage/common/column_reader.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_tables.hpp"

namespace {

using namespace systock;
using storage::SnapshotReader;
using storage::SnapshotReaderOptions;
using storage::SnapshotSelection;
using testing::TableBuilder;

void SetAge(const std::filesystem::path& path, std::chrono::hours age) {
  std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - age);
}

int64_t FirstId(const storage::RawSnapshot& snapshot) {
  auto id = storage::common::ColumnReader::Require(*snapshot.table, "id", snapshot.entity);
  return *id.Int(0);
}

void TestMissingAndEmptyDirectoriesReadAsAbsent() {
  const auto bronze = testing::MakeTempDir("snapshot_absent");
  std::filesystem::create_directories(bronze / "lojas");

  SnapshotReader reader({bronze.string()});
  assert(!reader.Read("clientes"));
  assert(!reader.Read("lojas"));

  bool threw = false;
  try {
    reader.Require("clientes");
  } catch (const util::MissingSourceError&) {
    threw = true;
  }
  assert(threw);
}

void TestNonParquetFilesAreIgnored() {
  const auto bronze = testing::MakeTempDir("snapshot_non_parquet");
  std::filesystem::create_directories(bronze / "lojas");
  {
    std::ofstream(bronze / "lojas" / "notes.txt") << "not a snapshot";
  }

  SnapshotReader reader({bronze.string()});
  assert(!reader.Read("lojas"));
  assert(reader.List("lojas").empty());
}

void TestNewestModificationTimeWins() {
  const auto bronze = testing::MakeTempDir("snapshot_mtime");

  auto older = TableBuilder().Int64("id", {1}).Build();
  auto newer = TableBuilder().Int64("id", {2}).Build();
  // the newer file sorts first by name, so only mtime can pick it
  SetAge(testing::WriteSnapshot(bronze, "lojas", *older, "b.parquet"), std::chrono::hours(48));
  SetAge(testing::WriteSnapshot(bronze, "lojas", *newer, "a.parquet"), std::chrono::hours(1));

  SnapshotReader reader({bronze.string()});
  assert(reader.List("lojas").size() == 2);

  auto snapshot = reader.Read("lojas");
  assert(snapshot);
  assert(snapshot->entity == "lojas");
  assert(FirstId(*snapshot) == 2);
  assert(snapshot->path.find("a.parquet") != std::string::npos);
}

void TestIngestionTimestampOverridesModificationTime() {
  const auto bronze = testing::MakeTempDir("snapshot_ingestion");

  auto early = TableBuilder().Int64("id", {1}).Timestamp("_ingestion_timestamp", {"2024-05-01T10:00:00Z"}).Build();
  auto late  = TableBuilder().Int64("id", {2}).Timestamp("_ingestion_timestamp", {"2024-05-02T10:00:00Z"}).Build();
  auto blank = TableBuilder().Int64("id", {3}).Build();

  // mtime order is the reverse of ingestion order
  SetAge(testing::WriteSnapshot(bronze, "vendas", *late, "late.parquet"), std::chrono::hours(72));
  SetAge(testing::WriteSnapshot(bronze, "vendas", *early, "early.parquet"), std::chrono::hours(24));
  SetAge(testing::WriteSnapshot(bronze, "vendas", *blank, "blank.parquet"), std::chrono::hours(1));

  SnapshotReaderOptions by_ingestion{bronze.string(), SnapshotSelection::kIngestionTimestamp};
  auto                  snapshot = SnapshotReader(by_ingestion).Read("vendas");
  assert(snapshot);
  assert(FirstId(*snapshot) == 2);

  auto by_mtime = SnapshotReader({bronze.string()}).Read("vendas");
  assert(by_mtime);
  assert(FirstId(*by_mtime) == 3);
}

void TestIngestionFallsBackToModificationTime() {
  const auto bronze = testing::MakeTempDir("snapshot_ingestion_fallback");

  SetAge(testing::WriteSnapshot(bronze, "estoque", *TableBuilder().Int64("id", {7}).Build(), "old.parquet"), std::chrono::hours(10));
  SetAge(testing::WriteSnapshot(bronze, "estoque", *TableBuilder().Int64("id", {8}).Build(), "new.parquet"), std::chrono::hours(2));

  auto snapshot = SnapshotReader({bronze.string(), SnapshotSelection::kIngestionTimestamp}).Read("estoque");
  assert(snapshot);
  assert(FirstId(*snapshot) == 8);
}

void TestRejectsPathLikeEntityNames() {
  const auto bronze = testing::MakeTempDir("snapshot_entity_names");
  SnapshotReader reader({bronze.string()});

  bool threw = false;
  try {
    reader.Read("../etc");
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestRequiresBronzeDirectory() {
  bool threw = false;
  try {
    SnapshotReader reader({""});
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMissingAndEmptyDirectoriesReadAsAbsent();
  TestNonParquetFilesAreIgnored();
  TestNewestModificationTimeWins();
  TestIngestionTimestampOverridesModificationTime();
  TestIngestionFallsBackToModificationTime();
  TestRejectsPathLikeEntityNames();
  TestRequiresBronzeDirectory();

  std::cout << "systock_unit_snapshot_reader: pass\n";
  return 0;
}
