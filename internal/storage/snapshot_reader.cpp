#include "snapshot_reader.hpp"

#include <algorithm>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/column_reader.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace systock::storage {

using observability::IntField;
using observability::StringField;

namespace {

bool NewerByModificationTime(const SnapshotFile& lhs, const SnapshotFile& rhs) {
  return std::tie(lhs.modified, lhs.path) > std::tie(rhs.modified, rhs.path);
}

} // namespace

SnapshotReader::SnapshotReader(SnapshotReaderOptions options) : options_(std::move(options)) {
  if (options_.bronze_dir.empty()) {
    throw util::ValidationError("snapshot reader requires a bronze directory");
  }
  std::tie(fs_, root_) = common::Unwrap(common::ResolveFileSystem(options_.bronze_dir));
}

std::vector<SnapshotFile> SnapshotReader::List(const std::string& entity) const {
  common::ValidateComponent("entity", entity);

  arrow::fs::FileSelector selector;
  selector.base_dir       = common::JoinPath(root_, entity);
  selector.recursive      = false;
  selector.allow_not_found = true;

  std::vector<SnapshotFile> files;
  for (const auto& info : common::Unwrap(fs_->GetFileInfo(selector))) {
    if (!info.IsFile() || !common::HasParquetExtension(info.path())) {
      continue;
    }
    files.push_back({info.path(), std::chrono::time_point_cast<util::Clock::duration>(info.mtime())});
  }
  return files;
}

std::optional<RawSnapshot> SnapshotReader::Read(const std::string& entity) const {
  common::ValidateComponent("entity", entity);

  const auto dir  = common::JoinPath(root_, entity);
  const auto info = common::Unwrap(fs_->GetFileInfo(dir));
  if (info.type() != arrow::fs::FileType::Directory) {
    SYSTOCK_LOG_WARN("snapshot directory not found", {StringField("entity", entity), StringField("path", dir)});
    return std::nullopt;
  }

  auto files = List(entity);
  if (files.empty()) {
    SYSTOCK_LOG_WARN("snapshot directory has no parquet files", {StringField("entity", entity), StringField("path", dir)});
    return std::nullopt;
  }

  if (options_.selection == SnapshotSelection::kIngestionTimestamp) {
    return SelectByIngestionTimestamp(entity, std::move(files));
  }
  return SelectByModificationTime(entity, std::move(files));
}

RawSnapshot SnapshotReader::Require(const std::string& entity) const {
  auto snapshot = Read(entity);
  if (!snapshot) {
    throw util::MissingSourceError("no raw snapshot for entity '" + entity + "'");
  }
  return std::move(*snapshot);
}

std::optional<RawSnapshot> SnapshotReader::SelectByModificationTime(const std::string& entity, std::vector<SnapshotFile> files) const {
  const auto newest = std::min_element(files.begin(), files.end(), NewerByModificationTime);

  RawSnapshot snapshot{entity, newest->path, common::ReadParquet(*fs_, newest->path)};
  SYSTOCK_LOG_INFO("snapshot selected", {StringField("entity", entity), StringField("path", snapshot.path),
                                         IntField("rows", snapshot.table->num_rows()), IntField("candidates", static_cast<int64_t>(files.size()))});
  return snapshot;
}

std::optional<RawSnapshot> SnapshotReader::SelectByIngestionTimestamp(const std::string& entity, std::vector<SnapshotFile> files) const {
  // Candidates are visited newest-mtime first so ties keep the mtime order.
  std::sort(files.begin(), files.end(), NewerByModificationTime);

  std::optional<RawSnapshot>     best;
  std::optional<util::TimePoint> best_ingested;

  for (const auto& file : files) {
    auto table = common::ReadParquet(*fs_, file.path);

    std::optional<util::TimePoint> ingested;
    if (auto column = common::ColumnReader::Find(*table, options_.ingestion_timestamp_column)) {
      for (int64_t i = 0; i < column->length(); ++i) {
        auto value = column->Timestamp(i);
        if (value && (!ingested || *value > *ingested)) {
          ingested = value;
        }
      }
    }

    const bool better = !best || (ingested && (!best_ingested || *ingested > *best_ingested));
    if (better) {
      best          = RawSnapshot{entity, file.path, std::move(table)};
      best_ingested = ingested;
    }
  }

  if (!best_ingested) {
    SYSTOCK_LOG_WARN("no ingestion timestamp found; using modification time",
                     {StringField("entity", entity), StringField("column", options_.ingestion_timestamp_column)});
  }

  SYSTOCK_LOG_INFO("snapshot selected", {StringField("entity", entity), StringField("path", best->path),
                                         IntField("rows", best->table->num_rows()), IntField("candidates", static_cast<int64_t>(files.size()))});
  return best;
}

} // namespace systock::storage
