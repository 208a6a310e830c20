#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/table.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace systock::storage {

enum class SnapshotSelection {
  kModificationTime,
  kIngestionTimestamp,
};

struct SnapshotReaderOptions {
  std::string       bronze_dir;
  SnapshotSelection selection{SnapshotSelection::kModificationTime};
  std::string       ingestion_timestamp_column{"_ingestion_timestamp"};
};

struct SnapshotFile {
  std::string     path;
  util::TimePoint modified;
};

struct RawSnapshot {
  std::string                   entity;
  std::string                   path;
  std::shared_ptr<arrow::Table> table;
};

/*
  SnapshotReader

  Raw snapshots live under <bronze_dir>/<entity>/ as Parquet files,
  one file per extraction run. Read() picks the most recent one:

  - kModificationTime: newest storage mtime; ties go to the
    lexicographically greatest file name.
  - kIngestionTimestamp: greatest value of the embedded ingestion
    column; files without a usable value rank below all others and
    fall back to mtime among themselves.

  A missing entity directory and an empty one both read as "not found".
*/
class SnapshotReader {
 public:
  explicit SnapshotReader(SnapshotReaderOptions options);

  std::optional<RawSnapshot> Read(const std::string& entity) const;

  // Throws util::MissingSourceError when Read() would return nullopt.
  RawSnapshot Require(const std::string& entity) const;

  // Parquet files present for an entity, unordered.
  std::vector<SnapshotFile> List(const std::string& entity) const;

  const SnapshotReaderOptions& options() const {
    return options_;
  }

 private:
  std::optional<RawSnapshot> SelectByModificationTime(const std::string& entity, std::vector<SnapshotFile> files) const;
  std::optional<RawSnapshot> SelectByIngestionTimestamp(const std::string& entity, std::vector<SnapshotFile> files) const;

  SnapshotReaderOptions                 options_;
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                           root_;
};

} // namespace systock::storage
