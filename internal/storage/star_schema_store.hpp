#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/table.h>
#include <arrow/util/compression.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/star_schema.hpp"

namespace systock::storage {

struct StarSchemaStoreOptions {
  std::string              silver_dir;
  arrow::Compression::type compression{arrow::Compression::SNAPPY};
};

struct TableStatistics {
  std::string      table;
  model::TableKind kind{model::TableKind::kDimension};
  int64_t          rows{0};
  int              columns{0};
  int64_t          size_bytes{0};
};

/*
  StarSchemaStore

  Intermediate star-schema tables as Parquet:
    <silver_dir>/dims/<table>.parquet
    <silver_dir>/facts/<table>.parquet

  Writes replace the previous file atomically.
*/
class StarSchemaStore {
 public:
  explicit StarSchemaStore(StarSchemaStoreOptions options);

  // Returns the written path.
  std::string Write(const std::string& table_name, model::TableKind kind, const arrow::Table& table);

  std::optional<std::shared_ptr<arrow::Table>> Read(const std::string& table_name, model::TableKind kind) const;

  std::vector<TableStatistics> Statistics() const;

  std::string RenderReport() const;

 private:
  std::string TablePath(const std::string& table_name, model::TableKind kind) const;

  StarSchemaStoreOptions                 options_;
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_;
};

} // namespace systock::storage
