#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/table.h>
#include <arrow/util/compression.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace systock::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return std::move(result).ValueOrDie();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Local paths and URIs (file://, s3://, gs://, ...) both resolve.
  Returns the filesystem plus the path inside it.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& path);

arrow::Compression::type ResolveCompression(systock::runtime::config::Compression compression);

std::shared_ptr<arrow::Table> ReadParquet(arrow::fs::FileSystem& fs, const std::string& path);

// Writes to "<path>.tmp" then moves it over path.
void WriteParquetAtomic(arrow::fs::FileSystem& fs, const std::string& path, const arrow::Table& table, arrow::Compression::type compression);

} // namespace systock::storage::common
