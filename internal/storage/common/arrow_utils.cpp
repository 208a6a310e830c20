#include "arrow_utils.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/memory_pool.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include <algorithm>

namespace systock::storage::common {

namespace {

constexpr int64_t kRowGroupSize = 64 * 1024;

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& path) {
  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(path, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

arrow::Compression::type ResolveCompression(systock::runtime::config::Compression compression) {
  switch (compression) {
    case systock::runtime::config::COMPRESSION_UNCOMPRESSED:
      return arrow::Compression::UNCOMPRESSED;
    case systock::runtime::config::COMPRESSION_GZIP:
      return arrow::Compression::GZIP;
    case systock::runtime::config::COMPRESSION_ZSTD:
      return arrow::Compression::ZSTD;
    case systock::runtime::config::COMPRESSION_LZ4:
      return arrow::Compression::LZ4;
    case systock::runtime::config::COMPRESSION_BROTLI:
      return arrow::Compression::BROTLI;
    case systock::runtime::config::COMPRESSION_SNAPPY:
    default:
      return arrow::Compression::SNAPPY;
  }
}

std::shared_ptr<arrow::Table> ReadParquet(arrow::fs::FileSystem& fs, const std::string& path) {
  auto input  = Unwrap(fs.OpenInputFile(path));
  auto reader = Unwrap(parquet::arrow::OpenFile(input, arrow::default_memory_pool()));

  std::shared_ptr<arrow::Table> table;
  Unwrap(reader->ReadTable(&table));
  return table;
}

void WriteParquetAtomic(arrow::fs::FileSystem& fs, const std::string& path, const arrow::Table& table, arrow::Compression::type compression) {
  const auto tmp_path = path + ".tmp";

  parquet::WriterProperties::Builder builder;
  builder.compression(compression);
  auto writer_props = builder.build();
  auto arrow_props  = parquet::ArrowWriterProperties::Builder().store_schema()->build();

  {
    auto output     = Unwrap(fs.OpenOutputStream(tmp_path));
    auto chunk_size = std::max<int64_t>(1, std::min<int64_t>(table.num_rows(), kRowGroupSize));
    auto status     = parquet::arrow::WriteTable(table, arrow::default_memory_pool(), output, chunk_size, writer_props, arrow_props);
    if (!status.ok()) {
      (void)output->Close();
      (void)fs.DeleteFile(tmp_path);
      throw std::runtime_error("parquet write failed for " + path + ": " + status.ToString());
    }
    Unwrap(output->Close());
  }

  Unwrap(fs.Move(tmp_path, path));
}

} // namespace systock::storage::common
