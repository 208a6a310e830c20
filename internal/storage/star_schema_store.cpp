#include "star_schema_store.hpp"

#include <parquet/file_reader.h>
#include <parquet/metadata.h>

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <sstream>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace systock::storage {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::string_view kParquetExtension = ".parquet";

std::string BaseName(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string HumanSize(int64_t bytes) {
  static constexpr const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
  double                       value    = static_cast<double>(bytes);
  std::size_t                  unit     = 0;
  while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
    value /= 1024.0;
    ++unit;
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), unit == 0 ? "%.0f %s" : "%.1f %s", value, kUnits[unit]);
  return buffer;
}

} // namespace

StarSchemaStore::StarSchemaStore(StarSchemaStoreOptions options) : options_(std::move(options)) {
  if (options_.silver_dir.empty()) {
    throw util::ValidationError("star-schema store requires a silver directory");
  }
  std::tie(fs_, root_) = common::Unwrap(common::ResolveFileSystem(options_.silver_dir));
}

std::string StarSchemaStore::TablePath(const std::string& table_name, model::TableKind kind) const {
  common::ValidateComponent("table", table_name);
  return common::JoinPath(common::JoinPath(root_, model::KindDirectory(kind)), table_name + std::string(kParquetExtension));
}

std::string StarSchemaStore::Write(const std::string& table_name, model::TableKind kind, const arrow::Table& table) {
  const auto path = TablePath(table_name, kind);
  common::Unwrap(fs_->CreateDir(common::JoinPath(root_, model::KindDirectory(kind)), /*recursive=*/true));
  common::WriteParquetAtomic(*fs_, path, table, options_.compression);

  SYSTOCK_LOG_INFO("star-schema table written", {StringField("table", table_name), StringField("path", path), IntField("rows", table.num_rows())});
  return path;
}

std::optional<std::shared_ptr<arrow::Table>> StarSchemaStore::Read(const std::string& table_name, model::TableKind kind) const {
  const auto path = TablePath(table_name, kind);
  const auto info = common::Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) {
    SYSTOCK_LOG_WARN("star-schema table not found", {StringField("table", table_name), StringField("path", path)});
    return std::nullopt;
  }
  return common::ReadParquet(*fs_, path);
}

std::vector<TableStatistics> StarSchemaStore::Statistics() const {
  std::vector<TableStatistics> stats;

  for (auto kind : {model::TableKind::kDimension, model::TableKind::kFact}) {
    arrow::fs::FileSelector selector;
    selector.base_dir        = common::JoinPath(root_, model::KindDirectory(kind));
    selector.allow_not_found = true;

    auto infos = common::Unwrap(fs_->GetFileInfo(selector));
    std::sort(infos.begin(), infos.end(), [](const auto& lhs, const auto& rhs) { return lhs.path() < rhs.path(); });

    for (const auto& info : infos) {
      if (!info.IsFile() || !common::HasParquetExtension(info.path())) {
        continue;
      }

      auto input    = common::Unwrap(fs_->OpenInputFile(info.path()));
      auto reader   = parquet::ParquetFileReader::Open(input);
      auto metadata = reader->metadata();

      auto name = BaseName(info.path());
      name.resize(name.size() - kParquetExtension.size());

      TableStatistics entry;
      entry.table      = std::move(name);
      entry.kind       = kind;
      entry.rows       = metadata->num_rows();
      entry.columns    = metadata->num_columns();
      entry.size_bytes = info.size();
      stats.push_back(std::move(entry));
    }
  }
  return stats;
}

std::string StarSchemaStore::RenderReport() const {
  const auto stats = Statistics();

  std::ostringstream out;
  out << "star schema: " << options_.silver_dir << "\n";
  if (stats.empty()) {
    out << "  (no tables)\n";
    return out.str();
  }

  int64_t total_rows  = 0;
  int64_t total_bytes = 0;
  for (const auto& entry : stats) {
    char line[160];
    std::snprintf(line, sizeof(line), "  %-6s %-22s rows=%-10lld columns=%-3d size=%s\n", model::KindDirectory(entry.kind).c_str(),
                  entry.table.c_str(), static_cast<long long>(entry.rows), entry.columns, HumanSize(entry.size_bytes).c_str());
    out << line;
    total_rows += entry.rows;
    total_bytes += entry.size_bytes;
  }
  out << "  total: " << stats.size() << " tables, " << total_rows << " rows, " << HumanSize(total_bytes) << "\n";
  return out.str();
}

} // namespace systock::storage
