#include "merge_loader.hpp"

#include <algorithm>
#include <chrono>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/column_reader.hpp"
#include "internal/util/dedupe.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace systock::load {

using db::sql::ColumnType;
using observability::IntField;
using observability::StringField;
using storage::common::ColumnReader;

namespace {

std::string KeyColumns(const db::sql::TableSpec& spec) {
  std::string out;
  for (const auto& column : spec.key_columns) {
    if (!out.empty()) out += ",";
    out += column;
  }
  return out;
}

template <typename T, typename Fn>
db::sql::Value OrNull(const std::optional<T>& v, Fn convert) {
  if (!v) return nullptr;
  return convert(*v);
}

db::sql::Value ReadValue(const ColumnReader& column, ColumnType type, int64_t i) {
  switch (type) {
    case ColumnType::kInteger:
      return OrNull(column.Int(i), [](int64_t x) { return db::sql::Value{x}; });
    case ColumnType::kDouble:
      return OrNull(column.Double(i), [](double x) { return db::sql::Value{x}; });
    case ColumnType::kBoolean:
      return OrNull(column.Bool(i), [](bool x) { return db::sql::Value{x}; });
    case ColumnType::kDate:
      return OrNull(column.Date(i), [](util::Days d) { return db::sql::Value{util::FormatDate(d)}; });
    case ColumnType::kTimestamp:
      return OrNull(column.Timestamp(i), [](util::TimePoint tp) { return db::sql::Value{util::FormatTimestamp(tp)}; });
    case ColumnType::kText:
      break;
  }
  return OrNull(column.String(i), [](const std::string& s) { return db::sql::Value{s}; });
}

} // namespace

MergeLoader::MergeLoader(std::shared_ptr<db::WarehouseRepository> repository, MergeOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw util::ValidationError("merge loader requires a warehouse repository");
  }
  if (options_.batch_size == 0) {
    options_.batch_size = 1;
  }
}

std::vector<db::sql::Row> MergeLoader::ToRows(const db::sql::TableSpec& spec, const arrow::Table& table) {
  std::vector<ColumnReader> columns;
  columns.reserve(spec.columns.size());
  for (const auto& column : spec.columns) {
    columns.push_back(ColumnReader::Require(table, column.source, spec.source_table));
  }

  std::vector<db::sql::Row> rows;
  rows.reserve(static_cast<std::size_t>(table.num_rows()));
  for (int64_t i = 0; i < table.num_rows(); ++i) {
    db::sql::Row row;
    row.reserve(columns.size());
    for (std::size_t c = 0; c < columns.size(); ++c) {
      row.push_back(ReadValue(columns[c], spec.columns[c].type, i));
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

MergeResult MergeLoader::Merge(const db::sql::TableSpec& spec, const arrow::Table& table) const {
  observability::SpanScope span("systock.merge");
  span.SetAttribute("table", spec.name);
  const auto start = std::chrono::steady_clock::now();

  MergeResult result;
  result.input_rows = static_cast<uint64_t>(table.num_rows());

  if (table.num_rows() == 0) {
    SYSTOCK_LOG_INFO("nothing to merge", {StringField("table", spec.name)});
    return result;
  }

  const auto key_indexes = spec.KeyIndexes();
  if (key_indexes.empty() || key_indexes.size() != spec.key_columns.size()) {
    throw util::LoadError("table " + spec.name + " has key columns outside its column list");
  }

  auto rows = ToRows(spec, table);

  const auto with_keys = std::remove_if(rows.begin(), rows.end(), [&](const db::sql::Row& row) {
    return std::any_of(key_indexes.begin(), key_indexes.end(), [&](std::size_t k) { return db::sql::IsNull(row[k]); });
  });
  result.skipped_null_keys = static_cast<uint64_t>(std::distance(with_keys, rows.end()));
  rows.erase(with_keys, rows.end());
  if (result.skipped_null_keys > 0) {
    SYSTOCK_LOG_WARN("rows without a natural key skipped", {StringField("table", spec.name), StringField("key", KeyColumns(spec)),
                                                            IntField("rows", static_cast<int64_t>(result.skipped_null_keys))});
  }

  const auto before_dedupe = rows.size();
  rows = util::KeepLastByKey(
      std::move(rows),
      [&](const db::sql::Row& row) {
        db::sql::Row key;
        for (auto k : key_indexes) key.push_back(row[k]);
        return key;
      },
      db::sql::RowLess{});
  result.duplicates_collapsed = static_cast<uint64_t>(before_dedupe - rows.size());
  if (result.duplicates_collapsed > 0) {
    SYSTOCK_LOG_WARN("rows sharing a natural key collapsed, last one kept",
                     {StringField("table", spec.name), StringField("key", KeyColumns(spec)),
                      IntField("rows", static_cast<int64_t>(result.duplicates_collapsed))});
  }

  std::unique_ptr<db::Session> session;
  try {
    session = repository_->Connect();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::LoadError("cannot connect to " + repository_->Backend() + " warehouse: " + e.what());
  }

  for (std::size_t begin = 0; begin < rows.size(); begin += options_.batch_size) {
    const auto end = std::min(rows.size(), begin + options_.batch_size);
    const std::vector<db::sql::Row> batch(rows.begin() + static_cast<std::ptrdiff_t>(begin), rows.begin() + static_cast<std::ptrdiff_t>(end));

    db::Result status;
    uint64_t   affected = 0;
    try {
      auto tx = session->Begin();
      status  = repository_->UpsertRows(*tx, spec, batch, &affected);
      if (status) {
        tx->Commit();
      }
    } catch (const std::exception& e) {
      status = db::Result::Err(db::ErrorCode::InternalError, e.what());
    }

    if (!status) {
      SYSTOCK_LOG_ERROR("merge batch failed", {StringField("table", spec.name), IntField("batch", static_cast<int64_t>(result.batches)),
                                               StringField("code", db::ErrorCodeName(status.code)), StringField("error", status.message)});
      span.RecordException(status.message);
      throw util::LoadError("merge into " + spec.name + " failed at batch " + std::to_string(result.batches) + ": " + status.message);
    }

    result.inserted_or_updated += affected;
    ++result.batches;
  }

  observability::Metrics::Instance().AddRowsMerged(spec.name, result.inserted_or_updated);
  observability::Metrics::Instance().ObserveStageDurationMs("merge", observability::ElapsedMs(start));
  span.SetAttribute("rows", static_cast<int64_t>(result.inserted_or_updated));

  SYSTOCK_LOG_INFO("merge complete", {StringField("table", spec.name), IntField("input_rows", static_cast<int64_t>(result.input_rows)),
                                      IntField("duplicates", static_cast<int64_t>(result.duplicates_collapsed)),
                                      IntField("merged", static_cast<int64_t>(result.inserted_or_updated)),
                                      IntField("batches", static_cast<int64_t>(result.batches))});
  return result;
}

void MergeLoader::EnsureTables(const std::vector<db::sql::TableSpec>& specs) const {
  db::Result status;
  try {
    auto session = repository_->Connect();
    auto tx      = session->Begin();
    for (const auto& spec : specs) {
      status = repository_->EnsureTable(*tx, spec);
      if (!status) {
        status.message = spec.name + ": " + status.message;
        break;
      }
    }
    if (status) {
      tx->Commit();
    }
  } catch (const std::exception& e) {
    status = db::Result::Err(db::ErrorCode::InternalError, e.what());
  }

  if (!status) {
    throw util::LoadError("warehouse bootstrap failed: " + status.message);
  }
  SYSTOCK_LOG_INFO("warehouse tables ensured", {StringField("backend", repository_->Backend()), IntField("tables", static_cast<int64_t>(specs.size()))});
}

} // namespace systock::load
