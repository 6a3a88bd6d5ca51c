//
// DataFrame access helpers
//
#include <epoch_zones/core/frame_utils.h>

#include <arrow/table.h>
#include <arrow/type.h>
#include <epoch_frame/factory/array_factory.h>
#include <epoch_frame/factory/dataframe_factory.h>
#include <epoch_frame/factory/index_factory.h>
#include <epoch_frame/index.h>
#include <epoch_frame/series.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace epoch_zones::frame {

namespace {
bool IsNumericType(arrow::Type::type type_id) {
  return type_id == arrow::Type::DOUBLE || type_id == arrow::Type::FLOAT ||
         type_id == arrow::Type::INT64 || type_id == arrow::Type::INT32 ||
         type_id == arrow::Type::INT16 || type_id == arrow::Type::INT8 ||
         type_id == arrow::Type::UINT64 || type_id == arrow::Type::UINT32 ||
         type_id == arrow::Type::UINT16 || type_id == arrow::Type::UINT8;
}
} // namespace

size_t RowCount(const epoch_frame::DataFrame &df) {
  if (!df.table()) {
    return 0;
  }
  return df.num_rows();
}

bool HasColumn(const epoch_frame::DataFrame &df, const std::string &column) {
  return df.table() && df.contains(column);
}

std::vector<std::string> ColumnNames(const epoch_frame::DataFrame &df) {
  if (!df.table()) {
    return {};
  }
  return df.column_names();
}

std::vector<std::string> NumericColumns(const epoch_frame::DataFrame &df) {
  std::vector<std::string> numeric_columns;
  if (!df.table()) {
    return numeric_columns;
  }

  auto schema = df.table()->schema();
  for (int i = 0; i < schema->num_fields(); ++i) {
    auto field = schema->field(i);
    if (IsNumericType(field->type()->id())) {
      numeric_columns.push_back(field->name());
    }
  }
  return numeric_columns;
}

std::vector<double> ColumnValues(const epoch_frame::DataFrame &df,
                                 const std::string &column) {
  if (!HasColumn(df, column)) {
    throw std::runtime_error(
        std::format("Column '{}' not found in DataFrame", column));
  }
  if (RowCount(df) == 0) {
    return {};
  }

  auto column_array = df[column].contiguous_array();
  if (column_array.type()->id() != arrow::Type::DOUBLE) {
    column_array = column_array.cast(arrow::float64());
  }
  return column_array.to_vector<double>();
}

std::vector<int64_t> Timestamps(const epoch_frame::DataFrame &df) {
  const size_t n = RowCount(df);
  if (n == 0) {
    return {};
  }
  const int64_t *raw = df.index()->array().to_timestamp_view()->raw_values();
  return std::vector<int64_t>(raw, raw + n);
}

epoch_frame::DataFrame Slice(const epoch_frame::DataFrame &df, int64_t start,
                             int64_t end) {
  return df.iloc({start, end + 1, std::nullopt});
}

epoch_frame::DataFrame MakeFrame(const std::vector<int64_t> &timestamps,
                                 const std::vector<std::string> &columns,
                                 const std::vector<std::vector<double>> &values) {
  if (columns.size() != values.size()) {
    throw std::invalid_argument(
        std::format("MakeFrame: {} column names for {} value arrays",
                    columns.size(), values.size()));
  }
  for (size_t i = 0; i < values.size(); ++i) {
    if (values[i].size() != timestamps.size()) {
      throw std::invalid_argument(
          std::format("MakeFrame: column '{}' has {} values for {} rows",
                      columns[i], values[i].size(), timestamps.size()));
    }
  }

  auto index = epoch_frame::factory::index::make_datetime_index(
      timestamps, "index", "UTC");
  return epoch_frame::make_dataframe<double>(index, values, columns);
}

epoch_frame::DataFrame MergeColumns(const epoch_frame::DataFrame &base,
                                    const epoch_frame::DataFrame &extra) {
  if (RowCount(base) != RowCount(extra)) {
    throw std::invalid_argument(
        std::format("MergeColumns: row count mismatch ({} vs {})",
                    RowCount(base), RowCount(extra)));
  }

  const auto extra_columns = ColumnNames(extra);
  std::vector<std::string> names;
  std::vector<arrow::ChunkedArrayPtr> arrays;
  for (const auto &column : ColumnNames(base)) {
    if (std::ranges::find(extra_columns, column) != extra_columns.end()) {
      continue;
    }
    names.push_back(column);
    arrays.push_back(base[column].array());
  }
  for (const auto &column : extra_columns) {
    names.push_back(column);
    arrays.push_back(epoch_frame::factory::array::make_array(
        ColumnValues(extra, column)));
  }
  return epoch_frame::make_dataframe(base.index(), arrays, names);
}

FrameSnapshot ToSnapshot(const epoch_frame::DataFrame &df) {
  FrameSnapshot snapshot;
  snapshot.index = Timestamps(df);
  for (const auto &column : NumericColumns(df)) {
    snapshot.columns.push_back(column);
    snapshot.values.push_back(ColumnValues(df, column));
  }
  return snapshot;
}

epoch_frame::DataFrame FromSnapshot(const FrameSnapshot &snapshot) {
  return MakeFrame(snapshot.index, snapshot.columns, snapshot.values);
}

std::vector<double> RollingMean(const std::vector<double> &values,
                                size_t window) {
  if (window <= 1) {
    return values;
  }
  std::vector<double> result(values.size(),
                             std::numeric_limits<double>::quiet_NaN());
  double sum = 0.0;
  size_t count = 0;
  for (size_t i = 0; i < values.size(); ++i) {
    if (std::isfinite(values[i])) {
      sum += values[i];
      ++count;
    }
    if (i >= window && std::isfinite(values[i - window])) {
      sum -= values[i - window];
      --count;
    }
    if (count > 0) {
      result[i] = sum / static_cast<double>(count);
    }
  }
  return result;
}

} // namespace epoch_zones::frame
