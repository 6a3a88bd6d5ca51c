#pragma once
//
// DataFrame access helpers
//
// All detection and analysis code reads the series through these helpers and
// works on plain std::vector<double> afterwards.
//

#include <epoch_frame/dataframe.h>

#include <cstdint>
#include <string>
#include <vector>

namespace epoch_zones::frame {

// Plain-data image of a DataFrame used by the persistence formats. Only the
// numeric columns are kept, as float64. FromSnapshot rebuilds the index as a
// UTC datetime index named "index".
struct FrameSnapshot {
  std::vector<int64_t> index;
  std::vector<std::string> columns;
  std::vector<std::vector<double>> values;

  bool operator==(const FrameSnapshot &) const = default;
};

[[nodiscard]] size_t RowCount(const epoch_frame::DataFrame &df);

[[nodiscard]] bool HasColumn(const epoch_frame::DataFrame &df,
                             const std::string &column);

[[nodiscard]] std::vector<std::string>
ColumnNames(const epoch_frame::DataFrame &df);

// Names of integer and floating point columns, in frame order
[[nodiscard]] std::vector<std::string>
NumericColumns(const epoch_frame::DataFrame &df);

// Column cast to float64. Throws std::runtime_error if the column is absent.
[[nodiscard]] std::vector<double>
ColumnValues(const epoch_frame::DataFrame &df, const std::string &column);

// Index as epoch nanoseconds UTC
[[nodiscard]] std::vector<int64_t>
Timestamps(const epoch_frame::DataFrame &df);

// Rows [start, end] inclusive
[[nodiscard]] epoch_frame::DataFrame Slice(const epoch_frame::DataFrame &df,
                                           int64_t start, int64_t end);

[[nodiscard]] epoch_frame::DataFrame
MakeFrame(const std::vector<int64_t> &timestamps,
          const std::vector<std::string> &columns,
          const std::vector<std::vector<double>> &values);

// Appends the columns of extra to base. Columns already present in base are
// replaced. Both frames must have the same number of rows.
[[nodiscard]] epoch_frame::DataFrame
MergeColumns(const epoch_frame::DataFrame &base,
             const epoch_frame::DataFrame &extra);

[[nodiscard]] FrameSnapshot ToSnapshot(const epoch_frame::DataFrame &df);
[[nodiscard]] epoch_frame::DataFrame
FromSnapshot(const FrameSnapshot &snapshot);

// Trailing rolling mean over the finite values in each window. Windows
// without a finite value yield NaN.
[[nodiscard]] std::vector<double> RollingMean(const std::vector<double> &values,
                                              size_t window);

} // namespace epoch_zones::frame
