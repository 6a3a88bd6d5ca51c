#pragma once
//
// Descriptive statistics on plain vectors
//
// NaN entries are ignored by every reduction unless stated otherwise.
// Reductions over too few finite values return std::nullopt.
//

#include <cstddef>
#include <optional>
#include <vector>

namespace epoch_zones::numeric {

[[nodiscard]] std::vector<double> DropNaN(const std::vector<double> &values);

[[nodiscard]] std::optional<double> Mean(const std::vector<double> &values);

// Sample standard deviation (ddof = 1 by default)
[[nodiscard]] std::optional<double> StdDev(const std::vector<double> &values,
                                           size_t ddof = 1);

[[nodiscard]] std::optional<double> Median(const std::vector<double> &values);

// Linear-interpolated quantile, q in [0, 1]
[[nodiscard]] std::optional<double> Quantile(const std::vector<double> &values,
                                             double q);

// Biased (population) moment estimators; kurtosis is Pearson (normal = 3)
[[nodiscard]] std::optional<double> Skewness(const std::vector<double> &values);
[[nodiscard]] std::optional<double> Kurtosis(const std::vector<double> &values);

// Pearson correlation over pairwise-finite entries. Needs min_periods pairs
// and non-zero variance on both sides.
[[nodiscard]] std::optional<double>
Correlation(const std::vector<double> &x, const std::vector<double> &y,
            size_t min_periods = 3);

[[nodiscard]] std::vector<double> Diff(const std::vector<double> &values);

struct PeakOptions {
  size_t distance{1};
  double prominence{0.0};
};

// Local maxima filtered by minimum distance then by prominence. Flat tops
// report their middle position.
[[nodiscard]] std::vector<size_t> FindPeaks(const std::vector<double> &values,
                                            const PeakOptions &options = {});

} // namespace epoch_zones::numeric
