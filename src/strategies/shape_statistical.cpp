#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/core/numeric.h>
#include <epoch_zones/strategies/default_strategies.h>

#include <spdlog/spdlog.h>

namespace epoch_zones::strategies {

FeatureMap
StatisticalShapeStrategy::Calculate(const epoch_frame::DataFrame &zone_data,
                                    const ColumnSelection &columns) const {
  FeatureMap features;
  if (!columns.primary || !frame::HasColumn(zone_data, *columns.primary)) {
    return features;
  }

  const auto values =
      numeric::DropNaN(frame::ColumnValues(zone_data, *columns.primary));
  if (values.size() < 3) {
    SPDLOG_DEBUG("shape: {} points, returning neutral shape", values.size());
    features["shape_skewness"] = 0.0;
    features["shape_kurtosis"] = 3.0;
    features["shape_smoothness"] = 0.0;
    return features;
  }

  // Constant series have no defined moments; report the neutral shape
  features["shape_skewness"] = numeric::Skewness(values).value_or(0.0);
  features["shape_kurtosis"] = numeric::Kurtosis(values).value_or(3.0);
  features["shape_smoothness"] =
      numeric::StdDev(numeric::Diff(values)).value_or(0.0);
  return features;
}

} // namespace epoch_zones::strategies
