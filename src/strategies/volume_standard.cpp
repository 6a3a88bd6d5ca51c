#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/core/numeric.h>
#include <epoch_zones/strategies/default_strategies.h>

#include <algorithm>
#include <cmath>

namespace epoch_zones::strategies {

FeatureMap
StandardVolumeStrategy::Calculate(const epoch_frame::DataFrame &zone_data,
                                  const ColumnSelection &columns) const {
  FeatureMap features;
  if (!frame::HasColumn(zone_data, "volume")) {
    return features;
  }
  const auto volume = frame::ColumnValues(zone_data, "volume");
  const bool has_volume = std::ranges::any_of(
      volume, [](double v) { return std::isfinite(v) && v != 0.0; });
  if (!has_volume) {
    return features;
  }

  const double avg = *numeric::Mean(volume);
  features["volume_avg"] = avg;

  if (std::isfinite(volume.front()) && volume.front() > 0.0) {
    features["volume_ratio"] = avg / volume.front();
  }

  const size_t half = volume.size() / 2;
  if (half > 0) {
    const auto first = numeric::Mean({volume.begin(), volume.begin() + half});
    const auto second = numeric::Mean({volume.begin() + half, volume.end()});
    if (first && second && *first > 0.0) {
      features["volume_entry_change"] = *second / *first - 1.0;
    }
  }

  if (columns.primary && frame::HasColumn(zone_data, *columns.primary)) {
    if (auto corr = numeric::Correlation(
            volume, frame::ColumnValues(zone_data, *columns.primary), 3)) {
      features["volume_indicator_corr"] = *corr;
    }
  }
  return features;
}

} // namespace epoch_zones::strategies
