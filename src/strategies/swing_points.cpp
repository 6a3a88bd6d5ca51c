#include "swing_common.h"

#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/core/numeric.h>
#include <epoch_zones/strategies/default_strategies.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace epoch_zones::strategies {

namespace {

struct Movement {
  double amplitude_pct;
  double duration_bars;
  double speed;
};

struct PriceBars {
  std::vector<double> high;
  std::vector<double> low;
};

std::optional<PriceBars> ReadPriceBars(const epoch_frame::DataFrame &data) {
  if (!frame::HasColumn(data, "close") || frame::RowCount(data) == 0) {
    return std::nullopt;
  }
  const auto close = frame::ColumnValues(data, "close");
  return PriceBars{frame::HasColumn(data, "high")
                       ? frame::ColumnValues(data, "high")
                       : close,
                   frame::HasColumn(data, "low")
                       ? frame::ColumnValues(data, "low")
                       : close};
}

void AddLegFeatures(FeatureMap &features, const std::string &prefix,
                    const std::vector<Movement> &legs) {
  std::vector<double> amplitudes;
  std::vector<double> durations;
  std::vector<double> speeds;
  for (const auto &leg : legs) {
    amplitudes.push_back(leg.amplitude_pct);
    durations.push_back(leg.duration_bars);
    speeds.push_back(leg.speed);
  }
  const auto max_or_zero = [](const std::vector<double> &v) {
    return v.empty() ? 0.0 : *std::ranges::max_element(v);
  };

  features[prefix + "_count"] = static_cast<double>(legs.size());
  features[prefix + "_avg_pct"] = numeric::Mean(amplitudes).value_or(0.0);
  features[prefix + "_max_pct"] = max_or_zero(amplitudes);
  features[prefix + "_min_pct"] =
      amplitudes.empty() ? 0.0 : *std::ranges::min_element(amplitudes);
  features[prefix + "_std_pct"] = numeric::StdDev(amplitudes, 0).value_or(0.0);
  features[prefix + "_median_pct"] = numeric::Median(amplitudes).value_or(0.0);
  features[prefix + "_avg_duration"] = numeric::Mean(durations).value_or(0.0);
  features[prefix + "_max_duration"] = max_or_zero(durations);
  features[prefix + "_avg_speed"] = numeric::Mean(speeds).value_or(0.0);
  features[prefix + "_max_speed"] = max_or_zero(speeds);
}

// Moves between consecutive points, split by direction
FeatureMap MeasureSwings(const std::vector<SwingPoint> &points,
                         double min_amplitude) {
  std::vector<Movement> rallies;
  std::vector<Movement> drops;
  for (size_t i = 1; i < points.size(); ++i) {
    const auto &from = points[i - 1];
    const auto &to = points[i];
    if (to.position <= from.position || from.price == 0.0) {
      continue;
    }
    const double bars = static_cast<double>(to.position - from.position);
    const double change_pct = (to.price / from.price - 1.0) * 100.0;
    if (!std::isfinite(change_pct) ||
        std::abs(change_pct) < min_amplitude * 100.0) {
      continue;
    }
    const Movement movement{std::abs(change_pct), bars,
                            std::abs(change_pct) / bars};
    if (change_pct > 0) {
      rallies.push_back(movement);
    } else if (change_pct < 0) {
      drops.push_back(movement);
    }
  }

  FeatureMap features;
  AddLegFeatures(features, "rally", rallies);
  AddLegFeatures(features, "drop", drops);

  const double avg_rally = std::get<double>(features["rally_avg_pct"]);
  const double avg_drop = std::get<double>(features["drop_avg_pct"]);
  const double rally_duration = std::get<double>(features["rally_avg_duration"]);
  const double drop_duration = std::get<double>(features["drop_avg_duration"]);
  features["swing_count"] =
      static_cast<double>(std::min(rallies.size(), drops.size()));
  features["rally_to_drop_ratio"] = avg_drop > 0 ? avg_rally / avg_drop : 0.0;
  features["duration_symmetry"] =
      drop_duration > 0 ? rally_duration / drop_duration : 0.0;
  return features;
}

} // namespace

namespace swing {

std::vector<SwingPoint> MergeExtrema(const std::vector<size_t> &peaks,
                                     const std::vector<size_t> &troughs,
                                     const std::vector<double> &high,
                                     const std::vector<double> &low) {
  std::vector<SwingPoint> points;
  points.reserve(peaks.size() + troughs.size());
  for (const auto position : peaks) {
    points.push_back({position, high[position], true});
  }
  for (const auto position : troughs) {
    points.push_back({position, low[position], false});
  }
  std::ranges::stable_sort(points, {}, &SwingPoint::position);
  return points;
}

} // namespace swing

FeatureMap SwingPointStrategy::Calculate(const epoch_frame::DataFrame &zone_data,
                                         const ColumnSelection &) const {
  const auto bars = ReadPriceBars(zone_data);
  if (!bars) {
    return {};
  }
  const auto points = FindSwingPoints(bars->high, bars->low);
  SPDLOG_DEBUG("{}: {} swing points over {} bars", Name(), points.size(),
               bars->high.size());
  return MeasureSwings(points, MinAmplitude());
}

SwingContext
SwingPointStrategy::CalculateGlobal(const epoch_frame::DataFrame &series) const {
  const auto bars = ReadPriceBars(series);
  if (!bars) {
    throw std::invalid_argument(std::format(
        "{}: global swings need a non-empty series with a close column",
        Name()));
  }
  SwingContext context{.strategy_name = Name(),
                       .series_length = bars->high.size(),
                       .min_amplitude = MinAmplitude(),
                       .points = FindSwingPoints(bars->high, bars->low)};
  SPDLOG_INFO("{}: {} global swing points over {} bars", Name(),
              context.points.size(), context.series_length);
  return context;
}

FeatureMap SwingPointStrategy::AggregateForZone(const Zone &zone,
                                                const SwingContext &context) const {
  const auto points = context.PointsWithin(zone.start_idx, zone.end_idx);
  if (points.size() < 2) {
    SPDLOG_DEBUG("zone {}: {} global swing points inside", zone.zone_id,
                 points.size());
  }
  return MeasureSwings(points, context.min_amplitude);
}

} // namespace epoch_zones::strategies
