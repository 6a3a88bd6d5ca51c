#include <epoch_zones/core/errors.h>
#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/core/numeric.h>
#include <epoch_zones/strategies/strategy_registry.h>
#include <epoch_zones/strategies/swing_presets.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <map>
#include <spdlog/spdlog.h>

namespace epoch_zones::strategies {

namespace {

const std::map<std::string, SwingPreset> &Presets() {
  static const std::map<std::string, SwingPreset> presets{
      {"default", SwingPreset{}},
      {"narrow_zone",
       SwingPreset{.zigzag = {.legs = 3, .deviation = 0.01},
                   .find_peaks = {.distance = 2,
                                  .prominence = std::nullopt,
                                  .min_amplitude_pct = 0.005},
                   .pivot_points = {.left_bars = 1,
                                    .right_bars = 1,
                                    .min_amplitude_pct = 0.005}}},
      {"wide_zone",
       SwingPreset{.zigzag = {.legs = 15, .deviation = 0.08},
                   .find_peaks = {.distance = 10,
                                  .prominence = std::nullopt,
                                  .min_amplitude_pct = 0.03},
                   .pivot_points = {.left_bars = 3,
                                    .right_bars = 3,
                                    .min_amplitude_pct = 0.025}}},
  };
  return presets;
}

bool IsPointStrategy(const std::string &name) {
  return name == "zigzag" || name == "find_peaks" || name == "pivot_points";
}

std::shared_ptr<const SwingPointStrategy>
MakePointStrategy(const std::string &name, const SwingPreset &preset) {
  if (name == "zigzag") {
    return std::make_shared<const ZigZagSwingStrategy>(preset.zigzag);
  }
  if (name == "find_peaks") {
    return std::make_shared<const FindPeaksSwingStrategy>(preset.find_peaks);
  }
  return std::make_shared<const PivotPointsSwingStrategy>(preset.pivot_points);
}

std::vector<double> Finite(std::vector<double> values) {
  std::erase_if(values, [](double value) { return !std::isfinite(value); });
  return values;
}

} // namespace

const SwingPreset &GetSwingPreset(const std::string &name) {
  const auto &presets = Presets();
  auto it = presets.find(name);
  if (it == presets.end()) {
    std::string available;
    for (const auto &[key, _] : presets) {
      available += available.empty() ? key : ", " + key;
    }
    throw ConfigurationError(std::format(
        "Unknown swing preset: '{}'. Available: {}", name, available));
  }
  return it->second;
}

std::vector<std::string> SwingPresetNames() {
  std::vector<std::string> names;
  for (const auto &[key, _] : Presets()) {
    names.push_back(key);
  }
  return names;
}

epoch_core::SwingScope ParseSwingScope(const std::string &text) {
  if (text != "per_zone" && text != "global") {
    throw ConfigurationError(std::format(
        "Invalid swing_scope: '{}'. Must be 'per_zone' or 'global'", text));
  }
  return epoch_core::SwingScopeWrapper::FromString(text);
}

SwingThresholds AutoSwingThresholds(const epoch_frame::DataFrame &data,
                                    double base_deviation) {
  SwingThresholds thresholds{.mid_price = 0.0,
                             .relative_range = base_deviation,
                             .zigzag_deviation = base_deviation,
                             .peak_prominence = base_deviation,
                             .pivot_deviation = base_deviation};
  if (frame::RowCount(data) == 0) {
    return thresholds;
  }
  for (const auto *column : {"high", "low", "close"}) {
    if (!frame::HasColumn(data, column)) {
      throw DataShapeError("auto_swing_thresholds", column);
    }
  }

  const auto high = Finite(frame::ColumnValues(data, "high"));
  const auto low = Finite(frame::ColumnValues(data, "low"));
  const auto close = frame::ColumnValues(data, "close");
  const double mid = numeric::Median(close).value_or(
      numeric::Mean(close).value_or(0.0));
  if (high.empty() || low.empty() || mid == 0.0 || !std::isfinite(mid)) {
    return thresholds;
  }

  const double range = *std::ranges::max_element(high) -
                       *std::ranges::min_element(low);
  thresholds.mid_price = mid;
  thresholds.relative_range = range / mid;
  thresholds.zigzag_deviation =
      std::max(base_deviation, 0.5 * thresholds.relative_range);
  thresholds.peak_prominence =
      std::max(base_deviation, 0.3 * thresholds.relative_range);
  thresholds.pivot_deviation =
      std::max(base_deviation, 0.25 * thresholds.relative_range);
  return thresholds;
}

AdaptiveSwingStrategy::AdaptiveSwingStrategy(std::string name,
                                             SwingPreset preset,
                                             double base_deviation)
    : m_name(std::move(name)), m_preset(preset),
      m_base_deviation(base_deviation) {
  if (!IsPointStrategy(m_name)) {
    throw ConfigurationError(std::format(
        "Auto swing thresholds support zigzag, find_peaks and pivot_points, "
        "not '{}'",
        m_name));
  }
  if (!(m_base_deviation > 0.0)) {
    throw ConfigurationError(std::format(
        "base_deviation must be positive, got {}", m_base_deviation));
  }
}

std::shared_ptr<const SwingPointStrategy>
AdaptiveSwingStrategy::Configure(const epoch_frame::DataFrame &data) const {
  const auto thresholds = AutoSwingThresholds(data, m_base_deviation);
  auto preset = m_preset;
  preset.zigzag.deviation = thresholds.zigzag_deviation;
  preset.find_peaks.min_amplitude_pct = thresholds.peak_prominence;
  if (thresholds.mid_price > 0.0) {
    preset.find_peaks.prominence =
        thresholds.peak_prominence * thresholds.mid_price;
  }
  preset.pivot_points.min_amplitude_pct = thresholds.pivot_deviation;
  SPDLOG_DEBUG("{}: adaptive thresholds range={:.4f} zigzag={:.4f} "
               "peaks={:.4f} pivots={:.4f}",
               m_name, thresholds.relative_range, thresholds.zigzag_deviation,
               thresholds.peak_prominence, thresholds.pivot_deviation);
  return MakePointStrategy(m_name, preset);
}

FeatureMap AdaptiveSwingStrategy::Calculate(const epoch_frame::DataFrame &zone_data,
                                            const ColumnSelection &columns) const {
  return Configure(zone_data)->Calculate(zone_data, columns);
}

SwingContext
AdaptiveSwingStrategy::CalculateGlobal(const epoch_frame::DataFrame &series) const {
  return Configure(series)->CalculateGlobal(series);
}

FeatureMap AdaptiveSwingStrategy::AggregateForZone(const Zone &zone,
                                                   const SwingContext &context) const {
  // The context carries the thresholds it was scanned with
  return MakePointStrategy(m_name, m_preset)->AggregateForZone(zone, context);
}

ISwingStrategyPtr MakeSwingStrategy(const std::string &name,
                                    const SwingConfig &config) {
  const auto &preset = GetSwingPreset(config.preset);
  if (!IsPointStrategy(name)) {
    if (config.auto_thresholds) {
      SPDLOG_WARN("swing strategy '{}' has no adaptive thresholds, using it "
                  "as registered",
                  name);
    }
    RegisterBuiltinAnalyticalStrategies();
    return SwingStrategyRegistry::Instance().Create(name);
  }
  if (config.auto_thresholds) {
    return std::make_shared<const AdaptiveSwingStrategy>(name, preset,
                                                         config.base_deviation);
  }
  return MakePointStrategy(name, preset);
}

} // namespace epoch_zones::strategies
