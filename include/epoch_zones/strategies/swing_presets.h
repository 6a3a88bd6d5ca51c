#pragma once
//
// Swing presets, range-scaled thresholds and swing strategy construction
//
// A preset fixes the parameters of the zigzag, find_peaks and pivot_points
// strategies together. With auto thresholds the preset values are only the
// starting point: each scanned input raises the thresholds to match its own
// relative price range.
//

#include <epoch_zones/strategies/default_strategies.h>

#include <string>
#include <vector>

namespace epoch_zones::strategies {

struct SwingPreset {
  ZigZagOptions zigzag;
  FindPeaksOptions find_peaks;
  PivotPointsOptions pivot_points;
};

inline constexpr const char *kDefaultSwingPreset = "default";

// Throws ConfigurationError naming the available presets
[[nodiscard]] const SwingPreset &GetSwingPreset(const std::string &name);

[[nodiscard]] std::vector<std::string> SwingPresetNames();

// Throws ConfigurationError unless text is "per_zone" or "global"
[[nodiscard]] epoch_core::SwingScope ParseSwingScope(const std::string &text);

struct SwingThresholds {
  // Median close, mean close when the median is undefined
  double mid_price{0.0};
  // (max(high) - min(low)) / mid_price
  double relative_range{0.0};
  double zigzag_deviation{0.0};
  double peak_prominence{0.0};
  double pivot_deviation{0.0};
};

// Each threshold is the larger of base_deviation and a fixed share of the
// relative range (0.5 zigzag, 0.3 peaks, 0.25 pivots). An empty frame or a
// zero mid price gives base_deviation everywhere. Throws DataShapeError when
// high, low or close is missing.
[[nodiscard]] SwingThresholds
AutoSwingThresholds(const epoch_frame::DataFrame &data,
                    double base_deviation = 0.01);

// Runs one of the point based swing strategies with thresholds recomputed
// from every frame it scans. find_peaks takes peak_prominence both as its
// amplitude filter and, scaled by the mid price, as its prominence. Global
// contexts carry the amplitude filter they were built with, so zones
// aggregate with the series-wide thresholds.
class AdaptiveSwingStrategy final : public ISwingStrategy {
public:
  // name is "zigzag", "find_peaks" or "pivot_points"
  AdaptiveSwingStrategy(std::string name, SwingPreset preset,
                        double base_deviation = 0.01);

  [[nodiscard]] std::string Name() const override { return m_name; }

  [[nodiscard]] FeatureMap
  Calculate(const epoch_frame::DataFrame &zone_data,
            const ColumnSelection &columns) const override;

  [[nodiscard]] SwingContext
  CalculateGlobal(const epoch_frame::DataFrame &series) const override;

  [[nodiscard]] FeatureMap
  AggregateForZone(const Zone &zone, const SwingContext &context) const override;

  // Strategy configured for the given input
  [[nodiscard]] std::shared_ptr<const SwingPointStrategy>
  Configure(const epoch_frame::DataFrame &data) const;

private:
  std::string m_name;
  SwingPreset m_preset;
  double m_base_deviation;
};

// The swing strategy a run uses. zigzag, find_peaks and pivot_points take
// the preset's parameters and are wrapped in AdaptiveSwingStrategy when auto
// thresholds are enabled. Other names come from SwingStrategyRegistry as
// registered.
[[nodiscard]] ISwingStrategyPtr MakeSwingStrategy(const std::string &name,
                                                  const SwingConfig &config);

} // namespace epoch_zones::strategies
