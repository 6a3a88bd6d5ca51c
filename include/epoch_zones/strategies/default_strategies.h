#pragma once
//
// Reference implementations of the analytical slots
//

#include <epoch_core/macros.h>
#include <epoch_zones/strategies/ianalytical_strategy.h>

namespace epoch_zones::strategies {

// shape_skewness, shape_kurtosis (Pearson, normal = 3), shape_smoothness
// (std of the first difference). Fewer than 3 points gives 0 / 3 / 0.
class StatisticalShapeStrategy final : public IShapeStrategy {
public:
  [[nodiscard]] std::string Name() const override { return "statistical"; }

  [[nodiscard]] FeatureMap
  Calculate(const epoch_frame::DataFrame &zone_data,
            const ColumnSelection &columns) const override;
};

struct ClassicDivergenceOptions {
  size_t min_peak_distance{5};
  double min_strength{0.01};
  // Indicator extreme must lie within this many bars of the price extreme
  size_t max_pairing_distance{10};
};

// Regular divergences between price extremes (high / low) and indicator
// extremes. The secondary column is used as indicator when present.
class ClassicDivergenceStrategy final : public IDivergenceStrategy {
public:
  explicit ClassicDivergenceStrategy(ClassicDivergenceOptions options = {})
      : m_options(options) {
    AssertFromFormat(m_options.min_peak_distance > 0,
                     "min_peak_distance must be positive");
  }

  [[nodiscard]] std::string Name() const override { return "classic"; }

  [[nodiscard]] FeatureMap
  Calculate(const epoch_frame::DataFrame &zone_data,
            const ColumnSelection &columns) const override;

private:
  ClassicDivergenceOptions m_options;
};

struct CombinedVolatilityOptions {
  size_t bb_length{20};
  double bb_std{2.0};
  double touch_threshold{0.01};
};

// Bollinger band width and touches plus ATR (the "atr" column when present,
// otherwise the true range)
class CombinedVolatilityStrategy final : public IVolatilityStrategy {
public:
  explicit CombinedVolatilityStrategy(CombinedVolatilityOptions options = {})
      : m_options(options) {
    AssertFromFormat(m_options.bb_length > 1, "bb_length must be at least 2");
    AssertFromFormat(m_options.bb_std > 0.0, "bb_std must be positive");
  }

  [[nodiscard]] std::string Name() const override { return "combined"; }

  [[nodiscard]] FeatureMap
  Calculate(const epoch_frame::DataFrame &zone_data,
            const ColumnSelection &columns) const override;

private:
  CombinedVolatilityOptions m_options;
};

class StandardVolumeStrategy final : public IVolumeStrategy {
public:
  [[nodiscard]] std::string Name() const override { return "standard"; }

  [[nodiscard]] FeatureMap
  Calculate(const epoch_frame::DataFrame &zone_data,
            const ColumnSelection &columns) const override;
};

// Swing strategies that reduce high / low (close when absent) to alternating
// swing points and measure the moves between consecutive points. Points
// closer than MinAmplitude() in relative price are not counted as moves.
class SwingPointStrategy : public ISwingStrategy {
public:
  [[nodiscard]] FeatureMap
  Calculate(const epoch_frame::DataFrame &zone_data,
            const ColumnSelection &columns) const final;

  // Throws std::invalid_argument when the series has no close column
  [[nodiscard]] SwingContext
  CalculateGlobal(const epoch_frame::DataFrame &series) const final;

  [[nodiscard]] FeatureMap
  AggregateForZone(const Zone &zone, const SwingContext &context) const final;

  // Swing points ordered by position
  [[nodiscard]] virtual std::vector<SwingPoint>
  FindSwingPoints(const std::vector<double> &high,
                  const std::vector<double> &low) const = 0;

  [[nodiscard]] virtual double MinAmplitude() const { return 0.0; }
};

struct ZigZagOptions {
  // Half-width of the window a pivot must dominate
  size_t legs{10};
  // Minimum relative move between consecutive pivots
  double deviation{0.05};
};

class ZigZagSwingStrategy final : public SwingPointStrategy {
public:
  explicit ZigZagSwingStrategy(ZigZagOptions options = {})
      : m_options(options) {
    AssertFromFormat(m_options.legs > 0, "legs must be positive");
    AssertFromFormat(m_options.deviation >= 0.0,
                     "deviation must be non-negative");
  }

  [[nodiscard]] std::string Name() const override { return "zigzag"; }

  // Alternating peak / trough sequence
  [[nodiscard]] std::vector<SwingPoint>
  FindSwingPoints(const std::vector<double> &high,
                  const std::vector<double> &low) const override;

  [[nodiscard]] const ZigZagOptions &GetOptions() const { return m_options; }

private:
  ZigZagOptions m_options;
};

struct FindPeaksOptions {
  size_t distance{5};
  // Absolute prominence; unset uses 1% of the scanned price range
  std::optional<double> prominence;
  // Moves below this fraction are skipped
  double min_amplitude_pct{0.02};
};

// Peaks of high and troughs of low found by prominence and distance
class FindPeaksSwingStrategy final : public SwingPointStrategy {
public:
  explicit FindPeaksSwingStrategy(FindPeaksOptions options = {})
      : m_options(options) {
    AssertFromFormat(m_options.distance > 0, "distance must be positive");
    AssertFromFormat(!m_options.prominence || *m_options.prominence >= 0.0,
                     "prominence must be non-negative");
    AssertFromFormat(m_options.min_amplitude_pct >= 0.0,
                     "min_amplitude_pct must be non-negative");
  }

  [[nodiscard]] std::string Name() const override { return "find_peaks"; }

  [[nodiscard]] std::vector<SwingPoint>
  FindSwingPoints(const std::vector<double> &high,
                  const std::vector<double> &low) const override;

  [[nodiscard]] double MinAmplitude() const override {
    return m_options.min_amplitude_pct;
  }

  [[nodiscard]] const FindPeaksOptions &GetOptions() const { return m_options; }

private:
  FindPeaksOptions m_options;
};

struct PivotPointsOptions {
  size_t left_bars{2};
  size_t right_bars{2};
  double min_amplitude_pct{0.015};
};

// Bars strictly above (below) left_bars neighbours before and right_bars
// neighbours after them
class PivotPointsSwingStrategy final : public SwingPointStrategy {
public:
  explicit PivotPointsSwingStrategy(PivotPointsOptions options = {})
      : m_options(options) {
    AssertFromFormat(m_options.left_bars > 0 && m_options.right_bars > 0,
                     "left_bars and right_bars must be positive");
    AssertFromFormat(m_options.min_amplitude_pct >= 0.0,
                     "min_amplitude_pct must be non-negative");
  }

  [[nodiscard]] std::string Name() const override { return "pivot_points"; }

  [[nodiscard]] std::vector<SwingPoint>
  FindSwingPoints(const std::vector<double> &high,
                  const std::vector<double> &low) const override;

  [[nodiscard]] double MinAmplitude() const override {
    return m_options.min_amplitude_pct;
  }

  [[nodiscard]] const PivotPointsOptions &GetOptions() const {
    return m_options;
  }

private:
  PivotPointsOptions m_options;
};

} // namespace epoch_zones::strategies
