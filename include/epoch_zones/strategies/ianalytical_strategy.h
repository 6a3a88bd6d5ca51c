#pragma once
//
// Analytical strategy slots
//
// Each slot computes one family of per-zone features. Strategies receive the
// zone sub-series and the resolved indicator columns; a column that is absent
// from the data yields an empty or partial feature map, never an exception.
//

#include <epoch_core/enum_wrapper.h>
#include <epoch_zones/core/zone.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

CREATE_ENUM(AnalyticalSlot, shape, divergence, volatility, volume, swing);

namespace epoch_zones::strategies {

struct ColumnSelection {
  std::optional<std::string> primary;
  std::optional<std::string> secondary;
};

class IAnalyticalStrategy {
public:
  virtual ~IAnalyticalStrategy() = default;

  [[nodiscard]] virtual std::string Name() const = 0;

  [[nodiscard]] virtual FeatureMap
  Calculate(const epoch_frame::DataFrame &zone_data,
            const ColumnSelection &columns) const = 0;
};

// Skewness, kurtosis and smoothness of the indicator
class IShapeStrategy : public IAnalyticalStrategy {};

// Price versus indicator divergences
class IDivergenceStrategy : public IAnalyticalStrategy {};

class IVolatilityStrategy : public IAnalyticalStrategy {};

class IVolumeStrategy : public IAnalyticalStrategy {};

struct SwingPoint {
  // Row of the scanned frame
  size_t position{0};
  double price{0.0};
  bool is_peak{false};
};

// Swing points of one pass over a whole series, ordered by position
struct SwingContext {
  std::string strategy_name;
  size_t series_length{0};
  // Moves below this fraction were ignored when the points were found
  double min_amplitude{0.0};
  std::vector<SwingPoint> points;

  // Points with start_idx <= position <= end_idx
  [[nodiscard]] std::vector<SwingPoint> PointsWithin(int64_t start_idx,
                                                     int64_t end_idx) const {
    if (end_idx < start_idx || end_idx < 0) {
      return {};
    }
    const auto first = static_cast<size_t>(std::max<int64_t>(start_idx, 0));
    const auto last = static_cast<size_t>(end_idx);
    const auto begin = std::ranges::lower_bound(
        points, first, {}, &SwingPoint::position);
    const auto end = std::ranges::upper_bound(
        points, last, {}, &SwingPoint::position);
    return std::vector<SwingPoint>(begin, end);
  }
};

// Rally and drop structure inside a zone. Calculate scans the zone alone;
// CalculateGlobal scans the full series once and AggregateForZone reads the
// zone's share of those points.
class ISwingStrategy : public IAnalyticalStrategy {
public:
  [[nodiscard]] virtual SwingContext
  CalculateGlobal(const epoch_frame::DataFrame &series) const = 0;

  [[nodiscard]] virtual FeatureMap
  AggregateForZone(const Zone &zone, const SwingContext &context) const = 0;
};

using IShapeStrategyPtr = std::shared_ptr<const IShapeStrategy>;
using IDivergenceStrategyPtr = std::shared_ptr<const IDivergenceStrategy>;
using IVolatilityStrategyPtr = std::shared_ptr<const IVolatilityStrategy>;
using IVolumeStrategyPtr = std::shared_ptr<const IVolumeStrategy>;
using ISwingStrategyPtr = std::shared_ptr<const ISwingStrategy>;

} // namespace epoch_zones::strategies
