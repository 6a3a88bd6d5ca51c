#include "core/tulip.h"

#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/core/numeric.h>
#include <epoch_zones/strategies/default_strategies.h>

#include <algorithm>
#include <cmath>

namespace epoch_zones::strategies {

namespace {

struct Bands {
  std::vector<double> lower;
  std::vector<double> middle;
  std::vector<double> upper;
};

Bands BollingerBands(const std::vector<double> &close, size_t length,
                     double width) {
  auto outputs = tulip::Run("bbands", {close.data()},
                          {static_cast<double>(length), width}, close.size());
  return {std::move(outputs[0]), std::move(outputs[1]), std::move(outputs[2])};
}

std::vector<double> TrueRange(const std::vector<double> &high,
                              const std::vector<double> &low,
                              const std::vector<double> &close) {
  return std::move(
      tulip::Run("tr", {high.data(), low.data(), close.data()}, {}, close.size())
          .front());
}

std::string TrendLabel(double change) {
  if (change > 0.2) {
    return "increasing";
  }
  if (change < -0.2) {
    return "decreasing";
  }
  return "stable";
}

std::string VolatilityRegime(double score) {
  if (score < 2.5) {
    return "low";
  }
  if (score < 5.0) {
    return "medium";
  }
  if (score < 7.5) {
    return "high";
  }
  return "extreme";
}

} // namespace

FeatureMap
CombinedVolatilityStrategy::Calculate(const epoch_frame::DataFrame &zone_data,
                                      const ColumnSelection &) const {
  FeatureMap features;
  for (const auto *column : {"high", "low", "close"}) {
    if (!frame::HasColumn(zone_data, column)) {
      return features;
    }
  }
  const size_t n = frame::RowCount(zone_data);
  if (n < 3) {
    return features;
  }

  const auto high = frame::ColumnValues(zone_data, "high");
  const auto low = frame::ColumnValues(zone_data, "low");
  const auto close = frame::ColumnValues(zone_data, "close");

  // Bollinger
  const auto bands = BollingerBands(close, m_options.bb_length, m_options.bb_std);
  std::vector<double> width;
  size_t upper_touches = 0;
  size_t lower_touches = 0;
  for (size_t i = 0; i < n; ++i) {
    if (!std::isfinite(bands.middle[i]) || bands.middle[i] == 0.0) {
      continue;
    }
    width.push_back((bands.upper[i] - bands.lower[i]) / bands.middle[i] * 100.0);
    if (close[i] >= bands.upper[i] * (1.0 - m_options.touch_threshold)) {
      ++upper_touches;
    }
    if (close[i] <= bands.lower[i] * (1.0 + m_options.touch_threshold)) {
      ++lower_touches;
    }
  }
  const double width_pct = numeric::Mean(width).value_or(0.0);
  const double current_width = width.empty() ? width_pct : width.back();
  features["bb_width_pct"] = width_pct;
  features["bb_width_std"] = numeric::StdDev(width).value_or(0.0);
  features["bb_squeeze_ratio"] = width_pct > 0 ? current_width / width_pct : 1.0;
  features["bb_upper_touches"] = static_cast<double>(upper_touches);
  features["bb_lower_touches"] = static_cast<double>(lower_touches);

  // ATR
  std::vector<double> atr;
  double atr_start = 0.0;
  double atr_end = 0.0;
  if (frame::HasColumn(zone_data, "atr")) {
    atr = frame::ColumnValues(zone_data, "atr");
    atr_start = atr.front();
    atr_end = atr.back();
  } else {
    atr = TrueRange(high, low, close);
    const size_t edge = std::min<size_t>(5, n);
    atr_start = *numeric::Mean({atr.begin(), atr.begin() + edge});
    atr_end = *numeric::Mean({atr.end() - edge, atr.end()});
  }

  const auto atr_avg = numeric::Mean(atr);
  if (!atr_avg) {
    return features;
  }
  const double price_range = *std::ranges::max_element(high) -
                             *std::ranges::min_element(low);
  const double normalized_range = *atr_avg > 0 ? price_range / *atr_avg : 0.0;
  const double change = atr_start > 0 ? atr_end / atr_start - 1.0 : 0.0;
  features["atr_avg"] = *atr_avg;
  features["atr_normalized_range"] = normalized_range;
  features["atr_trend"] = TrendLabel(change);

  const double score = std::clamp(
      std::min(width_pct / 2.0, 5.0) + std::min(normalized_range / 2.0, 3.0) +
          std::min(static_cast<double>(upper_touches + lower_touches) / 5.0, 2.0),
      0.0, 10.0);
  features["volatility_score"] = score;
  features["volatility_regime"] = VolatilityRegime(score);
  return features;
}

} // namespace epoch_zones::strategies
