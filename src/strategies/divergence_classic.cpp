#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/core/numeric.h>
#include <epoch_zones/strategies/default_strategies.h>

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace epoch_zones::strategies {

namespace {

struct Divergence {
  bool bullish;
  double strength;
};

std::vector<double> Negated(std::vector<double> values) {
  for (auto &v : values) {
    v = -v;
  }
  return values;
}

std::optional<size_t> NearestExtreme(size_t target,
                                     const std::vector<size_t> &extremes,
                                     size_t max_distance) {
  std::optional<size_t> best;
  size_t best_distance = max_distance + 1;
  for (size_t candidate : extremes) {
    const size_t distance =
        candidate > target ? candidate - target : target - candidate;
    if (distance < best_distance) {
      best = candidate;
      best_distance = distance;
    }
  }
  return best;
}

// Bearish pairs rising price peaks with falling indicator peaks; bullish
// pairs falling price troughs with rising indicator troughs.
void PairExtremes(const std::vector<size_t> &price_extremes,
                  const std::vector<size_t> &indicator_extremes,
                  const std::vector<double> &price,
                  const std::vector<double> &indicator, bool bullish,
                  const ClassicDivergenceOptions &options,
                  std::vector<Divergence> &out) {
  if (price_extremes.size() < 2 || indicator_extremes.size() < 2) {
    return;
  }
  for (size_t i = 0; i + 1 < price_extremes.size(); ++i) {
    const size_t p1 = price_extremes[i];
    const size_t p2 = price_extremes[i + 1];
    const auto i1 =
        NearestExtreme(p1, indicator_extremes, options.max_pairing_distance);
    const auto i2 =
        NearestExtreme(p2, indicator_extremes, options.max_pairing_distance);
    if (!i1 || !i2 || price[p1] == 0.0 || indicator[*i1] == 0.0) {
      continue;
    }

    const double price_slope = price[p2] - price[p1];
    const double indicator_slope = indicator[*i2] - indicator[*i1];
    const bool diverges = bullish ? (price_slope < 0 && indicator_slope > 0)
                                  : (price_slope > 0 && indicator_slope < 0);
    if (!diverges) {
      continue;
    }
    const double strength = std::abs(price_slope / price[p1]) *
                            std::abs(indicator_slope / indicator[*i1]);
    if (strength >= options.min_strength) {
      out.push_back({bullish, strength});
    }
  }
}

} // namespace

FeatureMap
ClassicDivergenceStrategy::Calculate(const epoch_frame::DataFrame &zone_data,
                                     const ColumnSelection &columns) const {
  FeatureMap features;

  std::optional<std::string> indicator_col;
  if (columns.secondary && frame::HasColumn(zone_data, *columns.secondary)) {
    indicator_col = columns.secondary;
  } else if (columns.primary &&
             frame::HasColumn(zone_data, *columns.primary)) {
    indicator_col = columns.primary;
  }
  if (!indicator_col || !frame::HasColumn(zone_data, "close")) {
    return features;
  }
  if (frame::RowCount(zone_data) < m_options.min_peak_distance * 2) {
    return features;
  }

  const auto close = frame::ColumnValues(zone_data, "close");
  const auto high = frame::HasColumn(zone_data, "high")
                        ? frame::ColumnValues(zone_data, "high")
                        : close;
  const auto low = frame::HasColumn(zone_data, "low")
                       ? frame::ColumnValues(zone_data, "low")
                       : close;
  const auto indicator = frame::ColumnValues(zone_data, *indicator_col);

  const auto std_or_zero = [](const std::vector<double> &v) {
    return numeric::StdDev(v, 0).value_or(0.0);
  };
  const numeric::PeakOptions price_peak_options{
      m_options.min_peak_distance, std_or_zero(high) * 0.5};
  const numeric::PeakOptions price_trough_options{
      m_options.min_peak_distance, std_or_zero(low) * 0.5};
  const numeric::PeakOptions indicator_options{
      m_options.min_peak_distance, std_or_zero(indicator) * 0.3};

  const auto price_peaks = numeric::FindPeaks(high, price_peak_options);
  const auto price_troughs = numeric::FindPeaks(Negated(low), price_trough_options);
  const auto indicator_peaks = numeric::FindPeaks(indicator, indicator_options);
  const auto indicator_troughs =
      numeric::FindPeaks(Negated(indicator), indicator_options);

  std::vector<Divergence> divergences;
  PairExtremes(price_peaks, indicator_peaks, high, indicator, false, m_options,
               divergences);
  PairExtremes(price_troughs, indicator_troughs, low, indicator, true,
               m_options, divergences);

  const auto bullish = static_cast<double>(std::ranges::count_if(
      divergences, [](const Divergence &d) { return d.bullish; }));
  const auto bearish = static_cast<double>(divergences.size()) - bullish;

  features["divergence_count"] = static_cast<double>(divergences.size());
  features["divergence_bullish_count"] = bullish;
  features["divergence_bearish_count"] = bearish;
  features["divergence_type"] =
      std::string(divergences.empty() ? "none" : "regular");
  features["divergence_direction"] = std::string(
      bullish > bearish ? "bullish" : (bearish > bullish ? "bearish" : "none"));

  double strength = 0.0;
  for (const auto &d : divergences) {
    strength += d.strength;
  }
  features["divergence_strength"] =
      divergences.empty() ? 0.0
                          : strength / static_cast<double>(divergences.size());
  return features;
}

} // namespace epoch_zones::strategies
