#include "swing_common.h"

#include <epoch_zones/strategies/default_strategies.h>

#include <algorithm>

namespace epoch_zones::strategies {

std::vector<SwingPoint>
PivotPointsSwingStrategy::FindSwingPoints(const std::vector<double> &high,
                                          const std::vector<double> &low) const {
  const size_t n = std::min(high.size(), low.size());
  const size_t left = m_options.left_bars;
  const size_t right = m_options.right_bars;
  if (n < left + right + 1) {
    return {};
  }

  std::vector<size_t> highs;
  std::vector<size_t> lows;
  for (size_t i = left; i + right < n; ++i) {
    bool is_high = true;
    bool is_low = true;
    for (size_t j = i - left; j <= i + right; ++j) {
      if (j == i) {
        continue;
      }
      // NaN neighbours fail both comparisons
      is_high = is_high && high[i] > high[j];
      is_low = is_low && low[i] < low[j];
    }
    if (is_high) {
      highs.push_back(i);
    }
    if (is_low) {
      lows.push_back(i);
    }
  }
  return swing::MergeExtrema(highs, lows, high, low);
}

} // namespace epoch_zones::strategies
