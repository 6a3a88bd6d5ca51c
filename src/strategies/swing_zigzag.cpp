#include <epoch_zones/strategies/default_strategies.h>

#include <algorithm>
#include <cmath>

namespace epoch_zones::strategies {

std::vector<SwingPoint>
ZigZagSwingStrategy::FindSwingPoints(const std::vector<double> &high,
                                     const std::vector<double> &low) const {
  const size_t n = std::min(high.size(), low.size());
  std::vector<SwingPoint> candidates;
  for (size_t i = 0; i < n; ++i) {
    const size_t from = i >= m_options.legs ? i - m_options.legs : 0;
    const size_t to = std::min(n - 1, i + m_options.legs);
    bool is_high = std::isfinite(high[i]);
    bool is_low = std::isfinite(low[i]);
    for (size_t j = from; j <= to && (is_high || is_low); ++j) {
      is_high = is_high && !(high[j] > high[i]);
      is_low = is_low && !(low[j] < low[i]);
    }
    if (is_high) {
      candidates.push_back({i, high[i], true});
    }
    if (is_low) {
      candidates.push_back({i, low[i], false});
    }
  }

  std::vector<SwingPoint> pivots;
  for (const auto &candidate : candidates) {
    if (pivots.empty()) {
      pivots.push_back(candidate);
      continue;
    }
    auto &last = pivots.back();
    if (candidate.is_peak == last.is_peak) {
      // Same side: keep the more extreme one
      if ((candidate.is_peak && candidate.price > last.price) ||
          (!candidate.is_peak && candidate.price < last.price)) {
        last = candidate;
      }
      continue;
    }
    if (candidate.position == last.position || last.price == 0.0) {
      continue;
    }
    if (std::abs(candidate.price / last.price - 1.0) >= m_options.deviation) {
      pivots.push_back(candidate);
    }
  }
  return pivots;
}

} // namespace epoch_zones::strategies
