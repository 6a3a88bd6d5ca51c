#include "swing_common.h"

#include <epoch_zones/core/numeric.h>
#include <epoch_zones/strategies/default_strategies.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace epoch_zones::strategies {

std::vector<SwingPoint>
FindPeaksSwingStrategy::FindSwingPoints(const std::vector<double> &high,
                                        const std::vector<double> &low) const {
  const size_t n = std::min(high.size(), low.size());
  if (n < 3) {
    return {};
  }

  double prominence = 0.0;
  if (m_options.prominence) {
    prominence = *m_options.prominence;
  } else {
    double top = -std::numeric_limits<double>::infinity();
    double bottom = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < n; ++i) {
      if (std::isfinite(high[i])) {
        top = std::max(top, high[i]);
      }
      if (std::isfinite(low[i])) {
        bottom = std::min(bottom, low[i]);
      }
    }
    const double range = top > bottom ? top - bottom : 0.0;
    prominence = std::max(range * 0.01, 1e-9);
  }

  const numeric::PeakOptions peak_options{m_options.distance, prominence};
  const std::vector<double> bounded_high(high.begin(), high.begin() + n);
  std::vector<double> inverted_low(low.begin(), low.begin() + n);
  std::ranges::transform(inverted_low, inverted_low.begin(),
                         [](double value) { return -value; });

  return swing::MergeExtrema(
      numeric::FindPeaks(bounded_high, peak_options),
      numeric::FindPeaks(inverted_low, peak_options), high, low);
}

} // namespace epoch_zones::strategies
