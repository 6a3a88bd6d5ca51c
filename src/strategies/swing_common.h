#pragma once
//
// Helpers shared by the swing point strategies
//

#include <epoch_zones/strategies/ianalytical_strategy.h>

#include <vector>

namespace epoch_zones::strategies::swing {

// Peaks priced on high and troughs priced on low, ordered by position. A bar
// that is both lists its peak first.
[[nodiscard]] std::vector<SwingPoint>
MergeExtrema(const std::vector<size_t> &peaks,
             const std::vector<size_t> &troughs,
             const std::vector<double> &high, const std::vector<double> &low);

} // namespace epoch_zones::strategies::swing
