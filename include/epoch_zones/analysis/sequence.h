#pragma once
//
// Label transition and recurring-pattern analysis in chronological order
//

#include <epoch_zones/analysis/analysis_result.h>

namespace epoch_zones::analysis {

struct SequenceOptions {
  size_t min_zones{3};
  size_t min_pattern_length{2};
  size_t max_pattern_length{3};
  int64_t min_occurrences{2};
  size_t max_patterns{10};
};

// std::nullopt when fewer than min_zones zones are given
[[nodiscard]] std::optional<SequenceAnalysis>
AnalyzeSequence(const ZoneList &zones, const SequenceOptions &options = {});

} // namespace epoch_zones::analysis
