#pragma once
//
// Hypothesis test battery over analyzed zones
//
// Tests (keys of HypothesisSuiteResult::tests):
//   label_duration_difference         duration between the two most populous
//                                     labels; Student t when both groups pass
//                                     Shapiro-Wilk, otherwise Mann-Whitney U
//   label_weighted_return_difference  same, on price_return * duration /
//                                     mean duration
//   duration_return_relationship      price_return of the longest 20% versus
//                                     the shortest 20% (t-test, Cohen's d)
//   label_sequence_randomness         runs test on the label sequence
//   transition_independence           chi-square on the transition table
//   duration_stationarity             ADF on chronological durations
//   duration_trend                    Pearson correlation of duration with
//                                     chronological order
//
// A test that cannot run records an error and is not significant.
//

#include <epoch_zones/analysis/analysis_result.h>

namespace epoch_zones::analysis {

struct HypothesisOptions {
  double alpha{0.05};
  size_t min_stationarity_zones{10};
  double extreme_quantile{0.2};
};

[[nodiscard]] HypothesisSuiteResult
RunHypothesisTests(const ZoneList &zones, const HypothesisOptions &options = {});

} // namespace epoch_zones::analysis
