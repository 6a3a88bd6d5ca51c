#pragma once
//
// Out-of-sample and walk-forward stability checks
//
// Both re-run detection and base analysis on sub-ranges of the series
// through a caller-supplied function and compare mean zone duration between
// the training and testing ranges.
//

#include <epoch_zones/analysis/analysis_result.h>

#include <functional>
#include <variant>

namespace epoch_zones::analysis {

using ReanalyzeFunction =
    std::function<ValidationMetrics(const epoch_frame::DataFrame &)>;

struct ValidationOptions {
  double train_ratio{0.7};
  double degradation_threshold{0.2};
  int64_t train_window{1000};
  int64_t test_window{200};
  int64_t step{100};
  // Validation runs only above this many zones
  size_t min_zones{20};
  size_t min_rows{10};
};

[[nodiscard]] double DegradationPct(double train, double test);

[[nodiscard]] std::variant<OutOfSampleResult, AnalysisDegraded>
OutOfSampleTest(const epoch_frame::DataFrame &series,
                const ReanalyzeFunction &reanalyze,
                const ValidationOptions &options);

// Windows shrink to half / quarter / eighth of the series when it is shorter
// than train_window + test_window
[[nodiscard]] std::variant<WalkForwardResult, AnalysisDegraded>
WalkForwardTest(const epoch_frame::DataFrame &series,
                const ReanalyzeFunction &reanalyze,
                const ValidationOptions &options);

// Failed sub-tests are appended to degraded
[[nodiscard]] std::variant<ValidationResult, AnalysisDegraded>
RunValidation(const epoch_frame::DataFrame &series, size_t zone_count,
              const ReanalyzeFunction &reanalyze,
              const ValidationOptions &options,
              std::vector<AnalysisDegraded> &degraded);

} // namespace epoch_zones::analysis
