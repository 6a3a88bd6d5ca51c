#pragma once
//
// Ordinary least squares models predicting zone duration and price return
//

#include <epoch_zones/analysis/analysis_result.h>

#include <variant>

namespace epoch_zones::analysis {

struct RegressionOptions {
  std::vector<std::string> targets{"duration", "price_return"};
  // Predictors actually present on the zones are used
  std::vector<std::string> predictors{"indicator_amplitude",
                                      "correlation_price_indicator",
                                      "price_range_pct", "num_peaks",
                                      "num_troughs"};
  // Models are fitted only above this many zones
  size_t min_zones{10};
};

// Fits one model per target. A zone is used only when the target and every
// selected predictor are present. Needs n >= p + 2 observations.
[[nodiscard]] std::variant<RegressionModel, AnalysisDegraded>
FitOls(const ZoneList &zones, const std::string &target,
       const std::vector<std::string> &predictors);

// Targets that cannot be fitted are appended to degraded
[[nodiscard]] std::variant<RegressionResult, AnalysisDegraded>
RunRegression(const ZoneList &zones, const RegressionOptions &options,
              std::vector<AnalysisDegraded> &degraded);

} // namespace epoch_zones::analysis
