#pragma once
//
// Indicator provider backed by Tulip Indicators
//
// Handles descriptors with source "tulip". The descriptor name is the Tulip
// indicator name; each Tulip option is read from the parameter of the same
// name with spaces replaced by underscores ("short period" ->
// "short_period"). Price inputs read the matching OHLCV column, the generic
// "real" input reads the column named by the "input" parameter (default
// "close"). Output columns carry Tulip's output names, e.g. macd, macd_signal
// and macd_histogram.
//

#include <epoch_zones/pipeline/indicator_provider.h>

namespace epoch_zones::pipeline {

inline constexpr const char *kTulipSource = "tulip";

class TulipIndicatorProvider final : public IIndicatorProvider {
public:
  // Throws ConfigurationError for another source or an unknown indicator,
  // MissingRuleError for absent options and DataShapeError for absent input
  // columns
  [[nodiscard]] epoch_frame::DataFrame
  Compute(const IndicatorDescriptor &descriptor,
          const epoch_frame::DataFrame &series) const override;

  [[nodiscard]] std::vector<std::string>
  OutputColumns(const IndicatorDescriptor &descriptor) const override;
};

} // namespace epoch_zones::pipeline
