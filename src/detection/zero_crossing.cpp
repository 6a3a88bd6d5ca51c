#include "zero_crossing.h"
#include "detection_common.h"

#include <format>
#include <spdlog/spdlog.h>

namespace epoch_zones::detection {

ZeroCrossingOptions ZeroCrossingOptions::FromConfig(
    const DetectionConfig &config) {
  config.RequireRules({"indicator_col"});

  ZeroCrossingOptions options;
  options.indicator_col = RequireStringRule(config, "indicator_col");
  if (auto window = rules::GetNumber(config.rules, "smooth_window")) {
    if (*window < 0) {
      throw ConfigurationError(std::format(
          "zero_crossing: smooth_window must be >= 0, got {}", *window));
    }
    options.smooth_window = static_cast<size_t>(*window);
  }
  return options;
}

ZoneList ZeroCrossingDetection::Detect(const epoch_frame::DataFrame &series,
                                       const DetectionConfig &config) const {
  const auto options = ZeroCrossingOptions::FromConfig(config);
  auto values = RequireColumn(series, "zero_crossing", options.indicator_col);
  if (options.smooth_window > 1) {
    values = frame::RollingMean(values, options.smooth_window);
  }

  const auto classes = SignClasses(values);
  ZoneAssembler assembler(series, config);
  for (const auto &run : SplitRuns(classes, 0)) {
    IndicatorContext context{.primary_column = options.indicator_col,
                             .secondary_column = std::nullopt,
                             .strategy_name = "zero_crossing",
                             .rules = config.rules};
    assembler.Add(run, classes[run.start] > 0 ? "bull" : "bear",
                  std::move(context));
  }

  auto zones = assembler.Release();
  SPDLOG_INFO("zero_crossing on '{}': {} zones ({} too short, {} filtered by "
              "type)",
              options.indicator_col, zones.size(),
              assembler.FilteredByDuration(), assembler.FilteredByType());
  return zones;
}

} // namespace epoch_zones::detection
