#include "line_crossing.h"
#include "detection_common.h"

#include <spdlog/spdlog.h>

namespace epoch_zones::detection {

ZoneList LineCrossingDetection::Detect(const epoch_frame::DataFrame &series,
                                       const DetectionConfig &config) const {
  config.RequireRules({"line1_col", "line2_col"});
  const auto line1_col = RequireStringRule(config, "line1_col");
  const auto line2_col = RequireStringRule(config, "line2_col");

  const auto line1 = RequireColumn(series, "line_crossing", line1_col);
  const auto line2 = RequireColumn(series, "line_crossing", line2_col);

  std::vector<double> diff(line1.size());
  for (size_t i = 0; i < diff.size(); ++i) {
    diff[i] = line1[i] - line2[i];
  }

  const auto classes = SignClasses(diff);
  ZoneAssembler assembler(series, config);
  for (const auto &run : SplitRuns(classes, 0)) {
    IndicatorContext context{.primary_column = line1_col,
                             .secondary_column = line2_col,
                             .strategy_name = "line_crossing",
                             .rules = config.rules};
    assembler.Add(run, classes[run.start] > 0 ? "bull" : "bear",
                  std::move(context));
  }

  auto zones = assembler.Release();
  SPDLOG_INFO("line_crossing '{}' vs '{}': {} zones", line1_col, line2_col,
              zones.size());
  return zones;
}

} // namespace epoch_zones::detection
