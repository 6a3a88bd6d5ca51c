#include <epoch_zones/detection/detection_registry.h>

#include "combined.h"
#include "line_crossing.h"
#include "preloaded.h"
#include "threshold.h"
#include "zero_crossing.h"

#include <mutex>

namespace epoch_zones::detection {

void RegisterBuiltinDetectionStrategies() {
  static std::once_flag once;
  std::call_once(once, [] {
    Register<ZeroCrossingDetection>(
        "zero_crossing",
        {.description = "Zones are sign runs of one indicator column",
         .supported_zones = {"bull", "bear"},
         .required_rules = {"indicator_col"}});

    Register<ThresholdDetection>(
        "threshold",
        {.description = "Three bands against upper and lower thresholds",
         .supported_zones = {"overbought", "between", "oversold"},
         .required_rules = {"indicator_col", "upper_threshold",
                            "lower_threshold"}});

    Register<LineCrossingDetection>(
        "line_crossing",
        {.description = "Sign of the difference between two lines",
         .supported_zones = {"bull", "bear"},
         .required_rules = {"line1_col", "line2_col"}});

    Register<PreloadedZonesDetection>(
        "preloaded",
        {.description = "Zones imported from an external table",
         .supported_zones = {"any"},
         .required_rules = {"zones"}});

    Register<CombinedRulesDetection>(
        "combined",
        {.description = "Boolean conditions combined with AND/OR logic",
         .supported_zones = {"active", "inactive"},
         .required_rules = {"conditions"}});
  });
}

} // namespace epoch_zones::detection
