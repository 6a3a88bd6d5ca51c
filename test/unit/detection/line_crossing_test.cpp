#include "common/fake_zone_series.h"

#include <epoch_zones/core/errors.h>
#include <epoch_zones/detection/detection_registry.h>

#include <catch2/catch_test_macros.hpp>

using namespace epoch_zones;
using namespace epoch_zones::detection;

TEST_CASE("Line-crossing detection", "[detection][line_crossing]") {
  RegisterBuiltinDetectionStrategies();
  const auto series =
      test::MakeSeries({{"macd", {1.0, 2.0, 3.0, 1.0, 0.0, -1.0, 2.0, 3.0}},
                        {"signal", {0.0, 1.0, 2.0, 2.0, 1.0, 0.0, 1.0, 1.0}}});

  DetectionConfig config;
  config.strategy_name = "line_crossing";
  config.rules["line1_col"] = "macd";
  config.rules["line2_col"] = "signal";
  config.min_duration = 2;

  const auto zones =
      ZoneDetectionRegistry::Instance().Get("line_crossing")->Detect(series, config);

  REQUIRE(zones.size() == 3);
  REQUIRE(zones[0].label == "bull");
  REQUIRE(zones[0].end_idx == 2);
  REQUIRE(zones[1].label == "bear");
  REQUIRE(zones[1].duration == 3);
  REQUIRE(zones[2].label == "bull");

  SECTION("Both lines are recorded in the context") {
    REQUIRE(zones[0].context.primary_column == "macd");
    REQUIRE(zones[0].context.secondary_column == "signal");
    REQUIRE(zones[0].context.strategy_name == "line_crossing");
  }

  SECTION("Missing second line column") {
    config.rules["line2_col"] = "slow";
    REQUIRE_THROWS_AS(
        ZoneDetectionRegistry::Instance().Get("line_crossing")->Detect(series, config),
        DataShapeError);
  }
}
