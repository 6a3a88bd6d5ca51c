#include "common/fake_zone_series.h"

#include <epoch_zones/core/errors.h>
#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/detection/detection_registry.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cmath>
#include <limits>
#include <numbers>
#include <numeric>

using namespace epoch_zones;
using namespace epoch_zones::detection;
using Catch::Matchers::ContainsSubstring;

namespace {
ZoneList DetectZeroCrossing(const epoch_frame::DataFrame &series,
                            DetectionConfig config) {
  RegisterBuiltinDetectionStrategies();
  config.strategy_name = "zero_crossing";
  return ZoneDetectionRegistry::Instance().Get("zero_crossing")->Detect(series,
                                                                      config);
}
} // namespace

TEST_CASE("Zero-crossing detection over a sine oscillator",
          "[detection][zero_crossing]") {
  // Period 50 over 1000 bars gives ~40 sign changes
  const auto series = test::MakeOscillatorSeries(1000, 50.0);
  const auto osc = frame::ColumnValues(series, "osc");

  DetectionConfig config;
  config.rules["indicator_col"] = "osc";
  config.min_duration = 2;
  const auto zones = DetectZeroCrossing(series, config);

  REQUIRE(zones.size() == test::CountSignRuns(osc, 2));
  REQUIRE(zones.size() >= 39);

  SECTION("Zones partition the sign runs without overlap") {
    for (size_t i = 0; i < zones.size(); ++i) {
      const auto &zone = zones[i];
      REQUIRE(zone.zone_id == static_cast<int64_t>(i));
      REQUIRE(zone.duration == zone.end_idx - zone.start_idx + 1);
      REQUIRE(zone.duration >= 2);
      REQUIRE(frame::RowCount(zone.data) == static_cast<size_t>(zone.duration));
      if (i > 0) {
        REQUIRE(zone.start_idx > zones[i - 1].end_idx);
        REQUIRE(zone.label != zones[i - 1].label);
      }
    }
  }

  SECTION("Labels follow the sign of the indicator") {
    for (const auto &zone : zones) {
      const bool positive = osc[static_cast<size_t>(zone.start_idx)] >= 0.0;
      REQUIRE(zone.label == (positive ? "bull" : "bear"));
    }
  }

  SECTION("Context names the indicator column") {
    for (const auto &zone : zones) {
      REQUIRE(zone.context.primary_column == "osc");
      REQUIRE_FALSE(zone.context.secondary_column.has_value());
      REQUIRE(zone.context.strategy_name == "zero_crossing");
      REQUIRE(rules::GetString(zone.context.rules, "indicator_col") == "osc");
    }
  }

  SECTION("Timestamps match the source index") {
    const auto timestamps = frame::Timestamps(series);
    for (const auto &zone : zones) {
      REQUIRE(zone.start_time == timestamps[zone.start_idx]);
      REQUIRE(zone.end_time == timestamps[zone.end_idx]);
    }
  }
}

TEST_CASE("Zero-crossing edge cases", "[detection][zero_crossing]") {
  DetectionConfig config;
  config.rules["indicator_col"] = "osc";

  SECTION("Zero counts as positive") {
    const auto series =
        test::MakeSeries({{"osc", {0.0, 0.0, 1.0, -1.0, -2.0}}});
    const auto zones = DetectZeroCrossing(series, config);
    REQUIRE(zones.size() == 2);
    REQUIRE(zones[0].label == "bull");
    REQUIRE(zones[0].duration == 3);
    REQUIRE(zones[1].label == "bear");
  }

  SECTION("Short runs are dropped") {
    const auto series =
        test::MakeSeries({{"osc", {1.0, 1.0, -1.0, 1.0, 1.0, 1.0}}});
    config.min_duration = 2;
    const auto zones = DetectZeroCrossing(series, config);
    REQUIRE(zones.size() == 2);
    REQUIRE(zones[1].start_idx == 3);
  }

  SECTION("Zone types filter labels") {
    const auto series =
        test::MakeSeries({{"osc", {1.0, 1.0, -1.0, -1.0, 1.0, 1.0}}});
    config.zone_types = {"bear"};
    const auto zones = DetectZeroCrossing(series, config);
    REQUIRE(zones.size() == 1);
    REQUIRE(zones[0].label == "bear");
    REQUIRE(zones[0].zone_id == 0);
  }

  SECTION("Missing column raises DataShapeError") {
    const auto series = test::MakeSeries({{"close", {1.0, 2.0, 3.0}}});
    try {
      (void)DetectZeroCrossing(series, config);
      FAIL("expected DataShapeError");
    } catch (const DataShapeError &e) {
      REQUIRE(e.GetColumn() == "osc");
    }
  }

  SECTION("Missing rule raises MissingRuleError") {
    const auto series = test::MakeSeries({{"osc", {1.0, 2.0, 3.0}}});
    REQUIRE_THROWS_WITH(DetectZeroCrossing(series, DetectionConfig{}),
                        ContainsSubstring("indicator_col"));
  }

  SECTION("Smoothing merges single-bar flips") {
    const auto series =
        test::MakeSeries({{"osc", {2.0, 2.0, -0.5, 2.0, 2.0, 2.0}}});
    config.rules["smooth_window"] = 2.0;
    const auto zones = DetectZeroCrossing(series, config);
    REQUIRE(zones.size() == 1);
    REQUIRE(zones[0].duration == 6);
  }
}

TEST_CASE("Zero-crossing with min_duration 1 partitions the series exactly",
          "[detection][zero_crossing]") {
  const auto series = test::MakeOscillatorSeries(300, 37.0);
  DetectionConfig config;
  config.rules["indicator_col"] = "osc";
  config.min_duration = 1;
  const auto zones = DetectZeroCrossing(series, config);

  REQUIRE_FALSE(zones.empty());
  REQUIRE(zones.front().start_idx == 0);
  REQUIRE(zones.back().end_idx == 299);
  for (size_t i = 1; i < zones.size(); ++i) {
    // Neither a gap nor an overlap between neighbours
    REQUIRE(zones[i].start_idx == zones[i - 1].end_idx + 1);
  }
  const int64_t covered = std::accumulate(
      zones.begin(), zones.end(), int64_t{0},
      [](int64_t total, const Zone &zone) { return total + zone.duration; });
  REQUIRE(covered == 300);
}

TEST_CASE("Zero-crossing smoothing tolerates warm-up NaN bars",
          "[detection][zero_crossing]") {
  constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
  constexpr size_t kBars = 200;
  constexpr size_t kWarmup = 5;

  std::vector<double> osc(kBars);
  for (size_t i = 0; i < kBars; ++i) {
    osc[i] = i < kWarmup ? NaN
                         : std::sin(2.0 * std::numbers::pi *
                                    static_cast<double>(i) / 40.0);
  }
  const auto series = test::MakeSeries({{"osc", osc}});

  DetectionConfig config;
  config.rules["indicator_col"] = "osc";
  config.rules["smooth_window"] = 3.0;
  const auto zones = DetectZeroCrossing(series, config);

  // Ten half periods, the first one shortened by the warm-up
  REQUIRE(zones.size() >= 9);
  REQUIRE(zones.front().start_idx == static_cast<int64_t>(kWarmup));
  REQUIRE(zones.back().end_idx == static_cast<int64_t>(kBars - 1));
  for (const auto &zone : zones) {
    REQUIRE(zone.label == (zone.zone_id % 2 == 0 ? "bull" : "bear"));
  }
}
