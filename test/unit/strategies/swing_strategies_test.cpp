#include "common/fake_zone_series.h"

#include <epoch_zones/analysis/zone_analyzer.h>
#include <epoch_zones/core/errors.h>
#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/strategies/strategy_registry.h>
#include <epoch_zones/strategies/swing_presets.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using namespace epoch_zones;
using namespace epoch_zones::strategies;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace {

double Number(const FeatureMap &features, const std::string &key) {
  REQUIRE(features.contains(key));
  return std::get<double>(features.at(key));
}

// 100, 105, 110, 105, 100, 95, 90, 95, ... peaks at 2 mod 8, troughs at 6 mod 8
std::vector<double> Triangle(size_t count) {
  static const double steps[] = {0, 1, 2, 1, 0, -1, -2, -1};
  std::vector<double> values;
  for (size_t i = 0; i < count; ++i) {
    values.push_back(100.0 + 5.0 * steps[i % 8]);
  }
  return values;
}

Zone ZoneOver(const epoch_frame::DataFrame &series, int64_t start,
              int64_t end) {
  Zone zone;
  zone.label = "bull";
  zone.start_idx = start;
  zone.end_idx = end;
  zone.duration = end - start + 1;
  zone.data = frame::Slice(series, start, end);
  return zone;
}

} // namespace

TEST_CASE("FindPeaks swing strategy", "[strategies][swing]") {
  const auto data = test::MakeSeries({{"close", Triangle(13)}});
  const double drop = (1.0 - 90.0 / 110.0) * 100.0;
  const double rally = (110.0 / 90.0 - 1.0) * 100.0;

  SECTION("Peaks on high and troughs on low") {
    const FindPeaksSwingStrategy strategy({.distance = 2});
    const auto path = Triangle(13);
    const auto points = strategy.FindSwingPoints(path, path);
    REQUIRE(points.size() == 3);
    REQUIRE(points[0].position == 2);
    REQUIRE(points[0].is_peak);
    REQUIRE(points[1].position == 6);
    REQUIRE(points[1].price == 90.0);
    REQUIRE_FALSE(points[1].is_peak);
    REQUIRE(points[2].position == 10);
  }

  SECTION("Rally and drop features") {
    const FindPeaksSwingStrategy strategy({.distance = 2});
    const auto features = strategy.Calculate(data, {});
    REQUIRE(Number(features, "rally_count") == 1.0);
    REQUIRE(Number(features, "drop_count") == 1.0);
    REQUIRE(Number(features, "swing_count") == 1.0);
    REQUIRE_THAT(Number(features, "rally_avg_pct"), WithinAbs(rally, 1e-9));
    REQUIRE_THAT(Number(features, "drop_avg_pct"), WithinAbs(drop, 1e-9));
    REQUIRE_THAT(Number(features, "duration_symmetry"), WithinAbs(1.0, 1e-12));
  }

  SECTION("Moves below the amplitude filter are skipped") {
    const FindPeaksSwingStrategy strategy(
        {.distance = 2, .prominence = std::nullopt, .min_amplitude_pct = 0.2});
    const auto features = strategy.Calculate(data, {});
    REQUIRE(Number(features, "rally_count") == 1.0);
    REQUIRE(Number(features, "drop_count") == 0.0);
    REQUIRE(Number(features, "swing_count") == 0.0);
  }

  SECTION("An explicit prominence above the swing height finds nothing") {
    const FindPeaksSwingStrategy strategy(
        {.distance = 2, .prominence = 50.0, .min_amplitude_pct = 0.02});
    const auto features = strategy.Calculate(data, {});
    REQUIRE(Number(features, "rally_count") == 0.0);
    REQUIRE(Number(features, "drop_count") == 0.0);
  }

  SECTION("Invalid options are rejected") {
    REQUIRE_THROWS(FindPeaksSwingStrategy({.distance = 0}));
    REQUIRE_THROWS(FindPeaksSwingStrategy(
        {.distance = 2, .prominence = -1.0, .min_amplitude_pct = 0.02}));
  }
}

TEST_CASE("Pivot points swing strategy", "[strategies][swing]") {
  const PivotPointsSwingStrategy strategy;

  SECTION("Strict pivots over left and right bars") {
    const auto path = Triangle(13);
    const auto points = strategy.FindSwingPoints(path, path);
    REQUIRE(points.size() == 3);
    REQUIRE(points[0].position == 2);
    REQUIRE(points[1].position == 6);
    REQUIRE_FALSE(points[1].is_peak);
    REQUIRE(points[2].position == 10);
  }

  SECTION("Flat tops are not pivots") {
    const std::vector<double> path{100, 104, 108, 108, 104, 100};
    REQUIRE(strategy.FindSwingPoints(path, path).empty());
  }

  SECTION("Fewer bars than the pivot window gives empty swings") {
    const auto data = test::MakeSeries({{"close", {100.0, 110.0, 100.0, 90.0}}});
    const auto features = strategy.Calculate(data, {});
    REQUIRE(Number(features, "rally_count") == 0.0);
    REQUIRE(Number(features, "swing_count") == 0.0);
    REQUIRE(Number(features, "rally_to_drop_ratio") == 0.0);
  }

  SECTION("Invalid options are rejected") {
    REQUIRE_THROWS(PivotPointsSwingStrategy({.left_bars = 0}));
    REQUIRE_THROWS(PivotPointsSwingStrategy(
        {.left_bars = 2, .right_bars = 2, .min_amplitude_pct = -0.1}));
  }
}

TEST_CASE("Global swing context", "[strategies][swing]") {
  const auto series = test::MakeSeries({{"close", Triangle(33)}});
  const PivotPointsSwingStrategy strategy;
  const auto context = strategy.CalculateGlobal(series);

  SECTION("One pass over the whole series") {
    REQUIRE(context.strategy_name == "pivot_points");
    REQUIRE(context.series_length == 33);
    REQUIRE(context.min_amplitude == PivotPointsOptions{}.min_amplitude_pct);
    REQUIRE(context.points.size() == 8);
    REQUIRE(context.points.front().position == 2);
    REQUIRE(context.points.back().position == 30);
  }

  SECTION("Zones read the points inside their rows") {
    REQUIRE(context.PointsWithin(6, 10).size() == 2);
    REQUIRE(context.PointsWithin(-5, 2).size() == 1);
    REQUIRE(context.PointsWithin(11, 13).empty());
    REQUIRE(context.PointsWithin(10, 6).empty());
  }

  SECTION("Interior zones match the per-zone scan") {
    const auto zone = ZoneOver(series, 8, 20);
    REQUIRE(strategy.AggregateForZone(zone, context) ==
            strategy.Calculate(zone.data, {}));
    REQUIRE(Number(strategy.AggregateForZone(zone, context), "swing_count") ==
            1.0);
  }

  SECTION("Fewer than two points inside gives empty swings") {
    const auto zone = ZoneOver(series, 0, 4);
    const auto features = strategy.AggregateForZone(zone, context);
    REQUIRE(Number(features, "rally_count") == 0.0);
    REQUIRE(Number(features, "drop_count") == 0.0);
  }

  SECTION("Global swings need a close column") {
    const auto osc_only = test::MakeSeries({{"osc", Triangle(10)}});
    REQUIRE_THROWS_AS(strategy.CalculateGlobal(osc_only), std::invalid_argument);
  }
}

TEST_CASE("Swing presets", "[strategies][swing]") {
  SECTION("Named presets") {
    REQUIRE(SwingPresetNames() ==
            std::vector<std::string>{"default", "narrow_zone", "wide_zone"});
    REQUIRE(GetSwingPreset("default").zigzag.legs == ZigZagOptions{}.legs);
    REQUIRE(GetSwingPreset("narrow_zone").zigzag.legs == 3);
    REQUIRE(GetSwingPreset("narrow_zone").pivot_points.left_bars == 1);
    REQUIRE(GetSwingPreset("wide_zone").find_peaks.distance == 10);
    REQUIRE_THROWS_AS(GetSwingPreset("tiny"), ConfigurationError);
    REQUIRE_THROWS_WITH(GetSwingPreset("tiny"),
                        ContainsSubstring("Unknown swing preset"));
  }

  SECTION("Strategies take the preset parameters") {
    const auto zigzag = std::dynamic_pointer_cast<const ZigZagSwingStrategy>(
        MakeSwingStrategy("zigzag", {.preset = "narrow_zone"}));
    REQUIRE(zigzag);
    REQUIRE(zigzag->GetOptions().legs == 3);
    REQUIRE(zigzag->GetOptions().deviation == 0.01);

    const auto pivots =
        std::dynamic_pointer_cast<const PivotPointsSwingStrategy>(
            MakeSwingStrategy("pivot_points", {.preset = "wide_zone"}));
    REQUIRE(pivots);
    REQUIRE(pivots->GetOptions().right_bars == 3);
  }

  SECTION("Analyzer slots follow the swing settings") {
    const auto selected = analysis::AnalyzerStrategies::FromNames(
        {{"swing", "find_peaks"}}, {.preset = "wide_zone"});
    const auto peaks =
        std::dynamic_pointer_cast<const FindPeaksSwingStrategy>(selected.swing);
    REQUIRE(peaks);
    REQUIRE(peaks->GetOptions().distance == 10);
    REQUIRE_THROWS_AS(
        analysis::AnalyzerStrategies::FromNames({}, {.preset = "tiny"}),
        ConfigurationError);
  }

  SECTION("Auto thresholds wrap the strategy") {
    const auto swing = MakeSwingStrategy(
        "find_peaks", {.preset = "default", .auto_thresholds = true});
    REQUIRE(std::dynamic_pointer_cast<const AdaptiveSwingStrategy>(swing));
    REQUIRE(swing->Name() == "find_peaks");
  }

  SECTION("Other names come from the registry") {
    RegisterBuiltinAnalyticalStrategies();
    REQUIRE_THROWS_AS(MakeSwingStrategy("elliott", {}), UnknownStrategyError);
  }

  SECTION("Swing scope parsing") {
    REQUIRE(ParseSwingScope("global") == epoch_core::SwingScope::global);
    REQUIRE(ParseSwingScope("per_zone") == epoch_core::SwingScope::per_zone);
    REQUIRE_THROWS_WITH(ParseSwingScope("zone"),
                        ContainsSubstring("Invalid swing_scope"));
  }
}

TEST_CASE("Automatic swing thresholds", "[strategies][swing]") {
  const auto data = test::MakeSeries({{"high", {105.0, 110.0, 108.0}},
                                      {"low", {95.0, 90.0, 92.0}},
                                      {"close", {100.0, 100.0, 104.0}}});

  SECTION("Thresholds scale with the relative range") {
    const auto thresholds = AutoSwingThresholds(data, 0.01);
    REQUIRE(thresholds.mid_price == 100.0);
    REQUIRE_THAT(thresholds.relative_range, WithinAbs(0.2, 1e-12));
    REQUIRE_THAT(thresholds.zigzag_deviation, WithinAbs(0.1, 1e-12));
    REQUIRE_THAT(thresholds.peak_prominence, WithinAbs(0.06, 1e-12));
    REQUIRE_THAT(thresholds.pivot_deviation, WithinAbs(0.05, 1e-12));
  }

  SECTION("Quiet ranges keep the base deviation") {
    const auto quiet = test::MakeSeries({{"high", {100.2, 100.3}},
                                         {"low", {99.9, 99.8}},
                                         {"close", {100.0, 100.0}}});
    const auto thresholds = AutoSwingThresholds(quiet, 0.01);
    REQUIRE(thresholds.zigzag_deviation == 0.01);
    REQUIRE(thresholds.peak_prominence == 0.01);
    REQUIRE(thresholds.pivot_deviation == 0.01);
  }

  SECTION("Empty data and a zero mid price keep the base deviation") {
    REQUIRE(AutoSwingThresholds(epoch_frame::DataFrame{}, 0.02)
                .zigzag_deviation == 0.02);
    const auto zero = test::MakeSeries(
        {{"high", {1.0, 2.0}}, {"low", {0.0, 0.0}}, {"close", {0.0, 0.0}}});
    REQUIRE(AutoSwingThresholds(zero, 0.02).pivot_deviation == 0.02);
  }

  SECTION("High, low and close are required") {
    const auto close_only = test::MakeSeries({{"close", {100.0, 101.0}}});
    REQUIRE_THROWS_AS(AutoSwingThresholds(close_only), DataShapeError);
  }
}

TEST_CASE("Adaptive swing strategy", "[strategies][swing]") {
  const auto data = test::MakeSeries({{"high", {105.0, 110.0, 108.0}},
                                      {"low", {95.0, 90.0, 92.0}},
                                      {"close", {100.0, 100.0, 104.0}}});
  const auto &preset = GetSwingPreset("default");

  SECTION("Thresholds are applied to the configured strategy") {
    const AdaptiveSwingStrategy zigzag("zigzag", preset);
    const auto configured = std::dynamic_pointer_cast<const ZigZagSwingStrategy>(
        zigzag.Configure(data));
    REQUIRE(configured);
    REQUIRE_THAT(configured->GetOptions().deviation, WithinAbs(0.1, 1e-12));
    REQUIRE(configured->GetOptions().legs == preset.zigzag.legs);

    const AdaptiveSwingStrategy peaks("find_peaks", preset);
    const auto peaks_configured =
        std::dynamic_pointer_cast<const FindPeaksSwingStrategy>(
            peaks.Configure(data));
    REQUIRE(peaks_configured);
    REQUIRE_THAT(*peaks_configured->GetOptions().prominence,
                 WithinAbs(6.0, 1e-9));
    REQUIRE_THAT(peaks_configured->GetOptions().min_amplitude_pct,
                 WithinAbs(0.06, 1e-12));
  }

  SECTION("Per-zone and global passes use their own input") {
    const auto path = Triangle(33);
    const auto series = test::MakeSeries(
        {{"high", path}, {"low", path}, {"close", path}});
    const AdaptiveSwingStrategy pivots("pivot_points", preset);
    REQUIRE(pivots.Calculate(series, {}) ==
            pivots.Configure(series)->Calculate(series, {}));

    const auto context = pivots.CalculateGlobal(series);
    // range 20 over a median close of 100
    REQUIRE_THAT(context.min_amplitude, WithinAbs(0.05, 1e-12));
    const auto zone = ZoneOver(series, 8, 20);
    REQUIRE(Number(pivots.AggregateForZone(zone, context), "swing_count") ==
            1.0);
  }

  SECTION("Only point strategies and positive deviations") {
    REQUIRE_THROWS_AS(AdaptiveSwingStrategy("elliott", preset),
                      ConfigurationError);
    REQUIRE_THROWS_AS(AdaptiveSwingStrategy("zigzag", preset, 0.0),
                      ConfigurationError);
  }
}
