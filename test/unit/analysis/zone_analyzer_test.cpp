#include "common/fake_zone_series.h"

#include <epoch_zones/analysis/zone_analyzer.h>
#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/detection/detection_registry.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <format>
#include <random>

using namespace epoch_zones;
using namespace epoch_zones::analysis;
using Catch::Matchers::ContainsSubstring;

namespace {

const AnalysisDegraded *FindNote(const RunMetadata &metadata,
                                 const std::string &component) {
  auto it = std::ranges::find(metadata.degraded, component,
                              &AnalysisDegraded::component);
  return it == metadata.degraded.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("Analyzer on an empty zone list", "[analysis][analyzer]") {
  const UniversalZoneAnalyzer analyzer(AnalyzerStrategies::FromNames());
  const auto series = test::MakeOscillatorSeries(50, 10.0);

  AnalyzeOptions options;
  options.run_regression = true;
  options.run_validation = true;
  const auto result = analyzer.Analyze({}, series, options);

  REQUIRE(result.zones.empty());
  REQUIRE(result.statistics.total_zones == 0);
  REQUIRE_FALSE(result.hypothesis_tests.has_value());
  REQUIRE_FALSE(result.sequence_analysis.has_value());
  REQUIRE_FALSE(result.clustering.has_value());
  REQUIRE_FALSE(result.regression.has_value());
  REQUIRE_FALSE(result.validation.has_value());
  REQUIRE(result.metadata.total_zones == 0);
  REQUIRE(result.metadata.analysis_timestamp > 0);
  REQUIRE_FALSE(result.metadata.clustering_performed);
  REQUIRE(frame::RowCount(result.data) == 50);
}

TEST_CASE("Analyzer with more clusters than zones", "[analysis][analyzer]") {
  const UniversalZoneAnalyzer analyzer(AnalyzerStrategies::FromNames());
  const auto zones = test::MakeAlternatingZones(3);

  AnalyzeOptions options;
  options.clustering.n_clusters = 5;
  const auto result = analyzer.Analyze(zones, epoch_frame::DataFrame{}, options);

  REQUIRE(result.zones.size() == 3);
  REQUIRE_FALSE(result.clustering.has_value());
  REQUIRE_FALSE(result.metadata.clustering_performed);
  const auto *note = FindNote(result.metadata, "clustering");
  REQUIRE(note != nullptr);
  REQUIRE_THAT(note->reason, ContainsSubstring("insufficient zones"));

  // The rest of the run is unaffected
  REQUIRE(result.statistics.total_zones == 3);
  REQUIRE(result.hypothesis_tests.has_value());
  REQUIRE(result.sequence_analysis.has_value());
}

TEST_CASE("Analyzer population run", "[analysis][analyzer]") {
  const UniversalZoneAnalyzer analyzer(AnalyzerStrategies::FromNames());
  const auto zones = test::MakeAlternatingZones(12);

  AnalyzeOptions options;
  options.clustering.n_clusters = 2;
  options.run_regression = true;
  options.run_validation = true;
  const auto result = analyzer.Analyze(zones, epoch_frame::DataFrame{}, options);

  SECTION("Every zone gets base and slot features") {
    REQUIRE(result.zones.size() == 12);
    for (size_t i = 0; i < result.zones.size(); ++i) {
      const auto &zone = result.zones[i];
      REQUIRE(zone.zone_id == static_cast<int64_t>(i));
      REQUIRE(zone.GetNumericFeature("duration") ==
              static_cast<double>(zone.duration));
      REQUIRE(zone.features.contains("price_return"));
      REQUIRE(zone.features.contains("indicator_amplitude"));
      REQUIRE(zone.features.contains("shape_skewness"));
      REQUIRE(zone.features.contains("volume_avg"));
    }
  }

  SECTION("Metadata") {
    REQUIRE(result.metadata.total_zones == 12);
    REQUIRE(result.metadata.zone_types == std::vector<std::string>{"bear", "bull"});
    REQUIRE(result.metadata.clustering_performed);
    REQUIRE(result.clustering->assignments.size() == 12);
    REQUIRE(result.metadata.regression_performed);
    REQUIRE(result.regression->models.contains("duration"));
  }

  SECTION("Validation without a re-analysis function is noted") {
    REQUIRE_FALSE(result.validation.has_value());
    REQUIRE_FALSE(result.metadata.validation_performed);
    REQUIRE(FindNote(result.metadata, "validation") != nullptr);
  }
}

TEST_CASE("Analyzer gates on population size", "[analysis][analyzer]") {
  const UniversalZoneAnalyzer analyzer(AnalyzerStrategies::FromNames());
  const auto zones = test::MakeAlternatingZones(2);

  AnalyzeOptions options;
  options.perform_clustering = false;
  options.run_regression = true;
  const auto result = analyzer.Analyze(zones, epoch_frame::DataFrame{}, options);

  REQUIRE_FALSE(result.sequence_analysis.has_value());
  REQUIRE(FindNote(result.metadata, "sequence_analysis") != nullptr);
  REQUIRE_FALSE(result.regression.has_value());
  REQUIRE_THAT(FindNote(result.metadata, "regression")->reason,
               ContainsSubstring("insufficient zones"));
  // Not requested, so not noted
  REQUIRE(FindNote(result.metadata, "clustering") == nullptr);
}

TEST_CASE("Analyzer is agnostic to the detection strategy",
          "[analysis][analyzer]") {
  const UniversalZoneAnalyzer analyzer(AnalyzerStrategies::FromNames());

  auto zone = test::MakeZone(0, "overbought", {100.0, 104.0, 103.0, 101.0});
  // Rename the indicator as a threshold strategy would report it
  zone.data = test::MakeSeries({{"close", frame::ColumnValues(zone.data, "close")},
                                {"high", frame::ColumnValues(zone.data, "high")},
                                {"low", frame::ColumnValues(zone.data, "low")},
                                {"rsi", {72.0, 80.0, 76.0, 71.0}}});
  zone.context.primary_column = "rsi";
  zone.context.strategy_name = "threshold";

  const auto features = analyzer.ExtractFeatures(zone);
  REQUIRE(features.contains("indicator_amplitude"));
  REQUIRE(std::get<double>(features.at("indicator_amplitude")) == 9.0);
  REQUIRE(features.contains("drawdown_from_peak"));
  REQUIRE(features.contains("shape_kurtosis"));
  // No volume column, so no volume features
  REQUIRE_FALSE(features.contains("volume_avg"));
}

TEST_CASE("Analyzer follows an indicator column named at run time",
          "[analysis][analyzer]") {
  std::random_device device;
  const auto column = std::format("ind_{:08x}", device());

  const auto base = test::MakeOscillatorSeries(240, 30.0);
  auto values = frame::ColumnValues(base, "osc");
  for (auto &value : values) {
    value *= 40.0;
  }
  // A decoy oscillator the fallback would pick first
  const auto series = frame::MergeColumns(
      base, test::MakeSeries({{column, values},
                              {"osc", std::vector<double>(240, 0.25)}}));

  detection::RegisterBuiltinDetectionStrategies();
  DetectionConfig config;
  config.strategy_name = "zero_crossing";
  config.rules["indicator_col"] = column;
  const auto zones = detection::ZoneDetectionRegistry::Instance()
                         .Get("zero_crossing")
                         ->Detect(series, config);
  REQUIRE(zones.size() >= 10);

  const UniversalZoneAnalyzer analyzer(AnalyzerStrategies::FromNames());
  AnalyzeOptions options;
  options.perform_clustering = false;
  const auto result = analyzer.Analyze(zones, series, options);

  for (const auto &zone : result.zones) {
    REQUIRE(zone.context.primary_column == column);
    const auto zone_values = frame::ColumnValues(zone.data, column);
    const auto [low, high] = std::ranges::minmax(zone_values);
    REQUIRE(zone.GetNumericFeature("indicator_amplitude") == high - low);
    REQUIRE(zone.features.contains("divergence_count"));
    REQUIRE(zone.features.contains("shape_skewness"));
  }
}

TEST_CASE("Analyzer with no slots configured", "[analysis][analyzer]") {
  const UniversalZoneAnalyzer analyzer;
  const auto zone = test::MakeZone(0, "bull", {100.0, 101.0, 102.0});
  const auto features = analyzer.ExtractFeatures(zone);
  REQUIRE(features.contains("price_return"));
  REQUIRE_FALSE(features.contains("shape_skewness"));
  REQUIRE_FALSE(features.contains("rally_count"));
}
