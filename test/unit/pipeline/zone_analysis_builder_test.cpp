#include "common/fake_zone_series.h"
#include "common/mocks.h"

#include <epoch_zones/core/errors.h>
#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/pipeline/zone_analysis_builder.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <trompeloeil.hpp>

using namespace epoch_zones;
using namespace epoch_zones::pipeline;
using Catch::Matchers::ContainsSubstring;
using trompeloeil::_;

TEST_CASE("Builder requires a detection strategy", "[pipeline][builder]") {
  ZoneAnalysisBuilder builder;
  builder.WithIndicator("custom", "osc").Analyze(false);

  REQUIRE_THROWS_AS(builder.Build(), ConfigurationError);
  REQUIRE_THROWS_WITH(
      builder.Build(),
      "Zone detection strategy not configured. Call DetectZones() first.");
}

TEST_CASE("Builder setters populate the configuration", "[pipeline][builder]") {
  RuleMap rules;
  rules["indicator_col"] = "osc";

  ZoneAnalysisBuilder builder;
  builder.WithIndicator("ta", "rsi", {})
      .DetectZones("zero_crossing", rules)
      .WithMinDuration(4)
      .WithZoneTypes({"bull"})
      .Analyze(true, 5, true, true)
      .WithClusteringFeatures({"duration", "price_return"})
      .WithStrategy("shape", "statistical")
      .WithCache(false, 120);

  const auto &config = builder.GetConfig();
  REQUIRE(config.indicator.has_value());
  REQUIRE(config.indicator->source == "ta");
  REQUIRE(config.indicator->name == "rsi");
  REQUIRE(config.detection.strategy_name == "zero_crossing");
  REQUIRE(rules::GetString(config.detection.rules, "indicator_col") == "osc");
  REQUIRE(config.detection.min_duration == 4);
  REQUIRE(config.detection.zone_types == std::vector<std::string>{"bull"});
  REQUIRE(config.perform_clustering);
  REQUIRE(config.n_clusters == 5);
  REQUIRE(config.run_regression);
  REQUIRE(config.run_validation);
  REQUIRE(config.clustering_features ==
          std::vector<std::string>{"duration", "price_return"});
  REQUIRE(config.strategies.at("shape") == "statistical");
  REQUIRE_FALSE(config.use_cache);
  REQUIRE(config.cache_ttl_seconds == 120);
}

TEST_CASE("Builder runs the pipeline", "[pipeline][builder]") {
  const auto series = test::MakeOscillatorSeries(200, 20.0);
  RuleMap rules;
  rules["indicator_col"] = "osc";

  SECTION("Series already carrying the indicator") {
    auto cache = std::make_shared<ZoneAnalysisCache>();
    ZoneAnalysisBuilder builder;
    builder.DetectZones("zero_crossing", rules).WithCacheHandle(cache);

    const auto result = builder.Run(series);
    REQUIRE(result != nullptr);
    REQUIRE_FALSE(result->zones.empty());
    REQUIRE(cache->MemoryEntries() == 1);
    REQUIRE(builder.Build().GetCache() == cache);
  }

  SECTION("Indicator computed by the provider") {
    std::vector<std::pair<std::string, std::vector<double>>> prices;
    for (const auto *column : {"open", "high", "low", "close", "volume"}) {
      prices.emplace_back(column, frame::ColumnValues(series, column));
    }
    const auto indicator =
        test::MakeSeries({{"osc", frame::ColumnValues(series, "osc")}});

    auto provider = std::make_shared<test::MockIndicatorProvider>();
    ALLOW_CALL(*provider, OutputColumns(_))
        .RETURN(std::vector<std::string>{"osc"});
    REQUIRE_CALL(*provider, Compute(_, _)).RETURN(indicator);

    ZoneAnalysisBuilder builder;
    builder.WithIndicator("custom", "osc")
        .DetectZones("zero_crossing", rules)
        .WithIndicatorProvider(provider)
        .WithCache(false);

    const auto result = builder.Run(test::MakeSeries(prices));
    REQUIRE(result != nullptr);
    REQUIRE(frame::HasColumn(result->data, "osc"));
    REQUIRE_FALSE(result->zones.empty());
  }
}

TEST_CASE("Builder swing settings", "[pipeline][builder]") {
  ZoneAnalysisBuilder builder;

  SECTION("Setters populate the swing configuration") {
    builder.WithSwingPreset("narrow_zone")
        .WithAutoSwingThresholds(true, 0.02)
        .WithSwingScope("global");
    const auto &swing = builder.GetConfig().swing;
    REQUIRE(swing.preset == "narrow_zone");
    REQUIRE(swing.auto_thresholds);
    REQUIRE(swing.base_deviation == 0.02);
    REQUIRE(swing.scope == epoch_core::SwingScope::global);
  }

  SECTION("Invalid settings are rejected") {
    REQUIRE_THROWS_WITH(builder.WithSwingPreset("tiny"),
                        ContainsSubstring("Unknown swing preset"));
    REQUIRE_THROWS_AS(builder.WithAutoSwingThresholds(true, 0.0),
                      ConfigurationError);
    REQUIRE_THROWS_WITH(builder.WithSwingScope("series"),
                        ContainsSubstring("Invalid swing_scope"));
    REQUIRE(builder.GetConfig().swing.preset == "default");
    REQUIRE(builder.GetConfig().swing.scope == epoch_core::SwingScope::per_zone);
  }

  SECTION("Disabling auto thresholds keeps the deviation") {
    builder.WithAutoSwingThresholds(false, 0.0);
    REQUIRE_FALSE(builder.GetConfig().swing.auto_thresholds);
    REQUIRE(builder.GetConfig().swing.base_deviation == SwingConfig{}.base_deviation);
  }

  SECTION("Global swings over a run") {
    RuleMap rules;
    rules["indicator_col"] = "osc";
    builder.DetectZones("zero_crossing", rules)
        .Analyze(false)
        .WithCache(false)
        .WithStrategy("swing", "pivot_points")
        .WithSwingScope("global");

    const auto result = builder.Run(test::MakeOscillatorSeries(200, 20.0, 5.0));
    REQUIRE(result != nullptr);
    REQUIRE(result->metadata.extra.at("swing_scope") == "global");
    REQUIRE(result->metadata.extra.at("swing_strategy") == "pivot_points");
    REQUIRE(result->metadata.extra.contains("swing_points"));
    for (const auto &zone : result->zones) {
      REQUIRE(zone.features.contains("swing_count"));
    }
  }
}
