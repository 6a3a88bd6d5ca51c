#include "analysis/adf.h"
#include "common/fake_zone_series.h"

#include <epoch_zones/analysis/clustering.h>
#include <epoch_zones/analysis/hypothesis.h>
#include <epoch_zones/analysis/regression.h>
#include <epoch_zones/analysis/sequence.h>
#include <epoch_zones/analysis/statistics.h>
#include <epoch_zones/analysis/validation.h>
#include <epoch_zones/analysis/zone_features.h>
#include <epoch_zones/core/frame_utils.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <random>

using namespace epoch_zones;
using namespace epoch_zones::analysis;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace {

// Feature-only zone; no bar data attached
Zone FeatureZone(int64_t id, const std::string &label, int64_t start_idx,
                 FeatureMap features) {
  Zone zone;
  zone.zone_id = id;
  zone.label = label;
  zone.start_idx = start_idx;
  if (auto it = features.find("duration"); it != features.end()) {
    zone.duration = static_cast<int64_t>(std::get<double>(it->second));
  }
  zone.end_idx = start_idx + zone.duration - 1;
  zone.features = std::move(features);
  return zone;
}

ZoneList AnalyzedAlternatingZones(size_t count) {
  auto zones = test::MakeAlternatingZones(count);
  for (auto &zone : zones) {
    zone.features = ExtractBaseFeatures(zone, "osc");
  }
  return zones;
}

} // namespace

TEST_CASE("Zone statistics", "[analysis][statistics]") {
  const ZoneList zones{
      FeatureZone(0, "bull", 0, {{"duration", 2.0}, {"price_return", 0.02}}),
      FeatureZone(1, "bear", 2, {{"duration", 1.0}, {"price_return", -0.04}}),
      FeatureZone(2, "bull", 3, {{"duration", 4.0}, {"price_return", 0.05}}),
      FeatureZone(3, "bear", 7, {{"duration", 3.0}, {"price_return", -0.05}}),
      FeatureZone(4, "bull", 10, {{"duration", 6.0}, {"price_return", 0.04},
                                  {"atr_trend", std::string("stable")}})};

  const auto stats = ComputeZoneStatistics(zones);
  REQUIRE(stats.total_zones == 5);
  REQUIRE(stats.label_counts.at("bull") == 3);
  REQUIRE(stats.label_counts.at("bear") == 2);
  REQUIRE_THAT(stats.label_ratios.at("bull"), WithinAbs(0.6, 1e-12));

  SECTION("Only numeric features are described") {
    REQUIRE(stats.features.size() == 2);
    REQUIRE_FALSE(stats.features.contains("atr_trend"));
    const auto &duration = stats.features.at("duration");
    REQUIRE(duration.count == 5);
    REQUIRE_THAT(duration.mean, WithinAbs(3.2, 1e-12));
    REQUIRE(duration.min == 1.0);
    REQUIRE(duration.max == 6.0);
    REQUIRE_THAT(stats.by_label.at("bull").at("duration").mean,
                 WithinAbs(4.0, 1e-12));
    REQUIRE_THAT(stats.by_label.at("bear").at("price_return").mean,
                 WithinAbs(-0.045, 1e-12));
  }

  SECTION("The two most frequent labels are compared") {
    REQUIRE(stats.comparisons.size() == 2);
    const auto &duration = stats.comparisons.front();
    REQUIRE(duration.metric == "duration");
    REQUIRE(duration.label_a == "bull");
    REQUIRE(duration.label_b == "bear");
    REQUIRE_THAT(duration.mean_b, WithinAbs(2.0, 1e-12));
    REQUIRE(duration.t_statistic > 0.0);
    REQUIRE(stats.comparisons.back().metric == "price_return");
    REQUIRE(stats.comparisons.back().significant);
  }

  SECTION("Degenerate populations") {
    REQUIRE(ComputeZoneStatistics({}).total_zones == 0);
    const auto single_label = ComputeZoneStatistics({zones[0], zones[2]});
    REQUIRE(single_label.comparisons.empty());
    REQUIRE(single_label.features.at("duration").count == 2);
  }
}

TEST_CASE("Distribution helpers", "[analysis][statistics]") {
  const auto stats = DescribeDistribution({4, 1, 3, 2});
  REQUIRE(stats.has_value());
  REQUIRE_THAT(stats->mean, WithinAbs(2.5, 1e-12));
  REQUIRE_THAT(stats->median, WithinAbs(2.5, 1e-12));
  REQUIRE_THAT(stats->q25, WithinAbs(1.75, 1e-12));
  REQUIRE_THAT(stats->q75, WithinAbs(3.25, 1e-12));
  REQUIRE_THAT(stats->std, WithinAbs(1.2909944, 1e-6));
  REQUIRE_FALSE(DescribeDistribution({}).has_value());

  ZoneList zones;
  for (const auto *label : {"b", "a", "a", "b", "c"}) {
    zones.push_back(FeatureZone(static_cast<int64_t>(zones.size()), label, 0, {}));
  }
  REQUIRE(LabelsByFrequency(zones) == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Hypothesis test battery", "[analysis][hypothesis]") {
  const std::vector<std::string> expected{
      "label_duration_difference",  "label_weighted_return_difference",
      "duration_return_relationship", "label_sequence_randomness",
      "transition_independence",    "duration_stationarity",
      "duration_trend"};

  SECTION("Every test is reported") {
    const auto suite = RunHypothesisTests(AnalyzedAlternatingZones(20));
    REQUIRE(suite.total_tests == 7);
    for (const auto &name : expected) {
      INFO(name);
      REQUIRE(suite.tests.contains(name));
      REQUIRE(suite.tests.at(name).name == name);
    }
    REQUIRE(suite.alpha == 0.05);
  }

  SECTION("Strict alternation is detected as non-random") {
    const auto suite = RunHypothesisTests(AnalyzedAlternatingZones(20));
    const auto &runs = suite.tests.at("label_sequence_randomness");
    REQUIRE_FALSE(runs.error.has_value());
    REQUIRE(runs.method == "runs_test");
    REQUIRE(runs.significant);
    const auto &transitions = suite.tests.at("transition_independence");
    REQUIRE(transitions.method == "chi_square");
    REQUIRE(transitions.significant);
    REQUIRE(transitions.details.at("dof") == 1.0);
    REQUIRE(suite.significant_tests >= 2);
  }

  SECTION("Label difference picks its method from normality") {
    const auto suite = RunHypothesisTests(AnalyzedAlternatingZones(20));
    const auto &duration = suite.tests.at("label_duration_difference");
    REQUIRE_FALSE(duration.error.has_value());
    REQUIRE((duration.method == "student_t" || duration.method == "mann_whitney_u"));
    REQUIRE(duration.sample_size == 20);
    REQUIRE(duration.details.contains("mean_bull"));
    REQUIRE(duration.details.contains("mean_bear"));
  }

  SECTION("Increasing durations trend") {
    ZoneList zones;
    int64_t start = 0;
    for (int64_t i = 0; i < 12; ++i) {
      const double duration = 2.0 + static_cast<double>(i);
      zones.push_back(FeatureZone(i, i % 2 == 0 ? "bull" : "bear", start,
                                  {{"duration", duration}}));
      start += static_cast<int64_t>(duration);
    }
    const auto suite = RunHypothesisTests(zones);
    const auto &trend = suite.tests.at("duration_trend");
    REQUIRE(trend.method == "pearson");
    REQUIRE_THAT(*trend.effect_size, WithinAbs(1.0, 1e-9));
    REQUIRE(trend.significant);
    REQUIRE(suite.tests.at("duration_return_relationship").error.has_value());
  }

  SECTION("Small or single-label inputs record errors instead of failing") {
    const auto suite = RunHypothesisTests(AnalyzedAlternatingZones(2));
    REQUIRE(suite.total_tests == 7);
    for (const auto &name : expected) {
      INFO(name);
      REQUIRE_FALSE(suite.tests.at(name).significant);
    }
    REQUIRE_THAT(*suite.tests.at("duration_stationarity").error,
                 ContainsSubstring("insufficient zones"));
    REQUIRE(suite.significant_tests == 0);

    ZoneList bulls;
    for (int64_t i = 0; i < 5; ++i) {
      bulls.push_back(FeatureZone(i, "bull", i * 10, {{"duration", 3.0 + i}}));
    }
    const auto single = RunHypothesisTests(bulls);
    REQUIRE_THAT(*single.tests.at("label_duration_difference").error,
                 ContainsSubstring("two distinct labels"));
  }
}

TEST_CASE("Sequence analysis", "[analysis][sequence]") {
  SECTION("Transitions follow start order, not list order") {
    const ZoneList zones{FeatureZone(2, "bull", 20, {}),
                         FeatureZone(0, "bull", 0, {}),
                         FeatureZone(4, "bull", 40, {}),
                         FeatureZone(1, "bear", 10, {}),
                         FeatureZone(3, "bear", 30, {})};
    const auto sequence = AnalyzeSequence(zones);
    REQUIRE(sequence.has_value());
    REQUIRE(sequence->transition_counts.at("bull").at("bear") == 2);
    REQUIRE(sequence->transition_counts.at("bear").at("bull") == 2);
    REQUIRE_FALSE(sequence->transition_counts.at("bull").contains("bull"));
    REQUIRE(sequence->transition_probabilities.at("bear").at("bull") == 1.0);
    REQUIRE(sequence->mean_run_length.at("bull") == 1.0);

    // bull-bear, bear-bull and bull-bear-bull occur twice
    REQUIRE(sequence->patterns.size() == 3);
    for (const auto &pattern : sequence->patterns) {
      REQUIRE(pattern.occurrences == 2);
    }
  }

  SECTION("Run lengths") {
    ZoneList zones;
    int64_t start = 0;
    for (const auto *label : {"a", "a", "b", "a", "a", "a"}) {
      zones.push_back(FeatureZone(start, label, start, {}));
      ++start;
    }
    const auto sequence = AnalyzeSequence(zones);
    REQUIRE(sequence.has_value());
    REQUIRE_THAT(sequence->mean_run_length.at("a"), WithinAbs(2.5, 1e-12));
    REQUIRE(sequence->max_run_length.at("a") == 3);
    REQUIRE(sequence->max_run_length.at("b") == 1);
    REQUIRE_THAT(sequence->transition_probabilities.at("a").at("a"),
                 WithinAbs(0.75, 1e-12));
  }

  SECTION("Fewer than three zones") {
    REQUIRE_FALSE(AnalyzeSequence(test::MakeAlternatingZones(2)).has_value());
  }
}

TEST_CASE("Zone clustering", "[analysis][clustering]") {
  ZoneList zones;
  const std::vector<double> durations{1.0, 1.1, 0.9, 10.0, 10.2, 9.8};
  for (size_t i = 0; i < durations.size(); ++i) {
    zones.push_back(FeatureZone(static_cast<int64_t>(i), i < 3 ? "bear" : "bull",
                                static_cast<int64_t>(i) * 20,
                                {{"duration", durations[i]},
                                 {"price_return", i < 3 ? -0.01 : 0.03}}));
  }
  ClusteringOptions options;
  options.n_clusters = 2;
  options.features = {"duration", "price_return"};

  SECTION("Well separated groups") {
    const auto outcome = ClusterZones(zones, options);
    REQUIRE(std::holds_alternative<ClusteringResult>(outcome));
    const auto &result = std::get<ClusteringResult>(outcome);
    REQUIRE(result.n_clusters == 2);
    REQUIRE(result.assignments.size() == 6);
    REQUIRE(result.assignments.at(0) == result.assignments.at(1));
    REQUIRE(result.assignments.at(0) == result.assignments.at(2));
    REQUIRE(result.assignments.at(3) == result.assignments.at(5));
    REQUIRE(result.assignments.at(0) != result.assignments.at(3));

    const auto &short_cluster = result.clusters.at(result.assignments.at(0));
    REQUIRE(short_cluster.size == 3);
    REQUIRE(short_cluster.label_counts.at("bear") == 3);
    REQUIRE_THAT(short_cluster.centroid.at("duration"), WithinAbs(1.0, 1e-9));
    const auto &long_cluster = result.clusters.at(result.assignments.at(3));
    REQUIRE_THAT(long_cluster.centroid.at("duration"), WithinAbs(10.0, 1e-9));
  }

  SECTION("Zones missing a feature are left unassigned") {
    zones.push_back(FeatureZone(6, "bull", 200, {{"duration", 5.0}}));
    const auto &result = std::get<ClusteringResult>(ClusterZones(zones, options));
    REQUIRE(result.assignments.size() == 6);
    REQUIRE_FALSE(result.assignments.contains(6));
  }

  SECTION("More clusters than zones degrades") {
    options.n_clusters = 7;
    const auto outcome = ClusterZones(zones, options);
    REQUIRE(std::holds_alternative<AnalysisDegraded>(outcome));
    const auto &note = std::get<AnalysisDegraded>(outcome);
    REQUIRE(note.component == "clustering");
    REQUIRE_THAT(note.reason, ContainsSubstring("insufficient zones"));
  }

  SECTION("Invalid options degrade") {
    options.n_clusters = 0;
    REQUIRE(std::holds_alternative<AnalysisDegraded>(ClusterZones(zones, options)));
    options.n_clusters = 2;
    options.features.clear();
    REQUIRE(std::holds_alternative<AnalysisDegraded>(ClusterZones(zones, options)));
  }
}

TEST_CASE("Zone regression", "[analysis][regression]") {
  // duration = 2 + 3 * amplitude exactly
  ZoneList zones;
  for (int64_t i = 0; i < 12; ++i) {
    const double amplitude = static_cast<double>(i % 5) + 0.5 * static_cast<double>(i);
    zones.push_back(FeatureZone(i, i % 2 == 0 ? "bull" : "bear", i * 20,
                                {{"duration", 2.0 + 3.0 * amplitude},
                                 {"indicator_amplitude", amplitude}}));
  }

  SECTION("Exact linear relationship") {
    const auto outcome = FitOls(zones, "duration", {"indicator_amplitude"});
    REQUIRE(std::holds_alternative<RegressionModel>(outcome));
    const auto &model = std::get<RegressionModel>(outcome);
    REQUIRE(model.n_obs == 12);
    REQUIRE_THAT(model.coefficients.at("intercept"), WithinAbs(2.0, 1e-8));
    REQUIRE_THAT(model.coefficients.at("indicator_amplitude"), WithinAbs(3.0, 1e-8));
    REQUIRE_THAT(model.r_squared, WithinAbs(1.0, 1e-9));
    REQUIRE(model.std_errors.contains("indicator_amplitude"));
  }

  SECTION("Too few observations for the predictors") {
    const ZoneList few(zones.begin(), zones.begin() + 3);
    const auto outcome = FitOls(few, "duration", {"indicator_amplitude"});
    REQUIRE(std::holds_alternative<AnalysisDegraded>(outcome));
    REQUIRE(std::get<AnalysisDegraded>(outcome).component == "regression.duration");
  }

  SECTION("Unfittable targets are noted, fittable ones kept") {
    std::vector<AnalysisDegraded> notes;
    const auto outcome = RunRegression(zones, {}, notes);
    REQUIRE(std::holds_alternative<RegressionResult>(outcome));
    const auto &result = std::get<RegressionResult>(outcome);
    REQUIRE(result.models.contains("duration"));
    REQUIRE(result.models.at("duration").predictors ==
            std::vector<std::string>{"indicator_amplitude"});
    REQUIRE_FALSE(result.models.contains("price_return"));
    REQUIRE(notes.size() == 1);
    REQUIRE(notes.front().component == "regression.price_return");
  }

  SECTION("Ten zones or fewer degrade") {
    std::vector<AnalysisDegraded> notes;
    const ZoneList ten(zones.begin(), zones.begin() + 10);
    const auto outcome = RunRegression(ten, {}, notes);
    REQUIRE(std::holds_alternative<AnalysisDegraded>(outcome));
    REQUIRE_THAT(std::get<AnalysisDegraded>(outcome).reason,
                 ContainsSubstring("insufficient zones"));
  }
}

TEST_CASE("Validation", "[analysis][validation]") {
  const auto series = test::MakeOscillatorSeries(100, 20.0);
  const ReanalyzeFunction constant = [](const epoch_frame::DataFrame &) {
    return ValidationMetrics{10, 5.0};
  };

  SECTION("Degradation percentage") {
    REQUIRE_THAT(DegradationPct(10.0, 12.0), WithinAbs(20.0, 1e-12));
    REQUIRE_THAT(DegradationPct(10.0, 7.0), WithinAbs(-30.0, 1e-12));
    REQUIRE(DegradationPct(0.0, 0.0) == 0.0);
    REQUIRE(DegradationPct(0.0, 5.0) == 100.0);
  }

  SECTION("Out-of-sample splits at the train ratio") {
    std::vector<size_t> rows_seen;
    const ReanalyzeFunction by_rows = [&](const epoch_frame::DataFrame &slice) {
      rows_seen.push_back(frame::RowCount(slice));
      return ValidationMetrics{1, static_cast<double>(frame::RowCount(slice))};
    };
    const auto outcome = OutOfSampleTest(series, by_rows, {});
    REQUIRE(std::holds_alternative<OutOfSampleResult>(outcome));
    const auto &result = std::get<OutOfSampleResult>(outcome);
    REQUIRE(result.split_index == 70);
    REQUIRE(rows_seen == std::vector<size_t>{70, 30});
    REQUIRE_THAT(result.degradation_pct, WithinAbs(-400.0 / 7.0, 1e-9));
    REQUIRE_FALSE(result.passed);

    const auto stable = std::get<OutOfSampleResult>(OutOfSampleTest(series, constant, {}));
    REQUIRE(stable.degradation_pct == 0.0);
    REQUIRE(stable.passed);
  }

  SECTION("Invalid train ratio degrades") {
    ValidationOptions options;
    options.train_ratio = 1.0;
    REQUIRE(std::holds_alternative<AnalysisDegraded>(
        OutOfSampleTest(series, constant, options)));
  }

  SECTION("Walk-forward windows shrink for short series") {
    const auto outcome = WalkForwardTest(series, constant, {});
    REQUIRE(std::holds_alternative<WalkForwardResult>(outcome));
    const auto &result = std::get<WalkForwardResult>(outcome);
    REQUIRE(result.train_window == 50);
    REQUIRE(result.test_window == 25);
    REQUIRE(result.step == 12);
    REQUIRE(result.windows.size() == 3);
    REQUIRE(result.windows[1].train_start == 12);
    REQUIRE(result.windows[1].test_start == 62);
    REQUIRE(result.windows[1].test_end == 87);
    REQUIRE(result.passed);
  }

  SECTION("Re-analysis failures degrade") {
    const ReanalyzeFunction failing = [](const epoch_frame::DataFrame &) -> ValidationMetrics {
      throw std::runtime_error("detector exploded");
    };
    const auto oos = OutOfSampleTest(series, failing, {});
    REQUIRE_THAT(std::get<AnalysisDegraded>(oos).reason,
                 ContainsSubstring("detector exploded"));
    const auto wf = WalkForwardTest(series, failing, {});
    REQUIRE(std::get<AnalysisDegraded>(wf).reason == "no window completed");

    std::vector<AnalysisDegraded> notes;
    const auto all = RunValidation(series, 25, failing, {}, notes);
    REQUIRE(std::holds_alternative<AnalysisDegraded>(all));
    REQUIRE(notes.size() == 2);
  }

  SECTION("Validation needs more than twenty zones and a re-analysis function") {
    std::vector<AnalysisDegraded> notes;
    REQUIRE_THAT(std::get<AnalysisDegraded>(
                     RunValidation(series, 20, constant, {}, notes))
                     .reason,
                 ContainsSubstring("insufficient zones"));
    REQUIRE(std::holds_alternative<AnalysisDegraded>(
        RunValidation(series, 25, nullptr, {}, notes)));

    const auto outcome = RunValidation(series, 21, constant, {}, notes);
    REQUIRE(std::holds_alternative<ValidationResult>(outcome));
    const auto &result = std::get<ValidationResult>(outcome);
    REQUIRE(result.metric == "mean_duration");
    REQUIRE(result.out_of_sample.has_value());
    REQUIRE(result.walk_forward.has_value());
  }
}

TEST_CASE("ADF stationarity regression", "[analysis][hypothesis]") {
  SECTION("White noise rejects the unit root") {
    std::mt19937 rng(7);
    std::normal_distribution<double> noise(0.0, 1.0);
    std::vector<double> series(200);
    for (auto &value : series) {
      value = noise(rng);
    }
    const auto result = adf::ComputeAdf(series, 1);
    REQUIRE(result.has_value());
    REQUIRE(result->nobs == 198);
    REQUIRE(result->used_lag == 1);
    REQUIRE(result->gamma < 0.0);
    REQUIRE(result->adf_stat < result->critical_values[0]);
    REQUIRE(result->pvalue <= 0.01);
  }

  SECTION("Degenerate inputs yield no result") {
    REQUIRE_FALSE(adf::ComputeAdf({1.0, 2.0, 3.0}, 1).has_value());
    REQUIRE_FALSE(adf::ComputeAdf(std::vector<double>(30, 4.0), 1).has_value());
  }
}
