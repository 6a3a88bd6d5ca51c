#pragma once
//
// Analysis result model
//
// An AnalysisResult is built once at the end of a run and shared as
// std::shared_ptr<const AnalysisResult>. Optional sections stay unset when
// the sub-analysis was not requested or was skipped; skips are recorded in
// metadata.degraded.
//

#include <epoch_zones/core/errors.h>
#include <epoch_zones/core/zone.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace epoch_zones {

namespace visualization {
class IZoneRenderer;
}

struct DistributionStats {
  int64_t count{0};
  double mean{0};
  double median{0};
  double std{0};
  double min{0};
  double max{0};
  double q25{0};
  double q75{0};
  std::optional<double> skewness;
  std::optional<double> kurtosis;

  bool operator==(const DistributionStats &) const = default;
};

// Welch t comparison of one feature between the two most populous labels
struct LabelComparison {
  std::string metric;
  std::string label_a;
  std::string label_b;
  double mean_a{0};
  double mean_b{0};
  double t_statistic{0};
  double p_value{1};
  bool significant{false};

  bool operator==(const LabelComparison &) const = default;
};

struct ZoneStatistics {
  int64_t total_zones{0};
  std::map<std::string, int64_t> label_counts;
  std::map<std::string, double> label_ratios;
  // feature -> stats over all zones
  std::map<std::string, DistributionStats> features;
  // label -> feature -> stats
  std::map<std::string, std::map<std::string, DistributionStats>> by_label;
  std::vector<LabelComparison> comparisons;

  bool operator==(const ZoneStatistics &) const = default;
};

struct HypothesisTestResult {
  std::string name;
  std::string hypothesis;
  std::string method;
  std::optional<double> statistic;
  std::optional<double> p_value;
  std::optional<double> effect_size;
  int64_t sample_size{0};
  bool significant{false};
  // Set when the test could not run; significant is then false
  std::optional<std::string> error;
  std::map<std::string, double> details;

  bool operator==(const HypothesisTestResult &) const = default;
};

struct HypothesisSuiteResult {
  double alpha{0.05};
  std::map<std::string, HypothesisTestResult> tests;
  int64_t total_tests{0};
  int64_t significant_tests{0};

  bool operator==(const HypothesisSuiteResult &) const = default;
};

struct SequencePattern {
  std::vector<std::string> labels;
  int64_t occurrences{0};

  bool operator==(const SequencePattern &) const = default;
};

struct SequenceAnalysis {
  // from label -> to label
  std::map<std::string, std::map<std::string, int64_t>> transition_counts;
  std::map<std::string, std::map<std::string, double>> transition_probabilities;
  std::map<std::string, double> mean_run_length;
  std::map<std::string, int64_t> max_run_length;
  std::vector<SequencePattern> patterns;

  bool operator==(const SequenceAnalysis &) const = default;
};

struct ClusterSummary {
  int64_t cluster_id{0};
  int64_t size{0};
  std::map<std::string, double> centroid;
  std::map<std::string, int64_t> label_counts;

  bool operator==(const ClusterSummary &) const = default;
};

struct ClusteringResult {
  int64_t n_clusters{0};
  std::vector<std::string> features;
  // zone_id -> cluster id
  std::map<int64_t, int64_t> assignments;
  std::vector<ClusterSummary> clusters;

  bool operator==(const ClusteringResult &) const = default;
};

struct RegressionModel {
  std::string target;
  std::vector<std::string> predictors;
  int64_t n_obs{0};
  double r_squared{0};
  double adj_r_squared{0};
  // Keyed by predictor name plus "intercept"
  std::map<std::string, double> coefficients;
  std::map<std::string, double> std_errors;
  std::map<std::string, double> p_values;

  bool operator==(const RegressionModel &) const = default;
};

struct RegressionResult {
  // target -> fitted model
  std::map<std::string, RegressionModel> models;

  bool operator==(const RegressionResult &) const = default;
};

// Zone metrics of a re-analysis over a sub-range of the series
struct ValidationMetrics {
  int64_t total_zones{0};
  double mean_duration{0};

  bool operator==(const ValidationMetrics &) const = default;
};

struct OutOfSampleResult {
  double train_ratio{0.7};
  int64_t split_index{0};
  ValidationMetrics train;
  ValidationMetrics test;
  // (test - train) / train, in percent
  double degradation_pct{0};
  bool passed{false};

  bool operator==(const OutOfSampleResult &) const = default;
};

struct WalkForwardWindow {
  int64_t train_start{0};
  int64_t train_end{0};
  int64_t test_start{0};
  int64_t test_end{0};
  ValidationMetrics train;
  ValidationMetrics test;

  bool operator==(const WalkForwardWindow &) const = default;
};

struct WalkForwardResult {
  int64_t train_window{0};
  int64_t test_window{0};
  int64_t step{0};
  std::vector<WalkForwardWindow> windows;
  double avg_train_metric{0};
  double avg_test_metric{0};
  double degradation_pct{0};
  bool passed{false};

  bool operator==(const WalkForwardResult &) const = default;
};

struct ValidationResult {
  std::string metric{"mean_duration"};
  double degradation_threshold{0.2};
  std::optional<OutOfSampleResult> out_of_sample;
  std::optional<WalkForwardResult> walk_forward;

  bool operator==(const ValidationResult &) const = default;
};

struct RunMetadata {
  int64_t analysis_timestamp{0}; // epoch nanoseconds UTC
  int64_t total_zones{0};
  std::vector<std::string> zone_types;
  bool clustering_performed{false};
  bool regression_performed{false};
  bool validation_performed{false};
  std::vector<AnalysisDegraded> degraded;
  std::map<std::string, std::string> extra;

  bool operator==(const RunMetadata &) const = default;
};

struct AnalysisResult {
  ZoneList zones;
  ZoneStatistics statistics;
  std::optional<HypothesisSuiteResult> hypothesis_tests;
  std::optional<SequenceAnalysis> sequence_analysis;
  std::optional<ClusteringResult> clustering;
  std::optional<RegressionResult> regression;
  std::optional<ValidationResult> validation;
  epoch_frame::DataFrame data;
  RunMetadata metadata;

  // Modes: "overview", "detail:<zone-id>", "comparison", "statistics".
  // Throws std::invalid_argument naming an unknown mode or zone id.
  [[nodiscard]] std::string
  Visualize(const std::string &mode,
            const visualization::IZoneRenderer &renderer) const;

  [[nodiscard]] const Zone *FindZone(int64_t zone_id) const;
};

using AnalysisResultPtr = std::shared_ptr<const AnalysisResult>;

} // namespace epoch_zones
