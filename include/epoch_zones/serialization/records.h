#pragma once
//
// Plain-data records mirroring Zone and AnalysisResult
//
// DataFrames are carried as FrameSnapshot so that glaze can reflect every
// field. JSON records leave the snapshots unset.
//

#include <epoch_zones/analysis/analysis_result.h>
#include <epoch_zones/core/frame_utils.h>

#include <optional>

namespace epoch_zones::serialization {

// Bumped whenever a record layout changes
constexpr int64_t kFormatVersion = 2;

struct ZoneRecord {
  int64_t zone_id{0};
  std::string label;
  int64_t start_idx{0};
  int64_t end_idx{0};
  int64_t start_time{0};
  int64_t end_time{0};
  int64_t duration{1};
  FeatureMap features;
  // Numeric features that were NaN or infinite; restored as NaN
  std::vector<std::string> non_finite_features;
  IndicatorContext context;
  std::optional<frame::FrameSnapshot> data;
};

struct AnalysisRecord {
  int64_t version{kFormatVersion};
  std::vector<ZoneRecord> zones;
  ZoneStatistics statistics;
  std::optional<HypothesisSuiteResult> hypothesis_tests;
  std::optional<SequenceAnalysis> sequence_analysis;
  std::optional<ClusteringResult> clustering;
  std::optional<RegressionResult> regression;
  std::optional<ValidationResult> validation;
  RunMetadata metadata;
  std::optional<frame::FrameSnapshot> data;
};

[[nodiscard]] ZoneRecord ToRecord(const Zone &zone, bool with_data);
[[nodiscard]] Zone FromRecord(const ZoneRecord &record);

[[nodiscard]] AnalysisRecord ToRecord(const AnalysisResult &result,
                                      bool with_data);
[[nodiscard]] AnalysisResult FromRecord(AnalysisRecord record);

} // namespace epoch_zones::serialization
