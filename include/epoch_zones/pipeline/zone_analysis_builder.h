#pragma once
//
// Fluent front-end collecting an AnalysisConfig
//
// Rules are forwarded to the detection strategy untouched; validation
// happens when the pipeline runs.
//

#include <epoch_zones/pipeline/zone_analysis_pipeline.h>

namespace epoch_zones::pipeline {

class ZoneAnalysisBuilder {
public:
  ZoneAnalysisBuilder &WithIndicator(std::string source, std::string name,
                                     RuleMap parameters = {});
  ZoneAnalysisBuilder &DetectZones(std::string strategy, RuleMap rules = {});
  ZoneAnalysisBuilder &WithMinDuration(int64_t min_duration);
  ZoneAnalysisBuilder &WithZoneTypes(std::vector<std::string> zone_types);
  ZoneAnalysisBuilder &WithConditions(std::vector<ZoneCondition> conditions);
  ZoneAnalysisBuilder &Analyze(bool clustering = true, int64_t n_clusters = 3,
                               bool regression = false,
                               bool validation = false);
  ZoneAnalysisBuilder &
  WithClusteringFeatures(std::vector<std::string> features);
  ZoneAnalysisBuilder &WithStrategy(const std::string &slot, std::string name);
  // Throws ConfigurationError for an unknown preset name
  ZoneAnalysisBuilder &WithSwingPreset(const std::string &name);
  ZoneAnalysisBuilder &WithAutoSwingThresholds(bool enable = true,
                                               double base_deviation = 0.01);
  // "per_zone" or "global"; anything else throws ConfigurationError
  ZoneAnalysisBuilder &WithSwingScope(const std::string &scope);
  ZoneAnalysisBuilder &WithCache(bool enable, int64_t ttl_seconds = 3600);
  ZoneAnalysisBuilder &WithCacheHandle(ZoneAnalysisCachePtr cache);
  ZoneAnalysisBuilder &WithIndicatorProvider(IIndicatorProviderPtr provider);

  // Throws ConfigurationError when DetectZones() was never called
  [[nodiscard]] ZoneAnalysisPipeline Build() const;

  [[nodiscard]] AnalysisResultPtr Run(const epoch_frame::DataFrame &series) const;

  [[nodiscard]] const AnalysisConfig &GetConfig() const { return m_config; }

private:
  AnalysisConfig m_config;
  bool m_detection_set{false};
  IIndicatorProviderPtr m_provider;
  ZoneAnalysisCachePtr m_cache;
};

} // namespace epoch_zones::pipeline
