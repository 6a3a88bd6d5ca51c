#include <epoch_zones/pipeline/zone_analysis_builder.h>
#include <epoch_zones/strategies/swing_presets.h>

#include <format>

namespace epoch_zones::pipeline {

ZoneAnalysisBuilder &ZoneAnalysisBuilder::WithIndicator(std::string source,
                                                        std::string name,
                                                        RuleMap parameters) {
  m_config.indicator = IndicatorDescriptor{std::move(source), std::move(name),
                                           std::move(parameters)};
  return *this;
}

ZoneAnalysisBuilder &ZoneAnalysisBuilder::DetectZones(std::string strategy,
                                                      RuleMap rules) {
  m_config.detection.strategy_name = std::move(strategy);
  m_config.detection.rules = std::move(rules);
  m_detection_set = true;
  return *this;
}

ZoneAnalysisBuilder &ZoneAnalysisBuilder::WithMinDuration(int64_t min_duration) {
  m_config.detection.min_duration = min_duration;
  return *this;
}

ZoneAnalysisBuilder &
ZoneAnalysisBuilder::WithZoneTypes(std::vector<std::string> zone_types) {
  m_config.detection.zone_types = std::move(zone_types);
  return *this;
}

ZoneAnalysisBuilder &
ZoneAnalysisBuilder::WithConditions(std::vector<ZoneCondition> conditions) {
  m_config.detection.conditions = std::move(conditions);
  return *this;
}

ZoneAnalysisBuilder &ZoneAnalysisBuilder::Analyze(bool clustering,
                                                  int64_t n_clusters,
                                                  bool regression,
                                                  bool validation) {
  m_config.perform_clustering = clustering;
  m_config.n_clusters = n_clusters;
  m_config.run_regression = regression;
  m_config.run_validation = validation;
  return *this;
}

ZoneAnalysisBuilder &
ZoneAnalysisBuilder::WithClusteringFeatures(std::vector<std::string> features) {
  m_config.clustering_features = std::move(features);
  return *this;
}

ZoneAnalysisBuilder &ZoneAnalysisBuilder::WithStrategy(const std::string &slot,
                                                       std::string name) {
  m_config.strategies[slot] = std::move(name);
  return *this;
}

ZoneAnalysisBuilder &
ZoneAnalysisBuilder::WithSwingPreset(const std::string &name) {
  (void)strategies::GetSwingPreset(name);
  m_config.swing.preset = name;
  return *this;
}

ZoneAnalysisBuilder &
ZoneAnalysisBuilder::WithAutoSwingThresholds(bool enable,
                                             double base_deviation) {
  if (enable && !(base_deviation > 0.0)) {
    throw ConfigurationError(std::format(
        "base_deviation must be positive, got {}", base_deviation));
  }
  m_config.swing.auto_thresholds = enable;
  if (enable) {
    m_config.swing.base_deviation = base_deviation;
  }
  return *this;
}

ZoneAnalysisBuilder &
ZoneAnalysisBuilder::WithSwingScope(const std::string &scope) {
  m_config.swing.scope = strategies::ParseSwingScope(scope);
  return *this;
}

ZoneAnalysisBuilder &ZoneAnalysisBuilder::WithCache(bool enable,
                                                    int64_t ttl_seconds) {
  m_config.use_cache = enable;
  m_config.cache_ttl_seconds = ttl_seconds;
  return *this;
}

ZoneAnalysisBuilder &
ZoneAnalysisBuilder::WithCacheHandle(ZoneAnalysisCachePtr cache) {
  m_cache = std::move(cache);
  return *this;
}

ZoneAnalysisBuilder &
ZoneAnalysisBuilder::WithIndicatorProvider(IIndicatorProviderPtr provider) {
  m_provider = std::move(provider);
  return *this;
}

ZoneAnalysisPipeline ZoneAnalysisBuilder::Build() const {
  if (!m_detection_set || m_config.detection.strategy_name.empty()) {
    throw ConfigurationError(
        "Zone detection strategy not configured. Call DetectZones() first.");
  }
  return ZoneAnalysisPipeline(m_config, m_provider, m_cache);
}

AnalysisResultPtr
ZoneAnalysisBuilder::Run(const epoch_frame::DataFrame &series) const {
  return Build().Run(series);
}

} // namespace epoch_zones::pipeline
