#pragma once
//
// Prepare -> Detect -> Analyze with content-addressed caching
//

#include <epoch_zones/analysis/zone_analyzer.h>
#include <epoch_zones/pipeline/indicator_provider.h>
#include <epoch_zones/pipeline/zone_analysis_cache.h>

namespace epoch_zones::pipeline {

class ZoneAnalysisPipeline {
public:
  explicit ZoneAnalysisPipeline(AnalysisConfig config,
                                IIndicatorProviderPtr provider = nullptr,
                                ZoneAnalysisCachePtr cache = nullptr);

  // Validates the configuration, serves cached results when enabled and
  // otherwise runs every stage and caches the outcome
  [[nodiscard]] AnalysisResultPtr Run(const epoch_frame::DataFrame &series) const;

  // Adds the indicator columns unless they are already present
  [[nodiscard]] epoch_frame::DataFrame
  Prepare(const epoch_frame::DataFrame &series) const;

  [[nodiscard]] ZoneList Detect(const epoch_frame::DataFrame &prepared) const;

  [[nodiscard]] AnalysisResult Analyze(ZoneList zones,
                                       const epoch_frame::DataFrame &prepared) const;

  // Throws ConfigurationError / UnknownStrategyError
  void Validate() const;

  // "zone_analysis_" + 32 hex digits over the index, every column and the
  // configuration. Conditions without a declarative description contribute
  // their masks over the prepared series.
  [[nodiscard]] std::string CacheKey(const epoch_frame::DataFrame &series) const;

  void Invalidate(const epoch_frame::DataFrame &series) const;

  [[nodiscard]] const AnalysisConfig &GetConfig() const { return m_config; }
  [[nodiscard]] const ZoneAnalysisCachePtr &GetCache() const { return m_cache; }

private:
  [[nodiscard]] analysis::AnalyzeOptions MakeAnalyzeOptions() const;

  [[nodiscard]] std::string
  ComputeKey(const epoch_frame::DataFrame &series,
             const epoch_frame::DataFrame *prepared) const;

  AnalysisConfig m_config;
  IIndicatorProviderPtr m_provider;
  ZoneAnalysisCachePtr m_cache;
};

} // namespace epoch_zones::pipeline
