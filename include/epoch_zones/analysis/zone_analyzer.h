#pragma once
//
// Universal Zone Analyzer
//
// Extracts per-zone features through the injected analytical slots and runs
// the population-level analyses. Agnostic to which detection strategy or
// indicator produced the zones.
//

#include <epoch_zones/analysis/analysis_result.h>
#include <epoch_zones/analysis/clustering.h>
#include <epoch_zones/analysis/hypothesis.h>
#include <epoch_zones/analysis/regression.h>
#include <epoch_zones/analysis/sequence.h>
#include <epoch_zones/analysis/validation.h>
#include <epoch_zones/strategies/ianalytical_strategy.h>

namespace epoch_zones::analysis {

// Any slot may be null, in which case its features are not computed
struct AnalyzerStrategies {
  strategies::IShapeStrategyPtr shape;
  strategies::IDivergenceStrategyPtr divergence;
  strategies::IVolatilityStrategyPtr volatility;
  strategies::IVolumeStrategyPtr volume;
  strategies::ISwingStrategyPtr swing;

  // Registered strategies by slot name; unnamed slots use the defaults. The
  // swing slot is built with the preset and threshold settings of swing.
  // Throws UnknownStrategyError for an unknown slot or strategy name and
  // ConfigurationError for an unknown preset.
  static AnalyzerStrategies
  FromNames(const std::map<std::string, std::string> &names = {},
            const SwingConfig &swing = {});
};

struct AnalyzeOptions {
  bool perform_clustering{true};
  ClusteringOptions clustering;
  bool run_regression{false};
  RegressionOptions regression;
  bool run_validation{false};
  ValidationOptions validation;
  // Required for validation; supplied by the pipeline
  ReanalyzeFunction reanalyze;
  HypothesisOptions hypothesis;
  SequenceOptions sequence;
  // global computes swing points once over the series; a failure falls back
  // to per_zone with a degraded note
  epoch_core::SwingScope swing_scope{epoch_core::SwingScope::per_zone};
};

class UniversalZoneAnalyzer {
public:
  explicit UniversalZoneAnalyzer(AnalyzerStrategies strategies = {})
      : m_strategies(std::move(strategies)) {}

  // Zones are copied into the result with their features filled in. An
  // empty zone list yields an empty, well-formed result.
  [[nodiscard]] AnalysisResult Analyze(ZoneList zones,
                                       const epoch_frame::DataFrame &series,
                                       const AnalyzeOptions &options = {}) const;

  // Base features plus every configured slot; a failing slot is logged and
  // only its features are missing. With a swing context the swing slot
  // aggregates the context's points instead of scanning the zone.
  [[nodiscard]] FeatureMap
  ExtractFeatures(const Zone &zone,
                  const strategies::SwingContext *swing_context = nullptr) const;

  [[nodiscard]] const AnalyzerStrategies &GetStrategies() const {
    return m_strategies;
  }

private:
  AnalyzerStrategies m_strategies;
};

} // namespace epoch_zones::analysis
