#include <epoch_zones/analysis/statistics.h>
#include <epoch_zones/analysis/zone_analyzer.h>
#include <epoch_zones/analysis/zone_features.h>
#include <epoch_zones/strategies/strategy_registry.h>
#include <epoch_zones/strategies/swing_presets.h>

#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_for.h>

#include <algorithm>
#include <chrono>
#include <format>
#include <set>
#include <spdlog/spdlog.h>

namespace epoch_zones::analysis {

namespace {

int64_t NowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

template <typename StrategyPtr>
void MergeSlot(const Zone &zone, const StrategyPtr &strategy,
               const std::string &slot,
               const strategies::ColumnSelection &columns,
               FeatureMap &features) {
  if (!strategy) {
    return;
  }
  try {
    for (auto &[key, value] : strategy->Calculate(zone.data, columns)) {
      features.insert_or_assign(key, std::move(value));
    }
  } catch (const std::exception &e) {
    SPDLOG_WARN("zone {}: {} strategy '{}' failed, features skipped: {}",
                zone.zone_id, slot, strategy->Name(), e.what());
  }
}

void NoteDegraded(RunMetadata &metadata, AnalysisDegraded note) {
  SPDLOG_WARN("{} skipped: {}", note.component, note.reason);
  metadata.degraded.push_back(std::move(note));
}

} // namespace

AnalyzerStrategies
AnalyzerStrategies::FromNames(const std::map<std::string, std::string> &names,
                              const SwingConfig &swing) {
  using namespace strategies;
  RegisterBuiltinAnalyticalStrategies();

  const auto known = epoch_core::AnalyticalSlotWrapper::GetAllAsStrings();
  for (const auto &[slot, _] : names) {
    if (slot == "Null" || std::ranges::find(known, slot) == known.end()) {
      throw UnknownStrategyError(
          slot, std::format("Unknown analytical slot: '{}'. Available: shape, "
                            "divergence, volatility, volume, swing",
                            slot));
    }
  }
  const auto name_for = [&](const char *slot, const char *fallback) {
    auto it = names.find(slot);
    return it == names.end() ? std::string(fallback) : it->second;
  };

  AnalyzerStrategies result;
  result.shape = ShapeStrategyRegistry::Instance().Create(
      name_for("shape", kDefaultShape));
  result.divergence = DivergenceStrategyRegistry::Instance().Create(
      name_for("divergence", kDefaultDivergence));
  result.volatility = VolatilityStrategyRegistry::Instance().Create(
      name_for("volatility", kDefaultVolatility));
  result.volume = VolumeStrategyRegistry::Instance().Create(
      name_for("volume", kDefaultVolume));
  result.swing = MakeSwingStrategy(name_for("swing", kDefaultSwing), swing);
  return result;
}

FeatureMap UniversalZoneAnalyzer::ExtractFeatures(
    const Zone &zone, const strategies::SwingContext *swing_context) const {
  const auto columns = ResolveColumns(zone);

  FeatureMap features;
  try {
    features = ExtractBaseFeatures(zone, columns.primary);
  } catch (const std::exception &e) {
    SPDLOG_WARN("zone {}: base features failed: {}", zone.zone_id, e.what());
    features["duration"] = static_cast<double>(zone.duration);
  }

  MergeSlot(zone, m_strategies.shape, "shape", columns, features);
  MergeSlot(zone, m_strategies.divergence, "divergence", columns, features);
  MergeSlot(zone, m_strategies.volatility, "volatility", columns, features);
  MergeSlot(zone, m_strategies.volume, "volume", columns, features);
  if (swing_context && m_strategies.swing) {
    try {
      for (auto &[key, value] :
           m_strategies.swing->AggregateForZone(zone, *swing_context)) {
        features.insert_or_assign(key, std::move(value));
      }
    } catch (const std::exception &e) {
      SPDLOG_WARN("zone {}: swing aggregation '{}' failed, features skipped: {}",
                  zone.zone_id, m_strategies.swing->Name(), e.what());
    }
  } else {
    MergeSlot(zone, m_strategies.swing, "swing", columns, features);
  }
  return features;
}

AnalysisResult UniversalZoneAnalyzer::Analyze(ZoneList zones,
                                              const epoch_frame::DataFrame &series,
                                              const AnalyzeOptions &options) const {
  AnalysisResult result;
  result.data = series;
  result.metadata.analysis_timestamp = NowNs();

  if (zones.empty()) {
    SPDLOG_WARN("No zones provided, returning empty result");
    return result;
  }
  SPDLOG_INFO("Starting analysis of {} zones", zones.size());
  auto &metadata = result.metadata;

  std::optional<strategies::SwingContext> swing_context;
  if (options.swing_scope == epoch_core::SwingScope::global &&
      m_strategies.swing) {
    try {
      swing_context = m_strategies.swing->CalculateGlobal(series);
      metadata.extra["swing_points"] =
          std::to_string(swing_context->points.size());
    } catch (const std::exception &e) {
      NoteDegraded(metadata,
                   {"swing_context",
                    std::format("global swings failed, using per_zone: {}",
                                e.what())});
    }
  }
  if (m_strategies.swing) {
    metadata.extra["swing_strategy"] = m_strategies.swing->Name();
    metadata.extra["swing_scope"] = swing_context ? "global" : "per_zone";
  }

  const auto *context = swing_context ? &*swing_context : nullptr;
  oneapi::tbb::parallel_for(
      oneapi::tbb::blocked_range<size_t>(0, zones.size()),
      [&](const oneapi::tbb::blocked_range<size_t> &range) {
        for (size_t i = range.begin(); i != range.end(); ++i) {
          zones[i].features = ExtractFeatures(zones[i], context);
        }
      });

  metadata.total_zones = static_cast<int64_t>(zones.size());
  std::set<std::string> labels;
  for (const auto &zone : zones) {
    labels.insert(zone.label);
  }
  metadata.zone_types.assign(labels.begin(), labels.end());

  result.statistics = ComputeZoneStatistics(zones, options.hypothesis.alpha);
  result.hypothesis_tests = RunHypothesisTests(zones, options.hypothesis);

  result.sequence_analysis = AnalyzeSequence(zones, options.sequence);
  if (!result.sequence_analysis) {
    NoteDegraded(metadata,
                 {"sequence_analysis",
                  std::format("insufficient zones: {} < {}", zones.size(),
                              options.sequence.min_zones)});
  }

  if (options.perform_clustering) {
    auto clustering = ClusterZones(zones, options.clustering);
    if (auto *value = std::get_if<ClusteringResult>(&clustering)) {
      result.clustering = std::move(*value);
    } else {
      NoteDegraded(metadata, std::get<AnalysisDegraded>(clustering));
    }
  }

  if (options.run_regression) {
    std::vector<AnalysisDegraded> notes;
    auto regression = RunRegression(zones, options.regression, notes);
    if (auto *value = std::get_if<RegressionResult>(&regression)) {
      result.regression = std::move(*value);
    } else {
      notes.push_back(std::get<AnalysisDegraded>(regression));
    }
    for (auto &note : notes) {
      NoteDegraded(metadata, std::move(note));
    }
  }

  if (options.run_validation) {
    std::vector<AnalysisDegraded> notes;
    auto validation = RunValidation(series, zones.size(), options.reanalyze,
                                    options.validation, notes);
    if (auto *value = std::get_if<ValidationResult>(&validation)) {
      result.validation = std::move(*value);
    } else {
      notes.push_back(std::get<AnalysisDegraded>(validation));
    }
    for (auto &note : notes) {
      NoteDegraded(metadata, std::move(note));
    }
  }

  metadata.clustering_performed = result.clustering.has_value();
  metadata.regression_performed = result.regression.has_value();
  metadata.validation_performed = result.validation.has_value();
  result.zones = std::move(zones);

  SPDLOG_INFO("Analysis complete: {} zones, clustering={}, regression={}, "
              "validation={}",
              result.zones.size(), metadata.clustering_performed,
              metadata.regression_performed, metadata.validation_performed);
  return result;
}

} // namespace epoch_zones::analysis
