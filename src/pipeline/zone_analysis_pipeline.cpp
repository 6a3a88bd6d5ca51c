#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/detection/detection_registry.h>
#include <epoch_zones/pipeline/zone_analysis_pipeline.h>

#include <arrow/chunked_array.h>
#include <boost/container_hash/hash.hpp>
#include <glaze/glaze.hpp>

#include <algorithm>
#include <format>
#include <optional>
#include <spdlog/spdlog.h>

namespace epoch_zones::pipeline {

namespace {

// Every configuration field that changes the outcome of a run
struct ConfigSignature {
  std::optional<IndicatorDescriptor> indicator;
  std::string strategy;
  int64_t min_duration{0};
  std::vector<std::string> zone_types;
  RuleMap rules;
  std::vector<std::string> conditions;
  bool perform_clustering{false};
  int64_t n_clusters{0};
  std::vector<std::string> clustering_features;
  bool run_regression{false};
  bool run_validation{false};
  std::map<std::string, std::string> strategies;
  std::string swing_preset;
  bool swing_auto_thresholds{false};
  double swing_base_deviation{0.0};
  std::string swing_scope;
};

std::string CanonicalConfig(const AnalysisConfig &config) {
  ConfigSignature signature{config.indicator,
                            config.detection.strategy_name,
                            config.detection.min_duration,
                            config.detection.zone_types,
                            config.detection.rules,
                            {},
                            config.perform_clustering,
                            config.n_clusters,
                            config.clustering_features,
                            config.run_regression,
                            config.run_validation,
                            config.strategies,
                            config.swing.preset,
                            config.swing.auto_thresholds,
                            config.swing.base_deviation,
                            epoch_core::SwingScopeWrapper::ToString(
                                config.swing.scope)};
  for (const auto &condition : config.detection.conditions) {
    signature.conditions.push_back(
        std::format("{}:{}", condition.declarative ? "rule" : "callable",
                    condition.description));
  }
  auto json = glz::write_json(signature);
  if (!json) {
    throw ConfigurationError("Failed to serialize configuration for cache key");
  }
  return json.value();
}

bool HasOpaqueConditions(const DetectionConfig &detection) {
  return std::ranges::any_of(detection.conditions,
                             [](const ZoneCondition &condition) {
                               return !condition.declarative;
                             });
}

std::size_t HashColumn(const epoch_frame::DataFrame &series,
                       const std::string &column,
                       const std::vector<std::string> &numeric) {
  if (std::ranges::find(numeric, column) != numeric.end()) {
    const auto values = frame::ColumnValues(series, column);
    return boost::hash_range(values.begin(), values.end());
  }
  return boost::hash_value(series[column].array()->ToString());
}

double MeanDuration(const ZoneList &zones) {
  if (zones.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto &zone : zones) {
    total += static_cast<double>(zone.duration);
  }
  return total / static_cast<double>(zones.size());
}

} // namespace

ZoneAnalysisPipeline::ZoneAnalysisPipeline(AnalysisConfig config,
                                           IIndicatorProviderPtr provider,
                                           ZoneAnalysisCachePtr cache)
    : m_config(std::move(config)), m_provider(std::move(provider)),
      m_cache(std::move(cache)) {
  detection::RegisterBuiltinDetectionStrategies();
  if (m_config.use_cache && !m_cache) {
    m_cache =
        std::make_shared<ZoneAnalysisCache>(ZoneAnalysisCache::DefaultDirectory());
  }
}

void ZoneAnalysisPipeline::Validate() const {
  const auto &detection_config = m_config.detection;
  if (detection_config.strategy_name.empty()) {
    throw ConfigurationError(
        "Zone detection strategy not configured. Call DetectZones() first.");
  }
  // Throws UnknownStrategyError listing the registered names
  (void)detection::ZoneDetectionRegistry::Instance().Info(
      detection_config.strategy_name);

  if (detection_config.min_duration < 1) {
    throw ConfigurationError(std::format("min_duration must be >= 1, got {}",
                                         detection_config.min_duration));
  }
  if (detection_config.zone_types.empty()) {
    throw ConfigurationError("zone_types must not be empty");
  }
  if (m_config.perform_clustering && m_config.n_clusters < 1) {
    throw ConfigurationError(
        std::format("n_clusters must be >= 1, got {}", m_config.n_clusters));
  }
  if (m_config.use_cache && m_config.cache_ttl_seconds <= 0) {
    throw ConfigurationError(std::format("cache_ttl must be positive, got {}",
                                         m_config.cache_ttl_seconds));
  }
  if (m_config.indicator && !m_provider) {
    throw ConfigurationError(std::format(
        "Indicator '{}.{}' configured but no indicator provider supplied",
        m_config.indicator->source, m_config.indicator->name));
  }
  (void)analysis::AnalyzerStrategies::FromNames(m_config.strategies,
                                                m_config.swing);
}

AnalysisResultPtr
ZoneAnalysisPipeline::Run(const epoch_frame::DataFrame &series) const {
  Validate();

  const bool use_cache = m_config.use_cache && m_cache;
  // Opaque conditions are keyed by their masks, which need the indicators
  std::optional<epoch_frame::DataFrame> prepared;
  if (use_cache && HasOpaqueConditions(m_config.detection)) {
    prepared = Prepare(series);
  }
  std::string key;
  if (use_cache) {
    key = ComputeKey(series, prepared ? &*prepared : nullptr);
    if (auto cached = m_cache->Get(key)) {
      SPDLOG_INFO("Using cached zone analysis {}", key);
      return cached;
    }
  }

  if (!prepared) {
    prepared = Prepare(series);
  }
  auto zones = Detect(*prepared);
  auto result = std::make_shared<const AnalysisResult>(
      Analyze(std::move(zones), *prepared));

  if (use_cache) {
    m_cache->Put(key, result, std::chrono::seconds(m_config.cache_ttl_seconds));
  }
  return result;
}

epoch_frame::DataFrame
ZoneAnalysisPipeline::Prepare(const epoch_frame::DataFrame &series) const {
  if (!m_config.indicator) {
    return series;
  }
  if (!m_provider) {
    throw ConfigurationError(
        "Indicator configured but no indicator provider supplied");
  }
  const auto &descriptor = *m_config.indicator;

  const auto expected = m_provider->OutputColumns(descriptor);
  const bool present =
      !expected.empty() &&
      std::ranges::all_of(expected, [&](const std::string &column) {
        return frame::HasColumn(series, column);
      });
  if (present) {
    SPDLOG_DEBUG("Indicator columns already present, skipping {}.{}",
                 descriptor.source, descriptor.name);
    return series;
  }

  SPDLOG_INFO("Computing indicator {}.{}", descriptor.source, descriptor.name);
  const auto computed = m_provider->Compute(descriptor, series);
  if (frame::RowCount(computed) != frame::RowCount(series)) {
    throw ZoneAnalysisError(std::format(
        "Indicator {}.{} returned {} rows for a series of {}",
        descriptor.source, descriptor.name, frame::RowCount(computed),
        frame::RowCount(series)));
  }
  return frame::MergeColumns(series, computed);
}

ZoneList ZoneAnalysisPipeline::Detect(const epoch_frame::DataFrame &prepared) const {
  auto strategy = detection::ZoneDetectionRegistry::Instance().Get(
      m_config.detection.strategy_name);
  auto zones = strategy->Detect(prepared, m_config.detection);
  SPDLOG_INFO("Detected {} zones with '{}'", zones.size(),
              m_config.detection.strategy_name);
  return zones;
}

AnalysisResult
ZoneAnalysisPipeline::Analyze(ZoneList zones,
                              const epoch_frame::DataFrame &prepared) const {
  analysis::UniversalZoneAnalyzer analyzer(
      analysis::AnalyzerStrategies::FromNames(m_config.strategies,
                                              m_config.swing));
  return analyzer.Analyze(std::move(zones), prepared, MakeAnalyzeOptions());
}

analysis::AnalyzeOptions ZoneAnalysisPipeline::MakeAnalyzeOptions() const {
  analysis::AnalyzeOptions options;
  options.perform_clustering = m_config.perform_clustering;
  options.clustering.n_clusters = static_cast<size_t>(
      std::max<int64_t>(1, m_config.n_clusters));
  options.clustering.features = m_config.clustering_features;
  options.run_regression = m_config.run_regression;
  options.run_validation = m_config.run_validation;
  options.swing_scope = m_config.swing.scope;

  if (m_config.run_validation) {
    options.reanalyze = [detection_config = m_config.detection](
                            const epoch_frame::DataFrame &slice) {
      auto strategy = detection::ZoneDetectionRegistry::Instance().Get(
          detection_config.strategy_name);
      const auto zones = strategy->Detect(slice, detection_config);
      return ValidationMetrics{static_cast<int64_t>(zones.size()),
                               MeanDuration(zones)};
    };
  }
  return options;
}

std::string
ZoneAnalysisPipeline::CacheKey(const epoch_frame::DataFrame &series) const {
  if (HasOpaqueConditions(m_config.detection)) {
    const auto prepared = Prepare(series);
    return ComputeKey(series, &prepared);
  }
  return ComputeKey(series, nullptr);
}

std::string
ZoneAnalysisPipeline::ComputeKey(const epoch_frame::DataFrame &series,
                                 const epoch_frame::DataFrame *prepared) const {
  std::size_t low = 0x9e3779b97f4a7c15ULL;
  std::size_t high = 0xc2b2ae3d27d4eb4fULL;
  const auto mix = [&](const auto &value) {
    boost::hash_combine(low, value);
    boost::hash_combine(high, value);
    boost::hash_combine(high, low);
  };

  mix(kCacheVersion);
  mix(frame::RowCount(series));
  const auto index = frame::Timestamps(series);
  mix(boost::hash_range(index.begin(), index.end()));
  const auto numeric = frame::NumericColumns(series);
  for (const auto &column : frame::ColumnNames(series)) {
    mix(column);
    mix(HashColumn(series, column, numeric));
  }
  mix(CanonicalConfig(m_config));

  if (prepared) {
    for (const auto &condition : m_config.detection.conditions) {
      if (condition.declarative) {
        continue;
      }
      std::size_t mask_hash = 0;
      for (const bool flag : condition.evaluate(*prepared)) {
        boost::hash_combine(mask_hash, flag);
      }
      mix(mask_hash);
    }
  }

  return std::format("zone_analysis_{:016x}{:016x}", high, low);
}

void ZoneAnalysisPipeline::Invalidate(const epoch_frame::DataFrame &series) const {
  if (m_cache) {
    m_cache->Invalidate(CacheKey(series));
  }
}

} // namespace epoch_zones::pipeline
