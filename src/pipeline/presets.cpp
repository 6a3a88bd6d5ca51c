#include <epoch_zones/pipeline/presets.h>
#include <epoch_zones/pipeline/tulip_indicator_provider.h>

#include <spdlog/spdlog.h>

namespace epoch_zones::pipeline {

namespace {

ZoneAnalysisBuilder &ApplyAnalysis(ZoneAnalysisBuilder &builder,
                                   const PresetAnalysisOptions &options) {
  builder
      .Analyze(options.clustering, options.n_clusters, options.regression,
               options.validation)
      .WithCache(options.enable_cache, options.cache_ttl_seconds);
  if (options.cache) {
    builder.WithCacheHandle(options.cache);
  }
  return builder;
}

RuleMap ZeroCrossingRules(const std::string &column,
                          const std::optional<int64_t> &smooth_window) {
  RuleMap rules;
  rules["indicator_col"] = column;
  if (smooth_window) {
    rules["smooth_window"] = static_cast<double>(*smooth_window);
  }
  return rules;
}

} // namespace

AnalysisResultPtr AnalyzeMacdZones(const epoch_frame::DataFrame &series,
                                   const MacdZoneOptions &options) {
  RuleMap parameters;
  parameters["short_period"] = static_cast<double>(options.fast);
  parameters["long_period"] = static_cast<double>(options.slow);
  parameters["signal_period"] = static_cast<double>(options.signal);

  ZoneAnalysisBuilder builder;
  builder.WithIndicator(kTulipSource, "macd", std::move(parameters))
      .WithIndicatorProvider(std::make_shared<const TulipIndicatorProvider>())
      .DetectZones("zero_crossing",
                   ZeroCrossingRules("macd_histogram", options.smooth_window))
      .WithMinDuration(options.min_duration)
      .WithZoneTypes(options.zone_types);
  return ApplyAnalysis(builder, options.analysis).Run(series);
}

AnalysisResultPtr AnalyzeRsiZones(const epoch_frame::DataFrame &series,
                                  const RsiZoneOptions &options) {
  RuleMap parameters;
  parameters["period"] = static_cast<double>(options.period);
  RuleMap rules;
  rules["indicator_col"] = std::string("rsi");
  rules["upper_threshold"] = options.upper_threshold;
  rules["lower_threshold"] = options.lower_threshold;

  ZoneAnalysisBuilder builder;
  builder.WithIndicator(kTulipSource, "rsi", std::move(parameters))
      .WithIndicatorProvider(std::make_shared<const TulipIndicatorProvider>())
      .DetectZones("threshold", std::move(rules))
      .WithMinDuration(options.min_duration)
      .WithZoneTypes(options.zone_types);
  return ApplyAnalysis(builder, options.analysis).Run(series);
}

AnalysisResultPtr AnalyzeAoZones(const epoch_frame::DataFrame &series,
                                 const AoZoneOptions &options) {
  ZoneAnalysisBuilder builder;
  builder.WithIndicator(kTulipSource, "ao")
      .WithIndicatorProvider(std::make_shared<const TulipIndicatorProvider>())
      .DetectZones("zero_crossing",
                   ZeroCrossingRules("ao", options.smooth_window))
      .WithMinDuration(options.min_duration)
      .WithZoneTypes(options.zone_types);
  return ApplyAnalysis(builder, options.analysis).Run(series);
}

AnalysisResultPtr
AnalyzePreloadedZones(const epoch_frame::DataFrame &series,
                      const std::vector<detection::ExternalZone> &zones,
                      const PresetAnalysisOptions &options) {
  ZoneAnalysisBuilder builder;
  builder.DetectZones("preloaded", detection::MakePreloadedRules(zones))
      .WithZoneTypes({"any"});
  return ApplyAnalysis(builder, options).Run(series);
}

AnalysisResultPtr
AnalyzePreloadedZones(const epoch_frame::DataFrame &series,
                      const std::filesystem::path &zones_csv,
                      const PresetAnalysisOptions &options) {
  SPDLOG_INFO("Analyzing preloaded zones from {}", zones_csv.string());
  return AnalyzePreloadedZones(series, detection::LoadExternalZonesCsv(zones_csv),
                               options);
}

} // namespace epoch_zones::pipeline
