#pragma once
//
// One-call analyses for common indicators
//
// Each preset configures a ZoneAnalysisBuilder and runs it. Indicators are
// computed with TulipIndicatorProvider unless the series already carries
// the output columns.
//

#include <epoch_zones/detection/external_zones.h>
#include <epoch_zones/pipeline/zone_analysis_builder.h>

#include <filesystem>
#include <optional>

namespace epoch_zones::pipeline {

// Analysis and cache settings shared by every preset
struct PresetAnalysisOptions {
  bool clustering{true};
  int64_t n_clusters{3};
  bool regression{false};
  bool validation{false};
  bool enable_cache{true};
  int64_t cache_ttl_seconds{3600};
  // Shared cache; the pipeline default is used when null
  ZoneAnalysisCachePtr cache;
};

struct MacdZoneOptions {
  int64_t fast{12};
  int64_t slow{26};
  int64_t signal{9};
  int64_t min_duration{2};
  std::vector<std::string> zone_types{"bull", "bear"};
  std::optional<int64_t> smooth_window;
  PresetAnalysisOptions analysis;
};

// Zero crossings of the MACD histogram (column "macd_histogram")
[[nodiscard]] AnalysisResultPtr
AnalyzeMacdZones(const epoch_frame::DataFrame &series,
                 const MacdZoneOptions &options = {});

struct RsiZoneOptions {
  int64_t period{14};
  double upper_threshold{70.0};
  double lower_threshold{30.0};
  int64_t min_duration{2};
  std::vector<std::string> zone_types{"overbought", "between", "oversold"};
  PresetAnalysisOptions analysis;
};

// Overbought / oversold bands of RSI (column "rsi")
[[nodiscard]] AnalysisResultPtr
AnalyzeRsiZones(const epoch_frame::DataFrame &series,
                const RsiZoneOptions &options = {});

struct AoZoneOptions {
  int64_t min_duration{2};
  std::vector<std::string> zone_types{"bull", "bear"};
  std::optional<int64_t> smooth_window;
  PresetAnalysisOptions analysis;
};

// Zero crossings of the Awesome Oscillator (column "ao"). Tulip fixes its
// periods at 5 and 34 bars.
[[nodiscard]] AnalysisResultPtr
AnalyzeAoZones(const epoch_frame::DataFrame &series,
               const AoZoneOptions &options = {});

// Zones imported from a table; every zone type in the table is kept
[[nodiscard]] AnalysisResultPtr
AnalyzePreloadedZones(const epoch_frame::DataFrame &series,
                      const std::vector<detection::ExternalZone> &zones,
                      const PresetAnalysisOptions &options = {});

// Same, reading the table with LoadExternalZonesCsv
[[nodiscard]] AnalysisResultPtr
AnalyzePreloadedZones(const epoch_frame::DataFrame &series,
                      const std::filesystem::path &zones_csv,
                      const PresetAnalysisOptions &options = {});

} // namespace epoch_zones::pipeline
