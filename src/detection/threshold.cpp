#include "threshold.h"
#include "detection_common.h"

#include <format>
#include <spdlog/spdlog.h>

namespace epoch_zones::detection {

namespace {
constexpr int kUpperBand = 1;
constexpr int kMiddleBand = 2;
constexpr int kLowerBand = 3;
constexpr int kUndefined = 0;

void ReadBandLabels(const DetectionConfig &config, ThresholdOptions &options) {
  auto it = config.rules.find("band_labels");
  if (it == config.rules.end()) {
    return;
  }
  if (!it->second.is_object()) {
    throw ConfigurationError(
        "threshold: rule 'band_labels' must be an object {upper, middle, lower}");
  }
  const auto &labels = it->second.get_object();
  auto read = [&](const char *key, std::string &target) {
    auto entry = labels.find(key);
    if (entry != labels.end() && entry->second.is_string()) {
      target = entry->second.get_string();
    }
  };
  read("upper", options.upper_label);
  read("middle", options.middle_label);
  read("lower", options.lower_label);
}
} // namespace

ThresholdOptions ThresholdOptions::FromConfig(const DetectionConfig &config) {
  config.RequireRules({"indicator_col", "upper_threshold", "lower_threshold"});

  ThresholdOptions options;
  options.indicator_col = RequireStringRule(config, "indicator_col");
  options.upper_threshold = RequireNumberRule(config, "upper_threshold");
  options.lower_threshold = RequireNumberRule(config, "lower_threshold");
  if (options.upper_threshold <= options.lower_threshold) {
    throw ConfigurationError(std::format(
        "threshold: upper_threshold ({}) must be greater than "
        "lower_threshold ({})",
        options.upper_threshold, options.lower_threshold));
  }
  ReadBandLabels(config, options);
  return options;
}

ZoneList ThresholdDetection::Detect(const epoch_frame::DataFrame &series,
                                    const DetectionConfig &config) const {
  const auto options = ThresholdOptions::FromConfig(config);
  const auto values =
      RequireColumn(series, "threshold", options.indicator_col);

  std::vector<int> bands(values.size(), kUndefined);
  for (size_t i = 0; i < values.size(); ++i) {
    const double v = values[i];
    if (std::isnan(v)) {
      continue;
    }
    if (v > options.upper_threshold) {
      bands[i] = kUpperBand;
    } else if (v < options.lower_threshold) {
      bands[i] = kLowerBand;
    } else {
      bands[i] = kMiddleBand;
    }
  }

  ZoneAssembler assembler(series, config);
  for (const auto &run : SplitRuns(bands, kUndefined)) {
    const int band = bands[run.start];
    const auto &label = band == kUpperBand   ? options.upper_label
                        : band == kLowerBand ? options.lower_label
                                             : options.middle_label;

    IndicatorContext context{.primary_column = options.indicator_col,
                             .secondary_column = std::nullopt,
                             .strategy_name = "threshold",
                             .rules = config.rules};
    context.rules["upper_threshold"] = options.upper_threshold;
    context.rules["lower_threshold"] = options.lower_threshold;
    assembler.Add(run, label, std::move(context));
  }

  auto zones = assembler.Release();
  SPDLOG_INFO("threshold on '{}' [{}, {}]: {} zones", options.indicator_col,
              options.lower_threshold, options.upper_threshold, zones.size());
  return zones;
}

} // namespace epoch_zones::detection
