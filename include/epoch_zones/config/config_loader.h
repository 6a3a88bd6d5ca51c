#pragma once
//
// YAML configuration loading
//
// Layout:
//   indicator:  {source, name, parameters}
//   detection:  {strategy, min_duration, zone_types, rules}
//   analysis:   {clustering, n_clusters, clustering_features, regression,
//                validation}
//   strategies: {<slot>: <registered name>}
//   swing:      {preset, auto_thresholds, base_deviation, scope}
//   cache:      {enabled, ttl}
//
// Rule and parameter maps are copied verbatim into glz::generic values.
//

#include <epoch_zones/core/zone.h>

#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace epoch_zones::config {

// Scalars become bool, number or string; sequences and maps recurse
[[nodiscard]] glz::generic ToGeneric(const YAML::Node &node);
[[nodiscard]] RuleMap ToRuleMap(const YAML::Node &node);

[[nodiscard]] AnalysisConfig LoadAnalysisConfig(const YAML::Node &node);

// Throws std::runtime_error naming the path when the file cannot be parsed
[[nodiscard]] AnalysisConfig
LoadAnalysisConfigFile(const std::filesystem::path &path);

} // namespace epoch_zones::config

namespace YAML {
template <> struct convert<epoch_zones::IndicatorDescriptor> {
  static bool decode(const Node &node, epoch_zones::IndicatorDescriptor &rhs);
};

template <> struct convert<epoch_zones::DetectionConfig> {
  static bool decode(const Node &node, epoch_zones::DetectionConfig &rhs);
};

template <> struct convert<epoch_zones::SwingConfig> {
  static bool decode(const Node &node, epoch_zones::SwingConfig &rhs);
};

template <> struct convert<epoch_zones::AnalysisConfig> {
  static bool decode(const Node &node, epoch_zones::AnalysisConfig &rhs);
};
} // namespace YAML
