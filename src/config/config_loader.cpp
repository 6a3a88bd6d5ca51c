#include <epoch_zones/config/config_loader.h>
#include <epoch_zones/core/errors.h>
#include <epoch_zones/strategies/swing_presets.h>

#include <glaze/glaze.hpp>

#include <format>

namespace epoch_zones::config {

glz::generic ToGeneric(const YAML::Node &node) {
  switch (node.Type()) {
  case YAML::NodeType::Null:
  case YAML::NodeType::Undefined:
    return glz::generic{};
  case YAML::NodeType::Sequence: {
    glz::generic::array_t array;
    for (const auto &item : node) {
      array.push_back(ToGeneric(item));
    }
    return glz::generic(std::move(array));
  }
  case YAML::NodeType::Map: {
    glz::generic::object_t object;
    for (const auto &item : node) {
      object[item.first.as<std::string>()] = ToGeneric(item.second);
    }
    return glz::generic(std::move(object));
  }
  case YAML::NodeType::Scalar:
    break;
  }

  // Quoted scalars stay strings
  if (node.Tag() == "!") {
    return glz::generic(node.as<std::string>());
  }
  bool flag{};
  if (YAML::convert<bool>::decode(node, flag)) {
    return glz::generic(flag);
  }
  double number{};
  if (YAML::convert<double>::decode(node, number)) {
    return glz::generic(number);
  }
  return glz::generic(node.as<std::string>());
}

RuleMap ToRuleMap(const YAML::Node &node) {
  RuleMap rules;
  if (!node) {
    return rules;
  }
  if (!node.IsMap()) {
    throw ConfigurationError("Expected a map of rules, got: " +
                             YAML::Dump(node));
  }
  for (const auto &item : node) {
    rules[item.first.as<std::string>()] = ToGeneric(item.second);
  }
  return rules;
}

AnalysisConfig LoadAnalysisConfig(const YAML::Node &node) {
  try {
    return node.as<AnalysisConfig>();
  } catch (const YAML::Exception &e) {
    throw ConfigurationError(
        std::format("Invalid analysis configuration: {}", e.what()));
  }
}

AnalysisConfig LoadAnalysisConfigFile(const std::filesystem::path &path) {
  YAML::Node node;
  try {
    node = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(
        std::format("Failed to load config {}: {}", path.string(), e.what()));
  }
  return LoadAnalysisConfig(node);
}

} // namespace epoch_zones::config

namespace YAML {

bool convert<epoch_zones::IndicatorDescriptor>::decode(
    const Node &node, epoch_zones::IndicatorDescriptor &rhs) {
  if (!node.IsMap() || !node["name"]) {
    throw epoch_zones::ConfigurationError(
        "indicator must be a map with at least a 'name' field");
  }
  rhs.source = node["source"].as<std::string>("custom");
  rhs.name = node["name"].as<std::string>();
  rhs.parameters = epoch_zones::config::ToRuleMap(node["parameters"]);
  return true;
}

bool convert<epoch_zones::DetectionConfig>::decode(
    const Node &node, epoch_zones::DetectionConfig &rhs) {
  if (!node["strategy"]) {
    throw epoch_zones::ConfigurationError(
        "detection must have a 'strategy' field");
  }
  rhs.strategy_name = node["strategy"].as<std::string>();
  rhs.min_duration = node["min_duration"].as<int64_t>(rhs.min_duration);

  if (const auto zone_types = node["zone_types"]) {
    rhs.zone_types = zone_types.IsScalar()
                         ? std::vector<std::string>{zone_types.as<std::string>()}
                         : zone_types.as<std::vector<std::string>>();
  }
  rhs.rules = epoch_zones::config::ToRuleMap(node["rules"]);
  return true;
}

bool convert<epoch_zones::SwingConfig>::decode(const Node &node,
                                               epoch_zones::SwingConfig &rhs) {
  if (!node.IsMap()) {
    throw epoch_zones::ConfigurationError("swing must be a map");
  }
  if (const auto preset = node["preset"]) {
    rhs.preset = preset.as<std::string>();
    (void)epoch_zones::strategies::GetSwingPreset(rhs.preset);
  }
  rhs.auto_thresholds = node["auto_thresholds"].as<bool>(rhs.auto_thresholds);
  rhs.base_deviation = node["base_deviation"].as<double>(rhs.base_deviation);
  if (!(rhs.base_deviation > 0.0)) {
    throw epoch_zones::ConfigurationError(
        std::format("swing.base_deviation must be positive, got {}",
                    rhs.base_deviation));
  }
  if (const auto scope = node["scope"]) {
    rhs.scope = epoch_zones::strategies::ParseSwingScope(scope.as<std::string>());
  }
  return true;
}

bool convert<epoch_zones::AnalysisConfig>::decode(
    const Node &node, epoch_zones::AnalysisConfig &rhs) {
  if (!node["detection"]) {
    throw epoch_zones::ConfigurationError(
        "configuration must have a 'detection' section");
  }
  if (const auto indicator = node["indicator"]) {
    rhs.indicator = indicator.as<epoch_zones::IndicatorDescriptor>();
  }
  rhs.detection = node["detection"].as<epoch_zones::DetectionConfig>();

  if (const auto analysis = node["analysis"]) {
    rhs.perform_clustering =
        analysis["clustering"].as<bool>(rhs.perform_clustering);
    rhs.n_clusters = analysis["n_clusters"].as<int64_t>(rhs.n_clusters);
    if (const auto features = analysis["clustering_features"]) {
      rhs.clustering_features = features.as<std::vector<std::string>>();
    }
    rhs.run_regression = analysis["regression"].as<bool>(rhs.run_regression);
    rhs.run_validation = analysis["validation"].as<bool>(rhs.run_validation);
  }

  if (const auto strategies = node["strategies"]) {
    rhs.strategies = strategies.as<std::map<std::string, std::string>>();
  }

  if (const auto swing = node["swing"]) {
    rhs.swing = swing.as<epoch_zones::SwingConfig>();
  }

  if (const auto cache = node["cache"]) {
    rhs.use_cache = cache["enabled"].as<bool>(rhs.use_cache);
    rhs.cache_ttl_seconds = cache["ttl"].as<int64_t>(rhs.cache_ttl_seconds);
  }
  return true;
}

} // namespace YAML
