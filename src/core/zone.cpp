//
// Zone model helpers
//
#include <epoch_zones/core/errors.h>
#include <epoch_zones/core/zone.h>

#include <algorithm>
#include <cmath>

namespace epoch_zones {

std::optional<double> Zone::GetNumericFeature(const std::string &key) const {
  auto it = features.find(key);
  if (it == features.end()) {
    return std::nullopt;
  }
  if (const auto *value = std::get_if<double>(&it->second)) {
    if (std::isfinite(*value)) {
      return *value;
    }
  }
  return std::nullopt;
}

void DetectionConfig::RequireRules(const std::vector<std::string> &keys) const {
  std::vector<std::string> missing;
  for (const auto &key : keys) {
    if (!rules.contains(key)) {
      missing.push_back(key);
    }
  }
  if (!missing.empty()) {
    throw MissingRuleError(strategy_name, std::move(missing));
  }
}

bool DetectionConfig::AllowsLabel(const std::string &label) const {
  return std::ranges::any_of(zone_types, [&](const std::string &allowed) {
    return allowed == "any" || allowed == label;
  });
}

namespace rules {

std::optional<double> GetNumber(const RuleMap &rules, const std::string &key) {
  auto it = rules.find(key);
  if (it == rules.end() || !it->second.is_number()) {
    return std::nullopt;
  }
  return it->second.get_number();
}

std::optional<std::string> GetString(const RuleMap &rules,
                                     const std::string &key) {
  auto it = rules.find(key);
  if (it == rules.end() || !it->second.is_string()) {
    return std::nullopt;
  }
  return std::string(it->second.get_string());
}

std::optional<bool> GetBool(const RuleMap &rules, const std::string &key) {
  auto it = rules.find(key);
  if (it == rules.end() || !it->second.holds<bool>()) {
    return std::nullopt;
  }
  return it->second.get<bool>();
}

std::vector<std::string> GetStringList(const RuleMap &rules,
                                       const std::string &key) {
  std::vector<std::string> values;
  auto it = rules.find(key);
  if (it == rules.end()) {
    return values;
  }
  if (it->second.is_string()) {
    values.emplace_back(it->second.get_string());
    return values;
  }
  if (!it->second.is_array()) {
    return values;
  }
  for (const auto &element : it->second.get_array()) {
    if (element.is_string()) {
      values.emplace_back(element.get_string());
    }
  }
  return values;
}

} // namespace rules

} // namespace epoch_zones
