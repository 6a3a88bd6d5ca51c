#include "combined.h"
#include "detection_common.h"

#include <epoch_zones/detection/conditions.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <spdlog/spdlog.h>

namespace epoch_zones::detection {

namespace {
void ReadZoneTypeMap(const DetectionConfig &config, CombinedOptions &options) {
  auto it = config.rules.find("zone_type_map");
  if (it == config.rules.end()) {
    return;
  }
  if (!it->second.is_object()) {
    throw ConfigurationError(
        "combined: rule 'zone_type_map' must be an object {true, false}");
  }
  for (const auto &[key, value] : it->second.get_object()) {
    if (!value.is_string()) {
      continue;
    }
    if (key == "true") {
      options.active_label = value.get_string();
    } else if (key == "false") {
      options.inactive_label = value.get_string();
    }
  }
}
} // namespace

CombinedOptions CombinedOptions::FromConfig(const DetectionConfig &config) {
  CombinedOptions options;
  options.conditions = config.conditions;
  for (const auto &expression : rules::GetStringList(config.rules, "conditions")) {
    options.conditions.push_back(ParseCondition(expression));
  }
  if (options.conditions.empty()) {
    throw MissingRuleError(config.strategy_name.empty() ? "combined"
                                                        : config.strategy_name,
                           {"conditions"});
  }

  auto logic = rules::GetString(config.rules, "logic").value_or("AND");
  std::ranges::transform(logic, logic.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  if (logic != "AND" && logic != "OR") {
    throw ConfigurationError(
        std::format("combined: logic must be 'AND' or 'OR', got '{}'", logic));
  }
  options.logic = epoch_core::ZoneConditionLogicWrapper::FromString(logic);

  ReadZoneTypeMap(config, options);
  options.indicator_col = rules::GetString(config.rules, "indicator_col");
  return options;
}

ZoneList CombinedRulesDetection::Detect(const epoch_frame::DataFrame &series,
                                        const DetectionConfig &config) const {
  const auto options = CombinedOptions::FromConfig(config);
  const size_t n = frame::RowCount(series);
  const bool use_and = options.logic == epoch_core::ZoneConditionLogic::AND;

  std::vector<int> combined(n, use_and ? 1 : 0);
  std::vector<std::string> descriptions;
  for (const auto &condition : options.conditions) {
    std::vector<bool> mask;
    try {
      mask = condition.evaluate(series);
    } catch (const ZoneAnalysisError &) {
      throw;
    } catch (const std::exception &e) {
      throw ZoneAnalysisError(std::format(
          "combined: error evaluating condition '{}': {}",
          condition.description, e.what()));
    }
    if (mask.size() != n) {
      throw ZoneAnalysisError(std::format(
          "combined: condition '{}' returned {} values for {} rows",
          condition.description, mask.size(), n));
    }
    for (size_t i = 0; i < n; ++i) {
      combined[i] = use_and ? (combined[i] && mask[i]) : (combined[i] || mask[i]);
    }
    descriptions.push_back(condition.description);
  }

  const auto logic_name =
      epoch_core::ZoneConditionLogicWrapper::ToString(options.logic);
  ZoneAssembler assembler(series, config);
  for (const auto &run : SplitRuns(combined, -1)) {
    IndicatorContext context{.primary_column =
                                 options.indicator_col.value_or("combined"),
                             .secondary_column = std::nullopt,
                             .strategy_name = "combined",
                             .rules = config.rules};
    context.rules["logic"] = logic_name;
    context.rules["num_conditions"] =
        static_cast<double>(options.conditions.size());
    std::vector<glz::generic> described(descriptions.begin(),
                                        descriptions.end());
    context.rules["conditions"] = described;

    assembler.Add(run,
                  combined[run.start] ? options.active_label
                                      : options.inactive_label,
                  std::move(context));
  }

  auto zones = assembler.Release();
  SPDLOG_INFO("combined ({}, {} conditions): {} zones", logic_name,
              options.conditions.size(), zones.size());
  return zones;
}

} // namespace epoch_zones::detection
