#pragma once
//
// Zone record model
//
// A zone is a contiguous labeled interval of a time-ordered series. Every
// zone carries an IndicatorContext describing which column(s) and which
// detection rule produced it, so downstream analysis never guesses the
// indicator name.
//

#include <epoch_core/enum_wrapper.h>
#include <epoch_frame/dataframe.h>
#include <glaze/json/generic.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// per_zone scans each zone on its own; global scans the series once and
// hands every zone the swing points inside it
CREATE_ENUM(SwingScope, per_zone, global);

namespace epoch_zones {

// Open key/value bag for strategy-specific rule parameters
using RuleMap = std::map<std::string, glz::generic>;

using FeatureValue = std::variant<double, std::string>;
// Flat feature map. A metric that could not be computed is absent.
using FeatureMap = std::map<std::string, FeatureValue>;

struct IndicatorContext {
  std::optional<std::string> primary_column;
  std::optional<std::string> secondary_column;
  std::string strategy_name;
  RuleMap rules;
};

struct Zone {
  int64_t zone_id{0};
  std::string label;
  int64_t start_idx{0};
  int64_t end_idx{0};
  int64_t start_time{0}; // epoch nanoseconds UTC
  int64_t end_time{0};
  int64_t duration{1};
  epoch_frame::DataFrame data;
  FeatureMap features;
  IndicatorContext context;

  [[nodiscard]] std::optional<double> GetNumericFeature(
      const std::string &key) const;
};

using ZoneList = std::vector<Zone>;

// Boolean row predicate used by the combined detection strategy. The
// description identifies the predicate in logs and cache keys.
struct ZoneCondition {
  std::string description;
  std::function<std::vector<bool>(const epoch_frame::DataFrame &)> evaluate;
  // Set when description fully determines evaluate. Cache keys of opaque
  // conditions hash the evaluated mask instead.
  bool declarative{false};
};

struct DetectionConfig {
  std::string strategy_name;
  int64_t min_duration{2};
  std::vector<std::string> zone_types{"bull", "bear"};
  RuleMap rules;
  std::vector<ZoneCondition> conditions;

  // Raises MissingRuleError naming strategy_name and every absent key
  void RequireRules(const std::vector<std::string> &keys) const;

  [[nodiscard]] bool AllowsLabel(const std::string &label) const;
};

struct IndicatorDescriptor {
  std::string source;
  std::string name;
  RuleMap parameters;
};

struct SwingConfig {
  // "default", "narrow_zone" or "wide_zone"
  std::string preset{"default"};
  // Rescale the thresholds to the price range of each input
  bool auto_thresholds{false};
  double base_deviation{0.01};
  epoch_core::SwingScope scope{epoch_core::SwingScope::per_zone};
};

struct AnalysisConfig {
  std::optional<IndicatorDescriptor> indicator;
  DetectionConfig detection;

  bool perform_clustering{true};
  int64_t n_clusters{3};
  std::vector<std::string> clustering_features{
      "duration", "price_return", "price_range_pct", "indicator_amplitude"};

  bool run_regression{false};
  bool run_validation{false};

  // Analytical slot name -> registered strategy name
  std::map<std::string, std::string> strategies;
  SwingConfig swing;

  bool use_cache{true};
  int64_t cache_ttl_seconds{3600};
};

// Rule bag accessors shared by detection strategies and config loading
namespace rules {
[[nodiscard]] std::optional<double> GetNumber(const RuleMap &rules,
                                              const std::string &key);
[[nodiscard]] std::optional<std::string> GetString(const RuleMap &rules,
                                                   const std::string &key);
[[nodiscard]] std::optional<bool> GetBool(const RuleMap &rules,
                                          const std::string &key);
[[nodiscard]] std::vector<std::string>
GetStringList(const RuleMap &rules, const std::string &key);
} // namespace rules

} // namespace epoch_zones
