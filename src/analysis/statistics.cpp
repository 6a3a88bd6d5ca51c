#include <epoch_zones/analysis/stat_tests.h>
#include <epoch_zones/analysis/statistics.h>
#include <epoch_zones/core/numeric.h>

#include <algorithm>
#include <set>

namespace epoch_zones::analysis {

std::optional<DistributionStats>
DescribeDistribution(const std::vector<double> &values) {
  const auto finite = numeric::DropNaN(values);
  if (finite.empty()) {
    return std::nullopt;
  }
  const auto [lo, hi] = std::ranges::minmax_element(finite);

  DistributionStats stats;
  stats.count = static_cast<int64_t>(finite.size());
  stats.mean = *numeric::Mean(finite);
  stats.median = *numeric::Median(finite);
  stats.std = numeric::StdDev(finite).value_or(0.0);
  stats.min = *lo;
  stats.max = *hi;
  stats.q25 = *numeric::Quantile(finite, 0.25);
  stats.q75 = *numeric::Quantile(finite, 0.75);
  stats.skewness = numeric::Skewness(finite);
  stats.kurtosis = numeric::Kurtosis(finite);
  return stats;
}

std::vector<double> FeatureColumn(const ZoneList &zones,
                                  const std::string &feature) {
  std::vector<double> values;
  values.reserve(zones.size());
  for (const auto &zone : zones) {
    if (auto value = zone.GetNumericFeature(feature)) {
      values.push_back(*value);
    }
  }
  return values;
}

std::vector<std::string> LabelsByFrequency(const ZoneList &zones) {
  std::map<std::string, int64_t> counts;
  for (const auto &zone : zones) {
    ++counts[zone.label];
  }
  std::vector<std::pair<std::string, int64_t>> ordered(counts.begin(),
                                                        counts.end());
  std::ranges::stable_sort(ordered, [](const auto &a, const auto &b) {
    return a.second > b.second;
  });
  std::vector<std::string> labels;
  for (const auto &[label, _] : ordered) {
    labels.push_back(label);
  }
  return labels;
}

ZoneStatistics ComputeZoneStatistics(const ZoneList &zones, double alpha) {
  ZoneStatistics stats;
  stats.total_zones = static_cast<int64_t>(zones.size());
  if (zones.empty()) {
    return stats;
  }

  std::set<std::string> numeric_features;
  for (const auto &zone : zones) {
    ++stats.label_counts[zone.label];
    for (const auto &[key, value] : zone.features) {
      if (std::holds_alternative<double>(value)) {
        numeric_features.insert(key);
      }
    }
  }
  for (const auto &[label, count] : stats.label_counts) {
    stats.label_ratios[label] =
        static_cast<double>(count) / static_cast<double>(zones.size());
  }

  for (const auto &feature : numeric_features) {
    if (auto overall = DescribeDistribution(FeatureColumn(zones, feature))) {
      stats.features[feature] = *overall;
    }
    std::map<std::string, std::vector<double>> per_label;
    for (const auto &zone : zones) {
      if (auto value = zone.GetNumericFeature(feature)) {
        per_label[zone.label].push_back(*value);
      }
    }
    for (const auto &[label, values] : per_label) {
      if (auto described = DescribeDistribution(values)) {
        stats.by_label[label][feature] = *described;
      }
    }
  }

  const auto labels = LabelsByFrequency(zones);
  if (labels.size() < 2) {
    return stats;
  }
  for (const auto *metric : {"duration", "price_return"}) {
    std::vector<double> a;
    std::vector<double> b;
    for (const auto &zone : zones) {
      if (auto value = zone.GetNumericFeature(metric)) {
        if (zone.label == labels[0]) {
          a.push_back(*value);
        } else if (zone.label == labels[1]) {
          b.push_back(*value);
        }
      }
    }
    auto test = StudentTTest(a, b, false);
    if (!test) {
      continue;
    }
    stats.comparisons.push_back(LabelComparison{
        .metric = metric,
        .label_a = labels[0],
        .label_b = labels[1],
        .mean_a = *numeric::Mean(a),
        .mean_b = *numeric::Mean(b),
        .t_statistic = test->statistic,
        .p_value = test->p_value,
        .significant = test->p_value < alpha});
  }
  return stats;
}

} // namespace epoch_zones::analysis
