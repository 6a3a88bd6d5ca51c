#include <epoch_zones/analysis/hypothesis.h>
#include <epoch_zones/analysis/stat_tests.h>
#include <epoch_zones/analysis/statistics.h>
#include <epoch_zones/core/numeric.h>

#include "adf.h"

#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>

namespace epoch_zones::analysis {

namespace {

HypothesisTestResult Failed(std::string name, std::string hypothesis,
                            std::string error) {
  HypothesisTestResult result;
  result.name = std::move(name);
  result.hypothesis = std::move(hypothesis);
  result.error = std::move(error);
  return result;
}

ZoneList Chronological(const ZoneList &zones) {
  ZoneList ordered = zones;
  std::ranges::stable_sort(ordered, {}, &Zone::start_idx);
  return ordered;
}

struct LabelGroups {
  std::string label_a;
  std::string label_b;
  std::vector<double> a;
  std::vector<double> b;
};

template <typename Metric>
std::optional<LabelGroups> SplitByTopLabels(const ZoneList &zones,
                                            Metric &&metric) {
  const auto labels = LabelsByFrequency(zones);
  if (labels.size() < 2) {
    return std::nullopt;
  }
  LabelGroups groups{labels[0], labels[1], {}, {}};
  for (const auto &zone : zones) {
    const std::optional<double> value = metric(zone);
    if (!value) {
      continue;
    }
    if (zone.label == groups.label_a) {
      groups.a.push_back(*value);
    } else if (zone.label == groups.label_b) {
      groups.b.push_back(*value);
    }
  }
  return groups;
}

template <typename Metric>
HypothesisTestResult LabelDifference(const ZoneList &zones,
                                     const std::string &name,
                                     const std::string &metric_name,
                                     Metric &&metric, double alpha) {
  const auto hypothesis =
      std::format("{} differs between the two most frequent labels", metric_name);
  auto groups = SplitByTopLabels(zones, std::forward<Metric>(metric));
  if (!groups) {
    return Failed(name, hypothesis, "need at least two distinct labels");
  }
  if (groups->a.size() < 2 || groups->b.size() < 2) {
    return Failed(name, hypothesis,
                  std::format("insufficient samples: {}={}, {}={}",
                              groups->label_a, groups->a.size(),
                              groups->label_b, groups->b.size()));
  }

  const auto normal_a = ShapiroWilk(groups->a);
  const auto normal_b = ShapiroWilk(groups->b);
  const bool both_normal = normal_a && normal_b && normal_a->p_value > alpha &&
                           normal_b->p_value > alpha;

  HypothesisTestResult result;
  result.name = name;
  result.hypothesis = hypothesis;
  result.sample_size = static_cast<int64_t>(groups->a.size() + groups->b.size());
  std::optional<TestStatistic> test;
  if (both_normal) {
    result.method = "student_t";
    test = StudentTTest(groups->a, groups->b, true);
  } else {
    result.method = "mann_whitney_u";
    test = MannWhitneyU(groups->a, groups->b);
  }
  if (!test) {
    return Failed(name, hypothesis,
                  std::format("{} undefined for these samples", result.method));
  }
  result.statistic = test->statistic;
  result.p_value = test->p_value;
  result.significant = test->p_value < alpha;
  result.effect_size = CohensD(groups->a, groups->b);
  result.details["mean_" + groups->label_a] = *numeric::Mean(groups->a);
  result.details["mean_" + groups->label_b] = *numeric::Mean(groups->b);
  if (normal_a) {
    result.details["normality_p_" + groups->label_a] = normal_a->p_value;
  }
  if (normal_b) {
    result.details["normality_p_" + groups->label_b] = normal_b->p_value;
  }
  return result;
}

HypothesisTestResult DurationReturnRelationship(const ZoneList &zones,
                                                const HypothesisOptions &options) {
  const std::string name = "duration_return_relationship";
  const std::string hypothesis = "Zone duration affects price return";

  std::vector<std::pair<double, double>> pairs;
  for (const auto &zone : zones) {
    auto duration = zone.GetNumericFeature("duration");
    auto price_return = zone.GetNumericFeature("price_return");
    if (duration && price_return) {
      pairs.emplace_back(*duration, *price_return);
    }
  }
  std::vector<double> durations;
  for (const auto &[duration, _] : pairs) {
    durations.push_back(duration);
  }
  const auto short_cut = numeric::Quantile(durations, options.extreme_quantile);
  const auto long_cut =
      numeric::Quantile(durations, 1.0 - options.extreme_quantile);
  if (!short_cut || !long_cut) {
    return Failed(name, hypothesis, "no zones with duration and price_return");
  }

  std::vector<double> long_returns;
  std::vector<double> short_returns;
  for (const auto &[duration, price_return] : pairs) {
    if (duration >= *long_cut) {
      long_returns.push_back(price_return);
    }
    if (duration <= *short_cut) {
      short_returns.push_back(price_return);
    }
  }
  auto test = StudentTTest(long_returns, short_returns, true);
  if (!test) {
    return Failed(name, hypothesis,
                  std::format("insufficient data: {} long, {} short zones",
                              long_returns.size(), short_returns.size()));
  }

  HypothesisTestResult result;
  result.name = name;
  result.hypothesis = hypothesis;
  result.method = "student_t";
  result.statistic = test->statistic;
  result.p_value = test->p_value;
  result.significant = test->p_value < options.alpha;
  result.effect_size = CohensD(long_returns, short_returns);
  result.sample_size =
      static_cast<int64_t>(long_returns.size() + short_returns.size());
  result.details["long_threshold"] = *long_cut;
  result.details["short_threshold"] = *short_cut;
  result.details["long_mean_return"] = *numeric::Mean(long_returns);
  result.details["short_mean_return"] = *numeric::Mean(short_returns);
  return result;
}

HypothesisTestResult SequenceRandomness(const ZoneList &ordered,
                                        double alpha) {
  const std::string name = "label_sequence_randomness";
  const std::string hypothesis = "Label sequence is not random";
  const auto labels = LabelsByFrequency(ordered);
  if (ordered.size() < 3 || labels.size() < 2) {
    return Failed(name, hypothesis, "need at least 3 zones and 2 labels");
  }
  std::vector<int> sequence;
  for (const auto &zone : ordered) {
    sequence.push_back(zone.label == labels[0] ? 1 : 0);
  }
  auto test = RunsTest(sequence);
  if (!test) {
    return Failed(name, hypothesis, "runs test undefined for this sequence");
  }
  HypothesisTestResult result;
  result.name = name;
  result.hypothesis = hypothesis;
  result.method = "runs_test";
  result.statistic = test->statistic;
  result.p_value = test->p_value;
  result.significant = test->p_value < alpha;
  result.sample_size = static_cast<int64_t>(sequence.size());
  return result;
}

HypothesisTestResult TransitionIndependence(const ZoneList &ordered,
                                            double alpha) {
  const std::string name = "transition_independence";
  const std::string hypothesis = "Next label depends on the current label";
  if (ordered.size() < 3) {
    return Failed(name, hypothesis, "need at least 3 zones");
  }

  std::vector<std::string> labels;
  for (const auto &zone : ordered) {
    if (std::ranges::find(labels, zone.label) == labels.end()) {
      labels.push_back(zone.label);
    }
  }
  std::ranges::sort(labels);
  const auto index_of = [&](const std::string &label) {
    return static_cast<size_t>(std::ranges::find(labels, label) - labels.begin());
  };

  std::vector<std::vector<double>> table(labels.size(),
                                         std::vector<double>(labels.size(), 0.0));
  for (size_t i = 1; i < ordered.size(); ++i) {
    table[index_of(ordered[i - 1].label)][index_of(ordered[i].label)] += 1.0;
  }
  auto test = ChiSquareIndependence(table);
  if (!test) {
    return Failed(name, hypothesis,
                  "transition table has fewer than 2 populated rows or columns");
  }
  HypothesisTestResult result;
  result.name = name;
  result.hypothesis = hypothesis;
  result.method = "chi_square";
  result.statistic = test->statistic;
  result.p_value = test->p_value;
  result.significant = test->p_value < alpha;
  result.sample_size = static_cast<int64_t>(ordered.size() - 1);
  result.details["dof"] = test->dof;
  return result;
}

HypothesisTestResult DurationStationarity(const std::vector<double> &durations,
                                          const HypothesisOptions &options) {
  const std::string name = "duration_stationarity";
  const std::string hypothesis = "Zone durations are stationary";
  if (durations.size() < options.min_stationarity_zones) {
    return Failed(name, hypothesis,
                  std::format("insufficient zones: {} < {}", durations.size(),
                              options.min_stationarity_zones));
  }
  auto adf_result = adf::ComputeAdf(durations, 1);
  if (!adf_result) {
    return Failed(name, hypothesis, "ADF regression is degenerate");
  }
  HypothesisTestResult result;
  result.name = name;
  result.hypothesis = hypothesis;
  result.method = "adf";
  result.statistic = adf_result->adf_stat;
  result.p_value = adf_result->pvalue;
  result.significant = adf_result->pvalue < options.alpha;
  result.sample_size = adf_result->nobs;
  result.details["critical_value_1pct"] = adf_result->critical_values[0];
  result.details["critical_value_5pct"] = adf_result->critical_values[1];
  result.details["critical_value_10pct"] = adf_result->critical_values[2];
  result.details["used_lag"] = adf_result->used_lag;
  return result;
}

HypothesisTestResult DurationTrend(const std::vector<double> &durations,
                                   double alpha) {
  const std::string name = "duration_trend";
  const std::string hypothesis = "Zone duration trends over time";
  std::vector<double> order(durations.size());
  for (size_t i = 0; i < order.size(); ++i) {
    order[i] = static_cast<double>(i);
  }
  auto test = PearsonTest(order, durations);
  if (!test) {
    return Failed(name, hypothesis,
                  "need at least 3 zones with varying duration");
  }
  HypothesisTestResult result;
  result.name = name;
  result.hypothesis = hypothesis;
  result.method = "pearson";
  result.statistic = test->statistic;
  result.p_value = test->p_value;
  result.effect_size = test->statistic;
  result.significant = test->p_value < alpha;
  result.sample_size = static_cast<int64_t>(durations.size());
  return result;
}

} // namespace

HypothesisSuiteResult RunHypothesisTests(const ZoneList &zones,
                                         const HypothesisOptions &options) {
  HypothesisSuiteResult suite;
  suite.alpha = options.alpha;

  const auto ordered = Chronological(zones);
  const auto mean_duration = numeric::Mean(FeatureColumn(ordered, "duration"));

  std::vector<HypothesisTestResult> results;
  results.push_back(LabelDifference(
      ordered, "label_duration_difference", "duration",
      [](const Zone &zone) { return zone.GetNumericFeature("duration"); },
      options.alpha));
  results.push_back(LabelDifference(
      ordered, "label_weighted_return_difference", "duration-weighted return",
      [&](const Zone &zone) -> std::optional<double> {
        auto price_return = zone.GetNumericFeature("price_return");
        if (!price_return || !mean_duration || *mean_duration <= 0.0) {
          return std::nullopt;
        }
        return *price_return * static_cast<double>(zone.duration) /
               *mean_duration;
      },
      options.alpha));
  results.push_back(DurationReturnRelationship(ordered, options));
  results.push_back(SequenceRandomness(ordered, options.alpha));
  results.push_back(TransitionIndependence(ordered, options.alpha));

  std::vector<double> durations;
  for (const auto &zone : ordered) {
    durations.push_back(static_cast<double>(zone.duration));
  }
  results.push_back(DurationStationarity(durations, options));
  results.push_back(DurationTrend(durations, options.alpha));

  for (auto &result : results) {
    if (result.error) {
      SPDLOG_DEBUG("hypothesis test {} skipped: {}", result.name, *result.error);
    }
    suite.significant_tests += result.significant ? 1 : 0;
    suite.tests[result.name] = std::move(result);
  }
  suite.total_tests = static_cast<int64_t>(suite.tests.size());
  return suite;
}

} // namespace epoch_zones::analysis
