#include <epoch_zones/analysis/validation.h>
#include <epoch_zones/core/frame_utils.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <spdlog/spdlog.h>

namespace epoch_zones::analysis {

namespace {

std::variant<ValidationMetrics, std::string>
SafeReanalyze(const ReanalyzeFunction &reanalyze,
              const epoch_frame::DataFrame &slice) {
  try {
    return reanalyze(slice);
  } catch (const std::exception &e) {
    return std::string(e.what());
  }
}

} // namespace

double DegradationPct(double train, double test) {
  if (train == 0.0) {
    return test == 0.0 ? 0.0 : 100.0;
  }
  return (test - train) / std::abs(train) * 100.0;
}

std::variant<OutOfSampleResult, AnalysisDegraded>
OutOfSampleTest(const epoch_frame::DataFrame &series,
                const ReanalyzeFunction &reanalyze,
                const ValidationOptions &options) {
  const auto rows = static_cast<int64_t>(frame::RowCount(series));
  if (options.train_ratio <= 0.0 || options.train_ratio >= 1.0) {
    return AnalysisDegraded{
        "validation.out_of_sample",
        std::format("train_ratio must be in (0, 1), got {}", options.train_ratio)};
  }
  if (rows < static_cast<int64_t>(options.min_rows)) {
    return AnalysisDegraded{"validation.out_of_sample",
                            std::format("insufficient rows: {} < {}", rows,
                                        options.min_rows)};
  }

  const auto split = static_cast<int64_t>(static_cast<double>(rows) *
                                          options.train_ratio);
  auto train = SafeReanalyze(reanalyze, frame::Slice(series, 0, split - 1));
  auto test = SafeReanalyze(reanalyze, frame::Slice(series, split, rows - 1));
  for (const auto *outcome : {&train, &test}) {
    if (const auto *error = std::get_if<std::string>(outcome)) {
      return AnalysisDegraded{"validation.out_of_sample", *error};
    }
  }

  OutOfSampleResult result;
  result.train_ratio = options.train_ratio;
  result.split_index = split;
  result.train = std::get<ValidationMetrics>(train);
  result.test = std::get<ValidationMetrics>(test);
  result.degradation_pct =
      DegradationPct(result.train.mean_duration, result.test.mean_duration);
  result.passed = std::abs(result.degradation_pct) <=
                  options.degradation_threshold * 100.0;
  SPDLOG_INFO("out-of-sample: degradation {:.1f}%, passed={}",
              result.degradation_pct, result.passed);
  return result;
}

std::variant<WalkForwardResult, AnalysisDegraded>
WalkForwardTest(const epoch_frame::DataFrame &series,
                const ReanalyzeFunction &reanalyze,
                const ValidationOptions &options) {
  const auto rows = static_cast<int64_t>(frame::RowCount(series));
  int64_t train_window = options.train_window;
  int64_t test_window = options.test_window;
  int64_t step = options.step;
  if (rows < train_window + test_window) {
    train_window = rows / 2;
    test_window = rows / 4;
    step = std::max<int64_t>(1, rows / 8);
  }
  if (train_window < static_cast<int64_t>(options.min_rows) ||
      test_window < 1 || step < 1) {
    return AnalysisDegraded{"validation.walk_forward",
                            std::format("insufficient rows: {}", rows)};
  }

  WalkForwardResult result;
  result.train_window = train_window;
  result.test_window = test_window;
  result.step = step;

  double train_sum = 0.0;
  double test_sum = 0.0;
  for (int64_t start = 0; start + train_window + test_window <= rows;
       start += step) {
    WalkForwardWindow window;
    window.train_start = start;
    window.train_end = start + train_window;
    window.test_start = window.train_end;
    window.test_end = window.test_start + test_window;

    auto train = SafeReanalyze(
        reanalyze, frame::Slice(series, window.train_start, window.train_end - 1));
    auto test = SafeReanalyze(
        reanalyze, frame::Slice(series, window.test_start, window.test_end - 1));
    if (std::holds_alternative<std::string>(train) ||
        std::holds_alternative<std::string>(test)) {
      SPDLOG_WARN("walk-forward: window at {} failed, skipped", start);
      continue;
    }
    window.train = std::get<ValidationMetrics>(train);
    window.test = std::get<ValidationMetrics>(test);
    train_sum += window.train.mean_duration;
    test_sum += window.test.mean_duration;
    result.windows.push_back(window);
  }

  if (result.windows.empty()) {
    return AnalysisDegraded{"validation.walk_forward", "no window completed"};
  }
  const auto count = static_cast<double>(result.windows.size());
  result.avg_train_metric = train_sum / count;
  result.avg_test_metric = test_sum / count;
  result.degradation_pct =
      DegradationPct(result.avg_train_metric, result.avg_test_metric);
  result.passed = std::abs(result.degradation_pct) <=
                  options.degradation_threshold * 100.0;
  SPDLOG_INFO("walk-forward: {} windows, degradation {:.1f}%, passed={}",
              result.windows.size(), result.degradation_pct, result.passed);
  return result;
}

std::variant<ValidationResult, AnalysisDegraded>
RunValidation(const epoch_frame::DataFrame &series, size_t zone_count,
              const ReanalyzeFunction &reanalyze,
              const ValidationOptions &options,
              std::vector<AnalysisDegraded> &degraded) {
  if (!reanalyze) {
    return AnalysisDegraded{"validation", "no re-analysis function supplied"};
  }
  if (zone_count <= options.min_zones) {
    return AnalysisDegraded{"validation",
                            std::format("insufficient zones: {} <= {}",
                                        zone_count, options.min_zones)};
  }

  ValidationResult result;
  result.degradation_threshold = options.degradation_threshold;

  auto out_of_sample = OutOfSampleTest(series, reanalyze, options);
  if (auto *value = std::get_if<OutOfSampleResult>(&out_of_sample)) {
    result.out_of_sample = std::move(*value);
  } else {
    degraded.push_back(std::get<AnalysisDegraded>(out_of_sample));
  }

  auto walk_forward = WalkForwardTest(series, reanalyze, options);
  if (auto *value = std::get_if<WalkForwardResult>(&walk_forward)) {
    result.walk_forward = std::move(*value);
  } else {
    degraded.push_back(std::get<AnalysisDegraded>(walk_forward));
  }

  if (!result.out_of_sample && !result.walk_forward) {
    return AnalysisDegraded{"validation", "no validation test completed"};
  }
  return result;
}

} // namespace epoch_zones::analysis
