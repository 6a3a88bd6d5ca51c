#include <epoch_zones/analysis/zone_features.h>
#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/core/numeric.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <spdlog/spdlog.h>

namespace epoch_zones::analysis {

namespace {

std::string Lower(std::string text) {
  std::ranges::transform(text, text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

bool LooksLikeOscillator(const std::vector<double> &values) {
  const auto finite = numeric::DropNaN(values);
  if (finite.size() < 2) {
    return false;
  }
  const auto [min_it, max_it] = std::ranges::minmax_element(finite);
  const double lo = *min_it;
  const double hi = *max_it;
  if (lo < 0.0 && hi > 0.0) {
    return true;
  }
  return lo >= -100.0 && hi <= 100.0 && hi > lo;
}

std::optional<size_t> ArgExtreme(const std::vector<double> &values, bool max) {
  std::optional<size_t> best;
  for (size_t i = 0; i < values.size(); ++i) {
    if (!std::isfinite(values[i])) {
      continue;
    }
    if (!best || (max ? values[i] > values[*best] : values[i] < values[*best])) {
      best = i;
    }
  }
  return best;
}

// Local maxima whose height reaches the series mean
size_t CountPeaksAboveMean(const std::vector<double> &values) {
  const auto mean = numeric::Mean(values);
  if (!mean) {
    return 0;
  }
  return static_cast<size_t>(std::ranges::count_if(
      numeric::FindPeaks(values),
      [&](size_t peak) { return values[peak] >= *mean; }));
}

} // namespace

const std::vector<std::string> &DefaultExcludedColumns() {
  static const std::vector<std::string> excluded{
      "open",  "high",       "low", "close", "volume", "time",
      "timestamp", "date",   "datetime", "atr", "true_range", "tr",
      "index", "id",         "zone_id"};
  return excluded;
}

std::optional<std::string>
FindOscillatorColumn(const epoch_frame::DataFrame &data,
                     const std::vector<std::string> &exclude) {
  std::vector<std::string> excluded;
  excluded.reserve(exclude.size());
  for (const auto &name : exclude) {
    excluded.push_back(Lower(name));
  }

  for (const auto &column : frame::NumericColumns(data)) {
    if (std::ranges::find(excluded, Lower(column)) != excluded.end()) {
      continue;
    }
    if (LooksLikeOscillator(frame::ColumnValues(data, column))) {
      return column;
    }
  }
  return std::nullopt;
}

strategies::ColumnSelection ResolveColumns(const Zone &zone) {
  strategies::ColumnSelection columns;
  if (zone.context.primary_column) {
    columns.primary = zone.context.primary_column;
    if (!frame::HasColumn(zone.data, *columns.primary)) {
      SPDLOG_DEBUG("zone {}: primary column '{}' absent from zone data",
                   zone.zone_id, *columns.primary);
    }
  } else {
    columns.primary = FindOscillatorColumn(zone.data);
    if (columns.primary) {
      SPDLOG_DEBUG("zone {}: no primary column in context, using '{}'",
                   zone.zone_id, *columns.primary);
    }
  }
  columns.secondary = zone.context.secondary_column;
  return columns;
}

FeatureMap ExtractBaseFeatures(const Zone &zone,
                               const std::optional<std::string> &primary_column) {
  FeatureMap features;
  features["duration"] = static_cast<double>(zone.duration);

  const auto &data = zone.data;
  if (!frame::HasColumn(data, "close") || frame::RowCount(data) == 0) {
    return features;
  }
  const auto close = frame::ColumnValues(data, "close");
  const auto high =
      frame::HasColumn(data, "high") ? frame::ColumnValues(data, "high") : close;
  const auto low =
      frame::HasColumn(data, "low") ? frame::ColumnValues(data, "low") : close;

  const double start_price = close.front();
  const double end_price = close.back();
  features["start_price"] = start_price;
  features["end_price"] = end_price;
  if (start_price != 0.0 && std::isfinite(start_price)) {
    features["price_return"] = end_price / start_price - 1.0;
  }

  const auto peak_pos = ArgExtreme(high, true);
  const auto trough_pos = ArgExtreme(low, false);
  if (peak_pos && trough_pos && low[*trough_pos] != 0.0) {
    features["price_range_pct"] = high[*peak_pos] / low[*trough_pos] - 1.0;
  }

  if (primary_column && frame::HasColumn(data, *primary_column)) {
    const auto indicator = frame::ColumnValues(data, *primary_column);
    const auto finite = numeric::DropNaN(indicator);
    if (!finite.empty()) {
      const auto [lo, hi] = std::ranges::minmax_element(finite);
      features["indicator_amplitude"] = *hi - *lo;
    }
    double max_slope = 0.0;
    bool has_slope = false;
    for (double d : numeric::Diff(indicator)) {
      if (std::isfinite(d)) {
        max_slope = std::max(max_slope, std::abs(d));
        has_slope = true;
      }
    }
    if (has_slope) {
      features["indicator_max_slope"] = max_slope;
    }
    if (auto corr = numeric::Correlation(close, indicator, 3)) {
      features["correlation_price_indicator"] = *corr;
    }
  }

  features["num_peaks"] = static_cast<double>(CountPeaksAboveMean(high));
  {
    std::vector<double> negated_low(low.size());
    std::ranges::transform(low, negated_low.begin(), [](double v) { return -v; });
    features["num_troughs"] = static_cast<double>(CountPeaksAboveMean(negated_low));
  }

  if (frame::HasColumn(data, "atr")) {
    const auto atr = frame::ColumnValues(data, "atr");
    if (atr.front() > 0.0 && features.contains("price_return")) {
      features["atr_normalized_return"] =
          std::get<double>(features["price_return"]) / atr.front();
    }
  }

  const double n = static_cast<double>(close.size());
  if ((zone.label == "bull" || zone.label == "overbought") && peak_pos &&
      high[*peak_pos] != 0.0) {
    features["drawdown_from_peak"] = end_price / high[*peak_pos] - 1.0;
    features["peak_time_ratio"] = static_cast<double>(*peak_pos) / n;
  } else if ((zone.label == "bear" || zone.label == "oversold") && trough_pos &&
             low[*trough_pos] != 0.0) {
    features["rally_from_trough"] = end_price / low[*trough_pos] - 1.0;
    features["trough_time_ratio"] = static_cast<double>(*trough_pos) / n;
  }
  return features;
}

} // namespace epoch_zones::analysis
