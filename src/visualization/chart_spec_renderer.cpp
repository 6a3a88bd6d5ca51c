#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/visualization/chart_spec_renderer.h>

#include <glaze/glaze.hpp>

#include <set>
#include <stdexcept>

namespace epoch_zones::visualization {

namespace {
constexpr const char *CANDLESTICK_CHART = "candlestick";
constexpr const char *LINE_CHART = "line";
constexpr const char *VOLUME_CHART = "column";

ChartPane BuildPricePane(const epoch_frame::DataFrame &data) {
  ChartPane pane;
  const bool has_ohlc = frame::HasColumn(data, "open") &&
                        frame::HasColumn(data, "high") &&
                        frame::HasColumn(data, "low") &&
                        frame::HasColumn(data, "close");
  if (has_ohlc) {
    pane.series.push_back({"price", CANDLESTICK_CHART, "Price",
                           {"open", "high", "low", "close"}});
  } else if (frame::HasColumn(data, "close")) {
    pane.series.push_back({"price", LINE_CHART, "Close", {"close"}});
  }
  return pane;
}

void AddIndicatorPanes(const epoch_frame::DataFrame &data,
                       const std::set<std::string> &columns,
                       ChartSpec &spec) {
  uint8_t axis = 1;
  for (const auto &column : columns) {
    if (!frame::HasColumn(data, column)) {
      continue;
    }
    ChartPane pane;
    pane.y_axis = axis++;
    pane.series.push_back({column, LINE_CHART, column, {column}});
    spec.panes.push_back(std::move(pane));
  }
  if (frame::HasColumn(data, "volume")) {
    ChartPane pane;
    pane.y_axis = axis;
    pane.series.push_back({"volume", VOLUME_CHART, "Volume", {"volume"}});
    spec.panes.push_back(std::move(pane));
  }
}

std::set<std::string> ContextColumns(const Zone &zone) {
  std::set<std::string> columns;
  if (zone.context.primary_column) {
    columns.insert(*zone.context.primary_column);
  }
  if (zone.context.secondary_column) {
    columns.insert(*zone.context.secondary_column);
  }
  return columns;
}

ZoneBand ToBand(const Zone &zone) {
  return {zone.zone_id, zone.label, zone.start_time, zone.end_time};
}

std::map<std::string, double> NumericFeatures(const FeatureMap &features) {
  std::map<std::string, double> numeric;
  for (const auto &[key, value] : features) {
    if (const auto *number = std::get_if<double>(&value)) {
      numeric[key] = *number;
    }
  }
  return numeric;
}

std::map<std::string, double> Summarize(const DistributionStats &stats) {
  return {{"count", static_cast<double>(stats.count)},
          {"mean", stats.mean},
          {"median", stats.median},
          {"std", stats.std},
          {"min", stats.min},
          {"max", stats.max}};
}
} // namespace

ChartSpec ChartSpecRenderer::BuildOverview(const AnalysisResult &result) {
  ChartSpec spec;
  spec.mode = "overview";
  spec.title = "Zones (" + std::to_string(result.zones.size()) + ")";
  spec.panes.push_back(BuildPricePane(result.data));

  std::set<std::string> columns;
  for (const auto &zone : result.zones) {
    columns.merge(ContextColumns(zone));
    spec.bands.push_back(ToBand(zone));
  }
  AddIndicatorPanes(result.data, columns, spec);
  return spec;
}

std::string ChartSpecRenderer::Overview(const AnalysisResult &result) const {
  return Write(BuildOverview(result));
}

std::string ChartSpecRenderer::Detail(const AnalysisResult &,
                                      const Zone &zone) const {
  ChartSpec spec;
  spec.mode = "detail";
  spec.title = "Zone " + std::to_string(zone.zone_id) + " (" + zone.label + ")";
  spec.panes.push_back(BuildPricePane(zone.data));
  AddIndicatorPanes(zone.data, ContextColumns(zone), spec);
  spec.bands.push_back(ToBand(zone));
  spec.table[zone.label] = NumericFeatures(zone.features);
  return Write(spec);
}

std::string ChartSpecRenderer::Comparison(const AnalysisResult &result) const {
  ChartSpec spec;
  spec.mode = "comparison";
  spec.title = "Zone comparison by label";
  for (const auto &[label, features] : result.statistics.by_label) {
    auto &row = spec.table[label];
    for (const auto &[feature, stats] : features) {
      row[feature] = stats.mean;
    }
  }
  for (const auto &comparison : result.statistics.comparisons) {
    spec.table["p_value"][comparison.metric] = comparison.p_value;
  }
  return Write(spec);
}

std::string ChartSpecRenderer::Statistics(const AnalysisResult &result) const {
  ChartSpec spec;
  spec.mode = "statistics";
  spec.title = "Zone feature statistics";
  for (const auto &[feature, stats] : result.statistics.features) {
    spec.table[feature] = Summarize(stats);
  }
  if (result.hypothesis_tests) {
    auto &row = spec.table["hypothesis_p_values"];
    for (const auto &[name, test] : result.hypothesis_tests->tests) {
      if (test.p_value) {
        row[name] = *test.p_value;
      }
    }
  }
  return Write(spec);
}

std::string ChartSpecRenderer::Write(const ChartSpec &spec) const {
  auto json = m_pretty ? glz::write<glz::opts{.prettify = true}>(spec)
                       : glz::write_json(spec);
  if (!json) {
    throw std::runtime_error("Failed to write chart spec '" + spec.title +
                             "'");
  }
  return json.value();
}

} // namespace epoch_zones::visualization
