#pragma once
//
// JSON chart-spec renderer
//
// Emits a pane/series description of the result (candlestick price pane,
// one pane per indicator column, zone bands) for a front-end charting
// library to draw.
//

#include <epoch_zones/visualization/izone_renderer.h>

#include <map>
#include <string>
#include <vector>

namespace epoch_zones::visualization {

struct ChartSeries {
  std::string id;
  std::string type; // "candlestick", "line", "column"
  std::string name;
  std::vector<std::string> columns;
};

struct ChartPane {
  uint8_t y_axis{0};
  std::vector<ChartSeries> series;
};

struct ZoneBand {
  int64_t zone_id{0};
  std::string label;
  int64_t start_time{0};
  int64_t end_time{0};
};

struct ChartSpec {
  std::string mode;
  std::string title;
  std::vector<ChartPane> panes;
  std::vector<ZoneBand> bands;
  // label -> metric -> value
  std::map<std::string, std::map<std::string, double>> table;
};

class ChartSpecRenderer final : public IZoneRenderer {
public:
  explicit ChartSpecRenderer(bool pretty = false) : m_pretty(pretty) {}

  std::string Overview(const AnalysisResult &result) const override;
  std::string Detail(const AnalysisResult &result,
                     const Zone &zone) const override;
  std::string Comparison(const AnalysisResult &result) const override;
  std::string Statistics(const AnalysisResult &result) const override;

  [[nodiscard]] static ChartSpec
  BuildOverview(const AnalysisResult &result);

private:
  [[nodiscard]] std::string Write(const ChartSpec &spec) const;

  bool m_pretty;
};

} // namespace epoch_zones::visualization
