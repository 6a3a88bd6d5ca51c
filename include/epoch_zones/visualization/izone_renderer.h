#pragma once
//
// Rendering delegate for analysis results
//
// The renderer owns every presentation decision and returns an opaque
// artifact (HTML, JSON chart spec, image path, ...).
//

#include <epoch_core/enum_wrapper.h>
#include <epoch_zones/analysis/analysis_result.h>

#include <memory>
#include <string>

CREATE_ENUM(ZoneDisplayMode, overview, detail, comparison, statistics);

namespace epoch_zones::visualization {

struct IZoneRenderer {
  virtual ~IZoneRenderer() = default;

  virtual std::string Overview(const AnalysisResult &result) const = 0;
  virtual std::string Detail(const AnalysisResult &result,
                             const Zone &zone) const = 0;
  virtual std::string Comparison(const AnalysisResult &result) const = 0;
  virtual std::string Statistics(const AnalysisResult &result) const = 0;
};

using IZoneRendererPtr = std::shared_ptr<const IZoneRenderer>;

struct DisplayRequest {
  epoch_core::ZoneDisplayMode mode{epoch_core::ZoneDisplayMode::overview};
  std::optional<int64_t> zone_id;
};

// Parses "overview", "comparison", "statistics" or "detail:<zone-id>".
// Throws std::invalid_argument naming the offending mode.
[[nodiscard]] DisplayRequest ParseDisplayMode(const std::string &mode);

} // namespace epoch_zones::visualization
