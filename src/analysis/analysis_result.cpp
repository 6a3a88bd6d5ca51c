#include <epoch_zones/analysis/analysis_result.h>
#include <epoch_zones/visualization/izone_renderer.h>

#include <algorithm>
#include <stdexcept>

namespace epoch_zones {

const Zone *AnalysisResult::FindZone(int64_t zone_id) const {
  auto it = std::ranges::find(zones, zone_id, &Zone::zone_id);
  return it == zones.end() ? nullptr : &*it;
}

std::string
AnalysisResult::Visualize(const std::string &mode,
                          const visualization::IZoneRenderer &renderer) const {
  using epoch_core::ZoneDisplayMode;
  const auto request = visualization::ParseDisplayMode(mode);

  switch (request.mode) {
  case ZoneDisplayMode::overview:
    return renderer.Overview(*this);
  case ZoneDisplayMode::comparison:
    return renderer.Comparison(*this);
  case ZoneDisplayMode::statistics:
    return renderer.Statistics(*this);
  case ZoneDisplayMode::detail: {
    const Zone *zone = FindZone(*request.zone_id);
    if (zone == nullptr) {
      throw std::invalid_argument("Unknown zone id: " +
                                  std::to_string(*request.zone_id));
    }
    return renderer.Detail(*this, *zone);
  }
  default:
    break;
  }
  throw std::invalid_argument("Unknown visualization mode: '" + mode + "'");
}

} // namespace epoch_zones
