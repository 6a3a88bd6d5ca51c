#include <epoch_zones/visualization/izone_renderer.h>

#include <charconv>
#include <stdexcept>

namespace epoch_zones::visualization {

DisplayRequest ParseDisplayMode(const std::string &mode) {
  const auto invalid = [&]() {
    return std::invalid_argument(
        "Unknown visualization mode: '" + mode +
        "'. Available: overview, detail:<zone-id>, comparison, statistics");
  };

  const auto colon = mode.find(':');
  const std::string base = mode.substr(0, colon);

  DisplayRequest request;
  if (base == "overview") {
    request.mode = epoch_core::ZoneDisplayMode::overview;
  } else if (base == "comparison") {
    request.mode = epoch_core::ZoneDisplayMode::comparison;
  } else if (base == "statistics") {
    request.mode = epoch_core::ZoneDisplayMode::statistics;
  } else if (base == "detail") {
    request.mode = epoch_core::ZoneDisplayMode::detail;
  } else {
    throw invalid();
  }

  if (request.mode != epoch_core::ZoneDisplayMode::detail) {
    if (colon != std::string::npos) {
      throw invalid();
    }
    return request;
  }

  if (colon == std::string::npos || colon + 1 == mode.size()) {
    throw std::invalid_argument("detail mode requires a zone id: '" + mode +
                                "'");
  }
  int64_t zone_id{0};
  const char *first = mode.data() + colon + 1;
  const char *last = mode.data() + mode.size();
  auto [ptr, ec] = std::from_chars(first, last, zone_id);
  if (ec != std::errc{} || ptr != last) {
    throw std::invalid_argument("Invalid zone id in mode: '" + mode + "'");
  }
  request.zone_id = zone_id;
  return request;
}

} // namespace epoch_zones::visualization
