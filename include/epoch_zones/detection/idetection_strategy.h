#pragma once
//
// Zone detection strategy interface
//

#include <epoch_zones/core/zone.h>
#include <memory>

namespace epoch_zones::detection {

struct IZoneDetectionStrategy {
  virtual ~IZoneDetectionStrategy() = default;

  // Scans the prepared series and returns zones in chronological order
  [[nodiscard]] virtual ZoneList
  Detect(const epoch_frame::DataFrame &series,
         const DetectionConfig &config) const = 0;
};

using IZoneDetectionStrategyPtr = std::unique_ptr<IZoneDetectionStrategy>;

} // namespace epoch_zones::detection
