#pragma once
//
// Line-crossing detection: sign of (line1 - line2), e.g. fast vs slow line
//
// Rules: line1_col, line2_col (required)
//

#include <epoch_zones/detection/idetection_strategy.h>

namespace epoch_zones::detection {

class LineCrossingDetection final : public IZoneDetectionStrategy {
public:
  [[nodiscard]] ZoneList Detect(const epoch_frame::DataFrame &series,
                                const DetectionConfig &config) const override;
};

} // namespace epoch_zones::detection
