#pragma once
//
// Zero-crossing detection: zones are sign runs of one indicator column
//
// Rules:
//   indicator_col (required)  column whose sign drives classification
//   smooth_window (optional)  trailing rolling-mean window applied first
//

#include <epoch_zones/detection/idetection_strategy.h>

namespace epoch_zones::detection {

struct ZeroCrossingOptions {
  std::string indicator_col;
  size_t smooth_window{0};

  static ZeroCrossingOptions FromConfig(const DetectionConfig &config);
};

class ZeroCrossingDetection final : public IZoneDetectionStrategy {
public:
  [[nodiscard]] ZoneList Detect(const epoch_frame::DataFrame &series,
                                const DetectionConfig &config) const override;
};

} // namespace epoch_zones::detection
