#pragma once
//
// Threshold (banded) detection: three bands against two thresholds
//
//   value >  upper          -> upper label  (default "overbought")
//   lower <= value <= upper -> middle label (default "between")
//   value <  lower          -> lower label  (default "oversold")
//
// Rules: indicator_col, upper_threshold, lower_threshold (required),
//        band_labels {upper, middle, lower} (optional)
//

#include <epoch_zones/detection/idetection_strategy.h>

namespace epoch_zones::detection {

struct ThresholdOptions {
  std::string indicator_col;
  double upper_threshold{};
  double lower_threshold{};
  std::string upper_label{"overbought"};
  std::string middle_label{"between"};
  std::string lower_label{"oversold"};

  static ThresholdOptions FromConfig(const DetectionConfig &config);
};

class ThresholdDetection final : public IZoneDetectionStrategy {
public:
  [[nodiscard]] ZoneList Detect(const epoch_frame::DataFrame &series,
                                const DetectionConfig &config) const override;
};

} // namespace epoch_zones::detection
