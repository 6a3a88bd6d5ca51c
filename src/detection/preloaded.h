#pragma once
//
// Preloaded detection: imports zones defined by an external table
//
// Rules:
//   zones (required)  array of {zone_id, type, start_time, end_time[, indicator]}
//                     times as epoch nanoseconds or "%Y-%m-%dT%H:%M:%S" strings
//   time_tolerance_ns (optional, default 60s)
//
// Each imported row covers every position whose timestamp lies in
// [start - tolerance, end + tolerance]. Overlaps resolve to the row imported
// last. Rows without any covered position are dropped with a warning.
//

#include <epoch_zones/detection/external_zones.h>
#include <epoch_zones/detection/idetection_strategy.h>

namespace epoch_zones::detection {

// Epoch nanoseconds as decimal text or "%Y-%m-%dT%H:%M:%S" with an optional
// trailing Z, read as UTC. field names the value in error messages.
[[nodiscard]] int64_t ParseTimestampString(std::string text,
                                           const std::string &field);

struct PreloadedOptions {
  std::vector<ExternalZone> zones;
  int64_t time_tolerance_ns{60'000'000'000};

  static PreloadedOptions FromConfig(const DetectionConfig &config);
};

class PreloadedZonesDetection final : public IZoneDetectionStrategy {
public:
  [[nodiscard]] ZoneList Detect(const epoch_frame::DataFrame &series,
                                const DetectionConfig &config) const override;
};

} // namespace epoch_zones::detection
