#pragma once
//
// Shared helpers for detection strategies: run splitting, rule access and
// the closing filter/assembly step every strategy goes through.
//

#include <epoch_zones/core/errors.h>
#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/core/zone.h>

#include <cmath>
#include <string>
#include <vector>

namespace epoch_zones::detection {

struct RunSegment {
  int64_t start;
  int64_t end; // inclusive
};

// Splits positions into maximal runs of equal class. Runs whose class equals
// skip_class are omitted.
template <typename Class>
std::vector<RunSegment> SplitRuns(const std::vector<Class> &classes,
                                  Class skip_class) {
  std::vector<RunSegment> runs;
  const auto n = static_cast<int64_t>(classes.size());
  int64_t start = 0;
  for (int64_t i = 1; i <= n; ++i) {
    if (i == n || classes[i] != classes[start]) {
      if (classes[start] != skip_class) {
        runs.push_back({start, i - 1});
      }
      start = i;
    }
  }
  return runs;
}

// Sign classes with zero counted as positive. NaN maps to 0.
std::vector<int> SignClasses(const std::vector<double> &values);

// Reads a column that must exist, raising DataShapeError otherwise
std::vector<double> RequireColumn(const epoch_frame::DataFrame &series,
                                  const std::string &strategy,
                                  const std::string &column);

// Required string rule. The key must already have been checked with
// RequireRules; a wrong type raises ConfigurationError.
std::string RequireStringRule(const DetectionConfig &config,
                              const std::string &key);

double RequireNumberRule(const DetectionConfig &config, const std::string &key);

class ZoneAssembler {
public:
  ZoneAssembler(const epoch_frame::DataFrame &series,
                const DetectionConfig &config);

  // Applies the min-duration and allowed-label filters, then builds the zone.
  // Returns false if the segment was filtered out.
  bool Add(const RunSegment &segment, const std::string &label,
           IndicatorContext context);

  [[nodiscard]] size_t FilteredByDuration() const { return m_filteredDuration; }
  [[nodiscard]] size_t FilteredByType() const { return m_filteredType; }

  ZoneList Release() { return std::move(m_zones); }

private:
  const epoch_frame::DataFrame &m_series;
  const DetectionConfig &m_config;
  std::vector<int64_t> m_timestamps;
  ZoneList m_zones;
  size_t m_filteredDuration{0};
  size_t m_filteredType{0};
};

} // namespace epoch_zones::detection
