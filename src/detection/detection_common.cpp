#include "detection_common.h"

#include <format>

namespace epoch_zones::detection {

std::vector<int> SignClasses(const std::vector<double> &values) {
  std::vector<int> classes(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    if (std::isnan(values[i])) {
      classes[i] = 0;
    } else {
      classes[i] = values[i] >= 0.0 ? 1 : -1;
    }
  }
  return classes;
}

std::vector<double> RequireColumn(const epoch_frame::DataFrame &series,
                                  const std::string &strategy,
                                  const std::string &column) {
  if (!frame::HasColumn(series, column)) {
    throw DataShapeError(strategy, column);
  }
  return frame::ColumnValues(series, column);
}

std::string RequireStringRule(const DetectionConfig &config,
                              const std::string &key) {
  auto value = rules::GetString(config.rules, key);
  if (!value) {
    throw ConfigurationError(std::format(
        "{}: rule '{}' must be a string", config.strategy_name, key));
  }
  return *value;
}

double RequireNumberRule(const DetectionConfig &config,
                         const std::string &key) {
  auto value = rules::GetNumber(config.rules, key);
  if (!value) {
    throw ConfigurationError(std::format(
        "{}: rule '{}' must be a number", config.strategy_name, key));
  }
  return *value;
}

ZoneAssembler::ZoneAssembler(const epoch_frame::DataFrame &series,
                             const DetectionConfig &config)
    : m_series(series), m_config(config),
      m_timestamps(frame::Timestamps(series)) {}

bool ZoneAssembler::Add(const RunSegment &segment, const std::string &label,
                        IndicatorContext context) {
  const int64_t duration = segment.end - segment.start + 1;
  if (duration < m_config.min_duration) {
    ++m_filteredDuration;
    return false;
  }
  if (!m_config.AllowsLabel(label)) {
    ++m_filteredType;
    return false;
  }

  Zone zone;
  zone.zone_id = static_cast<int64_t>(m_zones.size());
  zone.label = label;
  zone.start_idx = segment.start;
  zone.end_idx = segment.end;
  zone.start_time = m_timestamps.at(segment.start);
  zone.end_time = m_timestamps.at(segment.end);
  zone.duration = duration;
  zone.data = frame::Slice(m_series, segment.start, segment.end);
  zone.context = std::move(context);
  m_zones.push_back(std::move(zone));
  return true;
}

} // namespace epoch_zones::detection
