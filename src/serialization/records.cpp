#include <epoch_zones/serialization/records.h>

#include <cmath>
#include <limits>

namespace epoch_zones::serialization {

namespace {
void EncodeFeatures(const FeatureMap &features, ZoneRecord &record) {
  for (const auto &[name, value] : features) {
    const auto *number = std::get_if<double>(&value);
    if (number && !std::isfinite(*number)) {
      record.non_finite_features.push_back(name);
    } else {
      record.features.emplace(name, value);
    }
  }
}
} // namespace

ZoneRecord ToRecord(const Zone &zone, bool with_data) {
  ZoneRecord record{zone.zone_id,
                    zone.label,
                    zone.start_idx,
                    zone.end_idx,
                    zone.start_time,
                    zone.end_time,
                    zone.duration,
                    {},
                    {},
                    zone.context,
                    std::nullopt};
  EncodeFeatures(zone.features, record);
  if (with_data) {
    record.data = frame::ToSnapshot(zone.data);
  }
  return record;
}

Zone FromRecord(const ZoneRecord &record) {
  Zone zone;
  zone.zone_id = record.zone_id;
  zone.label = record.label;
  zone.start_idx = record.start_idx;
  zone.end_idx = record.end_idx;
  zone.start_time = record.start_time;
  zone.end_time = record.end_time;
  zone.duration = record.duration;
  zone.features = record.features;
  for (const auto &name : record.non_finite_features) {
    zone.features[name] = std::numeric_limits<double>::quiet_NaN();
  }
  zone.context = record.context;
  if (record.data) {
    zone.data = frame::FromSnapshot(*record.data);
  }
  return zone;
}

AnalysisRecord ToRecord(const AnalysisResult &result, bool with_data) {
  AnalysisRecord record;
  record.zones.reserve(result.zones.size());
  for (const auto &zone : result.zones) {
    record.zones.push_back(ToRecord(zone, with_data));
  }
  record.statistics = result.statistics;
  record.hypothesis_tests = result.hypothesis_tests;
  record.sequence_analysis = result.sequence_analysis;
  record.clustering = result.clustering;
  record.regression = result.regression;
  record.validation = result.validation;
  record.metadata = result.metadata;
  if (with_data) {
    record.data = frame::ToSnapshot(result.data);
  }
  return record;
}

AnalysisResult FromRecord(AnalysisRecord record) {
  AnalysisResult result;
  result.zones.reserve(record.zones.size());
  for (const auto &zone : record.zones) {
    result.zones.push_back(FromRecord(zone));
  }
  result.statistics = std::move(record.statistics);
  result.hypothesis_tests = std::move(record.hypothesis_tests);
  result.sequence_analysis = std::move(record.sequence_analysis);
  result.clustering = std::move(record.clustering);
  result.regression = std::move(record.regression);
  result.validation = std::move(record.validation);
  result.metadata = std::move(record.metadata);
  if (record.data) {
    result.data = frame::FromSnapshot(*record.data);
  }
  return result;
}

} // namespace epoch_zones::serialization
