#include "preloaded.h"
#include "detection_common.h"

#include <arrow/compute/api.h>
#include <arrow/scalar.h>

#include <algorithm>
#include <charconv>
#include <format>
#include <spdlog/spdlog.h>

namespace epoch_zones::detection {

int64_t ParseTimestampString(std::string text, const std::string &field) {
  int64_t ns{};
  const auto *end = text.data() + text.size();
  if (auto [ptr, ec] = std::from_chars(text.data(), end, ns);
      ec == std::errc{} && ptr == end) {
    return ns;
  }

  if (text.ends_with('Z')) {
    text.pop_back();
  }
  auto ts = arrow::compute::Strptime(
      arrow::MakeScalar(text),
      arrow::compute::StrptimeOptions{"%Y-%m-%dT%H:%M:%S",
                                      arrow::TimeUnit::NANO});
  if (!ts.ok()) {
    throw ConfigurationError(std::format(
        "preloaded: cannot parse {} '{}': {}", field, text,
        ts.status().ToString()));
  }
  return ts->scalar_as<arrow::TimestampScalar>().value;
}

namespace {

int64_t ReadTimestamp(const glz::generic::object_t &row,
                      const std::string &field) {
  auto it = row.find(field);
  if (it == row.end()) {
    throw ConfigurationError(
        std::format("preloaded: zone row is missing '{}'", field));
  }
  if (it->second.is_number()) {
    return static_cast<int64_t>(it->second.get_number());
  }
  if (it->second.is_string()) {
    return ParseTimestampString(it->second.get_string(), field);
  }
  throw ConfigurationError(std::format(
      "preloaded: '{}' must be epoch nanoseconds or a timestamp string",
      field));
}

ExternalZone ReadExternalZone(const glz::generic &element, size_t position) {
  if (!element.is_object()) {
    throw ConfigurationError(
        std::format("preloaded: zone row {} is not an object", position));
  }
  const auto &row = element.get_object();

  ExternalZone zone;
  if (auto it = row.find("zone_id"); it != row.end()) {
    if (it->second.is_string()) {
      zone.zone_id = it->second.get_string();
    } else if (it->second.is_number()) {
      zone.zone_id = std::format("{}", it->second.get_number());
    }
  }
  if (zone.zone_id.empty()) {
    zone.zone_id = std::to_string(position);
  }

  auto type = row.find("type");
  if (type == row.end() || !type->second.is_string()) {
    throw ConfigurationError(std::format(
        "preloaded: zone '{}' is missing a string 'type'", zone.zone_id));
  }
  zone.type = type->second.get_string();
  zone.start_time = ReadTimestamp(row, "start_time");
  zone.end_time = ReadTimestamp(row, "end_time");
  if (zone.end_time < zone.start_time) {
    throw ConfigurationError(std::format(
        "preloaded: zone '{}' ends before it starts", zone.zone_id));
  }
  if (auto it = row.find("indicator");
      it != row.end() && it->second.is_string()) {
    zone.indicator = it->second.get_string();
  }
  return zone;
}

} // namespace

RuleMap MakePreloadedRules(const std::vector<ExternalZone> &zones,
                           int64_t time_tolerance_ns) {
  std::vector<glz::generic> rows;
  rows.reserve(zones.size());
  for (const auto &zone : zones) {
    glz::generic row;
    row["zone_id"] = zone.zone_id;
    row["type"] = zone.type;
    // Decimal strings keep nanosecond precision through the generic bag
    row["start_time"] = std::to_string(zone.start_time);
    row["end_time"] = std::to_string(zone.end_time);
    if (zone.indicator) {
      row["indicator"] = *zone.indicator;
    }
    rows.push_back(std::move(row));
  }

  RuleMap rules;
  rules["zones"] = rows;
  rules["time_tolerance_ns"] = static_cast<double>(time_tolerance_ns);
  return rules;
}

PreloadedOptions PreloadedOptions::FromConfig(const DetectionConfig &config) {
  config.RequireRules({"zones"});

  const auto &zones = config.rules.at("zones");
  if (!zones.is_array()) {
    throw ConfigurationError("preloaded: rule 'zones' must be an array");
  }

  PreloadedOptions options;
  size_t position = 0;
  for (const auto &element : zones.get_array()) {
    options.zones.push_back(ReadExternalZone(element, position++));
  }
  if (auto tolerance = rules::GetNumber(config.rules, "time_tolerance_ns")) {
    options.time_tolerance_ns = static_cast<int64_t>(*tolerance);
  }
  if (options.time_tolerance_ns < 0) {
    throw ConfigurationError("preloaded: time_tolerance_ns must be >= 0");
  }
  return options;
}

ZoneList PreloadedZonesDetection::Detect(const epoch_frame::DataFrame &series,
                                         const DetectionConfig &config) const {
  const auto options = PreloadedOptions::FromConfig(config);
  const auto timestamps = frame::Timestamps(series);

  // Owning import row per position; later rows overwrite earlier ones
  std::vector<int64_t> owner(timestamps.size(), -1);
  std::vector<bool> matched(options.zones.size(), false);
  for (size_t row = 0; row < options.zones.size(); ++row) {
    const auto &external = options.zones[row];
    const auto first = std::ranges::lower_bound(
        timestamps, external.start_time - options.time_tolerance_ns);
    const auto last = std::ranges::upper_bound(
        timestamps, external.end_time + options.time_tolerance_ns);
    if (first >= last) {
      SPDLOG_WARN("preloaded: zone '{}' has no overlapping data, dropping",
                  external.zone_id);
      continue;
    }
    matched[row] = true;
    std::fill(owner.begin() + (first - timestamps.begin()),
              owner.begin() + (last - timestamps.begin()),
              static_cast<int64_t>(row));
  }

  std::vector<bool> emitted(options.zones.size(), false);
  ZoneAssembler assembler(series, config);
  for (const auto &run : SplitRuns(owner, int64_t{-1})) {
    const auto row = static_cast<size_t>(owner[run.start]);
    const auto &external = options.zones[row];
    emitted[row] = true;

    IndicatorContext context{.primary_column = external.indicator,
                             .secondary_column = std::nullopt,
                             .strategy_name = "preloaded",
                             .rules = {}};
    context.rules["source"] = std::string("external");
    context.rules["external_zone_id"] = external.zone_id;
    context.rules["time_tolerance_ns"] =
        static_cast<double>(options.time_tolerance_ns);
    assembler.Add(run, external.type, std::move(context));
  }

  for (size_t row = 0; row < options.zones.size(); ++row) {
    if (matched[row] && !emitted[row]) {
      SPDLOG_WARN("preloaded: zone '{}' fully overlapped by later imports, "
                  "dropping",
                  options.zones[row].zone_id);
    }
  }

  auto zones = assembler.Release();
  SPDLOG_INFO("preloaded: imported {} of {} external zones", zones.size(),
              options.zones.size());
  return zones;
}

} // namespace epoch_zones::detection
