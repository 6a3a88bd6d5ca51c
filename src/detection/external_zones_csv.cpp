#include "preloaded.h"

#include <epoch_zones/core/errors.h>
#include <epoch_zones/detection/external_zones.h>

#include <arrow/array.h>
#include <arrow/chunked_array.h>
#include <arrow/compute/api.h>
#include <arrow/table.h>
#include <arrow/type_traits.h>
#include <epoch_frame/serialization.h>

#include <format>
#include <spdlog/spdlog.h>

namespace epoch_zones::detection {

namespace {

std::shared_ptr<arrow::ChunkedArray> CastColumn(
    const std::shared_ptr<arrow::ChunkedArray> &column,
    const std::shared_ptr<arrow::DataType> &type, const std::string &name) {
  auto cast = arrow::compute::Cast(column, type);
  if (!cast.ok()) {
    throw ConfigurationError(std::format("preloaded: cannot read column '{}': {}",
                                         name, cast.status().ToString()));
  }
  return cast->chunked_array();
}

// One entry per row; nulls are empty
std::vector<std::optional<std::string>>
ReadText(const std::shared_ptr<arrow::ChunkedArray> &column,
         const std::string &name) {
  std::vector<std::optional<std::string>> values;
  values.reserve(static_cast<size_t>(column->length()));
  for (const auto &chunk : CastColumn(column, arrow::utf8(), name)->chunks()) {
    const auto &strings = static_cast<const arrow::StringArray &>(*chunk);
    for (int64_t i = 0; i < strings.length(); ++i) {
      if (strings.IsNull(i)) {
        values.emplace_back(std::nullopt);
      } else {
        values.emplace_back(std::string(strings.GetView(i)));
      }
    }
  }
  return values;
}

std::vector<int64_t> ReadTimes(const std::shared_ptr<arrow::ChunkedArray> &column,
                               const std::string &name) {
  std::vector<int64_t> times;
  times.reserve(static_cast<size_t>(column->length()));

  const auto type_id = column->type()->id();
  const bool temporal = type_id == arrow::Type::TIMESTAMP ||
                        type_id == arrow::Type::DATE32 ||
                        type_id == arrow::Type::DATE64;
  if (temporal || arrow::is_integer(type_id)) {
    auto source = temporal ? CastColumn(column,
                                        arrow::timestamp(arrow::TimeUnit::NANO),
                                        name)
                           : column;
    for (const auto &chunk : CastColumn(source, arrow::int64(), name)->chunks()) {
      const auto &values = static_cast<const arrow::Int64Array &>(*chunk);
      for (int64_t i = 0; i < values.length(); ++i) {
        if (values.IsNull(i)) {
          throw ConfigurationError(std::format(
              "preloaded: row {} has no {}", times.size(), name));
        }
        times.push_back(values.Value(i));
      }
    }
    return times;
  }

  for (const auto &text : ReadText(column, name)) {
    if (!text || text->empty()) {
      throw ConfigurationError(
          std::format("preloaded: row {} has no {}", times.size(), name));
    }
    times.push_back(ParseTimestampString(*text, name));
  }
  return times;
}

} // namespace

std::vector<ExternalZone>
LoadExternalZonesCsv(const std::filesystem::path &path) {
  auto read = epoch_frame::read_csv_file(path.string(),
                                         epoch_frame::CSVReadOptions{});
  if (!read.ok()) {
    throw ConfigurationError(std::format("Failed to read zones from {}: {}",
                                         path.string(),
                                         read.status().ToString()));
  }
  const auto table = read.ValueOrDie().table();

  const auto column = [&](const std::string &name,
                          bool required) -> std::shared_ptr<arrow::ChunkedArray> {
    auto found = table ? table->GetColumnByName(name) : nullptr;
    if (!found && required) {
      throw ConfigurationError(std::format(
          "Zones file {} is missing the '{}' column", path.string(), name));
    }
    return found;
  };

  try {
    const auto types = ReadText(column("type", true), "type");
    const auto starts = ReadTimes(column("start_time", true), "start_time");
    const auto ends = ReadTimes(column("end_time", true), "end_time");
    std::vector<std::optional<std::string>> ids(types.size());
    if (auto ids_column = column("zone_id", false)) {
      ids = ReadText(ids_column, "zone_id");
    }
    std::vector<std::optional<std::string>> indicators(types.size());
    if (auto indicator_column = column("indicator", false)) {
      indicators = ReadText(indicator_column, "indicator");
    }

    std::vector<ExternalZone> zones;
    zones.reserve(types.size());
    for (size_t row = 0; row < types.size(); ++row) {
      ExternalZone zone;
      zone.zone_id = ids[row] && !ids[row]->empty() ? *ids[row]
                                                     : std::to_string(row);
      if (!types[row] || types[row]->empty()) {
        throw ConfigurationError(
            std::format("preloaded: zone '{}' has no type", zone.zone_id));
      }
      zone.type = *types[row];
      zone.start_time = starts[row];
      zone.end_time = ends[row];
      if (zone.end_time < zone.start_time) {
        throw ConfigurationError(std::format(
            "preloaded: zone '{}' ends before it starts", zone.zone_id));
      }
      if (indicators[row] && !indicators[row]->empty()) {
        zone.indicator = *indicators[row];
      }
      zones.push_back(std::move(zone));
    }
    SPDLOG_INFO("Loaded {} external zones from {}", zones.size(), path.string());
    return zones;
  } catch (const ConfigurationError &e) {
    throw ConfigurationError(std::format("{}: {}", path.string(), e.what()));
  }
}

} // namespace epoch_zones::detection
