#pragma once
//
// Zones defined outside the library, imported by the "preloaded" strategy
//

#include <epoch_zones/core/zone.h>

#include <filesystem>

namespace epoch_zones::detection {

struct ExternalZone {
  std::string zone_id;
  std::string type;
  int64_t start_time{}; // epoch nanoseconds UTC
  int64_t end_time{};
  std::optional<std::string> indicator;
};

// Builds the rule bag accepted by the preloaded strategy
RuleMap MakePreloadedRules(const std::vector<ExternalZone> &zones,
                           int64_t time_tolerance_ns = 60'000'000'000);

// Reads a zone table from CSV. start_time, end_time and type are required;
// zone_id (default: the row number) and indicator are optional and other
// columns are ignored. Times are timestamp columns, epoch nanoseconds or
// ISO-8601 text, all read as UTC. Throws ConfigurationError naming the path
// for unreadable files, missing columns and unparsable rows.
[[nodiscard]] std::vector<ExternalZone>
LoadExternalZonesCsv(const std::filesystem::path &path);

} // namespace epoch_zones::detection
