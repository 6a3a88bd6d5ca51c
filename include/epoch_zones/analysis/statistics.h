#pragma once
//
// Population statistics over zone feature maps
//

#include <epoch_zones/analysis/analysis_result.h>

namespace epoch_zones::analysis {

[[nodiscard]] std::optional<DistributionStats>
DescribeDistribution(const std::vector<double> &values);

// Finite values of one numeric feature across zones, in zone order
[[nodiscard]] std::vector<double> FeatureColumn(const ZoneList &zones,
                                                const std::string &feature);

// Labels ordered by zone count (descending, ties by name)
[[nodiscard]] std::vector<std::string> LabelsByFrequency(const ZoneList &zones);

[[nodiscard]] ZoneStatistics ComputeZoneStatistics(const ZoneList &zones,
                                                   double alpha = 0.05);

} // namespace epoch_zones::analysis
