#pragma once
//
// K-means clustering of zones over a chosen numeric feature subset
//

#include <epoch_zones/analysis/analysis_result.h>

#include <variant>

namespace epoch_zones::analysis {

struct ClusteringOptions {
  int64_t n_clusters{3};
  std::vector<std::string> features{"duration", "price_return",
                                    "price_range_pct", "indicator_amplitude"};
  size_t max_iterations{1000};
  size_t seed{42};
};

// Features are z-scored before clustering; centroids are reported in the
// original units. Zones missing any selected feature are left unassigned.
// Returns AnalysisDegraded when fewer usable zones than clusters remain.
[[nodiscard]] std::variant<ClusteringResult, AnalysisDegraded>
ClusterZones(const ZoneList &zones, const ClusteringOptions &options);

} // namespace epoch_zones::analysis
