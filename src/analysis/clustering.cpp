#include <epoch_zones/analysis/clustering.h>

#include <armadillo>
#include <mlpack/core.hpp>
#include <mlpack/methods/kmeans/kmeans.hpp>

#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>

namespace epoch_zones::analysis {

std::variant<ClusteringResult, AnalysisDegraded>
ClusterZones(const ZoneList &zones, const ClusteringOptions &options) {
  if (options.n_clusters < 1) {
    return AnalysisDegraded{"clustering",
                            std::format("invalid cluster count {}",
                                        options.n_clusters)};
  }
  if (options.features.empty()) {
    return AnalysisDegraded{"clustering", "no clustering features selected"};
  }

  std::vector<const Zone *> usable;
  for (const auto &zone : zones) {
    const bool complete = std::ranges::all_of(
        options.features, [&](const std::string &feature) {
          return zone.GetNumericFeature(feature).has_value();
        });
    if (complete) {
      usable.push_back(&zone);
    } else {
      SPDLOG_DEBUG("clustering: zone {} lacks a selected feature, skipped",
                   zone.zone_id);
    }
  }

  const auto k = static_cast<size_t>(options.n_clusters);
  if (usable.size() < k) {
    return AnalysisDegraded{
        "clustering",
        std::format("insufficient zones: {} < {}", usable.size(), k)};
  }

  // mlpack expects features as rows, observations as columns
  const size_t n_features = options.features.size();
  arma::mat data(n_features, usable.size());
  for (size_t col = 0; col < usable.size(); ++col) {
    for (size_t row = 0; row < n_features; ++row) {
      data(row, col) = *usable[col]->GetNumericFeature(options.features[row]);
    }
  }

  const arma::vec mean = arma::mean(data, 1);
  arma::vec scale = arma::stddev(data, 0, 1);
  scale.transform([](double s) { return s > 0.0 ? s : 1.0; });
  arma::mat scaled = data.each_col() - mean;
  scaled.each_col() /= scale;

  mlpack::RandomSeed(options.seed);
  mlpack::KMeans<> kmeans(options.max_iterations);
  arma::Row<size_t> assignments;
  arma::mat centroids;
  kmeans.Cluster(scaled, k, assignments, centroids);

  ClusteringResult result;
  result.n_clusters = options.n_clusters;
  result.features = options.features;
  result.clusters.resize(k);
  for (size_t c = 0; c < k; ++c) {
    auto &summary = result.clusters[c];
    summary.cluster_id = static_cast<int64_t>(c);
    for (size_t row = 0; row < n_features; ++row) {
      summary.centroid[options.features[row]] =
          centroids(row, c) * scale(row) + mean(row);
    }
  }
  for (size_t col = 0; col < usable.size(); ++col) {
    const auto cluster = assignments(col);
    result.assignments[usable[col]->zone_id] = static_cast<int64_t>(cluster);
    auto &summary = result.clusters[cluster];
    ++summary.size;
    ++summary.label_counts[usable[col]->label];
  }

  SPDLOG_INFO("clustering: {} zones into {} clusters over {} features",
              usable.size(), k, n_features);
  return result;
}

} // namespace epoch_zones::analysis
