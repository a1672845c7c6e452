#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <swipe/clustering/types.hpp>

namespace swipe::clustering {

  void DbscanConfig::validate() const {
    if (!std::isfinite(epsilon) || epsilon <= 0.0f) {
      throw std::invalid_argument(fmt::format("epsilon must be positive, got {}", epsilon));
    }
    if (min_points < 1) {
      throw std::invalid_argument(
          fmt::format("min_points must be at least 1, got {}", min_points));
    }
  }

  const Cluster* ClusteringResult::find_cluster(const std::string& cluster_id) const noexcept {
    auto it = std::ranges::find(clusters, cluster_id, &Cluster::id);
    return it == clusters.end() ? nullptr : &*it;
  }

  float quality_score(size_t n_clusters, size_t total_items) noexcept {
    if (n_clusters == 0 || total_items == 0) return 0.0f;
    double ratio = static_cast<double>(n_clusters) / std::sqrt(static_cast<double>(total_items));
    return static_cast<float>(std::min(1.0, ratio));
  }

}  // namespace swipe::clustering
