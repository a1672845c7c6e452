#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <swipe/clustering/distance.hpp>
#include <swipe/common/entity.hpp>
#include <vector>

namespace swipe::clustering {

  using Clock = std::chrono::system_clock;
  using Timestamp = Clock::time_point;

  // entity id -> cluster id. Noise points have no entry.
  using Assignments = std::map<std::string, std::string>;

  struct Cluster {
    std::string id;  // "dbscan-<n>", unique within one run only
    std::vector<float> centroid;
    size_t size = 0;
    float density = 0.0f;
    std::vector<std::string> member_ids;
    Timestamp created_at{};
    Timestamp updated_at{};
  };

  // DBSCAN hyperparameters
  struct DbscanConfig {
    float epsilon = 0.3f;
    int min_points = 5;
    DistanceKind distance = DistanceKind::Cosine;

    // Throws std::invalid_argument on non-positive epsilon or min_points < 1.
    void validate() const;
  };

  struct ResultMetadata {
    size_t total_items = 0;
    EntityType entity_type = EntityType::Post;
    Timestamp created_at{};
    size_t noise_count = 0;
  };

  // Outcome of one recalculation. Built once, never mutated after being returned.
  struct ClusteringResult {
    std::vector<Cluster> clusters;
    Assignments assignments;
    float quality = 0.0f;
    bool converged = true;
    int iterations = 0;
    ResultMetadata metadata;

    [[nodiscard]] const Cluster* find_cluster(const std::string& cluster_id) const noexcept;
  };

  // min(1, n_clusters / sqrt(total_items)), or 0 without clusters.
  [[nodiscard]] float quality_score(size_t n_clusters, size_t total_items) noexcept;

}  // namespace swipe::clustering
