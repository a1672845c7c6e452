#pragma once
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <swipe/clustering/centroid_index.hpp>
#include <swipe/clustering/types.hpp>
#include <swipe/common/entity.hpp>

namespace swipe::batch {

  struct NearestCluster {
    std::string cluster_id;
    float distance = 0.0f;
  };

  // Newest clustering result per entity type, readable from any thread while the
  // batch jobs publish new runs.
  class ClusterRegistry {
  public:
    explicit ClusterRegistry(clustering::DistanceKind kind = clustering::DistanceKind::Cosine)
        : kind_(kind) {}

    ClusterRegistry(const ClusterRegistry&) = delete;
    ClusterRegistry& operator=(const ClusterRegistry&) = delete;

    // Replaces the current result for result.metadata.entity_type.
    void publish(clustering::ClusteringResult result);

    [[nodiscard]] std::shared_ptr<const clustering::ClusteringResult> latest(
        EntityType type) const;

    [[nodiscard]] std::optional<std::string> assignment_for(EntityType type,
                                                            const std::string& entity_id) const;

    [[nodiscard]] std::optional<clustering::Cluster> cluster(EntityType type,
                                                             const std::string& cluster_id) const;

    // Closest centroid of the current run; nullopt without clusters.
    [[nodiscard]] std::optional<NearestCluster> nearest_cluster(
        EntityType type, std::span<const float> embedding) const;

  private:
    struct Entry {
      clustering::ClusteringResult result;
      clustering::CentroidIndex index;
    };

    [[nodiscard]] std::shared_ptr<const Entry> entry(EntityType type) const;

    clustering::DistanceKind kind_;
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const Entry> users_;
    std::shared_ptr<const Entry> posts_;
  };

}  // namespace swipe::batch
