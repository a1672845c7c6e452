#include <mutex>
#include <swipe/batch/cluster_registry.hpp>
#include <swipe/common/logging.hpp>
#include <utility>
#include <vector>

namespace swipe::batch {

  using clustering::ClusteringResult;

  void ClusterRegistry::publish(ClusteringResult result) {
    auto next = std::make_shared<Entry>(Entry{std::move(result), clustering::CentroidIndex(kind_)});

    const auto& clusters = next->result.clusters;
    if (!clusters.empty() && !clusters.front().centroid.empty()) {
      const size_t dim = clusters.front().centroid.size();
      std::vector<float> flat;
      flat.reserve(clusters.size() * dim);
      for (const auto& c : clusters) {
        flat.insert(flat.end(), c.centroid.begin(), c.centroid.end());
      }
      next->index.load_centroids(flat.data(), clusters.size(), dim);
    }

    const EntityType type = next->result.metadata.entity_type;
    get_logger("swipe.registry")
        ->info("published {} {} clusters covering {} entities", clusters.size(), to_string(type),
               next->result.assignments.size());

    std::unique_lock lock(mutex_);
    (type == EntityType::User ? users_ : posts_) = std::move(next);
  }

  std::shared_ptr<const ClusterRegistry::Entry> ClusterRegistry::entry(EntityType type) const {
    std::shared_lock lock(mutex_);
    return type == EntityType::User ? users_ : posts_;
  }

  std::shared_ptr<const ClusteringResult> ClusterRegistry::latest(EntityType type) const {
    auto current = entry(type);
    if (!current) return nullptr;
    return {current, &current->result};
  }

  std::optional<std::string> ClusterRegistry::assignment_for(EntityType type,
                                                             const std::string& entity_id) const {
    auto current = entry(type);
    if (!current) return std::nullopt;
    auto it = current->result.assignments.find(entity_id);
    if (it == current->result.assignments.end()) return std::nullopt;
    return it->second;
  }

  std::optional<clustering::Cluster> ClusterRegistry::cluster(EntityType type,
                                                              const std::string& cluster_id) const {
    auto current = entry(type);
    if (!current) return std::nullopt;
    const auto* found = current->result.find_cluster(cluster_id);
    if (!found) return std::nullopt;
    return *found;
  }

  std::optional<NearestCluster> ClusterRegistry::nearest_cluster(
      EntityType type, std::span<const float> embedding) const {
    auto current = entry(type);
    if (!current || current->index.n_clusters() == 0) return std::nullopt;

    auto [row, dist] = current->index.assign(embedding);
    if (row < 0) return std::nullopt;
    return NearestCluster{.cluster_id = current->result.clusters[static_cast<size_t>(row)].id,
                          .distance = dist};
  }

}  // namespace swipe::batch
