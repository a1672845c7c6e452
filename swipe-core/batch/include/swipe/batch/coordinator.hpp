#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <swipe/batch/cluster_registry.hpp>
#include <swipe/batch/config.hpp>
#include <swipe/batch/periodic_timer.hpp>
#include <swipe/batch/recalculator.hpp>
#include <swipe/batch/refresher.hpp>
#include <swipe/batch/repositories.hpp>
#include <vector>

namespace swipe::batch {

  struct EmbeddingPassReport {
    std::optional<RefreshSummary> users;
    std::optional<RefreshSummary> posts;
  };

  struct ClusteringPassReport {
    std::shared_ptr<const clustering::ClusteringResult> posts;
    std::shared_ptr<const clustering::ClusteringResult> users;
  };

  // Owns the two periodic batch jobs: embedding refresh and cluster recalculation.
  //
  // States: stopped -> running on start(), running -> stopped on stop().
  // While running, each job fires on its own interval and the two may overlap.
  // Every scheduled tick logs and swallows its own failure so the timer keeps firing.
  class BatchCoordinator {
  public:
    // Throws std::invalid_argument on an invalid config, or when an entity type
    // has an id source without an embedding service (or the reverse).
    BatchCoordinator(BatchConfig config, BatchRepositories repositories);
    ~BatchCoordinator();

    BatchCoordinator(const BatchCoordinator&) = delete;
    BatchCoordinator& operator=(const BatchCoordinator&) = delete;
    BatchCoordinator(BatchCoordinator&&) = delete;
    BatchCoordinator& operator=(BatchCoordinator&&) = delete;

    // Starts both timers and runs both jobs once right away on the timer
    // threads. Calling start() while running only logs a warning.
    void start();

    // Stops scheduling. A job already running finishes; stop() waits for it.
    void stop();

    // Runs the refresh job then the clustering job on the calling thread.
    // Errors propagate to the caller.
    void force_update();

    // Single passes, errors propagate.
    EmbeddingPassReport run_embedding_pass();
    ClusteringPassReport run_clustering_pass();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] size_t active_timers() const;

    [[nodiscard]] std::optional<std::string> current_assignment(
        EntityType type, const std::string& entity_id) const {
      return registry_.assignment_for(type, entity_id);
    }

    [[nodiscard]] std::shared_ptr<const clustering::ClusteringResult> current_clusters(
        EntityType type) const {
      return registry_.latest(type);
    }

    [[nodiscard]] std::optional<NearestCluster> nearest_cluster(
        EntityType type, std::span<const float> embedding) const {
      return registry_.nearest_cluster(type, embedding);
    }

    [[nodiscard]] ClusterRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] const BatchConfig& config() const noexcept { return config_; }

  private:
    void scheduled_embedding_pass() noexcept;
    void scheduled_clustering_pass() noexcept;

    [[nodiscard]] std::shared_ptr<const clustering::ClusteringResult> recalculate(
        EntityType type, IEmbeddingSource& source);

    BatchConfig config_;
    BatchRepositories repositories_;
    ClusterRecalculator recalculator_;
    EmbeddingRefresher refresher_;
    ClusterRegistry registry_;

    mutable std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::vector<std::unique_ptr<PeriodicTimer>> timers_;
  };

}  // namespace swipe::batch
