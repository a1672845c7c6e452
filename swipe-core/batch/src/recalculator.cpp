#include <exception>
#include <expected>
#include <string>
#include <swipe/batch/recalculator.hpp>
#include <swipe/clustering/dbscan.hpp>
#include <swipe/common/logging.hpp>
#include <swipe/common/tracy.hpp>
#include <utility>

namespace swipe::batch {

  using clustering::ClusteringResult;

  ClusterRecalculator::ClusterRecalculator(size_t batch_size, std::shared_ptr<IClusterSink> sink)
      : collector_(batch_size), sink_(std::move(sink)) {}

  ClusteringResult ClusterRecalculator::recalculate(EntityType type, IEmbeddingSource& source,
                                                    const clustering::DbscanConfig& config) const {
    SWIPE_ZONE;
    auto log = get_logger("swipe.recalculator");
    log->info("recalculating {} clusters", to_string(type));

    // Validate before paging through the whole source.
    clustering::DbscanClustering dbscan(config);

    auto batch = collector_.collect(source, type);

    ClusteringResult result;
    result.metadata.entity_type = type;
    result.metadata.total_items = batch.total_items;
    result.metadata.created_at = clustering::Clock::now();

    if (batch.entities.empty()) {
      log->warn("no {} embeddings available for clustering", to_string(type));
      result.quality = 0.0f;
      result.converged = true;
      result.iterations = 0;
      return result;
    }

    auto clustered = dbscan.process(batch.vectors, batch.entities);

    result.clusters = std::move(clustered.clusters);
    result.assignments = std::move(clustered.assignments);
    result.metadata.noise_count = clustered.noise_count;
    result.quality = clustering::quality_score(result.clusters.size(), batch.total_items);
    result.converged = true;
    result.iterations = 1;

    if (sink_) {
      persist(result);
    }

    log->info("{} clustering done: {} clusters, {} noise points, quality {:.2f}",
              to_string(type), result.clusters.size(), result.metadata.noise_count,
              result.quality);
    return result;
  }

  void ClusterRecalculator::persist(const ClusteringResult& result) const {
    auto log = get_logger("swipe.recalculator");
    std::expected<void, std::string> saved;
    try {
      saved = sink_->save_clustering_result(result);
    } catch (const std::exception& e) {
      saved = std::unexpected(std::string(e.what()));
    } catch (...) {
      saved = std::unexpected(std::string("unknown error"));
    }
    if (!saved) {
      // Durability is best effort; the caller still gets the computed result.
      log->error("failed to persist {} clusters: {}", to_string(result.metadata.entity_type),
                 saved.error());
      return;
    }
    log->info("persisted {} {} clusters", result.clusters.size(),
              to_string(result.metadata.entity_type));
  }

}  // namespace swipe::batch
