#pragma once
#include <cstddef>
#include <memory>
#include <swipe/batch/collector.hpp>
#include <swipe/batch/repositories.hpp>
#include <swipe/clustering/types.hpp>

namespace swipe::batch {

  // Collects a population's embeddings, clusters them and hands the result to the
  // sink. Holds no state between calls besides its construction parameters.
  class ClusterRecalculator {
  public:
    explicit ClusterRecalculator(size_t batch_size = 100,
                                 std::shared_ptr<IClusterSink> sink = nullptr);

    // Collection and clustering errors propagate. Persistence is best effort:
    // a sink failure is logged and the computed result is still returned.
    [[nodiscard]] clustering::ClusteringResult recalculate(
        EntityType type, IEmbeddingSource& source,
        const clustering::DbscanConfig& config = {}) const;

    [[nodiscard]] clustering::ClusteringResult recalculate_user_clusters(
        IEmbeddingSource& source, const clustering::DbscanConfig& config = {}) const {
      return recalculate(EntityType::User, source, config);
    }

    [[nodiscard]] clustering::ClusteringResult recalculate_post_clusters(
        IEmbeddingSource& source, const clustering::DbscanConfig& config = {}) const {
      return recalculate(EntityType::Post, source, config);
    }

    [[nodiscard]] bool has_sink() const noexcept { return sink_ != nullptr; }

  private:
    void persist(const clustering::ClusteringResult& result) const;

    EmbeddingCollector collector_;
    std::shared_ptr<IClusterSink> sink_;
  };

}  // namespace swipe::batch
