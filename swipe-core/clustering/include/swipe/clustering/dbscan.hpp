#pragma once
#include <cstdint>
#include <span>
#include <swipe/clustering/types.hpp>
#include <swipe/common/entity.hpp>
#include <swipe/common/matrix.hpp>
#include <vector>

namespace swipe::clustering {

  // Per-point label. Positive values are 1-based cluster numbers.
  inline constexpr int kUnvisited = 0;
  inline constexpr int kNoise = -1;

  struct DbscanResult {
    std::vector<Cluster> clusters;
    Assignments assignments;
    std::vector<int> labels;  // parallel to the input rows
    size_t noise_count = 0;
  };

  // Density-based clustering over a batch of embeddings.
  //
  // A point is a core point when its epsilon-neighborhood (itself included) holds at
  // least min_points points. Clusters grow breadth-first from core points; points
  // reachable only through a core point become border members, everything else is
  // noise. Points are visited in row order, so identical input yields identical
  // clusters and ids.
  class DbscanClustering {
  public:
    DbscanClustering() = default;
    explicit DbscanClustering(DbscanConfig config);

    // vectors.rows() must equal entities.size(); throws std::invalid_argument
    // otherwise. Empty input gives an empty result.
    [[nodiscard]] DbscanResult process(const EmbeddingMatrix<float>& vectors,
                                       std::span<const Entity> entities) const;

    [[nodiscard]] const DbscanConfig& config() const noexcept { return config_; }

  private:
    using Neighborhoods = std::vector<std::vector<uint32_t>>;

    [[nodiscard]] Neighborhoods compute_neighborhoods(const EmbeddingMatrix<float>& vectors) const;
    [[nodiscard]] std::vector<int> assign_labels(const Neighborhoods& neighborhoods,
                                                 int& n_clusters) const;
    [[nodiscard]] Cluster summarize(const EmbeddingMatrix<float>& vectors,
                                    std::span<const Entity> entities,
                                    std::span<const uint32_t> members, int cluster_number,
                                    Timestamp now) const;

    DbscanConfig config_;
  };

}  // namespace swipe::clustering
