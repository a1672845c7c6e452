#pragma once
#include <cstddef>
#include <span>
#include <swipe/clustering/distance.hpp>
#include <usearch/index_plugins.hpp>
#include <utility>
#include <vector>

namespace swipe::clustering {

  // Nearest-centroid lookup over the centroids of one clustering run.
  // Read-only after load_centroids(), so assign() may be called concurrently.
  class CentroidIndex {
  public:
    explicit CentroidIndex(DistanceKind kind = DistanceKind::Cosine) noexcept : kind_(kind) {}

    CentroidIndex(CentroidIndex&&) = default;
    CentroidIndex& operator=(CentroidIndex&&) = default;
    CentroidIndex(const CentroidIndex&) = delete;
    CentroidIndex& operator=(const CentroidIndex&) = delete;

    // Row-major n_clusters x dim
    void load_centroids(const float* data, size_t n_clusters, size_t dim);

    // Returns (row, distance), or (-1, 0) when nothing is loaded.
    // Euclidean distances are true L2, not squared.
    [[nodiscard]] std::pair<int, float> assign(std::span<const float> embedding) const;

    [[nodiscard]] size_t n_clusters() const noexcept { return n_clusters_; }
    [[nodiscard]] size_t dim() const noexcept { return dim_; }
    [[nodiscard]] DistanceKind kind() const noexcept { return kind_; }

  private:
    std::vector<float> centroids_;
    unum::usearch::metric_punned_t metric_;
    DistanceKind kind_;
    size_t n_clusters_ = 0;
    size_t dim_ = 0;
  };

}  // namespace swipe::clustering
