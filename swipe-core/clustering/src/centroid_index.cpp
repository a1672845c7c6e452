#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <swipe/clustering/centroid_index.hpp>
#include <swipe/common/tracy.hpp>

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace {

  struct MinDistanceResult {
    float dist;
    int idx;
  };

#ifdef _OPENMP
#  ifndef _MSC_VER
#    pragma omp declare reduction(custom_min_float:MinDistanceResult : omp_out           \
                                      = (omp_in.dist < omp_out.dist) ? omp_in : omp_out) \
        initializer(omp_priv = {std::numeric_limits<float>::max(), -1})
#  endif
#endif

}  // namespace

namespace swipe::clustering {

  void CentroidIndex::load_centroids(const float* data, size_t n_clusters, size_t dim) {
    if (n_clusters == 0 || dim == 0) [[unlikely]] {
      throw std::invalid_argument("n_clusters and dim must be positive");
    }
    if (n_clusters > SIZE_MAX / dim) [[unlikely]] {
      throw std::invalid_argument("n_clusters * dim would overflow");
    }

    size_t total_size = n_clusters * dim;
    if (total_size > SIZE_MAX / sizeof(float)) [[unlikely]] {
      throw std::invalid_argument("allocation size would overflow");
    }

    using namespace unum::usearch;
    metric_kind_t metric_kind
        = kind_ == DistanceKind::Cosine ? metric_kind_t::cos_k : metric_kind_t::l2sq_k;
    metric_ = metric_punned_t(dim, metric_kind, scalar_kind_t::f32_k);

    centroids_.resize(total_size);
    std::memcpy(centroids_.data(), data, total_size * sizeof(float));
    n_clusters_ = n_clusters;
    dim_ = dim;
  }

  std::pair<int, float> CentroidIndex::assign(std::span<const float> embedding) const {
    SWIPE_ZONE;
    if (n_clusters_ == 0) return {-1, 0.0f};
    if (embedding.size() != dim_) [[unlikely]] {
      throw std::invalid_argument("dimension mismatch in assign");
    }

    const auto* emb_bytes = reinterpret_cast<const unum::usearch::byte_t*>(embedding.data());
    const int n = static_cast<int>(n_clusters_);

    auto centroid_distance = [&](int i) {
      const auto* centroid_bytes = reinterpret_cast<const unum::usearch::byte_t*>(
          centroids_.data() + static_cast<size_t>(i) * dim_);
      return static_cast<float>(metric_(emb_bytes, centroid_bytes));
    };

    MinDistanceResult best{std::numeric_limits<float>::max(), -1};

#if defined(_OPENMP) && !defined(_MSC_VER)
    if (n > 100) {
#  pragma omp parallel for reduction(custom_min_float : best)
      for (int i = 0; i < n; ++i) {
        float dist = centroid_distance(i);
        if (dist < best.dist) {
          best.dist = dist;
          best.idx = i;
        }
      }
    } else
#endif
    {
      for (int i = 0; i < n; ++i) {
        float dist = centroid_distance(i);
        if (dist < best.dist) {
          best.dist = dist;
          best.idx = i;
        }
      }
    }

    float reported = kind_ == DistanceKind::Euclidean ? std::sqrt(best.dist) : best.dist;
    return {best.idx, reported};
  }

}  // namespace swipe::clustering
