#include <fmt/format.h>

#include <deque>
#include <stdexcept>
#include <swipe/clustering/dbscan.hpp>
#include <swipe/clustering/distance.hpp>
#include <swipe/common/tracy.hpp>

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace swipe::clustering {

  DbscanClustering::DbscanClustering(DbscanConfig config) : config_(config) {
    config_.validate();
  }

  DbscanResult DbscanClustering::process(const EmbeddingMatrix<float>& vectors,
                                         std::span<const Entity> entities) const {
    SWIPE_ZONE;
    if (vectors.rows() != entities.size()) [[unlikely]] {
      throw std::invalid_argument(
          fmt::format("embedding count ({}) does not match entity count ({})", vectors.rows(),
                      entities.size()));
    }

    DbscanResult result;
    if (vectors.empty()) {
      return result;
    }

    auto neighborhoods = compute_neighborhoods(vectors);
    int n_clusters = 0;
    result.labels = assign_labels(neighborhoods, n_clusters);

    std::vector<std::vector<uint32_t>> members(static_cast<size_t>(n_clusters));
    for (size_t i = 0; i < result.labels.size(); ++i) {
      int label = result.labels[i];
      if (label > 0) {
        members[static_cast<size_t>(label - 1)].push_back(static_cast<uint32_t>(i));
      } else {
        ++result.noise_count;
      }
    }

    const auto now = Clock::now();
    result.clusters.reserve(members.size());
    for (size_t c = 0; c < members.size(); ++c) {
      result.clusters.push_back(
          summarize(vectors, entities, members[c], static_cast<int>(c + 1), now));
      for (uint32_t idx : members[c]) {
        result.assignments[entities[idx].id] = result.clusters.back().id;
      }
    }

    return result;
  }

  // =============================================================================
  // Neighborhoods
  // =============================================================================

  DbscanClustering::Neighborhoods DbscanClustering::compute_neighborhoods(
      const EmbeddingMatrix<float>& vectors) const {
    SWIPE_ZONE;
    const auto n = static_cast<int>(vectors.rows());
    Neighborhoods neighborhoods(vectors.rows());

    // Rows are independent; each thread writes only its own row.
#ifdef _OPENMP
#  pragma omp parallel for schedule(dynamic, 16) if (n > 256)
#endif
    for (int i = 0; i < n; ++i) {
      auto row_i = vectors.row(static_cast<size_t>(i));
      auto& out = neighborhoods[static_cast<size_t>(i)];
      for (int j = 0; j < n; ++j) {
        if (i == j || distance(row_i, vectors.row(static_cast<size_t>(j)), config_.distance)
                          <= config_.epsilon) {
          out.push_back(static_cast<uint32_t>(j));
        }
      }
    }

    return neighborhoods;
  }

  // =============================================================================
  // Region growing
  // =============================================================================

  std::vector<int> DbscanClustering::assign_labels(const Neighborhoods& neighborhoods,
                                                   int& n_clusters) const {
    SWIPE_ZONE;
    const auto min_points = static_cast<size_t>(config_.min_points);
    std::vector<int> labels(neighborhoods.size(), kUnvisited);
    n_clusters = 0;

    std::deque<uint32_t> queue;
    for (size_t point = 0; point < neighborhoods.size(); ++point) {
      if (labels[point] != kUnvisited) continue;

      const auto& seeds = neighborhoods[point];
      if (seeds.size() < min_points) {
        // May still become a border point of a later cluster.
        labels[point] = kNoise;
        continue;
      }

      const int cluster = ++n_clusters;
      labels[point] = cluster;

      queue.clear();
      for (uint32_t q : seeds) {
        if (q != point) queue.push_back(q);
      }

      while (!queue.empty()) {
        uint32_t current = queue.front();
        queue.pop_front();

        if (labels[current] == kNoise) {
          labels[current] = cluster;
          continue;
        }
        if (labels[current] != kUnvisited) continue;

        labels[current] = cluster;
        const auto& reach = neighborhoods[current];
        if (reach.size() >= min_points) {
          for (uint32_t q : reach) {
            if (labels[q] == kUnvisited || labels[q] == kNoise) queue.push_back(q);
          }
        }
      }
    }

    return labels;
  }

  // =============================================================================
  // Cluster summary
  // =============================================================================

  Cluster DbscanClustering::summarize(const EmbeddingMatrix<float>& vectors,
                                      std::span<const Entity> entities,
                                      std::span<const uint32_t> members, int cluster_number,
                                      Timestamp now) const {
    const size_t dim = vectors.cols();
    std::vector<double> sum(dim, 0.0);
    for (uint32_t idx : members) {
      auto row = vectors.row(idx);
      for (size_t d = 0; d < dim; ++d) sum[d] += row[d];
    }

    Cluster cluster;
    cluster.id = fmt::format("dbscan-{}", cluster_number);
    cluster.size = members.size();
    cluster.centroid.resize(dim);
    for (size_t d = 0; d < dim; ++d) {
      cluster.centroid[d] = static_cast<float>(sum[d] / static_cast<double>(members.size()));
    }

    double spread = 0.0;
    cluster.member_ids.reserve(members.size());
    for (uint32_t idx : members) {
      spread += distance(vectors.row(idx), cluster.centroid, config_.distance);
      cluster.member_ids.push_back(entities[idx].id);
    }
    spread /= static_cast<double>(members.size());

    cluster.density = static_cast<float>(static_cast<double>(cluster.size) / (1.0 + spread));
    cluster.created_at = now;
    cluster.updated_at = now;
    return cluster;
  }

}  // namespace swipe::clustering
