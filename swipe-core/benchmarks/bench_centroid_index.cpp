#include <benchmark/benchmark.h>

#include <random>
#include <string>
#include <swipe/clustering/centroid_index.hpp>
#include <vector>

using namespace swipe::clustering;

namespace {

  std::vector<float> generate(size_t count, uint32_t seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<float> values(count);
    for (auto& v : values) {
      v = dist(rng);
    }
    return values;
  }

}  // namespace

static void BM_CentroidAssign(benchmark::State& state) {
  const int n_clusters = state.range(0);
  const int dim = state.range(1);

  CentroidIndex index(DistanceKind::Cosine);
  auto centroids = generate(static_cast<size_t>(n_clusters) * dim);
  index.load_centroids(centroids.data(), n_clusters, dim);

  auto query = generate(dim, 7);

  for (auto _ : state) {
    auto [row, distance] = index.assign(query);
    benchmark::DoNotOptimize(row);
    benchmark::DoNotOptimize(distance);
  }

  state.SetLabel(std::to_string(n_clusters) + "c/" + std::to_string(dim) + "d");
}

static void BM_CentroidLoad(benchmark::State& state) {
  const int n_clusters = state.range(0);
  const int dim = state.range(1);

  auto centroids = generate(static_cast<size_t>(n_clusters) * dim);

  for (auto _ : state) {
    CentroidIndex index(DistanceKind::Cosine);
    index.load_centroids(centroids.data(), n_clusters, dim);
    benchmark::DoNotOptimize(index);
  }

  state.SetLabel(std::to_string(n_clusters) + "c/" + std::to_string(dim) + "d");
}

static void CentroidArgs(benchmark::internal::Benchmark* b) {
  for (int clusters : {10, 50, 100, 500}) {
    for (int dim : {64, 384, 768, 1536}) {
      b->Args({clusters, dim});
    }
  }
  b->Unit(benchmark::kMicrosecond);
}

BENCHMARK(BM_CentroidAssign)->Apply(CentroidArgs);
BENCHMARK(BM_CentroidLoad)->Apply(CentroidArgs);
