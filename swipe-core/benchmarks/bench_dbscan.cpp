#include <benchmark/benchmark.h>

#include <random>
#include <string>
#include <swipe/clustering/dbscan.hpp>
#include <vector>

using namespace swipe;
using namespace swipe::clustering;

namespace {

  // Points scattered around a handful of blob centers so that DBSCAN finds
  // real clusters instead of labelling everything noise.
  EmbeddingMatrix<float> generate_blobs(int n_points, int dim, int n_blobs, uint32_t seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> center_dist(-1.0f, 1.0f);
    std::normal_distribution<float> noise(0.0f, 0.02f);

    std::vector<float> centers(static_cast<size_t>(n_blobs) * dim);
    for (auto& v : centers) {
      v = center_dist(rng);
    }

    EmbeddingMatrix<float> points(n_points, dim);
    for (int i = 0; i < n_points; ++i) {
      const float* center = centers.data() + static_cast<size_t>(i % n_blobs) * dim;
      for (int d = 0; d < dim; ++d) {
        points(i, d) = center[d] + noise(rng);
      }
    }
    return points;
  }

  std::vector<Entity> generate_entities(int n_points) {
    std::vector<Entity> entities;
    entities.reserve(n_points);
    for (int i = 0; i < n_points; ++i) {
      entities.push_back(Entity{.id = "p" + std::to_string(i), .type = EntityType::Post});
    }
    return entities;
  }

}  // namespace

static void BM_DbscanProcess(benchmark::State& state) {
  const int n_points = state.range(0);
  const int dim = state.range(1);

  auto points = generate_blobs(n_points, dim, 8);
  auto entities = generate_entities(n_points);
  DbscanClustering dbscan(
      DbscanConfig{.epsilon = 0.05f, .min_points = 5, .distance = DistanceKind::Cosine});

  for (auto _ : state) {
    auto result = dbscan.process(points, entities);
    benchmark::DoNotOptimize(result);
  }

  state.SetItemsProcessed(state.iterations() * n_points);
  state.SetLabel(std::to_string(n_points) + "n/" + std::to_string(dim) + "d");
}

static void BM_DbscanProcess_Euclidean(benchmark::State& state) {
  const int n_points = state.range(0);
  const int dim = state.range(1);

  auto points = generate_blobs(n_points, dim, 8);
  auto entities = generate_entities(n_points);
  DbscanClustering dbscan(
      DbscanConfig{.epsilon = 0.5f, .min_points = 5, .distance = DistanceKind::Euclidean});

  for (auto _ : state) {
    auto result = dbscan.process(points, entities);
    benchmark::DoNotOptimize(result);
  }

  state.SetItemsProcessed(state.iterations() * n_points);
  state.SetLabel(std::to_string(n_points) + "n/" + std::to_string(dim) + "d");
}

static void DbscanArgs(benchmark::internal::Benchmark* b) {
  for (int points : {100, 500, 1000, 2000}) {
    for (int dim : {64, 384, 768}) {
      b->Args({points, dim});
    }
  }
  b->Unit(benchmark::kMillisecond);
}

BENCHMARK(BM_DbscanProcess)->Apply(DbscanArgs);
BENCHMARK(BM_DbscanProcess_Euclidean)->Apply(DbscanArgs);
