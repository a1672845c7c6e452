#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <swipe/clustering/centroid_index.hpp>
#include <swipe/clustering/distance.hpp>
#include <swipe/common/matrix.hpp>
#include <utility>
#include <vector>

using namespace swipe::clustering;
using swipe::EmbeddingMatrix;

// =============================================================================
// SECTION 1: Basic Functionality
// =============================================================================

class CentroidIndexTest : public ::testing::Test {
protected:
  static void fill_matrix(EmbeddingMatrix<float>& m, std::initializer_list<float> values) {
    auto it = values.begin();
    for (size_t i = 0; i < m.rows(); ++i) {
      for (size_t j = 0; j < m.cols(); ++j) {
        m(i, j) = (it != values.end()) ? *it++ : float(0);
      }
    }
  }

  static void random_matrix(EmbeddingMatrix<float>& m, std::mt19937& gen) {
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    for (size_t i = 0; i < m.rows(); ++i) {
      for (size_t j = 0; j < m.cols(); ++j) {
        m(i, j) = dist(gen);
      }
    }
  }

  static EmbeddingMatrix<float> axes() {
    EmbeddingMatrix<float> centers(3, 4);
    fill_matrix(centers, {1.0f, 0.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f});
    return centers;
  }
};

TEST_F(CentroidIndexTest, EmptyIndex) {
  CentroidIndex index;
  EXPECT_EQ(index.n_clusters(), 0u);
  EXPECT_EQ(index.dim(), 0u);

  std::vector<float> vec = {1.0f, 0.0f};
  auto [row, dist] = index.assign(vec);
  EXPECT_EQ(row, -1);
  EXPECT_EQ(dist, 0.0f);
}

TEST_F(CentroidIndexTest, LoadCentroids) {
  auto centers = this->axes();
  CentroidIndex index;
  index.load_centroids(centers.data(), centers.rows(), centers.cols());
  EXPECT_EQ(index.n_clusters(), 3u);
  EXPECT_EQ(index.dim(), 4u);
  EXPECT_EQ(index.kind(), DistanceKind::Cosine);
}

TEST_F(CentroidIndexTest, LoadRejectsZeroShape) {
  CentroidIndex index;
  float data[] = {1.0f};
  EXPECT_THROW(index.load_centroids(data, 0, 1), std::invalid_argument);
  EXPECT_THROW(index.load_centroids(data, 1, 0), std::invalid_argument);
}

TEST_F(CentroidIndexTest, AssignToNearestCosine) {
  auto centers = this->axes();
  CentroidIndex index(DistanceKind::Cosine);
  index.load_centroids(centers.data(), centers.rows(), centers.cols());

  std::vector<float> vec = {0.0f, 0.95f, 0.05f, 0.0f};
  auto [row, dist] = index.assign(vec);
  EXPECT_EQ(row, 1);
  EXPECT_NEAR(dist, cosine_distance(vec, centers.row(1)), 1e-5f);
}

TEST_F(CentroidIndexTest, AssignExactMatchEuclidean) {
  auto centers = this->axes();
  CentroidIndex index(DistanceKind::Euclidean);
  index.load_centroids(centers.data(), centers.rows(), centers.cols());

  std::vector<float> vec = {0.0f, 0.0f, 1.0f, 0.0f};
  auto [row, dist] = index.assign(vec);
  EXPECT_EQ(row, 2);
  EXPECT_NEAR(dist, 0.0f, 1e-6f);
}

TEST_F(CentroidIndexTest, EuclideanDistanceIsNotSquared) {
  EmbeddingMatrix<float> centers(1, 2);
  this->fill_matrix(centers, {0.0f, 0.0f});
  CentroidIndex index(DistanceKind::Euclidean);
  index.load_centroids(centers.data(), centers.rows(), centers.cols());

  std::vector<float> vec = {3.0f, 4.0f};
  auto [row, dist] = index.assign(vec);
  EXPECT_EQ(row, 0);
  EXPECT_NEAR(dist, 5.0f, 1e-5f);
}

TEST_F(CentroidIndexTest, DimensionMismatchThrows) {
  auto centers = this->axes();
  CentroidIndex index;
  index.load_centroids(centers.data(), centers.rows(), centers.cols());

  std::vector<float> vec = {1.0f, 0.0f};
  EXPECT_THROW((void)index.assign(vec), std::invalid_argument);
}

TEST_F(CentroidIndexTest, ReloadReplacesCentroids) {
  auto centers = this->axes();
  CentroidIndex index(DistanceKind::Euclidean);
  index.load_centroids(centers.data(), centers.rows(), centers.cols());

  EmbeddingMatrix<float> other(2, 2);
  this->fill_matrix(other, {0.0f, 0.0f, 10.0f, 10.0f});
  index.load_centroids(other.data(), other.rows(), other.cols());

  EXPECT_EQ(index.n_clusters(), 2u);
  EXPECT_EQ(index.dim(), 2u);
  std::vector<float> vec = {9.0f, 9.5f};
  EXPECT_EQ(index.assign(vec).first, 1);
}

// =============================================================================
// SECTION 2: Many centroids (parallel path)
// =============================================================================

TEST_F(CentroidIndexTest, ManyClustersMatchBruteForce) {
  constexpr size_t N_CLUSTERS = 300;
  constexpr size_t DIM = 32;
  constexpr int N_QUERIES = 40;

  std::mt19937 gen(42);
  EmbeddingMatrix<float> centers(N_CLUSTERS, DIM);
  this->random_matrix(centers, gen);

  CentroidIndex index(DistanceKind::Euclidean);
  index.load_centroids(centers.data(), centers.rows(), centers.cols());

  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  for (int q = 0; q < N_QUERIES; ++q) {
    std::vector<float> query(DIM);
    for (auto& v : query) v = dist(gen);

    int expected = -1;
    float best = std::numeric_limits<float>::max();
    for (size_t c = 0; c < N_CLUSTERS; ++c) {
      float d = euclidean_distance(query, centers.row(c));
      if (d < best) {
        best = d;
        expected = static_cast<int>(c);
      }
    }

    auto [row, assigned] = index.assign(query);
    EXPECT_EQ(row, expected);
    EXPECT_NEAR(assigned, best, 1e-3f);
  }
}

TEST_F(CentroidIndexTest, MoveKeepsLoadedCentroids) {
  auto centers = this->axes();
  CentroidIndex index;
  index.load_centroids(centers.data(), centers.rows(), centers.cols());

  CentroidIndex moved = std::move(index);
  EXPECT_EQ(moved.n_clusters(), 3u);
  std::vector<float> vec = {1.0f, 0.0f, 0.0f, 0.0f};
  EXPECT_EQ(moved.assign(vec).first, 0);
}
