#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <swipe/clustering/distance.hpp>

namespace swipe::clustering {

  namespace {

    void check_dims(std::span<const float> a, std::span<const float> b) {
      if (a.size() != b.size()) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("vector dimension mismatch: {} vs {}", a.size(), b.size()));
      }
    }

    struct CosineTerms {
      double dot = 0.0;
      double norm_a = 0.0;
      double norm_b = 0.0;
    };

    CosineTerms cosine_terms(std::span<const float> a, std::span<const float> b) noexcept {
      CosineTerms t;
      for (size_t i = 0; i < a.size(); ++i) {
        const double x = a[i];
        const double y = b[i];
        t.dot += x * y;
        t.norm_a += x * x;
        t.norm_b += y * y;
      }
      return t;
    }

  }  // namespace

  std::string_view to_string(DistanceKind kind) noexcept {
    switch (kind) {
      case DistanceKind::Euclidean:
        return "euclidean";
      case DistanceKind::Cosine:
        return "cosine";
    }
    return "cosine";
  }

  DistanceKind distance_kind_from_string(std::string_view name) {
    if (name == "euclidean") return DistanceKind::Euclidean;
    if (name == "cosine") return DistanceKind::Cosine;
    throw std::invalid_argument(
        fmt::format("distance must be 'euclidean' or 'cosine', got '{}'", name));
  }

  float euclidean_distance(std::span<const float> a, std::span<const float> b) {
    check_dims(a, b);
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
      const double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
      sum += diff * diff;
    }
    return static_cast<float>(std::sqrt(sum));
  }

  float cosine_similarity(std::span<const float> a, std::span<const float> b) {
    check_dims(a, b);
    auto t = cosine_terms(a, b);
    if (t.norm_a == 0.0 || t.norm_b == 0.0) return 0.0f;
    return static_cast<float>(t.dot / (std::sqrt(t.norm_a) * std::sqrt(t.norm_b)));
  }

  float cosine_distance(std::span<const float> a, std::span<const float> b) {
    check_dims(a, b);
    auto t = cosine_terms(a, b);
    if (t.norm_a == 0.0 || t.norm_b == 0.0) return 1.0f;
    double similarity = t.dot / (std::sqrt(t.norm_a) * std::sqrt(t.norm_b));
    // Rounding can push |similarity| past 1 for (anti)parallel vectors.
    similarity = std::clamp(similarity, -1.0, 1.0);
    return static_cast<float>(1.0 - similarity);
  }

  float distance(std::span<const float> a, std::span<const float> b, DistanceKind kind) {
    switch (kind) {
      case DistanceKind::Euclidean:
        return euclidean_distance(a, b);
      case DistanceKind::Cosine:
        return cosine_distance(a, b);
    }
    throw std::invalid_argument("unknown distance kind");
  }

}  // namespace swipe::clustering
