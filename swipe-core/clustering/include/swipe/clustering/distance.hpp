#pragma once
#include <span>
#include <string_view>

namespace swipe::clustering {

  enum class DistanceKind { Euclidean, Cosine };

  [[nodiscard]] std::string_view to_string(DistanceKind kind) noexcept;

  // Accepts "euclidean" and "cosine". Throws std::invalid_argument otherwise.
  [[nodiscard]] DistanceKind distance_kind_from_string(std::string_view name);

  // All functions below throw std::invalid_argument when a.size() != b.size().

  [[nodiscard]] float euclidean_distance(std::span<const float> a, std::span<const float> b);

  // Returns 0 when either vector has zero magnitude.
  [[nodiscard]] float cosine_similarity(std::span<const float> a, std::span<const float> b);

  // 1 - cosine_similarity, or 1 when either vector has zero magnitude.
  [[nodiscard]] float cosine_distance(std::span<const float> a, std::span<const float> b);

  [[nodiscard]] float distance(std::span<const float> a, std::span<const float> b,
                               DistanceKind kind);

}  // namespace swipe::clustering
