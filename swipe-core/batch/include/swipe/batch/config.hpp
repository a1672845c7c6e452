#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <swipe/clustering/types.hpp>

namespace swipe::batch {

  // Settings of the scheduled batch jobs. Collaborators are passed separately
  // (see BatchRepositories).
  struct BatchConfig {
    std::chrono::milliseconds embedding_update_interval = std::chrono::hours(12);
    std::chrono::milliseconds clustering_interval = std::chrono::hours(24);
    size_t batch_size = 100;
    size_t max_items_per_run = 5000;
    clustering::DbscanConfig clustering{
        .epsilon = 0.25f, .min_points = 3, .distance = clustering::DistanceKind::Cosine};

    // Missing keys keep their defaults. Parse errors propagate from nlohmann::json.
    [[nodiscard]] static BatchConfig from_json(const std::string& path);
    [[nodiscard]] static BatchConfig from_json_string(const std::string& json_str);

    [[nodiscard]] std::string to_json_string() const;

    // Throws std::invalid_argument on non-positive intervals or sizes.
    void validate() const;
  };

}  // namespace swipe::batch
