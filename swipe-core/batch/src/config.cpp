#include <fmt/format.h>

#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <swipe/batch/config.hpp>

using json = nlohmann::json;

namespace swipe::clustering {

  // ============================================================================
  // JSON Serialization - DbscanConfig
  // ============================================================================

  void to_json(json& j, const DbscanConfig& c) {
    j = {{"epsilon", c.epsilon},
         {"min_points", c.min_points},
         {"distance", std::string(to_string(c.distance))}};
  }

  void from_json(const json& j, DbscanConfig& c) {
    c.epsilon = j.value("epsilon", c.epsilon);
    c.min_points = j.value("min_points", c.min_points);
    if (j.contains("distance")) {
      c.distance = distance_kind_from_string(j.at("distance").get<std::string>());
    }
  }

}  // namespace swipe::clustering

namespace swipe::batch {

  namespace {

    // Sizes are read signed so that negative values are rejected instead of wrapping.
    size_t read_size(const json& j, const char* key, size_t fallback) {
      if (!j.contains(key)) return fallback;
      auto value = j.at(key).get<int64_t>();
      if (value <= 0) {
        throw std::invalid_argument(fmt::format("{} must be positive, got {}", key, value));
      }
      return static_cast<size_t>(value);
    }

  }  // namespace

  // ============================================================================
  // JSON File I/O
  // ============================================================================

  BatchConfig BatchConfig::from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(fmt::format("Failed to open batch config file: {}", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
  }

  BatchConfig BatchConfig::from_json_string(const std::string& json_str) {
    json j = json::parse(json_str);

    BatchConfig config;
    if (j.contains("embedding_update_interval_ms")) {
      config.embedding_update_interval
          = std::chrono::milliseconds(j.at("embedding_update_interval_ms").get<int64_t>());
    }
    if (j.contains("clustering_interval_ms")) {
      config.clustering_interval
          = std::chrono::milliseconds(j.at("clustering_interval_ms").get<int64_t>());
    }
    config.batch_size = read_size(j, "batch_size", config.batch_size);
    config.max_items_per_run = read_size(j, "max_items_per_run", config.max_items_per_run);
    if (j.contains("clustering")) {
      j.at("clustering").get_to(config.clustering);
    }

    config.validate();
    return config;
  }

  std::string BatchConfig::to_json_string() const {
    json j;
    j["embedding_update_interval_ms"] = embedding_update_interval.count();
    j["clustering_interval_ms"] = clustering_interval.count();
    j["batch_size"] = batch_size;
    j["max_items_per_run"] = max_items_per_run;
    j["clustering"] = clustering;
    return j.dump(2);
  }

  // ============================================================================
  // Validation
  // ============================================================================

  void BatchConfig::validate() const {
    if (embedding_update_interval.count() <= 0) {
      throw std::invalid_argument(
          fmt::format("embedding_update_interval must be positive, got {} ms",
                      embedding_update_interval.count()));
    }
    if (clustering_interval.count() <= 0) {
      throw std::invalid_argument(fmt::format(
          "clustering_interval must be positive, got {} ms", clustering_interval.count()));
    }
    if (batch_size == 0) {
      throw std::invalid_argument("batch_size must be positive");
    }
    if (max_items_per_run == 0) {
      throw std::invalid_argument("max_items_per_run must be positive");
    }
    clustering.validate();
  }

}  // namespace swipe::batch
