#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace swipe {

  enum class EntityType { User, Post };

  [[nodiscard]] std::string_view to_string(EntityType type) noexcept;

  // Accepts "user" and "post". Throws std::invalid_argument otherwise.
  [[nodiscard]] EntityType entity_type_from_string(std::string_view name);

  struct Entity {
    std::string id;
    EntityType type = EntityType::Post;
    nlohmann::json metadata = nlohmann::json::object();

    bool operator==(const Entity& other) const noexcept {
      return type == other.type && id == other.id;
    }
  };

  // Unit returned by an embedding source. A missing or empty vector marks a
  // record that has not been embedded yet.
  struct EmbeddingRecord {
    std::string entity_id;
    std::optional<std::vector<float>> vector;
    nlohmann::json metadata = nlohmann::json::object();
  };

}  // namespace swipe
