#include <fmt/format.h>

#include <stdexcept>
#include <swipe/common/entity.hpp>

namespace swipe {

  std::string_view to_string(EntityType type) noexcept {
    switch (type) {
      case EntityType::User:
        return "user";
      case EntityType::Post:
        return "post";
    }
    return "post";
  }

  EntityType entity_type_from_string(std::string_view name) {
    if (name == "user") return EntityType::User;
    if (name == "post") return EntityType::Post;
    throw std::invalid_argument(
        fmt::format("entity type must be 'user' or 'post', got '{}'", name));
  }

}  // namespace swipe
