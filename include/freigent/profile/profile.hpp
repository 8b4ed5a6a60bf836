#pragma once

#include <string>
#include <vector>

#include "freigent/core/types.hpp"

namespace freigent::profile {

// A product the user has used before
struct ProductExperience {
  std::string name;
  std::string notes;
  int rating = 0;

  bool operator==(const ProductExperience& other) const = default;
};

// Stored user profile; one per user id
struct UserProfile {
  std::string name;
  std::string personality;
  std::string values;
  std::vector<ProductExperience> experiences;

  json to_json() const;
  static UserProfile from_json(const json& j);

  // Plain-text rendering used in recommendation prompts
  std::string to_prompt_text() const;

  bool operator==(const UserProfile& other) const = default;
};

}  // namespace freigent::profile
