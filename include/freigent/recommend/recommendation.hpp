#pragma once

#include <string>
#include <vector>

#include "freigent/core/types.hpp"

namespace freigent::recommend {

// One suggested product
struct Product {
  std::string name;
  std::string short_description;
  std::string why_match;
  std::string estimated_price_range;

  // Any further keys the model returned, kept verbatim
  json extra = json::object();

  json to_json() const;
  static Product from_json(const json& j);

  bool operator==(const Product& other) const = default;
};

// Result of one recommendation call: {products, summary_for_user}
struct Recommendation {
  std::vector<Product> products;
  std::string summary_for_user;

  json to_json() const;

  // Tolerant: missing or malformed keys fall back to defaults
  static Recommendation from_json(const json& j);

  bool operator==(const Recommendation& other) const = default;
};

inline constexpr const char* kMissingSummary = "No summary_for_user provided by the model.";

}  // namespace freigent::recommend
