#include "freigent/recommend/recommendation.hpp"

namespace freigent::recommend {

namespace {

// Models sometimes emit numbers or nulls where strings are expected
std::string string_field(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return {};
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

}  // namespace

json Product::to_json() const {
  json j = extra.is_object() ? extra : json::object();
  j["name"] = name;
  j["short_description"] = short_description;
  j["why_match"] = why_match;
  j["estimated_price_range"] = estimated_price_range;
  return j;
}

Product Product::from_json(const json& j) {
  Product p;
  if (!j.is_object()) {
    p.name = j.is_string() ? j.get<std::string>() : j.dump();
    return p;
  }

  p.name = string_field(j, "name");
  p.short_description = string_field(j, "short_description");
  p.why_match = string_field(j, "why_match");
  p.estimated_price_range = string_field(j, "estimated_price_range");

  for (auto& [key, value] : j.items()) {
    if (key == "name" || key == "short_description" || key == "why_match" || key == "estimated_price_range") continue;
    p.extra[key] = value;
  }
  return p;
}

json Recommendation::to_json() const {
  json items = json::array();
  for (const auto& p : products) {
    items.push_back(p.to_json());
  }
  return {{"products", items}, {"summary_for_user", summary_for_user}};
}

Recommendation Recommendation::from_json(const json& j) {
  Recommendation rec;
  if (!j.is_object()) {
    rec.summary_for_user = kMissingSummary;
    return rec;
  }

  auto products = j.find("products");
  if (products != j.end() && products->is_array()) {
    for (const auto& item : *products) {
      rec.products.push_back(Product::from_json(item));
    }
  }

  auto summary = j.find("summary_for_user");
  if (summary != j.end() && summary->is_string()) {
    rec.summary_for_user = summary->get<std::string>();
  } else {
    rec.summary_for_user = kMissingSummary;
  }
  return rec;
}

}  // namespace freigent::recommend
