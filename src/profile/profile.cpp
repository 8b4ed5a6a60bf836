#include "freigent/profile/profile.hpp"

#include <sstream>

namespace freigent::profile {

json UserProfile::to_json() const {
  json exps = json::array();
  for (const auto& e : experiences) {
    exps.push_back({{"name", e.name}, {"notes", e.notes}, {"rating", e.rating}});
  }
  return {{"name", name}, {"personality", personality}, {"values", values}, {"experiences", exps}};
}

UserProfile UserProfile::from_json(const json& j) {
  UserProfile profile;
  profile.name = j.value("name", "");
  profile.personality = j.value("personality", "");
  profile.values = j.value("values", "");

  if (j.contains("experiences") && j["experiences"].is_array()) {
    for (const auto& e : j["experiences"]) {
      ProductExperience exp;
      exp.name = e.value("name", "");
      exp.notes = e.value("notes", "");
      exp.rating = e.value("rating", 0);
      profile.experiences.push_back(std::move(exp));
    }
  }
  return profile;
}

std::string UserProfile::to_prompt_text() const {
  std::ostringstream out;
  out << "User name: " << (name.empty() ? "Unknown user" : name) << "\n";
  out << "Personality: " << personality << "\n";
  out << "Values in products: " << values << "\n";
  out << "Past product experience:\n";

  if (experiences.empty()) {
    out << "No concrete past product experience.\n";
  } else {
    for (const auto& e : experiences) {
      out << "- " << (e.name.empty() ? "Unknown product" : e.name) << " (rating " << e.rating << "/5): " << e.notes << "\n";
    }
  }
  return out.str();
}

}  // namespace freigent::profile
