#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "freigent/llm/provider.hpp"
#include "freigent/profile/profile.hpp"
#include "freigent/recommend/recommendation.hpp"

namespace freigent::recommend {

// Maps a profile plus a free-text query to product recommendations.
// Implementations never throw; failures come back as a fallback Recommendation
// with no products and a diagnostic summary.
class Recommender {
 public:
  virtual ~Recommender() = default;

  virtual Recommendation generate(const profile::UserProfile& profile, const std::string& query) = 0;
};

// Fallback returned when generation fails
Recommendation fallback_recommendation(const std::string& error);

// Recommender backed by an LLM provider, asking for a strict JSON answer
class LlmRecommender : public Recommender {
 public:
  struct Options {
    std::string model;
    int max_tokens = 2048;
    std::chrono::seconds timeout{60};
  };

  LlmRecommender(std::shared_ptr<llm::Provider> provider, Options options);

  Recommendation generate(const profile::UserProfile& profile, const std::string& query) override;

  static const std::string& system_prompt();

  static std::string user_prompt(const profile::UserProfile& profile, const std::string& query);

  // Parse the model's text into a Recommendation; throws on invalid JSON
  static Recommendation parse_model_output(const std::string& text);

 private:
  std::shared_ptr<llm::Provider> provider_;
  Options options_;
};

}  // namespace freigent::recommend
