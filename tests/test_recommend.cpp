#include <gtest/gtest.h>

#include <chrono>
#include <future>

#include "freigent/profile/profile.hpp"
#include "freigent/recommend/recommender.hpp"

using namespace freigent;
using namespace freigent::recommend;

namespace {

// Provider returning a canned response, or never answering when `hang` is set
class FakeProvider : public llm::Provider {
 public:
  llm::LlmResponse response;
  bool hang = false;
  std::vector<llm::LlmRequest> requests;

  std::string name() const override {
    return "fake";
  }

  std::vector<ModelInfo> models() const override {
    return {{"fake-model", "fake", 1000, 100}};
  }

  std::future<llm::LlmResponse> complete(const llm::LlmRequest& request) override {
    requests.push_back(request);
    if (hang) {
      return pending_.get_future();
    }
    std::promise<llm::LlmResponse> p;
    p.set_value(response);
    return p.get_future();
  }

 private:
  std::promise<llm::LlmResponse> pending_;
};

profile::UserProfile alice() {
  profile::UserProfile p;
  p.name = "Alice";
  p.personality = "outdoorsy, frugal";
  p.values = "durability";
  p.experiences = {{"Trail shoes", "lasted three years", 5}};
  return p;
}

const char* kGoodOutput = R"({
  "products": [
    {"name": "Rain Jacket", "short_description": "Light shell", "why_match": "You hike", "estimated_price_range": "$80-$120"},
    {"name": "Headlamp", "short_description": "USB charged", "why_match": "Night trails", "estimated_price_range": "$30", "brand": "Petzl"}
  ],
  "summary_for_user": "Two picks for the trail."
})";

}  // namespace

// --- Profile rendering ---

TEST(ProfileTest, PromptText) {
  auto text = alice().to_prompt_text();
  EXPECT_NE(text.find("User name: Alice"), std::string::npos);
  EXPECT_NE(text.find("Personality: outdoorsy, frugal"), std::string::npos);
  EXPECT_NE(text.find("Values in products: durability"), std::string::npos);
  EXPECT_NE(text.find("- Trail shoes (rating 5/5): lasted three years"), std::string::npos);
}

TEST(ProfileTest, PromptTextWithoutExperiences) {
  profile::UserProfile p;
  auto text = p.to_prompt_text();
  EXPECT_NE(text.find("User name: Unknown user"), std::string::npos);
  EXPECT_NE(text.find("No concrete past product experience."), std::string::npos);
}

TEST(ProfileTest, JsonRoundTrip) {
  auto p = alice();
  EXPECT_EQ(profile::UserProfile::from_json(p.to_json()), p);
}

// --- Recommendation parsing ---

TEST(RecommendationTest, FromJsonKeepsExtraKeys) {
  auto rec = Recommendation::from_json(json::parse(kGoodOutput));
  ASSERT_EQ(rec.products.size(), 2);
  EXPECT_EQ(rec.products[0].name, "Rain Jacket");
  EXPECT_EQ(rec.products[0].estimated_price_range, "$80-$120");
  EXPECT_EQ(rec.products[1].extra["brand"], "Petzl");
  EXPECT_EQ(rec.products[1].to_json()["brand"], "Petzl");
  EXPECT_EQ(rec.summary_for_user, "Two picks for the trail.");
}

TEST(RecommendationTest, MissingKeysGetDefaults) {
  auto rec = Recommendation::from_json(json::parse(R"({"products": [{"name": "Mug", "estimated_price_range": 12}]})"));
  ASSERT_EQ(rec.products.size(), 1);
  EXPECT_EQ(rec.products[0].name, "Mug");
  EXPECT_EQ(rec.products[0].why_match, "");
  // Non-string values are kept as their JSON text
  EXPECT_EQ(rec.products[0].estimated_price_range, "12");
  EXPECT_EQ(rec.summary_for_user, kMissingSummary);
}

TEST(RecommendationTest, ProductsNotAnArray) {
  auto rec = Recommendation::from_json(json::parse(R"({"products": "none", "summary_for_user": "hi"})"));
  EXPECT_TRUE(rec.products.empty());
  EXPECT_EQ(rec.summary_for_user, "hi");
}

// --- LlmRecommender ---

TEST(LlmRecommenderTest, ParsesModelOutput) {
  auto provider = std::make_shared<FakeProvider>();
  provider->response.text = kGoodOutput;
  LlmRecommender recommender(provider, {"fake-model", 512, std::chrono::seconds(5)});

  auto rec = recommender.generate(alice(), "rain gear");
  ASSERT_EQ(rec.products.size(), 2);
  EXPECT_EQ(rec.summary_for_user, "Two picks for the trail.");

  ASSERT_EQ(provider->requests.size(), 1);
  const auto& req = provider->requests[0];
  EXPECT_EQ(req.model, "fake-model");
  ASSERT_TRUE(req.max_tokens.has_value());
  EXPECT_EQ(*req.max_tokens, 512);
  EXPECT_EQ(req.system_prompt, LlmRecommender::system_prompt());
  ASSERT_EQ(req.messages.size(), 1);
  EXPECT_EQ(req.messages[0].role, "user");
  EXPECT_NE(req.messages[0].content.find("User name: Alice"), std::string::npos);
  EXPECT_NE(req.messages[0].content.find("rain gear"), std::string::npos);
}

TEST(LlmRecommenderTest, StripsCodeFence) {
  auto rec = LlmRecommender::parse_model_output(std::string("```json\n") + kGoodOutput + "\n```\n");
  EXPECT_EQ(rec.products.size(), 2);
}

TEST(LlmRecommenderTest, InvalidJsonGivesFallback) {
  auto provider = std::make_shared<FakeProvider>();
  provider->response.text = "Sure! Here are some ideas: a tent.";
  LlmRecommender recommender(provider, {"fake-model", 512, std::chrono::seconds(5)});

  auto rec = recommender.generate(alice(), "tent");
  EXPECT_TRUE(rec.products.empty());
  EXPECT_EQ(rec.summary_for_user.rfind(
                "The agent tried to return a result, but there was an error parsing the JSON output.\n\nError: ", 0),
            0);
}

TEST(LlmRecommenderTest, ProviderErrorGivesFallback) {
  auto provider = std::make_shared<FakeProvider>();
  provider->response.error = "HTTP error: 500";
  LlmRecommender recommender(provider, {"fake-model", 512, std::chrono::seconds(5)});

  auto rec = recommender.generate(alice(), "tent");
  EXPECT_TRUE(rec.products.empty());
  EXPECT_NE(rec.summary_for_user.find("Error: HTTP error: 500"), std::string::npos);
}

TEST(LlmRecommenderTest, TimeoutGivesFallback) {
  auto provider = std::make_shared<FakeProvider>();
  provider->hang = true;
  LlmRecommender recommender(provider, {"fake-model", 512, std::chrono::seconds(0)});

  auto rec = recommender.generate(alice(), "tent");
  EXPECT_TRUE(rec.products.empty());
  EXPECT_NE(rec.summary_for_user.find("timed out"), std::string::npos);
}

TEST(LlmRecommenderTest, NoProvider) {
  LlmRecommender recommender(nullptr, {"fake-model", 512, std::chrono::seconds(5)});

  auto rec = recommender.generate(alice(), "tent");
  EXPECT_TRUE(rec.products.empty());
  EXPECT_NE(rec.summary_for_user.find("Error: "), std::string::npos);
}

TEST(LlmRecommenderTest, Fallback) {
  auto rec = fallback_recommendation("boom");
  EXPECT_TRUE(rec.products.empty());
  EXPECT_EQ(rec.summary_for_user,
            "The agent tried to return a result, but there was an error parsing the JSON output.\n\nError: boom");
}
