#include <gtest/gtest.h>

#include <thread>

#include "freigent/service/freigent_service.hpp"
#include "test_fakes.hpp"

using namespace freigent;
using namespace freigent::service;

class ServiceTest : public ::testing::Test {
 protected:
  profile::UserProfile make_profile(const std::string& name) {
    profile::UserProfile p;
    p.name = name;
    p.personality = name + " personality";
    p.values = "value";
    return p;
  }

  hub::Hub hub_;
  test::MemoryProfileStore store_;
  test::FakeRecommender recommender_;
  FreigentService service_{FreigentService::Options{}, hub_, store_, recommender_};
};

TEST_F(ServiceTest, SetProfileRegistersEverywhere) {
  auto result = service_.set_profile("u1", make_profile("Alice"));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->agent_id, "u1");
  EXPECT_EQ(result.value->agent_type, "freigent");
  EXPECT_EQ(result.value->display_name, "Alice");
  EXPECT_EQ(result.value->personality_summary, "Alice personality");

  EXPECT_TRUE(store_.load("u1").has_value());
  ASSERT_EQ(store_.list_agents().size(), 1);
  EXPECT_EQ(store_.list_agents()[0].display_name, "Alice");

  auto agents = service_.list_agents();
  ASSERT_EQ(agents.size(), 1);
  EXPECT_EQ(agents[0], *result.value);
}

TEST_F(ServiceTest, SetProfileValidatesAndReportsStoreErrors) {
  auto empty = service_.set_profile("", make_profile("Nobody"));
  EXPECT_FALSE(empty.ok());
  EXPECT_EQ(empty.code, ErrorCode::InvalidArgument);

  store_.fail = true;
  auto failed = service_.set_profile("u1", make_profile("Alice"));
  EXPECT_FALSE(failed.ok());
  EXPECT_EQ(failed.code, ErrorCode::StoreFailure);
  EXPECT_TRUE(service_.list_agents().empty());
}

TEST_F(ServiceTest, Search) {
  service_.set_profile("u1", make_profile("Alice"));

  auto result = service_.search("u1", "backpack");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->products[0].name, "Alice-pick");

  auto missing = service_.search("u9", "backpack");
  EXPECT_FALSE(missing.ok());
  EXPECT_EQ(missing.code, ErrorCode::ProfileNotFound);
  EXPECT_EQ(*missing.error, "No profile stored for user_id 'u9'");
}

TEST_F(ServiceTest, AutoSearchEndToEnd) {
  service_.set_profile("u1", make_profile("Alice"));
  service_.set_profile("u2", make_profile("Bob"));

  auto result = service_.auto_search("u1", "coffee grinder");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->helper_agent_ids, std::vector<AgentId>{"u2"});
  EXPECT_EQ(result.value->helper_results.size(), 1);
  EXPECT_EQ(result.value->merged_products.size(), 2);
}

TEST_F(ServiceTest, ConcurrentAutoSearchesForSameUser) {
  service_.set_profile("u1", make_profile("Alice"));
  service_.set_profile("u2", make_profile("Bob"));
  service_.set_profile("u3", make_profile("Carol"));

  std::vector<Result<orchestrator::AutoSearchResult>> results(4);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([this, &results, i]() {
      results[i] = service_.auto_search("u1", "query " + std::to_string(i));
    });
  }
  for (auto& t : threads) t.join();

  // Serialized runs never steal each other's replies
  for (const auto& r : results) {
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value->helper_results.size(), 2);
  }
}

TEST_F(ServiceTest, InboxAndProcess) {
  service_.set_profile("u1", make_profile("Alice"));
  service_.register_agent("u2", "freigent", "Bob");

  service_.send("u1", "u2", {{"type", hub::payload_type::kRecommendationRequest}, {"from_user_id", "u1"}, {"query", "pen"}});
  EXPECT_EQ(service_.inbox("u2", false).size(), 1);

  auto outcomes = service_.process_inbox("u2", 10);
  ASSERT_EQ(outcomes.size(), 1);
  EXPECT_EQ(outcomes[0].status, worker::OutcomeStatus::Ok);

  auto replies = service_.inbox("u1");
  ASSERT_EQ(replies.size(), 1);
  EXPECT_EQ(replies[0].type(), hub::payload_type::kRecommendationResponse);
  EXPECT_TRUE(service_.inbox("u1").empty());
}

TEST(ServiceOptionsTest, FromConfig) {
  Config config;
  config.hub.agent_type = "shopper";
  config.hub.worker_max_messages = 3;

  auto options = FreigentService::Options::from_config(config);
  EXPECT_EQ(options.agent_type, "shopper");
  EXPECT_EQ(options.worker_max_messages, 3);
}
