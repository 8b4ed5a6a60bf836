#include <gtest/gtest.h>

#include "freigent/llm/anthropic.hpp"
#include "freigent/llm/openai.hpp"
#include "freigent/llm/provider.hpp"
#include "freigent/net/http_client.hpp"

using namespace freigent;
using namespace freigent::llm;

TEST(LlmTest, ProviderFactory) {
  auto& factory = ProviderFactory::instance();

  ProviderConfig empty_config;
  asio::io_context io_ctx;

  EXPECT_NE(factory.create("anthropic", empty_config, io_ctx), nullptr);
  EXPECT_NE(factory.create("openai", empty_config, io_ctx), nullptr);
  EXPECT_EQ(factory.create("unknown", empty_config, io_ctx), nullptr);
}

TEST(LlmTest, AnthropicModels) {
  asio::io_context io_ctx;
  ProviderConfig config;
  config.api_key = "test-key";

  AnthropicProvider provider(config, io_ctx);
  EXPECT_EQ(provider.name(), "anthropic");

  // 默认推荐模型必须在列表中
  auto model = provider.get_model("claude-3-haiku-20240307");
  ASSERT_TRUE(model.has_value());
  EXPECT_EQ(model->provider, "anthropic");
  EXPECT_FALSE(provider.get_model("no-such-model").has_value());
}

TEST(LlmTest, AnthropicRequestFormat) {
  LlmRequest request;
  request.model = "claude-3-haiku-20240307";
  request.system_prompt = "You are a product recommendation engine.";
  request.messages.push_back(ChatMessage::user("Hello"));

  auto j = request.to_anthropic_format();

  EXPECT_EQ(j["model"], "claude-3-haiku-20240307");
  EXPECT_EQ(j["system"], "You are a product recommendation engine.");
  EXPECT_EQ(j["max_tokens"], 2048);
  ASSERT_EQ(j["messages"].size(), 1);
  EXPECT_EQ(j["messages"][0]["role"], "user");
  EXPECT_EQ(j["messages"][0]["content"], "Hello");
  EXPECT_FALSE(j.contains("temperature"));
}

TEST(LlmTest, OpenAIRequestFormat) {
  LlmRequest request;
  request.model = "gpt-4o-mini";
  request.system_prompt = "Be brief.";
  request.max_tokens = 256;
  request.temperature = 0.2;
  request.messages.push_back(ChatMessage::user("Hi"));

  auto j = request.to_openai_format();

  EXPECT_EQ(j["model"], "gpt-4o-mini");
  EXPECT_EQ(j["max_tokens"], 256);
  EXPECT_DOUBLE_EQ(j["temperature"].get<double>(), 0.2);

  // System prompt becomes the first message
  ASSERT_EQ(j["messages"].size(), 2);
  EXPECT_EQ(j["messages"][0]["role"], "system");
  EXPECT_EQ(j["messages"][0]["content"], "Be brief.");
  EXPECT_EQ(j["messages"][1]["role"], "user");
}

TEST(LlmTest, AnthropicParseResponse) {
  auto r = AnthropicProvider::parse_response(R"({
    "content": [{"type": "text", "text": "{\"products\": "}, {"type": "text", "text": "[]}"}],
    "stop_reason": "max_tokens",
    "usage": {"input_tokens": 12, "output_tokens": 34}
  })");

  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.text, "{\"products\": []}");
  EXPECT_EQ(r.finish_reason, FinishReason::Length);
  EXPECT_EQ(r.usage.input_tokens, 12);
  EXPECT_EQ(r.usage.output_tokens, 34);
  EXPECT_EQ(r.usage.total(), 46);
}

TEST(LlmTest, OpenAIParseResponse) {
  auto r = OpenAIProvider::parse_response(R"({
    "choices": [{"message": {"role": "assistant", "content": "hello"}, "finish_reason": "stop"}],
    "usage": {"prompt_tokens": 5, "completion_tokens": 7}
  })");

  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.text, "hello");
  EXPECT_EQ(r.finish_reason, FinishReason::Stop);
  EXPECT_EQ(r.usage.input_tokens, 5);
  EXPECT_EQ(r.usage.output_tokens, 7);

  auto empty = OpenAIProvider::parse_response(R"({"choices": []})");
  EXPECT_FALSE(empty.ok());
}

TEST(LlmTest, ParseResponseRejectsGarbage) {
  auto r = AnthropicProvider::parse_response("<html>Bad Gateway</html>");
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.finish_reason, FinishReason::Error);
}

TEST(LlmTest, FinishReasonStrings) {
  EXPECT_EQ(finish_reason_from_string("end_turn"), FinishReason::Stop);
  EXPECT_EQ(finish_reason_from_string("length"), FinishReason::Length);
  EXPECT_EQ(to_string(FinishReason::Length), "length");
}

// --- HTTP helpers ---

TEST(HttpTest, ParseUrl) {
  auto u = net::ParsedUrl::parse("https://api.anthropic.com/v1/messages?beta=true");
  ASSERT_TRUE(u.has_value());
  EXPECT_TRUE(u->is_https());
  EXPECT_EQ(u->host, "api.anthropic.com");
  EXPECT_EQ(u->port_or_default(), "443");
  EXPECT_EQ(u->path, "/v1/messages");
  EXPECT_EQ(u->query, "?beta=true");

  auto local = net::ParsedUrl::parse("http://localhost:8080");
  ASSERT_TRUE(local.has_value());
  EXPECT_EQ(local->port_or_default(), "8080");
  EXPECT_EQ(local->path, "/");

  EXPECT_FALSE(net::ParsedUrl::parse("ftp://example.com").has_value());
}

TEST(HttpTest, Retryable) {
  net::HttpResponse r;
  r.status_code = 503;
  EXPECT_TRUE(net::is_retryable(r));

  r.status_code = 429;
  EXPECT_TRUE(net::is_retryable(r));
  r.body = R"({"error": {"type": "insufficient_quota"}})";
  EXPECT_FALSE(net::is_retryable(r));

  r.status_code = 400;
  r.body.clear();
  EXPECT_FALSE(net::is_retryable(r));
}
