#pragma once

#include <asio.hpp>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "freigent/core/types.hpp"

namespace freigent::llm {

// One chat turn; role is "user" or "assistant"
struct ChatMessage {
  std::string role;
  std::string content;

  static ChatMessage user(std::string text) {
    return {"user", std::move(text)};
  }
};

// LLM request
struct LlmRequest {
  std::string model;
  std::string system_prompt;
  std::vector<ChatMessage> messages;

  // Generation parameters
  std::optional<double> temperature;
  std::optional<int> max_tokens;

  // Convert to API-specific format
  json to_anthropic_format() const;
  json to_openai_format() const;
};

// LLM response (non-streaming)
struct LlmResponse {
  std::string text;
  FinishReason finish_reason = FinishReason::Stop;
  TokenUsage usage;
  std::optional<std::string> error;

  bool ok() const {
    return !error.has_value();
  }
};

// Abstract LLM provider interface
class Provider {
 public:
  virtual ~Provider() = default;

  // Provider name
  virtual std::string name() const = 0;

  // Available models
  virtual std::vector<ModelInfo> models() const = 0;

  // Get model info
  virtual std::optional<ModelInfo> get_model(const std::string& model_id) const;

  // Non-streaming completion. Failures are reported in LlmResponse::error.
  virtual std::future<LlmResponse> complete(const LlmRequest& request) = 0;
};

// Provider factory
class ProviderFactory {
 public:
  static ProviderFactory& instance();

  // Create provider by name; nullptr for unknown names
  std::shared_ptr<Provider> create(const std::string& name, const ProviderConfig& config, asio::io_context& io_ctx);

  // Register custom provider factory
  using FactoryFunc = std::function<std::shared_ptr<Provider>(const ProviderConfig&, asio::io_context&)>;
  void register_provider(const std::string& name, FactoryFunc factory);

 private:
  ProviderFactory();

  std::mutex mutex_;
  std::map<std::string, FactoryFunc> factories_;
};

}  // namespace freigent::llm
