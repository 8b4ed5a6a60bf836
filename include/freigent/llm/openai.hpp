#pragma once

#include "freigent/llm/provider.hpp"
#include "freigent/net/http_client.hpp"

namespace freigent::llm {

// OpenAI-compatible chat completions provider
class OpenAIProvider : public Provider {
 public:
  OpenAIProvider(const ProviderConfig& config, asio::io_context& io_ctx);

  std::string name() const override {
    return "openai";
  }

  std::vector<ModelInfo> models() const override;

  std::future<LlmResponse> complete(const LlmRequest& request) override;

  // Parse a successful /v1/chat/completions response body
  static LlmResponse parse_response(const std::string& body);

 private:
  ProviderConfig config_;
  net::HttpClient http_client_;

  std::string base_url_ = "https://api.openai.com";
};

}  // namespace freigent::llm
