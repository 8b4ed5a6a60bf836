#pragma once

#include "freigent/llm/provider.hpp"
#include "freigent/net/http_client.hpp"

namespace freigent::llm {

// Anthropic Messages API provider
class AnthropicProvider : public Provider {
 public:
  AnthropicProvider(const ProviderConfig& config, asio::io_context& io_ctx);

  std::string name() const override {
    return "anthropic";
  }

  std::vector<ModelInfo> models() const override;

  std::future<LlmResponse> complete(const LlmRequest& request) override;

  // Parse a successful /v1/messages response body
  static LlmResponse parse_response(const std::string& body);

 private:
  ProviderConfig config_;
  net::HttpClient http_client_;

  std::string base_url_ = "https://api.anthropic.com";
  std::string api_version_ = "2023-06-01";
};

}  // namespace freigent::llm
