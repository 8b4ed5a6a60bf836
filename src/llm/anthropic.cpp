#include "freigent/llm/anthropic.hpp"

#include <spdlog/spdlog.h>

#include "llm/http_error.hpp"

namespace freigent::llm {

AnthropicProvider::AnthropicProvider(const ProviderConfig& config, asio::io_context& io_ctx) : config_(config), http_client_(io_ctx) {
  if (!config.base_url.empty()) {
    base_url_ = config.base_url;
  }
}

std::vector<ModelInfo> AnthropicProvider::models() const {
  return {
      {"claude-sonnet-4-20250514", "anthropic", 200000, 64000},
      {"claude-3-5-sonnet-20241022", "anthropic", 200000, 8192},
      {"claude-3-5-haiku-20241022", "anthropic", 200000, 8192},
      {"claude-3-haiku-20240307", "anthropic", 200000, 4096},
  };
}

LlmResponse AnthropicProvider::parse_response(const std::string& body) {
  LlmResponse result;

  try {
    auto j = json::parse(body);

    // Concatenate text blocks; other block types are not requested
    if (j.contains("content")) {
      for (const auto& content : j["content"]) {
        if (content.value("type", "") == "text") {
          result.text += content.value("text", "");
        }
      }
    }

    result.finish_reason = finish_reason_from_string(j.value("stop_reason", "end_turn"));

    if (j.contains("usage")) {
      result.usage.input_tokens = j["usage"].value("input_tokens", int64_t(0));
      result.usage.output_tokens = j["usage"].value("output_tokens", int64_t(0));
    }
  } catch (const std::exception& e) {
    result.error = std::string("Parse error: ") + e.what();
    result.finish_reason = FinishReason::Error;
  }

  return result;
}

std::future<LlmResponse> AnthropicProvider::complete(const LlmRequest& request) {
  auto promise = std::make_shared<std::promise<LlmResponse>>();
  auto future = promise->get_future();

  net::HttpOptions options;
  options.method = "POST";
  options.body = request.to_anthropic_format().dump();
  options.headers = {{"Content-Type", "application/json"}, {"x-api-key", config_.api_key}, {"anthropic-version", api_version_}};

  for (const auto& [key, value] : config_.headers) {
    options.headers[key] = value;
  }

  spdlog::debug("anthropic: POST /v1/messages model={}", request.model);

  http_client_.request(base_url_ + "/v1/messages", options, [promise](net::HttpResponse response) {
    if (!response.ok()) {
      LlmResponse result;
      result.error = describe_http_failure(response);
      result.finish_reason = FinishReason::Error;
      promise->set_value(std::move(result));
      return;
    }
    promise->set_value(parse_response(response.body));
  });

  return future;
}

}  // namespace freigent::llm
