#include "freigent/llm/openai.hpp"

#include <spdlog/spdlog.h>

#include "llm/http_error.hpp"

namespace freigent::llm {

OpenAIProvider::OpenAIProvider(const ProviderConfig& config, asio::io_context& io_ctx) : config_(config), http_client_(io_ctx) {
  if (!config.base_url.empty()) {
    base_url_ = config.base_url;
  }
}

std::vector<ModelInfo> OpenAIProvider::models() const {
  return {
      {"gpt-4.1", "openai", 1047576, 32768},
      {"gpt-4.1-mini", "openai", 1047576, 32768},
      {"gpt-4o", "openai", 128000, 16384},
      {"gpt-4o-mini", "openai", 128000, 16384},
  };
}

LlmResponse OpenAIProvider::parse_response(const std::string& body) {
  LlmResponse result;

  try {
    auto j = json::parse(body);

    if (!j.contains("choices") || j["choices"].empty()) {
      result.error = "Response has no choices";
      result.finish_reason = FinishReason::Error;
      return result;
    }

    const auto& choice = j["choices"][0];
    if (choice.contains("message") && choice["message"].contains("content") && choice["message"]["content"].is_string()) {
      result.text = choice["message"]["content"].get<std::string>();
    }

    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
      result.finish_reason = finish_reason_from_string(choice["finish_reason"].get<std::string>());
    }

    if (j.contains("usage")) {
      result.usage.input_tokens = j["usage"].value("prompt_tokens", int64_t(0));
      result.usage.output_tokens = j["usage"].value("completion_tokens", int64_t(0));
    }
  } catch (const std::exception& e) {
    result.error = std::string("Parse error: ") + e.what();
    result.finish_reason = FinishReason::Error;
  }

  return result;
}

std::future<LlmResponse> OpenAIProvider::complete(const LlmRequest& request) {
  auto promise = std::make_shared<std::promise<LlmResponse>>();
  auto future = promise->get_future();

  net::HttpOptions options;
  options.method = "POST";
  options.body = request.to_openai_format().dump();
  options.headers = {{"Content-Type", "application/json"}, {"Authorization", "Bearer " + config_.api_key}};

  if (config_.organization && !config_.organization->empty()) {
    options.headers["OpenAI-Organization"] = *config_.organization;
  }

  for (const auto& [key, value] : config_.headers) {
    options.headers[key] = value;
  }

  spdlog::debug("openai: POST /v1/chat/completions model={}", request.model);

  http_client_.request(base_url_ + "/v1/chat/completions", options, [promise](net::HttpResponse response) {
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
