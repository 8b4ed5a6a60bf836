#include "freigent/llm/provider.hpp"

#include "freigent/llm/anthropic.hpp"
#include "freigent/llm/openai.hpp"

namespace freigent::llm {

std::optional<ModelInfo> Provider::get_model(const std::string& model_id) const {
  for (const auto& model : models()) {
    if (model.id == model_id) {
      return model;
    }
  }
  return std::nullopt;
}

ProviderFactory& ProviderFactory::instance() {
  static ProviderFactory instance;
  return instance;
}

ProviderFactory::ProviderFactory() {
  factories_["anthropic"] = [](const ProviderConfig& cfg, asio::io_context& ctx) {
    return std::make_shared<AnthropicProvider>(cfg, ctx);
  };
  factories_["openai"] = [](const ProviderConfig& cfg, asio::io_context& ctx) {
    return std::make_shared<OpenAIProvider>(cfg, ctx);
  };
}

std::shared_ptr<Provider> ProviderFactory::create(const std::string& name, const ProviderConfig& config, asio::io_context& io_ctx) {
  FactoryFunc factory;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = factories_.find(name);
    if (it == factories_.end()) {
      return nullptr;
    }
    factory = it->second;
  }
  return factory(config, io_ctx);
}

void ProviderFactory::register_provider(const std::string& name, FactoryFunc factory) {
  std::lock_guard<std::mutex> lock(mutex_);
  factories_[name] = std::move(factory);
}

json LlmRequest::to_anthropic_format() const {
  json request;
  request["model"] = model;
  request["max_tokens"] = max_tokens.value_or(2048);

  if (!system_prompt.empty()) {
    request["system"] = system_prompt;
  }

  if (temperature) {
    request["temperature"] = *temperature;
  }

  json msgs = json::array();
  for (const auto& msg : messages) {
    msgs.push_back({{"role", msg.role}, {"content", msg.content}});
  }
  request["messages"] = msgs;

  return request;
}

json LlmRequest::to_openai_format() const {
  json request;
  request["model"] = model;

  if (max_tokens) {
    request["max_tokens"] = *max_tokens;
  }

  if (temperature) {
    request["temperature"] = *temperature;
  }

  // OpenAI takes the system prompt as the first message
  json msgs = json::array();
  if (!system_prompt.empty()) {
    msgs.push_back({{"role", "system"}, {"content", system_prompt}});
  }
  for (const auto& msg : messages) {
    msgs.push_back({{"role", msg.role}, {"content", msg.content}});
  }
  request["messages"] = msgs;

  return request;
}

}  // namespace freigent::llm
