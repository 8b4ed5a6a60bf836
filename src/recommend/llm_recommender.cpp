#include <spdlog/spdlog.h>

#include <stdexcept>

#include "freigent/recommend/recommender.hpp"

namespace freigent::recommend {

namespace {

std::string trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

// Models occasionally wrap the JSON in ```json ... ``` despite instructions
std::string strip_code_fence(const std::string& text) {
  auto s = trim(text);
  if (!s.starts_with("```")) return s;

  auto first_newline = s.find('\n');
  if (first_newline == std::string::npos) return s;
  auto closing = s.rfind("```");
  if (closing == std::string::npos || closing <= first_newline) return s;

  return trim(s.substr(first_newline + 1, closing - first_newline - 1));
}

}  // namespace

Recommendation fallback_recommendation(const std::string& error) {
  Recommendation rec;
  rec.summary_for_user =
      "The agent tried to return a result, but there was an error parsing the JSON output.\n\n"
      "Error: " +
      error;
  return rec;
}

LlmRecommender::LlmRecommender(std::shared_ptr<llm::Provider> provider, Options options)
    : provider_(std::move(provider)), options_(std::move(options)) {}

const std::string& LlmRecommender::system_prompt() {
  static const std::string prompt =
      "You are a product recommendation engine for an AI shopping friend (Freigent). You receive:\n"
      "1) A detailed user profile (personality, values, previous products).\n"
      "2) A free-text product search query.\n\n"
      "Your job is to suggest 3-5 concrete product ideas that match the user.\n"
      "IMPORTANT:\n"
      "- You MUST respond with ONLY valid JSON.\n"
      "- Do NOT include any markdown, backticks, or plain text outside JSON.\n"
      "- The JSON must have this exact structure:\n"
      "{\n"
      "  \"products\": [\n"
      "    {\n"
      "      \"name\": \"string\",\n"
      "      \"short_description\": \"string\",\n"
      "      \"why_match\": \"string\",\n"
      "      \"estimated_price_range\": \"string\"\n"
      "    },\n"
      "    ... 3 to 5 items ...\n"
      "  ],\n"
      "  \"summary_for_user\": \"short, friendly paragraph explaining the recommendations\"\n"
      "}\n"
      "- The JSON must be parseable by a strict JSON parser.\n";
  return prompt;
}

std::string LlmRecommender::user_prompt(const profile::UserProfile& profile, const std::string& query) {
  return "Here is the user profile:\n"
         "----------------------------------------\n" +
         profile.to_prompt_text() +
         "\n"
         "----------------------------------------\n\n"
         "Here is the user's product search query:\n" +
         query +
         "\n\n"
         "Now generate the JSON response as specified. Remember: JSON only.";
}

Recommendation LlmRecommender::parse_model_output(const std::string& text) {
  auto j = json::parse(strip_code_fence(text));
  if (!j.is_object()) {
    throw std::invalid_argument("model output is not a JSON object");
  }
  return Recommendation::from_json(j);
}

Recommendation LlmRecommender::generate(const profile::UserProfile& profile, const std::string& query) {
  if (!provider_) {
    return fallback_recommendation("no LLM provider configured");
  }

  llm::LlmRequest request;
  request.model = options_.model;
  request.system_prompt = system_prompt();
  request.max_tokens = options_.max_tokens;
  request.messages.push_back(llm::ChatMessage::user(user_prompt(profile, query)));

  try {
    auto future = provider_->complete(request);
    if (future.wait_for(options_.timeout) != std::future_status::ready) {
      spdlog::warn("recommender: {} did not answer within {}s", provider_->name(), options_.timeout.count());
      return fallback_recommendation("LLM request timed out");
    }

    auto response = future.get();
    if (!response.ok()) {
      spdlog::warn("recommender: {} request failed: {}", provider_->name(), *response.error);
      return fallback_recommendation(*response.error);
    }

    auto rec = parse_model_output(response.text);
    spdlog::debug("recommender: {} product(s), {} input / {} output tokens", rec.products.size(), response.usage.input_tokens,
                  response.usage.output_tokens);
    return rec;
  } catch (const std::exception& e) {
    spdlog::warn("recommender: generation failed: {}", e.what());
    return fallback_recommendation(e.what());
  }
}

}  // namespace freigent::recommend
