#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace freigent {

using json = nlohmann::json;

// Type aliases
using AgentId = std::string;
using MessageId = std::string;
using UserId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Agent type tag used for recommendation personas
inline constexpr const char *kFreigentAgentType = "freigent";

// Error categories surfaced through Result
enum class ErrorCode {
  None,
  ProfileNotFound,
  StoreFailure,
  InvalidArgument
};

std::string to_string(ErrorCode code);

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;
  ErrorCode code = ErrorCode::None;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt, ErrorCode::None};
  }

  static Result failure(ErrorCode code, std::string err) {
    return Result{std::nullopt, std::move(err), code};
  }
};

// Token usage tracking
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage &operator+=(const TokenUsage &other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    return *this;
  }
};

// Finish reason for LLM responses
enum class FinishReason {
  Stop,    // Natural completion
  Length,  // Token limit reached
  Error    // Error occurred
};

std::string to_string(FinishReason reason);

FinishReason finish_reason_from_string(const std::string &str);

// Model info
struct ModelInfo {
  std::string id;
  std::string provider;  // "anthropic", "openai"
  int64_t context_window = 128000;
  int64_t max_output_tokens = 8192;
};

// Provider configuration
struct ProviderConfig {
  std::string name;
  std::string api_key;
  std::string base_url;
  std::optional<std::string> organization;
  std::map<std::string, std::string> headers;
};

}  // namespace freigent
