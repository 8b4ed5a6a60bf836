#include "freigent/core/types.hpp"

namespace freigent {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "none";
    case ErrorCode::ProfileNotFound:
      return "profile_not_found";
    case ErrorCode::StoreFailure:
      return "store_failure";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::Length:
      return "length";
    case FinishReason::Error:
      return "error";
  }
  return "unknown";
}

FinishReason finish_reason_from_string(const std::string &str) {
  if (str == "stop" || str == "end_turn" || str == "stop_sequence") return FinishReason::Stop;
  if (str == "length" || str == "max_tokens") return FinishReason::Length;
  if (str == "error") return FinishReason::Error;
  return FinishReason::Stop;
}

}  // namespace freigent
