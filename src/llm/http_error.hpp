#pragma once

#include <string>

#include "freigent/core/types.hpp"
#include "freigent/net/http_client.hpp"

namespace freigent::llm {

// Error text for a failed provider call: network error, the API's
// {"error": {"message": ...}} body, or the raw status and body.
inline std::string describe_http_failure(const net::HttpResponse& response) {
  if (!response.error.empty()) {
    return "Network error: " + response.error;
  }

  std::string error = "HTTP error: " + std::to_string(response.status_code);
  if (response.body.empty()) {
    return error;
  }

  auto err = json::parse(response.body, nullptr, false);
  if (!err.is_discarded() && err.is_object() && err.contains("error") && err["error"].is_object() && err["error"].contains("message") &&
      err["error"]["message"].is_string()) {
    return err["error"]["message"].get<std::string>();
  }
  return error + " - " + response.body;
}

}  // namespace freigent::llm
