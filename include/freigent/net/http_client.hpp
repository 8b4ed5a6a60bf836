#pragma once

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace freigent::net {

// HTTP response
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string error;

  bool ok() const {
    return error.empty() && status_code >= 200 && status_code < 300;
  }
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout{30};

  // Retries for connection failures, 429 and 5xx (0 = single attempt)
  int max_retries = 0;
  std::chrono::milliseconds retry_delay{1000};
};

// Async HTTP/1.1 client on ASIO, TLS through OpenSSL.
// Callbacks run on the io_context thread; the caller keeps the context running.
class HttpClient {
 public:
  explicit HttpClient(asio::io_context& io_ctx);

  ~HttpClient();

  // Async request with callback
  void request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback);

  // Async request returning future (with retries when options.max_retries > 0)
  std::future<HttpResponse> request(const std::string& url, const HttpOptions& options);

  // Convenience methods
  std::future<HttpResponse> get(const std::string& url, const std::map<std::string, std::string>& headers = {});

  std::future<HttpResponse> post(const std::string& url, const std::string& body, const std::map<std::string, std::string>& headers = {});

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  static std::optional<ParsedUrl> parse(const std::string& url);
};

// True for responses worth retrying: no response, 429 (not quota), 500/502/503/504
bool is_retryable(const HttpResponse& response);

}  // namespace freigent::net
