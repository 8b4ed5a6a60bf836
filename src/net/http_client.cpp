#include "freigent/net/http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <asio/ssl.hpp>
#include <cctype>
#include <regex>
#include <sstream>
#include <thread>

namespace freigent::net {

using tcp = asio::ip::tcp;
using TlsStream = asio::ssl::stream<tcp::socket>;

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  std::regex url_regex(R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

bool is_retryable(const HttpResponse& resp) {
  // No HTTP response at all: DNS, connect, TLS or timeout failure
  if (resp.status_code == 0) return true;
  if (resp.status_code == 429) {
    // Quota exhaustion will not clear up by waiting
    if (resp.body.find("insufficient_quota") != std::string::npos) return false;
    if (resp.body.find("quota_exceeded") != std::string::npos) return false;
    if (resp.body.find("billing") != std::string::npos) return false;
    return true;
  }
  return resp.status_code == 500 || resp.status_code == 502 || resp.status_code == 503 || resp.status_code == 504;
}

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// Decode a complete "Transfer-Encoding: chunked" body
std::optional<std::string> decode_chunked(const std::string& raw) {
  std::string out;
  size_t pos = 0;
  while (pos < raw.size()) {
    auto line_end = raw.find("\r\n", pos);
    if (line_end == std::string::npos) return std::nullopt;

    size_t size = 0;
    try {
      size = std::stoul(raw.substr(pos, line_end - pos), nullptr, 16);
    } catch (const std::exception&) {
      return std::nullopt;
    }
    pos = line_end + 2;
    if (size == 0) break;
    if (pos + size > raw.size()) return std::nullopt;

    out.append(raw, pos, size);
    pos += size + 2;
  }
  return out;
}

std::string build_request(const ParsedUrl& url, const HttpOptions& options) {
  std::ostringstream req;
  req << options.method << " " << url.path << url.query << " HTTP/1.1\r\n";
  req << "Host: " << url.host << "\r\n";
  req << "Connection: close\r\n";

  for (const auto& [key, value] : options.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!options.body.empty()) {
    req << "Content-Length: " << options.body.size() << "\r\n";
  }

  req << "\r\n";
  req << options.body;
  return req.str();
}

template <typename Socket>
void close_socket(const std::shared_ptr<Socket>& socket) {
  asio::error_code ignored;
  socket->lowest_layer().close(ignored);
}

void handshake(const std::shared_ptr<tcp::socket>&, std::function<void(const asio::error_code&)> next) {
  next(asio::error_code{});
}

void handshake(const std::shared_ptr<TlsStream>& socket, std::function<void(const asio::error_code&)> next) {
  socket->async_handshake(asio::ssl::stream_base::client, std::move(next));
}

}  // namespace

// HTTP Client implementation
class HttpClient::Impl {
 public:
  explicit Impl(asio::io_context& io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client), resolver_(io_ctx) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  void request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      callback(HttpResponse{0, {}, "", "Invalid URL"});
      return;
    }

    if (parsed->is_https()) {
      auto socket = std::make_shared<TlsStream>(io_ctx_, ssl_ctx_);
      // SNI hostname
      SSL_set_tlsext_host_name(socket->native_handle(), parsed->host.c_str());
      exchange(socket, *parsed, options, std::move(callback));
    } else {
      exchange(std::make_shared<tcp::socket>(io_ctx_), *parsed, options, std::move(callback));
    }
  }

 private:
  // resolve -> connect -> (TLS handshake) -> write -> read headers -> read body
  template <typename Socket>
  void exchange(std::shared_ptr<Socket> socket, const ParsedUrl& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto response = std::make_shared<HttpResponse>();
    auto request_str = std::make_shared<std::string>(build_request(url, options));
    auto buffer = std::make_shared<asio::streambuf>();
    auto timed_out = std::make_shared<bool>(false);

    // When the timer fires (not cancelled) the socket is closed, which fails the pending operation
    auto timer = std::make_shared<asio::steady_timer>(io_ctx_);
    timer->expires_after(options.timeout);
    timer->async_wait([socket, timed_out](const asio::error_code& ec) {
      if (!ec) {
        *timed_out = true;
        close_socket(socket);
      }
    });

    auto done = [timer, timed_out, callback, socket](HttpResponse resp) {
      timer->cancel();
      close_socket(socket);
      if (*timed_out) {
        resp.error = "Request timed out";
        resp.status_code = 0;
      }
      callback(std::move(resp));
    };

    auto fail = [response, done](const std::string& what, const asio::error_code& ec) {
      response->error = what + ": " + ec.message();
      done(*response);
    };

    resolver_.async_resolve(
        url.host, url.port_or_default(),
        [this, socket, request_str, response, buffer, done, fail](const asio::error_code& ec, tcp::resolver::results_type results) {
          if (ec) return fail("DNS resolution failed", ec);

          asio::async_connect(
              socket->lowest_layer(), results,
              [this, socket, request_str, response, buffer, done, fail](const asio::error_code& ec, const tcp::endpoint&) {
                if (ec) return fail("Connection failed", ec);

                handshake(socket, [this, socket, request_str, response, buffer, done, fail](const asio::error_code& ec) {
                  if (ec) return fail("SSL handshake failed", ec);

                  asio::async_write(*socket, asio::buffer(*request_str),
                                    [this, socket, request_str, response, buffer, done, fail](const asio::error_code& ec, size_t) {
                                      if (ec) return fail("Write failed", ec);
                                      read_headers(socket, response, buffer, done);
                                    });
                });
              });
        });
  }

  template <typename Socket>
  void read_headers(std::shared_ptr<Socket> socket, std::shared_ptr<HttpResponse> response, std::shared_ptr<asio::streambuf> buffer,
                    std::function<void(HttpResponse)> done) {
    asio::async_read_until(*socket, *buffer, "\r\n\r\n", [this, socket, response, buffer, done](const asio::error_code& ec, size_t) {
      if (ec && ec != asio::error::eof) {
        response->error = "Read headers failed: " + ec.message();
        done(*response);
        return;
      }

      std::istream stream(buffer.get());
      std::string status_line;
      std::getline(stream, status_line);

      std::regex status_regex(R"(HTTP/[\d.]+ (\d+))");
      std::smatch match;
      if (!std::regex_search(status_line, match, status_regex)) {
        response->error = "Invalid HTTP response: cannot parse status line";
        done(*response);
        return;
      }
      response->status_code = std::stoi(match[1].str());

      // Header names are stored lower-case
      std::string header_line;
      while (std::getline(stream, header_line) && header_line != "\r") {
        auto colon = header_line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = to_lower(header_line.substr(0, colon));
        std::string value = header_line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        response->headers[key] = value;
      }

      read_body(socket, response, buffer, done);
    });
  }

  template <typename Socket>
  void read_body(std::shared_ptr<Socket> socket, std::shared_ptr<HttpResponse> response, std::shared_ptr<asio::streambuf> buffer,
                 std::function<void(HttpResponse)> done) {
    if (buffer->size() > 0) {
      std::istream stream(buffer.get());
      std::ostringstream chunk;
      chunk << stream.rdbuf();
      response->body += chunk.str();
    }

    if (body_complete(*response)) {
      finish(response, done);
      return;
    }

    asio::async_read(*socket, *buffer, asio::transfer_at_least(1), [this, socket, response, buffer, done](const asio::error_code& ec, size_t) {
      // TLS peers often close without close_notify; treat SSL-category errors as EOF
      bool is_eof = (ec == asio::error::eof) || (ec.category() == asio::error::get_ssl_category()) || ec == asio::ssl::error::stream_truncated;

      if (ec && !is_eof) {
        response->error = "Read body failed: " + ec.message();
        done(*response);
        return;
      }

      if (is_eof) {
        if (buffer->size() > 0) {
          std::istream stream(buffer.get());
          std::ostringstream chunk;
          chunk << stream.rdbuf();
          response->body += chunk.str();
        }
        finish(response, done);
      } else {
        read_body(socket, response, buffer, done);
      }
    });
  }

  static bool body_complete(const HttpResponse& response) {
    auto it = response.headers.find("content-length");
    if (it != response.headers.end()) {
      try {
        return response.body.size() >= std::stoull(it->second);
      } catch (const std::exception&) {
        return false;
      }
    }
    auto te = response.headers.find("transfer-encoding");
    if (te != response.headers.end() && to_lower(te->second) == "chunked") {
      return response.body.size() >= 5 && response.body.compare(response.body.size() - 5, 5, "0\r\n\r\n") == 0;
    }
    return false;
  }

  static void finish(std::shared_ptr<HttpResponse> response, const std::function<void(HttpResponse)>& done) {
    auto te = response->headers.find("transfer-encoding");
    if (te != response->headers.end() && to_lower(te->second) == "chunked") {
      auto decoded = decode_chunked(response->body);
      if (!decoded) {
        response->error = "Malformed chunked body";
      } else {
        response->body = std::move(*decoded);
      }
    }
    done(*response);
  }

  asio::io_context& io_ctx_;
  asio::ssl::context ssl_ctx_;
  tcp::resolver resolver_;
};

HttpClient::HttpClient(asio::io_context& io_ctx) : impl_(std::make_unique<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

void HttpClient::request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
  impl_->request(url, options, std::move(callback));
}

std::future<HttpResponse> HttpClient::request(const std::string& url, const HttpOptions& options) {
  if (options.max_retries <= 0) {
    auto promise = std::make_shared<std::promise<HttpResponse>>();
    auto future = promise->get_future();

    impl_->request(url, options, [promise](HttpResponse response) {
      promise->set_value(std::move(response));
    });

    return future;
  }

  // The retry loop blocks between attempts, so it runs off the io thread
  return std::async(std::launch::async, [this, url, options]() -> HttpResponse {
    HttpResponse last_response;
    int max_attempts = 1 + options.max_retries;

    for (int attempt = 0; attempt < max_attempts; ++attempt) {
      auto promise = std::make_shared<std::promise<HttpResponse>>();
      auto future = promise->get_future();

      impl_->request(url, options, [promise](HttpResponse response) {
        promise->set_value(std::move(response));
      });

      last_response = future.get();

      if (last_response.ok() || !is_retryable(last_response) || attempt + 1 >= max_attempts) {
        return last_response;
      }

      spdlog::warn("HTTP request to {} failed (status={}, error={}), retrying {}/{}...", url, last_response.status_code, last_response.error,
                   attempt + 1, options.max_retries);
      std::this_thread::sleep_for(options.retry_delay);
    }

    return last_response;
  });
}

std::future<HttpResponse> HttpClient::get(const std::string& url, const std::map<std::string, std::string>& headers) {
  HttpOptions options;
  options.method = "GET";
  options.headers = headers;
  return request(url, options);
}

std::future<HttpResponse> HttpClient::post(const std::string& url, const std::string& body, const std::map<std::string, std::string>& headers) {
  HttpOptions options;
  options.method = "POST";
  options.body = body;
  options.headers = headers;
  return request(url, options);
}

}  // namespace freigent::net
