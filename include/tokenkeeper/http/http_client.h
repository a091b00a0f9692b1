#ifndef TOKENKEEPER_HTTP_HTTP_CLIENT_H
#define TOKENKEEPER_HTTP_HTTP_CLIENT_H

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>

/**
 * @file http_client.h
 * @brief Blocking HTTP client capability injected into the token components
 */

namespace tokenkeeper {
namespace http {

enum class HttpMethod { GET, POST };

using HeaderMap = std::unordered_map<std::string, std::string>;

/**
 * @brief HTTP response structure
 *
 * status_code is -1 when no HTTP response was received (DNS, connect,
 * TLS, timeout); `error` then holds the transport error.
 */
struct HttpResponse {
  int status_code{-1};
  HeaderMap headers;
  std::string body;
  std::string error;
  std::chrono::milliseconds latency{0};

  bool transportFailed() const { return status_code < 0; }
  bool isSuccess() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @brief HTTP request configuration
 */
struct HttpRequest {
  std::string url;
  HttpMethod method;
  HeaderMap headers;
  std::string body;
  std::chrono::milliseconds timeout;
  bool verify_ssl;

  HttpRequest()
      : method(HttpMethod::GET), timeout(10000), verify_ssl(true) {}
};

/**
 * @brief Performs one request per call; implementations are thread-safe
 */
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse request(const HttpRequest& request) = 0;

  HttpResponse get(const std::string& url, const HeaderMap& headers = {});

  HttpResponse post(const std::string& url,
                    const std::string& body,
                    const HeaderMap& headers = {});
};

/**
 * @brief libcurl-backed client (one easy handle per request)
 */
class CurlHttpClient : public HttpClient {
 public:
  struct Config {
    std::chrono::milliseconds connection_timeout;
    bool verify_ssl_certificates;
    std::string ca_bundle_path;
    std::string user_agent;

    Config()
        : connection_timeout(5000),
          verify_ssl_certificates(true),
          user_agent("tokenkeeper/1.0") {}
  };

  explicit CurlHttpClient(const Config& config = Config());
  ~CurlHttpClient() override;

  HttpResponse request(const HttpRequest& request) override;

  struct Stats {
    size_t total_requests;
    size_t failed_requests;
    std::chrono::milliseconds avg_latency;
  };

  Stats stats() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief Percent-encode a query or form value
 */
std::string urlEncode(const std::string& value);

}  // namespace http
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_HTTP_HTTP_CLIENT_H
