#include "tokenkeeper/http/http_client.h"

#include <atomic>
#include <mutex>

#include <curl/curl.h>

#define TOKENKEEPER_LOG_COMPONENT "Http.client"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace http {

namespace {

// libcurl's global state is process-wide and not thread-safe to set up
void ensureCurlInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  std::string* response = static_cast<std::string*>(userdata);
  response->append(ptr, size * nmemb);
  return size * nmemb;
}

size_t header_callback(char* buffer,
                       size_t size,
                       size_t nitems,
                       void* userdata) {
  auto* headers = static_cast<HeaderMap*>(userdata);
  std::string header(buffer, size * nitems);

  size_t colon_pos = header.find(':');
  if (colon_pos != std::string::npos) {
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);

    name.erase(0, name.find_first_not_of(" \t"));
    name.erase(name.find_last_not_of(" \t\r\n") + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);

    if (!name.empty()) {
      (*headers)[name] = value;
    }
  }

  return size * nitems;
}

// Strips the query string so tokens passed as parameters never reach logs
std::string redactUrl(const std::string& url) {
  size_t query = url.find('?');
  return query == std::string::npos ? url : url.substr(0, query) + "?...";
}

}  // namespace

HttpResponse HttpClient::get(const std::string& url, const HeaderMap& headers) {
  HttpRequest req;
  req.url = url;
  req.method = HttpMethod::GET;
  req.headers = headers;
  return request(req);
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const HeaderMap& headers) {
  HttpRequest req;
  req.url = url;
  req.method = HttpMethod::POST;
  req.body = body;
  req.headers = headers;
  return request(req);
}

class CurlHttpClient::Impl {
 public:
  explicit Impl(const Config& config)
      : config_(config),
        total_requests_(0),
        failed_requests_(0),
        total_latency_ms_(0) {
    ensureCurlInitialized();
  }

  HttpResponse request(const HttpRequest& request) {
    auto start = std::chrono::steady_clock::now();
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
      response.status_code = -1;
      response.error = "Failed to initialize CURL";
      ++failed_requests_;
      return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (request.method == HttpMethod::POST) {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(request.body.size()));
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header_pair : request.headers) {
      std::string header = header_pair.first + ": " + header_pair.second;
      headers = curl_slist_append(headers, header.c_str());
    }
    if (headers) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

    const bool verify = request.verify_ssl && config_.verify_ssl_certificates;
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);
    if (!config_.ca_bundle_path.empty()) {
      curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle_path.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connection_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(request.timeout.count()));

    std::string response_body;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);

    if (res != CURLE_OK) {
      // A partial response is still a failed exchange
      response.status_code = -1;
      response.error = curl_easy_strerror(res);
      ++failed_requests_;
      TOKENKEEPER_LOG(Debug, "{} {} failed: {}",
                      request.method == HttpMethod::POST ? "POST" : "GET",
                      redactUrl(request.url), response.error);
    }

    response.body = std::move(response_body);

    auto end = std::chrono::steady_clock::now();
    response.latency =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    ++total_requests_;
    total_latency_ms_ += response.latency.count();

    if (headers) {
      curl_slist_free_all(headers);
    }
    curl_easy_cleanup(curl);

    return response;
  }

  Stats stats() const {
    Stats stats;
    stats.total_requests = total_requests_;
    stats.failed_requests = failed_requests_;
    stats.avg_latency =
        total_requests_ > 0
            ? std::chrono::milliseconds(total_latency_ms_ / total_requests_)
            : std::chrono::milliseconds(0);
    return stats;
  }

 private:
  Config config_;
  std::atomic<size_t> total_requests_;
  std::atomic<size_t> failed_requests_;
  std::atomic<long long> total_latency_ms_;
};

CurlHttpClient::CurlHttpClient(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::request(const HttpRequest& request) {
  return impl_->request(request);
}

CurlHttpClient::Stats CurlHttpClient::stats() const { return impl_->stats(); }

std::string urlEncode(const std::string& value) {
  ensureCurlInitialized();
  CURL* curl = curl_easy_init();
  if (!curl) {
    return value;
  }

  char* encoded =
      curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
  std::string result(encoded ? encoded : value);

  if (encoded) {
    curl_free(encoded);
  }
  curl_easy_cleanup(curl);
  return result;
}

}  // namespace http
}  // namespace tokenkeeper
