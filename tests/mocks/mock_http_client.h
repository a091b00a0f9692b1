#pragma once

#include <string>

#include <gmock/gmock.h>

#include "tokenkeeper/http/http_client.h"

namespace tokenkeeper {
namespace test {

class MockHttpClient : public http::HttpClient {
 public:
  MOCK_METHOD(http::HttpResponse,
              request,
              (const http::HttpRequest& request),
              (override));
};

inline http::HttpResponse httpResponse(int status, const std::string& body) {
  http::HttpResponse response;
  response.status_code = status;
  response.body = body;
  return response;
}

inline http::HttpResponse transportFailure(const std::string& error) {
  http::HttpResponse response;
  response.status_code = -1;
  response.error = error;
  return response;
}

// Matches requests whose URL starts with `prefix`
MATCHER_P(UrlStartsWith, prefix, "") {
  return arg.url.compare(0, std::string(prefix).size(), prefix) == 0;
}

}  // namespace test
}  // namespace tokenkeeper
