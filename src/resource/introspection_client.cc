#include "tokenkeeper/resource/introspection_client.h"

#include <algorithm>
#include <sstream>

#include "tokenkeeper/event/time_conversion.h"

#define TOKENKEEPER_LOG_COMPONENT "Introspection.client"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace resource {

namespace {

bool meansInvalidToken(int status) {
  return status == 400 || status == 401 || status == 403 || status == 404;
}

Result<IntrospectionResult> malformed(const std::string& message) {
  return makeError<IntrospectionResult>(
      ErrorCode::INTROSPECTION_RESPONSE_MALFORMED, message);
}

// Log lines name a token by its length only
std::string tokenFingerprint(const std::string& token) {
  return "<" + std::to_string(token.size()) + " chars>";
}

}  // namespace

IntrospectionClient::Config IntrospectionClient::Config::fromConfiguration(
    const config::Configuration& configuration) {
  Config config;
  config.endpoints = configuration.token_info.endpoints();
  config.query_parameter = configuration.token_info.query_parameter;
  config.cache_max_entries = configuration.token_info.cache_max_entries;
  config.timeout = configuration.http.timeout;
  return config;
}

IntrospectionClient::IntrospectionClient(const Config& config,
                                         http::HttpClient& http,
                                         const event::TimeSource& time_source)
    : config_(config),
      http_(http),
      time_source_(time_source),
      cache_(config.cache_max_entries, time_source) {}

Result<IntrospectionResult> IntrospectionClient::introspect(
    const std::string& bearer_token) {
  if (bearer_token.empty()) {
    return makeError<IntrospectionResult>(ErrorCode::INTROSPECTION_INVALID,
                                          "empty bearer token");
  }

  if (auto cached = cache_.get(bearer_token)) {
    return makeSuccess(std::move(*cached));
  }

  auto result = fetch(bearer_token);
  if (isSuccess(result)) {
    const IntrospectionResult& info = getValue(result);
    if (info.expires_at) {
      cache_.put(bearer_token, info, *info.expires_at);
    }
  }
  return result;
}

Result<IntrospectionResult> IntrospectionClient::fetch(
    const std::string& bearer_token) {
  if (config_.endpoints.empty()) {
    return makeError<IntrospectionResult>(
        ErrorCode::INTROSPECTION_UNAVAILABLE,
        "no token-info endpoint configured");
  }

  http::HttpRequest request;
  request.method = http::HttpMethod::GET;
  request.timeout = config_.timeout;
  request.headers["Accept"] = "application/json";

  const std::string query =
      config_.query_parameter + "=" + http::urlEncode(bearer_token);

  bool only_malformed = true;
  std::string last_failure;

  for (const auto& endpoint : config_.endpoints) {
    request.url = endpoint +
                  (endpoint.find('?') == std::string::npos ? "?" : "&") +
                  query;
    const event::MonotonicTime fetched_at = time_source_.monotonicTime();
    http::HttpResponse response = http_.request(request);

    if (response.transportFailed()) {
      only_malformed = false;
      last_failure = endpoint + ": " + response.error;
      TOKENKEEPER_LOG_WARNING("Token-info endpoint {} unreachable: {}",
                              endpoint, response.error);
      continue;
    }

    if (meansInvalidToken(response.status_code)) {
      TOKENKEEPER_LOG_DEBUG("Token {} rejected by {} with HTTP {}",
                            tokenFingerprint(bearer_token), endpoint,
                            response.status_code);
      return makeError<IntrospectionResult>(
          ErrorCode::INTROSPECTION_INVALID,
          "token rejected with HTTP " +
              std::to_string(response.status_code));
    }

    if (response.status_code != 200) {
      only_malformed = false;
      last_failure =
          endpoint + ": HTTP " + std::to_string(response.status_code);
      TOKENKEEPER_LOG_WARNING("Token-info endpoint {} answered HTTP {}",
                              endpoint, response.status_code);
      continue;
    }

    auto result = parseResponse(response.body, fetched_at);
    if (isError(result) &&
        getError(result).code ==
            ErrorCode::INTROSPECTION_RESPONSE_MALFORMED) {
      last_failure = endpoint + ": " + getError(result).message;
      TOKENKEEPER_LOG_WARNING("Token-info endpoint {} sent an unusable body: {}",
                              endpoint, getError(result).message);
      continue;
    }
    return result;
  }

  return makeError<IntrospectionResult>(
      only_malformed ? ErrorCode::INTROSPECTION_RESPONSE_MALFORMED
                     : ErrorCode::INTROSPECTION_UNAVAILABLE,
      last_failure);
}

Result<IntrospectionResult> IntrospectionClient::parseResponse(
    const std::string& body,
    event::MonotonicTime fetched_at) const {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    return malformed(std::string("invalid JSON: ") + e.what());
  }
  if (!document.is_object()) {
    return malformed("response is not a JSON object");
  }

  auto active = document.find("active");
  if (active != document.end() && active->is_boolean() &&
      !active->get<bool>()) {
    return makeError<IntrospectionResult>(ErrorCode::INTROSPECTION_INVALID,
                                          "token is not active");
  }

  IntrospectionResult result;
  result.fetched_at = fetched_at;

  for (const char* key : {"uid", "sub"}) {
    auto subject = document.find(key);
    if (subject != document.end() && subject->is_string()) {
      result.subject = subject->get<std::string>();
      break;
    }
  }

  auto scope = document.find("scope");
  if (scope != document.end() && scope->is_array()) {
    for (const auto& entry : *scope) {
      if (!entry.is_string()) {
        return malformed("scope contains a non-string entry");
      }
      result.scope.insert(entry.get<std::string>());
    }
  } else if (scope != document.end() && scope->is_string()) {
    std::istringstream words(scope->get<std::string>());
    std::string word;
    while (words >> word) {
      result.scope.insert(word);
    }
  } else if (scope != document.end() && !scope->is_null()) {
    return malformed("scope is neither an array nor a string");
  }

  auto expires_in = document.find("expires_in");
  auto exp = document.find("exp");
  if (expires_in != document.end() && !expires_in->is_null()) {
    if (!expires_in->is_number()) {
      return malformed("expires_in is not a number");
    }
    const double seconds = expires_in->get<double>();
    if (seconds <= 0) {
      return makeError<IntrospectionResult>(ErrorCode::INTROSPECTION_INVALID,
                                            "token has expired");
    }
    result.expires_at = fetched_at + event::boundedLifetime(seconds);
  } else if (exp != document.end() && !exp->is_null()) {
    if (!exp->is_number()) {
      return malformed("exp is not a number");
    }
    const event::SystemTime expiry =
        event::systemTimeFromEpochSeconds(exp->get<double>());
    const event::SystemTime now = time_source_.systemTime();
    if (expiry <= now) {
      return makeError<IntrospectionResult>(ErrorCode::INTROSPECTION_INVALID,
                                            "token has expired");
    }
    result.expires_at =
        fetched_at + std::min<std::chrono::nanoseconds>(
                         expiry - now, event::kMaxTrackedLifetime);
  }

  result.raw_claims = std::move(document);
  return makeSuccess(std::move(result));
}

}  // namespace resource
}  // namespace tokenkeeper
