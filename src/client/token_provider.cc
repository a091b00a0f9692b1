#include "tokenkeeper/client/token_provider.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <nlohmann/json.hpp>

#include "tokenkeeper/core/encoding.h"
#include "tokenkeeper/event/time_conversion.h"

#define TOKENKEEPER_LOG_COMPONENT "Provider.client"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace client {

namespace {

bool isAuthoritativeRejection(int status) {
  return status == 400 || status == 401 || status == 403;
}

// Provider error bodies look like {"error": "...", "error_description": ".."}
std::string describeRejection(const http::HttpResponse& response) {
  std::string description = "HTTP " + std::to_string(response.status_code);
  try {
    auto body = nlohmann::json::parse(response.body);
    if (body.is_object()) {
      auto error = body.find("error");
      if (error != body.end() && error->is_string()) {
        description += " " + error->get<std::string>();
      }
      auto detail = body.find("error_description");
      if (detail != body.end() && detail->is_string()) {
        description += ": " + detail->get<std::string>();
      }
    }
  } catch (const nlohmann::json::parse_error&) {
    // Non-JSON error page; the status alone is reported
  }
  return description;
}

std::string joinScopes(const std::vector<std::string>& scopes) {
  std::string joined;
  for (const auto& scope : scopes) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += scope;
  }
  return joined;
}

// expires_in as a positive number of seconds; numeric strings are accepted
optional<double> readLifetimeSeconds(const nlohmann::json& value) {
  double seconds = 0;
  if (value.is_number()) {
    seconds = value.get<double>();
  } else if (value.is_string()) {
    const std::string text = value.get<std::string>();
    std::istringstream stream(text);
    if (!(stream >> seconds) || !stream.eof()) {
      return nullopt;
    }
  } else {
    return nullopt;
  }
  if (!std::isfinite(seconds) || seconds <= 0) {
    return nullopt;
  }
  return seconds;
}

}  // namespace

TokenProviderClient::Config TokenProviderClient::Config::fromConfiguration(
    const config::Configuration& configuration) {
  Config config;
  config.endpoints = configuration.token_provider.endpoints();
  config.realm = configuration.token_provider.realm;
  config.grant_type = configuration.token_provider.grant_type;
  config.default_lifetime = configuration.token_provider.default_lifetime;
  config.timeout = configuration.http.timeout;
  return config;
}

TokenProviderClient::TokenProviderClient(const Config& config,
                                         http::HttpClient& http,
                                         const event::TimeSource& time_source)
    : config_(config), http_(http), time_source_(time_source) {}

Result<AccessToken> TokenProviderClient::acquire(
    const credentials::CredentialSnapshot& credentials,
    const std::vector<std::string>& scopes) {
  if (config_.endpoints.empty()) {
    return makeError<AccessToken>(ErrorCode::PROVIDER_UNAVAILABLE,
                                  "no token endpoint configured");
  }
  if (config_.grant_type == config::GrantType::Password &&
      !credentials.user) {
    return makeError<AccessToken>(
        ErrorCode::CREDENTIALS_NOT_FOUND,
        "password grant requires user credentials");
  }

  http::HttpRequest request;
  request.method = http::HttpMethod::POST;
  request.timeout = config_.timeout;
  request.body = requestBody(credentials, scopes);
  request.headers["Authorization"] =
      "Basic " + base64Encode(credentials.client.id + ":" +
                              credentials.client.secret);
  request.headers["Content-Type"] = "application/x-www-form-urlencoded";
  request.headers["Accept"] = "application/json";

  bool only_malformed = true;
  std::string last_failure;

  for (const auto& endpoint : config_.endpoints) {
    request.url = endpointUrl(endpoint);
    const event::MonotonicTime issued_at = time_source_.monotonicTime();
    http::HttpResponse response = http_.request(request);

    if (response.transportFailed()) {
      only_malformed = false;
      last_failure = endpoint + ": " + response.error;
      TOKENKEEPER_LOG_WARNING("Token endpoint {} unreachable: {}", endpoint,
                              response.error);
      continue;
    }

    if (isAuthoritativeRejection(response.status_code)) {
      std::string reason = describeRejection(response);
      TOKENKEEPER_LOG_ERROR("Token endpoint {} rejected the request: {}",
                            endpoint, reason);
      return makeError<AccessToken>(ErrorCode::PROVIDER_REJECTED,
                                    endpoint + ": " + reason);
    }

    if (!response.isSuccess()) {
      only_malformed = false;
      last_failure =
          endpoint + ": HTTP " + std::to_string(response.status_code);
      TOKENKEEPER_LOG_WARNING("Token endpoint {} answered HTTP {}", endpoint,
                              response.status_code);
      continue;
    }

    auto token = parseResponse(response.body, issued_at, scopes);
    if (isError(token)) {
      last_failure = endpoint + ": " + getError(token).message;
      TOKENKEEPER_LOG_WARNING("Token endpoint {} sent an unusable body: {}",
                              endpoint, getError(token).message);
      continue;
    }

    TOKENKEEPER_LOG_DEBUG("Acquired token from {} valid for {}ms", endpoint,
                          std::chrono::duration_cast<std::chrono::milliseconds>(
                              getValue(token).lifetime())
                              .count());
    return token;
  }

  return makeError<AccessToken>(only_malformed
                                    ? ErrorCode::PROVIDER_RESPONSE_MALFORMED
                                    : ErrorCode::PROVIDER_UNAVAILABLE,
                                last_failure);
}

std::string TokenProviderClient::requestBody(
    const credentials::CredentialSnapshot& credentials,
    const std::vector<std::string>& scopes) const {
  std::string body =
      "grant_type=" +
      std::string(config::grantTypeToString(config_.grant_type));
  if (config_.grant_type == config::GrantType::Password) {
    body += "&username=" + http::urlEncode(credentials.user->username);
    body += "&password=" + http::urlEncode(credentials.user->password);
  }
  if (!scopes.empty()) {
    body += "&scope=" + http::urlEncode(joinScopes(scopes));
  }
  return body;
}

std::string TokenProviderClient::endpointUrl(
    const std::string& endpoint) const {
  if (config_.realm.empty()) {
    return endpoint;
  }
  const char separator =
      endpoint.find('?') == std::string::npos ? '?' : '&';
  return endpoint + separator + "realm=" + http::urlEncode(config_.realm);
}

Result<AccessToken> TokenProviderClient::parseResponse(
    const std::string& body,
    event::MonotonicTime issued_at,
    const std::vector<std::string>& scopes) const {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    return makeError<AccessToken>(ErrorCode::PROVIDER_RESPONSE_MALFORMED,
                                  std::string("invalid JSON: ") + e.what());
  }
  if (!document.is_object()) {
    return makeError<AccessToken>(ErrorCode::PROVIDER_RESPONSE_MALFORMED,
                                  "response is not a JSON object");
  }

  auto value = document.find("access_token");
  if (value == document.end() || !value->is_string() ||
      value->get<std::string>().empty()) {
    return makeError<AccessToken>(ErrorCode::PROVIDER_RESPONSE_MALFORMED,
                                  "access_token missing");
  }

  AccessToken token;
  token.value = value->get<std::string>();
  token.issued_at = issued_at;

  auto expires_in = document.find("expires_in");
  if (expires_in == document.end() || expires_in->is_null()) {
    token.expires_at = issued_at + config_.default_lifetime;
  } else {
    auto seconds = readLifetimeSeconds(*expires_in);
    if (!seconds) {
      return makeError<AccessToken>(ErrorCode::PROVIDER_RESPONSE_MALFORMED,
                                    "expires_in is not a positive number");
    }
    const std::chrono::nanoseconds lifetime = event::boundedLifetime(*seconds);
    if (lifetime == event::kMaxTrackedLifetime) {
      TOKENKEEPER_LOG_DEBUG("expires_in of {}s shortened to {}h", *seconds,
                            event::kMaxTrackedLifetime.count());
    }
    token.expires_at =
        issued_at + std::max<std::chrono::nanoseconds>(
                        std::chrono::milliseconds(1), lifetime);
  }

  // A provider may narrow the scope; without a scope field we assume the
  // requested one was granted
  auto scope = document.find("scope");
  if (scope != document.end() && scope->is_string()) {
    std::istringstream words(scope->get<std::string>());
    std::string word;
    while (words >> word) {
      token.scope.insert(word);
    }
  } else if (scope != document.end() && scope->is_array()) {
    for (const auto& entry : *scope) {
      if (entry.is_string()) {
        token.scope.insert(entry.get<std::string>());
      }
    }
  } else {
    token.scope.insert(scopes.begin(), scopes.end());
  }

  return makeSuccess(std::move(token));
}

}  // namespace client
}  // namespace tokenkeeper
