#ifndef TOKENKEEPER_RESOURCE_INTROSPECTION_CLIENT_H
#define TOKENKEEPER_RESOURCE_INTROSPECTION_CLIENT_H

#include <chrono>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tokenkeeper/config/configuration.h"
#include "tokenkeeper/core/compat.h"
#include "tokenkeeper/core/result.h"
#include "tokenkeeper/event/event_loop.h"
#include "tokenkeeper/http/http_client.h"
#include "tokenkeeper/resource/memory_cache.h"

/**
 * @file introspection_client.h
 * @brief Bearer token validation against a remote token-info authority
 */

namespace tokenkeeper {
namespace resource {

/**
 * @brief What the authority said about a token
 *
 * Only tokens the authority accepted become a result; rejected tokens are
 * reported as INTROSPECTION_INVALID.
 */
struct IntrospectionResult {
  bool valid{true};
  // "uid", or "sub" when uid is absent; empty if the authority sent neither
  std::string subject;
  std::set<std::string> scope;
  // Absent when the authority gave no expiry; such results are not cached
  optional<event::MonotonicTime> expires_at;
  nlohmann::json raw_claims;
  // When the authority was asked
  event::MonotonicTime fetched_at;
};

/**
 * @brief Validates opaque bearer tokens with caching and fallback
 *
 * Issues GET <endpoint>?<query_parameter>=<token> against the configured
 * endpoints in order. 400, 401, 403 and 404 mean the token is invalid and
 * end the lookup. Transport errors, other statuses and unusable bodies move
 * on to the next endpoint; when every endpoint failed the result is
 * INTROSPECTION_UNAVAILABLE, which callers must not confuse with an invalid
 * token.
 *
 * Accepted results are cached under the token value until their own
 * expires_at. Cache reads take a short mutex and never wait on the network.
 */
class IntrospectionClient {
 public:
  struct Config {
    std::vector<std::string> endpoints;
    std::string query_parameter = "access_token";
    size_t cache_max_entries = 10000;
    std::chrono::milliseconds timeout{10000};

    static Config fromConfiguration(const config::Configuration& configuration);
  };

  IntrospectionClient(const Config& config,
                      http::HttpClient& http,
                      const event::TimeSource& time_source);

  Result<IntrospectionResult> introspect(const std::string& bearer_token);

  size_t cachedEntries() const { return cache_.size(); }

  const Config& config() const { return config_; }

 private:
  Result<IntrospectionResult> fetch(const std::string& bearer_token);
  Result<IntrospectionResult> parseResponse(
      const std::string& body,
      event::MonotonicTime fetched_at) const;

  Config config_;
  http::HttpClient& http_;
  const event::TimeSource& time_source_;
  MemoryCache<std::string, IntrospectionResult> cache_;
};

}  // namespace resource
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_RESOURCE_INTROSPECTION_CLIENT_H
