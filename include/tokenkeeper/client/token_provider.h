#ifndef TOKENKEEPER_CLIENT_TOKEN_PROVIDER_H
#define TOKENKEEPER_CLIENT_TOKEN_PROVIDER_H

#include <chrono>
#include <string>
#include <vector>

#include "tokenkeeper/client/access_token.h"
#include "tokenkeeper/config/configuration.h"
#include "tokenkeeper/core/result.h"
#include "tokenkeeper/credentials/credential_store.h"
#include "tokenkeeper/event/event_loop.h"
#include "tokenkeeper/http/http_client.h"

/**
 * @file token_provider.h
 * @brief Acquisition of access tokens from the OAuth2 token endpoint
 */

namespace tokenkeeper {
namespace client {

/**
 * @brief Source of access tokens for the lifecycle manager
 */
class TokenProvider {
 public:
  virtual ~TokenProvider() = default;

  /**
   * @brief Obtain one token for the given scopes
   *
   * Fails with PROVIDER_REJECTED, PROVIDER_UNAVAILABLE or
   * PROVIDER_RESPONSE_MALFORMED. Blocks for the duration of the exchange.
   */
  virtual Result<AccessToken> acquire(
      const credentials::CredentialSnapshot& credentials,
      const std::vector<std::string>& scopes) = 0;
};

/**
 * @brief TokenProvider over the token endpoint's HTTP interface
 *
 * Sends POST <endpoint>?realm=<realm> with HTTP Basic client authentication
 * and a form-encoded body:
 *   grant_type=password&username=..&password=..&scope=a b
 *   grant_type=client_credentials&scope=a b
 *
 * Endpoints are tried in order. 400, 401 and 403 are authoritative and end
 * the attempt with PROVIDER_REJECTED; transport errors, other statuses and
 * unusable bodies move on to the next endpoint.
 */
class TokenProviderClient : public TokenProvider {
 public:
  struct Config {
    std::vector<std::string> endpoints;
    std::string realm;
    config::GrantType grant_type = config::GrantType::Password;
    std::chrono::seconds default_lifetime{60};
    std::chrono::milliseconds timeout{10000};

    static Config fromConfiguration(const config::Configuration& configuration);
  };

  TokenProviderClient(const Config& config,
                      http::HttpClient& http,
                      const event::TimeSource& time_source);

  Result<AccessToken> acquire(
      const credentials::CredentialSnapshot& credentials,
      const std::vector<std::string>& scopes) override;

  const Config& config() const { return config_; }

 private:
  std::string requestBody(const credentials::CredentialSnapshot& credentials,
                          const std::vector<std::string>& scopes) const;
  std::string endpointUrl(const std::string& endpoint) const;
  Result<AccessToken> parseResponse(const std::string& body,
                                    event::MonotonicTime issued_at,
                                    const std::vector<std::string>& scopes) const;

  Config config_;
  http::HttpClient& http_;
  const event::TimeSource& time_source_;
};

}  // namespace client
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_CLIENT_TOKEN_PROVIDER_H
