#ifndef TOKENKEEPER_RESOURCE_JWT_VALIDATOR_H
#define TOKENKEEPER_RESOURCE_JWT_VALIDATOR_H

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tokenkeeper/core/compat.h"
#include "tokenkeeper/core/result.h"
#include "tokenkeeper/event/event_loop.h"

/**
 * @file jwt_validator.h
 * @brief Local verification of self-contained (JWT) bearer tokens
 */

namespace tokenkeeper {
namespace resource {

/**
 * @brief Verified content of a token
 */
struct JwtClaims {
  std::string key_id;     // kid
  std::string algorithm;  // alg
  std::string subject;    // sub
  std::string issuer;     // iss
  optional<std::string> realm;
  std::set<std::string> scopes;
  event::SystemTime expires_at;  // exp
  event::SystemTime issued_at;   // iat
  nlohmann::json payload;
};

/**
 * @brief JWT validation configuration
 */
struct JwtValidatorConfig {
  // Accept any issuer when empty
  std::string expected_issuer;
  // Checked in addition to sub, iss, exp and iat
  std::vector<std::string> required_claims;
  // Tolerance applied to exp
  std::chrono::seconds clock_skew{0};
};

/**
 * @brief Verifies RS256/384/512 and ES256/384/512 tokens against keys
 * registered by key id
 *
 * Purely local; no keys are fetched. A token is accepted only when its
 * signature verifies with the key named by its "kid" header, the required
 * claims are present, the issuer matches and exp has not passed.
 *
 * Failures: JWT_MALFORMED (not three base64url JSON segments),
 * JWT_SIGNATURE_INVALID (alg "none", unsupported alg, unknown kid, bad
 * signature), JWT_CLAIMS_MISSING, JWT_ISSUER_MISMATCH, JWT_EXPIRED.
 *
 * Keys are usually registered once at startup; verify() is safe to call
 * concurrently with itself and with key registration.
 */
class JwtValidator {
 public:
  JwtValidator(const JwtValidatorConfig& config,
               const event::TimeSource& time_source);
  ~JwtValidator();

  /**
   * @brief Register a PEM "PUBLIC KEY" (RSA or EC) under `key_id`
   *
   * Fails with CONFIG_INVALID when the PEM cannot be read.
   */
  VoidResult addPemKey(const std::string& key_id, const std::string& pem);

  /**
   * @brief Register a JSON Web Key (kty RSA with n/e, or EC with crv/x/y)
   * under its "kid"
   */
  VoidResult addJwk(const nlohmann::json& jwk);

  /**
   * @brief Register every key of a JWK set {"keys": [...]}; stops at the
   * first key that cannot be used
   */
  VoidResult addJwkSet(const nlohmann::json& jwk_set);

  size_t keyCount() const;

  Result<JwtClaims> verify(const std::string& token) const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace resource
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_RESOURCE_JWT_VALIDATOR_H
