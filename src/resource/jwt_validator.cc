#include "tokenkeeper/resource/jwt_validator.h"

#include <map>
#include <mutex>
#include <sstream>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "tokenkeeper/core/encoding.h"
#include "tokenkeeper/event/time_conversion.h"

#define TOKENKEEPER_LOG_COMPONENT "Jwt.validator"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace resource {

namespace {

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

struct Algorithm {
  const EVP_MD* (*digest)();
  int key_type;
  // EC only: curve order size in bits
  int curve_bits;
};

const Algorithm* findAlgorithm(const std::string& name) {
  static const std::map<std::string, Algorithm> kAlgorithms = {
      {"RS256", {&EVP_sha256, EVP_PKEY_RSA, 0}},
      {"RS384", {&EVP_sha384, EVP_PKEY_RSA, 0}},
      {"RS512", {&EVP_sha512, EVP_PKEY_RSA, 0}},
      {"ES256", {&EVP_sha256, EVP_PKEY_EC, 256}},
      {"ES384", {&EVP_sha384, EVP_PKEY_EC, 384}},
      {"ES512", {&EVP_sha512, EVP_PKEY_EC, 521}},
  };
  auto it = kAlgorithms.find(name);
  return it == kAlgorithms.end() ? nullptr : &it->second;
}

Error configError(const std::string& message) {
  return Error(ErrorCode::CONFIG_INVALID, message);
}

PkeyPtr readPemPublicKey(const std::string& pem) {
  BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
  if (!bio) {
    return nullptr;
  }
  EVP_PKEY* key = PEM_read_bio_PUBKEY(bio, nullptr, nullptr, nullptr);
  BIO_free(bio);
  ERR_clear_error();
  return PkeyPtr(key);
}

BIGNUM* decodeBignum(const std::string& encoded) {
  auto raw = base64UrlDecode(encoded);
  if (!raw || raw->empty()) {
    return nullptr;
  }
  return BN_bin2bn(reinterpret_cast<const unsigned char*>(raw->data()),
                   static_cast<int>(raw->size()), nullptr);
}

PkeyPtr rsaKeyFromJwk(const std::string& n_b64, const std::string& e_b64) {
  BIGNUM* n = decodeBignum(n_b64);
  BIGNUM* e = decodeBignum(e_b64);
  if (!n || !e) {
    BN_free(n);
    BN_free(e);
    return nullptr;
  }

  RSA* rsa = RSA_new();
  if (!rsa) {
    BN_free(n);
    BN_free(e);
    return nullptr;
  }
  // RSA takes ownership of the BIGNUMs
  if (RSA_set0_key(rsa, n, e, nullptr) != 1) {
    RSA_free(rsa);
    BN_free(n);
    BN_free(e);
    return nullptr;
  }

  PkeyPtr key(EVP_PKEY_new());
  if (!key || EVP_PKEY_assign_RSA(key.get(), rsa) != 1) {
    RSA_free(rsa);
    return nullptr;
  }
  return key;
}

int curveNid(const std::string& crv) {
  if (crv == "P-256") return NID_X9_62_prime256v1;
  if (crv == "P-384") return NID_secp384r1;
  if (crv == "P-521") return NID_secp521r1;
  return NID_undef;
}

PkeyPtr ecKeyFromJwk(const std::string& crv,
                     const std::string& x_b64,
                     const std::string& y_b64) {
  const int nid = curveNid(crv);
  if (nid == NID_undef) {
    return nullptr;
  }

  BIGNUM* x = decodeBignum(x_b64);
  BIGNUM* y = decodeBignum(y_b64);
  EC_KEY* ec = EC_KEY_new_by_curve_name(nid);
  // Coordinates are copied, not adopted
  const bool ok = x && y && ec &&
                  EC_KEY_set_public_key_affine_coordinates(ec, x, y) == 1;
  BN_free(x);
  BN_free(y);
  if (!ok) {
    EC_KEY_free(ec);
    ERR_clear_error();
    return nullptr;
  }

  PkeyPtr key(EVP_PKEY_new());
  if (!key || EVP_PKEY_assign_EC_KEY(key.get(), ec) != 1) {
    EC_KEY_free(ec);
    return nullptr;
  }
  return key;
}

// JWS carries ECDSA signatures as r||s; OpenSSL verifies DER
bool rawToDerSignature(const std::string& raw,
                       size_t coordinate_size,
                       std::string& der) {
  if (raw.size() != 2 * coordinate_size) {
    return false;
  }
  const auto* bytes = reinterpret_cast<const unsigned char*>(raw.data());
  BIGNUM* r = BN_bin2bn(bytes, static_cast<int>(coordinate_size), nullptr);
  BIGNUM* s = BN_bin2bn(bytes + coordinate_size,
                        static_cast<int>(coordinate_size), nullptr);
  ECDSA_SIG* sig = ECDSA_SIG_new();
  if (!r || !s || !sig || ECDSA_SIG_set0(sig, r, s) != 1) {
    BN_free(r);
    BN_free(s);
    ECDSA_SIG_free(sig);
    return false;
  }

  const int length = i2d_ECDSA_SIG(sig, nullptr);
  if (length <= 0) {
    ECDSA_SIG_free(sig);
    return false;
  }
  der.resize(static_cast<size_t>(length));
  auto* out = reinterpret_cast<unsigned char*>(&der[0]);
  i2d_ECDSA_SIG(sig, &out);
  ECDSA_SIG_free(sig);
  return true;
}

bool verifyDigestSignature(EVP_PKEY* key,
                           const EVP_MD* md,
                           const std::string& signing_input,
                           const std::string& signature) {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    return false;
  }
  const bool ok =
      EVP_DigestVerifyInit(ctx, nullptr, md, nullptr, key) == 1 &&
      EVP_DigestVerifyUpdate(ctx, signing_input.data(),
                             signing_input.size()) == 1 &&
      EVP_DigestVerifyFinal(
          ctx, reinterpret_cast<const unsigned char*>(signature.data()),
          signature.size()) == 1;
  EVP_MD_CTX_free(ctx);
  // A failed verification leaves entries on the thread's error queue
  ERR_clear_error();
  return ok;
}

Result<nlohmann::json::object_t> decodeSegment(const std::string& segment,
                                               const char* what) {
  auto decoded = base64UrlDecode(segment);
  if (!decoded) {
    return makeError<nlohmann::json::object_t>(
        ErrorCode::JWT_MALFORMED, std::string(what) + " is not base64url");
  }
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(*decoded);
  } catch (const nlohmann::json::parse_error&) {
    return makeError<nlohmann::json::object_t>(
        ErrorCode::JWT_MALFORMED, std::string(what) + " is not JSON");
  }
  if (!document.is_object()) {
    return makeError<nlohmann::json::object_t>(
        ErrorCode::JWT_MALFORMED, std::string(what) + " is not a JSON object");
  }
  return makeSuccess(document.get<nlohmann::json::object_t>());
}

std::string stringField(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  return it != object.end() && it->is_string() ? it->get<std::string>()
                                               : std::string();
}

Result<JwtClaims> claimsMissing(const std::string& claim) {
  return makeError<JwtClaims>(ErrorCode::JWT_CLAIMS_MISSING,
                              "claim '" + claim + "' is missing or mistyped");
}

}  // namespace

class JwtValidator::Impl {
 public:
  Impl(const JwtValidatorConfig& config, const event::TimeSource& time_source)
      : config_(config), time_source_(time_source) {}

  VoidResult addKey(const std::string& key_id, PkeyPtr key) {
    const int type = EVP_PKEY_base_id(key.get());
    if (type != EVP_PKEY_RSA && type != EVP_PKEY_EC) {
      return makeVoidError(
          configError("key '" + key_id + "' is neither RSA nor EC"));
    }
    std::shared_ptr<EVP_PKEY> shared(key.release(), PkeyDeleter());
    std::lock_guard<std::mutex> lock(mutex_);
    keys_[key_id] = std::move(shared);
    TOKENKEEPER_LOG_DEBUG("Registered {} key '{}'",
                          type == EVP_PKEY_RSA ? "RSA" : "EC", key_id);
    return makeVoidSuccess();
  }

  size_t keyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
  }

  Result<JwtClaims> verify(const std::string& token) const {
    const size_t first = token.find('.');
    const size_t second =
        first == std::string::npos ? first : token.find('.', first + 1);
    if (second == std::string::npos ||
        token.find('.', second + 1) != std::string::npos) {
      return makeError<JwtClaims>(ErrorCode::JWT_MALFORMED,
                                  "token must have three segments");
    }

    auto header = decodeSegment(token.substr(0, first), "header");
    if (isError(header)) {
      return makeError<JwtClaims>(getError(header));
    }
    auto payload = decodeSegment(
        token.substr(first + 1, second - first - 1), "payload");
    if (isError(payload)) {
      return makeError<JwtClaims>(getError(payload));
    }
    auto signature = base64UrlDecode(token.substr(second + 1));
    if (!signature) {
      return makeError<JwtClaims>(ErrorCode::JWT_MALFORMED,
                                  "signature is not base64url");
    }

    const nlohmann::json head(getValue(header));
    auto alg = head.find("alg");
    if (alg == head.end() || !alg->is_string()) {
      return makeError<JwtClaims>(ErrorCode::JWT_MALFORMED,
                                  "header has no algorithm");
    }
    const std::string algorithm_name = alg->get<std::string>();
    const Algorithm* algorithm = findAlgorithm(algorithm_name);
    if (!algorithm) {
      // Covers "none"
      return makeError<JwtClaims>(
          ErrorCode::JWT_SIGNATURE_INVALID,
          "algorithm '" + algorithm_name + "' is not accepted");
    }

    auto kid = head.find("kid");
    if (kid == head.end() || !kid->is_string()) {
      return makeError<JwtClaims>(ErrorCode::JWT_SIGNATURE_INVALID,
                                  "header names no key id");
    }
    const std::string key_id = kid->get<std::string>();
    std::shared_ptr<EVP_PKEY> key = findKey(key_id);
    if (!key) {
      return makeError<JwtClaims>(ErrorCode::JWT_SIGNATURE_INVALID,
                                  "unknown key id '" + key_id + "'");
    }
    if (EVP_PKEY_base_id(key.get()) != algorithm->key_type ||
        (algorithm->curve_bits != 0 &&
         EVP_PKEY_bits(key.get()) != algorithm->curve_bits)) {
      return makeError<JwtClaims>(
          ErrorCode::JWT_SIGNATURE_INVALID,
          "key '" + key_id + "' does not fit algorithm " + algorithm_name);
    }

    std::string encoded_signature = *signature;
    if (algorithm->key_type == EVP_PKEY_EC &&
        !rawToDerSignature(*signature,
                           static_cast<size_t>(algorithm->curve_bits + 7) / 8,
                           encoded_signature)) {
      return makeError<JwtClaims>(ErrorCode::JWT_SIGNATURE_INVALID,
                                  "ECDSA signature has the wrong length");
    }
    if (!verifyDigestSignature(key.get(), algorithm->digest(),
                               token.substr(0, second), encoded_signature)) {
      return makeError<JwtClaims>(ErrorCode::JWT_SIGNATURE_INVALID,
                                  "signature does not verify");
    }

    return checkClaims(nlohmann::json(getValue(payload)), key_id,
                       algorithm_name);
  }

 private:
  std::shared_ptr<EVP_PKEY> findKey(const std::string& key_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(key_id);
    return it == keys_.end() ? nullptr : it->second;
  }

  Result<JwtClaims> checkClaims(nlohmann::json payload,
                                const std::string& key_id,
                                const std::string& algorithm) const {
    JwtClaims claims;
    claims.key_id = key_id;
    claims.algorithm = algorithm;

    auto sub = payload.find("sub");
    if (sub == payload.end() || !sub->is_string()) {
      return claimsMissing("sub");
    }
    claims.subject = sub->get<std::string>();

    auto iss = payload.find("iss");
    if (iss == payload.end() || !iss->is_string()) {
      return claimsMissing("iss");
    }
    claims.issuer = iss->get<std::string>();

    auto exp = payload.find("exp");
    if (exp == payload.end() || !exp->is_number()) {
      return claimsMissing("exp");
    }
    claims.expires_at = event::systemTimeFromEpochSeconds(exp->get<double>());

    auto iat = payload.find("iat");
    if (iat == payload.end() || !iat->is_number()) {
      return claimsMissing("iat");
    }
    claims.issued_at = event::systemTimeFromEpochSeconds(iat->get<double>());

    for (const auto& name : config_.required_claims) {
      auto it = payload.find(name);
      if (it == payload.end() || it->is_null()) {
        return claimsMissing(name);
      }
    }

    auto realm = payload.find("realm");
    if (realm != payload.end() && realm->is_string()) {
      claims.realm = realm->get<std::string>();
    }

    auto scope = payload.find("scope");
    if (scope != payload.end() && scope->is_array()) {
      for (const auto& entry : *scope) {
        if (!entry.is_string()) {
          return claimsMissing("scope");
        }
        claims.scopes.insert(entry.get<std::string>());
      }
    } else if (scope != payload.end() && scope->is_string()) {
      std::istringstream words(scope->get<std::string>());
      std::string word;
      while (words >> word) {
        claims.scopes.insert(word);
      }
    }

    if (!config_.expected_issuer.empty() &&
        claims.issuer != config_.expected_issuer) {
      return makeError<JwtClaims>(ErrorCode::JWT_ISSUER_MISMATCH,
                                  "issuer '" + claims.issuer +
                                      "' is not trusted");
    }

    // exp may be SystemTime::max(); the skew is taken off the clock instead
    if (time_source_.systemTime() - config_.clock_skew >= claims.expires_at) {
      return makeError<JwtClaims>(ErrorCode::JWT_EXPIRED,
                                  "token expired for subject " +
                                      claims.subject);
    }

    claims.payload = std::move(payload);
    return makeSuccess(std::move(claims));
  }

  const JwtValidatorConfig config_;
  const event::TimeSource& time_source_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<EVP_PKEY>> keys_;
};

JwtValidator::JwtValidator(const JwtValidatorConfig& config,
                           const event::TimeSource& time_source)
    : impl_(new Impl(config, time_source)) {}

JwtValidator::~JwtValidator() = default;

VoidResult JwtValidator::addPemKey(const std::string& key_id,
                                   const std::string& pem) {
  PkeyPtr key = readPemPublicKey(pem);
  if (!key) {
    return makeVoidError(
        configError("key '" + key_id + "' is not a PEM public key"));
  }
  return impl_->addKey(key_id, std::move(key));
}

VoidResult JwtValidator::addJwk(const nlohmann::json& jwk) {
  if (!jwk.is_object()) {
    return makeVoidError(configError("JWK is not a JSON object"));
  }
  const std::string key_id = stringField(jwk, "kid");
  const std::string kty = stringField(jwk, "kty");
  if (key_id.empty()) {
    return makeVoidError(configError("JWK has no kid"));
  }

  PkeyPtr key;
  if (kty == "RSA") {
    key = rsaKeyFromJwk(stringField(jwk, "n"),
                        stringField(jwk, "e"));
  } else if (kty == "EC") {
    key = ecKeyFromJwk(stringField(jwk, "crv"),
                       stringField(jwk, "x"),
                       stringField(jwk, "y"));
  } else {
    return makeVoidError(
        configError("JWK '" + key_id + "' has unsupported kty '" + kty + "'"));
  }
  if (!key) {
    return makeVoidError(
        configError("JWK '" + key_id + "' has invalid key material"));
  }
  return impl_->addKey(key_id, std::move(key));
}

VoidResult JwtValidator::addJwkSet(const nlohmann::json& jwk_set) {
  if (!jwk_set.is_object() || !jwk_set.contains("keys") ||
      !jwk_set["keys"].is_array()) {
    return makeVoidError(configError("JWK set has no keys array"));
  }
  for (const auto& jwk : jwk_set["keys"]) {
    auto added = addJwk(jwk);
    if (isError(added)) {
      return added;
    }
  }
  return makeVoidSuccess();
}

size_t JwtValidator::keyCount() const { return impl_->keyCount(); }

Result<JwtClaims> JwtValidator::verify(const std::string& token) const {
  return impl_->verify(token);
}

}  // namespace resource
}  // namespace tokenkeeper
