#include <gtest/gtest.h>

#include <memory>
#include <string>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "tokenkeeper/core/encoding.h"
#include "tokenkeeper/resource/jwt_validator.h"

#include "../mocks/simulated_dispatcher.h"

namespace tokenkeeper {
namespace resource {
namespace {

using nlohmann::json;

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

PkeyPtr generateRsaKey() {
  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
  EVP_PKEY* key = nullptr;
  if (ctx && EVP_PKEY_keygen_init(ctx) == 1 &&
      EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, 2048) == 1) {
    EVP_PKEY_keygen(ctx, &key);
  }
  EVP_PKEY_CTX_free(ctx);
  return PkeyPtr(key);
}

PkeyPtr generateEcKey(int nid) {
  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
  EVP_PKEY* key = nullptr;
  if (ctx && EVP_PKEY_keygen_init(ctx) == 1 &&
      EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, nid) == 1) {
    EVP_PKEY_keygen(ctx, &key);
  }
  EVP_PKEY_CTX_free(ctx);
  return PkeyPtr(key);
}

std::string publicKeyPem(EVP_PKEY* key) {
  BIO* bio = BIO_new(BIO_s_mem());
  PEM_write_bio_PUBKEY(bio, key);
  char* data = nullptr;
  const long length = BIO_get_mem_data(bio, &data);
  std::string pem(data, static_cast<size_t>(length));
  BIO_free(bio);
  return pem;
}

std::string bignumBytes(const BIGNUM* bn, int width = 0) {
  const int size = width > 0 ? width : BN_num_bytes(bn);
  std::string out(static_cast<size_t>(size), '\0');
  BN_bn2binpad(bn, reinterpret_cast<unsigned char*>(&out[0]), size);
  return out;
}

json rsaJwk(EVP_PKEY* key, const std::string& kid) {
  RSA* rsa = EVP_PKEY_get1_RSA(key);
  const BIGNUM* n = nullptr;
  const BIGNUM* e = nullptr;
  RSA_get0_key(rsa, &n, &e, nullptr);
  json jwk = {{"kty", "RSA"},
              {"kid", kid},
              {"n", base64UrlEncode(bignumBytes(n))},
              {"e", base64UrlEncode(bignumBytes(e))}};
  RSA_free(rsa);
  return jwk;
}

json ecJwk(EVP_PKEY* key, const std::string& kid) {
  EC_KEY* ec = EVP_PKEY_get1_EC_KEY(key);
  BIGNUM* x = BN_new();
  BIGNUM* y = BN_new();
  EC_POINT_get_affine_coordinates(EC_KEY_get0_group(ec),
                                  EC_KEY_get0_public_key(ec), x, y, nullptr);
  json jwk = {{"kty", "EC"},
              {"kid", kid},
              {"crv", "P-256"},
              {"x", base64UrlEncode(bignumBytes(x, 32))},
              {"y", base64UrlEncode(bignumBytes(y, 32))}};
  BN_free(x);
  BN_free(y);
  EC_KEY_free(ec);
  return jwk;
}

std::string digestSign(EVP_PKEY* key,
                       const EVP_MD* md,
                       const std::string& input) {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  size_t length = 0;
  std::string signature;
  if (EVP_DigestSignInit(ctx, nullptr, md, nullptr, key) == 1 &&
      EVP_DigestSignUpdate(ctx, input.data(), input.size()) == 1 &&
      EVP_DigestSignFinal(ctx, nullptr, &length) == 1) {
    signature.resize(length);
    EVP_DigestSignFinal(
        ctx, reinterpret_cast<unsigned char*>(&signature[0]), &length);
    signature.resize(length);
  }
  EVP_MD_CTX_free(ctx);
  return signature;
}

// DER ECDSA signature to the r||s form used by JWS
std::string derToRaw(const std::string& der, int coordinate_size) {
  const auto* bytes = reinterpret_cast<const unsigned char*>(der.data());
  ECDSA_SIG* sig = d2i_ECDSA_SIG(nullptr, &bytes, static_cast<long>(der.size()));
  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig, &r, &s);
  std::string raw =
      bignumBytes(r, coordinate_size) + bignumBytes(s, coordinate_size);
  ECDSA_SIG_free(sig);
  return raw;
}

std::string signToken(EVP_PKEY* key,
                      const json& header,
                      const json& payload) {
  const std::string input = base64UrlEncode(header.dump()) + "." +
                            base64UrlEncode(payload.dump());
  const std::string alg = header.value("alg", "");
  std::string signature;
  if (alg == "RS256") {
    signature = digestSign(key, EVP_sha256(), input);
  } else if (alg == "ES256") {
    signature = derToRaw(digestSign(key, EVP_sha256(), input), 32);
  }
  return input + "." + base64UrlEncode(signature);
}

class JwtValidatorTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    rsa_key_ = generateRsaKey().release();
    ec_key_ = generateEcKey(NID_X9_62_prime256v1).release();
  }

  static void TearDownTestSuite() {
    EVP_PKEY_free(rsa_key_);
    EVP_PKEY_free(ec_key_);
    rsa_key_ = nullptr;
    ec_key_ = nullptr;
  }

  void SetUp() override {
    ASSERT_NE(rsa_key_, nullptr);
    ASSERT_NE(ec_key_, nullptr);
    config_.expected_issuer = "https://issuer.example.com";
    validator_ = std::make_unique<JwtValidator>(config_, time_);
    ASSERT_TRUE(isSuccess(validator_->addPemKey("rsa-1", publicKeyPem(rsa_key_))));
    ASSERT_TRUE(isSuccess(validator_->addPemKey("ec-1", publicKeyPem(ec_key_))));
  }

  int64_t now() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
               time_.systemTime().time_since_epoch())
        .count();
  }

  json payload() const {
    return {{"sub", "jdoe"},
            {"iss", "https://issuer.example.com"},
            {"iat", now()},
            {"exp", now() + 300},
            {"realm", "/employees"},
            {"scope", {"uid", "cn"}}};
  }

  std::string rsaToken(const json& body) const {
    return signToken(rsa_key_, {{"alg", "RS256"}, {"kid", "rsa-1"}}, body);
  }

  static EVP_PKEY* rsa_key_;
  static EVP_PKEY* ec_key_;

  JwtValidatorConfig config_;
  test::SimulatedTimeSource time_;
  std::unique_ptr<JwtValidator> validator_;
};

EVP_PKEY* JwtValidatorTest::rsa_key_ = nullptr;
EVP_PKEY* JwtValidatorTest::ec_key_ = nullptr;

TEST_F(JwtValidatorTest, VerifiesRs256) {
  auto result = validator_->verify(rsaToken(payload()));
  ASSERT_TRUE(isSuccess(result)) << getError(result).toString();

  const JwtClaims& claims = getValue(result);
  EXPECT_EQ(claims.key_id, "rsa-1");
  EXPECT_EQ(claims.algorithm, "RS256");
  EXPECT_EQ(claims.subject, "jdoe");
  EXPECT_EQ(claims.issuer, "https://issuer.example.com");
  ASSERT_TRUE(claims.realm.has_value());
  EXPECT_EQ(*claims.realm, "/employees");
  EXPECT_EQ(claims.scopes, (std::set<std::string>{"uid", "cn"}));
  EXPECT_EQ(claims.expires_at,
            event::SystemTime(std::chrono::seconds(now() + 300)));
}

TEST_F(JwtValidatorTest, VerifiesEs256) {
  auto token =
      signToken(ec_key_, {{"alg", "ES256"}, {"kid", "ec-1"}}, payload());
  auto result = validator_->verify(token);
  ASSERT_TRUE(isSuccess(result)) << getError(result).toString();
  EXPECT_EQ(getValue(result).algorithm, "ES256");
}

TEST_F(JwtValidatorTest, AlgorithmNoneIsRejected) {
  const std::string token = base64UrlEncode(R"({"alg":"none","kid":"rsa-1"})") +
                            "." + base64UrlEncode(payload().dump()) + ".";
  auto result = validator_->verify(token);
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, ErrorCode::JWT_SIGNATURE_INVALID);
}

TEST_F(JwtValidatorTest, UnknownKeyIdIsRejected) {
  auto token =
      signToken(rsa_key_, {{"alg", "RS256"}, {"kid", "other"}}, payload());
  auto result = validator_->verify(token);
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, ErrorCode::JWT_SIGNATURE_INVALID);
}

TEST_F(JwtValidatorTest, KeyMustFitAlgorithm) {
  // RSA signature presented under the EC key's id
  auto token =
      signToken(rsa_key_, {{"alg", "RS256"}, {"kid", "ec-1"}}, payload());
  auto result = validator_->verify(token);
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, ErrorCode::JWT_SIGNATURE_INVALID);
}

TEST_F(JwtValidatorTest, TamperedPayloadIsRejected) {
  const std::string token = rsaToken(payload());
  json forged = payload();
  forged["sub"] = "admin";

  const size_t first = token.find('.');
  const size_t second = token.find('.', first + 1);
  const std::string tampered = token.substr(0, first) + "." +
                               base64UrlEncode(forged.dump()) +
                               token.substr(second);

  auto result = validator_->verify(tampered);
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, ErrorCode::JWT_SIGNATURE_INVALID);
}

TEST_F(JwtValidatorTest, MalformedTokens) {
  for (const std::string token :
       {std::string(""), std::string("abc"), std::string("a.b"),
        std::string("a.b.c.d"), std::string("!!!.e30.sig"),
        base64UrlEncode("[1]") + "." + base64UrlEncode("{}") + ".sig",
        base64UrlEncode(R"({"kid":"rsa-1"})") + "." + base64UrlEncode("{}") +
            "."}) {
    auto result = validator_->verify(token);
    ASSERT_TRUE(isError(result)) << token;
    EXPECT_EQ(getError(result).code, ErrorCode::JWT_MALFORMED) << token;
  }
}

TEST_F(JwtValidatorTest, ExpiredToken) {
  json body = payload();
  body["exp"] = now() - 1;
  auto result = validator_->verify(rsaToken(body));
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, ErrorCode::JWT_EXPIRED);
}

TEST_F(JwtValidatorTest, ExpiresExactlyAtExp) {
  auto token = rsaToken(payload());
  time_.advance(std::chrono::seconds(299));
  EXPECT_TRUE(isSuccess(validator_->verify(token)));
  time_.advance(std::chrono::seconds(1));
  auto result = validator_->verify(token);
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, ErrorCode::JWT_EXPIRED);
}

TEST_F(JwtValidatorTest, FarFutureTimestampsSaturate) {
  json body = payload();
  body["exp"] = 100000000000LL;
  auto result = validator_->verify(rsaToken(body));
  ASSERT_TRUE(isSuccess(result));
  EXPECT_EQ(getValue(result).expires_at, event::SystemTime::max());

  body["exp"] = 1e300;
  body["iat"] = 1e300;
  result = validator_->verify(rsaToken(body));
  ASSERT_TRUE(isSuccess(result));
  EXPECT_EQ(getValue(result).issued_at, event::SystemTime::max());

  body["exp"] = -100000000000LL;
  result = validator_->verify(rsaToken(body));
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, ErrorCode::JWT_EXPIRED);
}

TEST_F(JwtValidatorTest, ClockSkewExtendsValidity) {
  config_.clock_skew = std::chrono::seconds(60);
  JwtValidator lenient(config_, time_);
  ASSERT_TRUE(isSuccess(lenient.addPemKey("rsa-1", publicKeyPem(rsa_key_))));

  json body = payload();
  body["exp"] = now() - 30;
  EXPECT_TRUE(isSuccess(lenient.verify(rsaToken(body))));
}

TEST_F(JwtValidatorTest, MissingClaims) {
  for (const char* claim : {"sub", "iss", "exp", "iat"}) {
    json body = payload();
    body.erase(claim);
    auto result = validator_->verify(rsaToken(body));
    ASSERT_TRUE(isError(result)) << claim;
    EXPECT_EQ(getError(result).code, ErrorCode::JWT_CLAIMS_MISSING) << claim;
  }
}

TEST_F(JwtValidatorTest, ConfiguredRequiredClaims) {
  config_.required_claims = {"azp"};
  JwtValidator strict(config_, time_);
  ASSERT_TRUE(isSuccess(strict.addPemKey("rsa-1", publicKeyPem(rsa_key_))));

  auto result = strict.verify(rsaToken(payload()));
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, ErrorCode::JWT_CLAIMS_MISSING);

  json body = payload();
  body["azp"] = "frontend";
  EXPECT_TRUE(isSuccess(strict.verify(rsaToken(body))));
}

TEST_F(JwtValidatorTest, IssuerMismatch) {
  json body = payload();
  body["iss"] = "https://evil.example.com";
  auto result = validator_->verify(rsaToken(body));
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, ErrorCode::JWT_ISSUER_MISMATCH);
}

TEST_F(JwtValidatorTest, AnyIssuerWhenNoneConfigured) {
  config_.expected_issuer.clear();
  JwtValidator open(config_, time_);
  ASSERT_TRUE(isSuccess(open.addPemKey("rsa-1", publicKeyPem(rsa_key_))));

  json body = payload();
  body["iss"] = "https://other.example.com";
  EXPECT_TRUE(isSuccess(open.verify(rsaToken(body))));
}

TEST_F(JwtValidatorTest, RegistersJwkSet) {
  JwtValidator validator(config_, time_);
  json jwks = {{"keys", {rsaJwk(rsa_key_, "jwk-rsa"), ecJwk(ec_key_, "jwk-ec")}}};
  ASSERT_TRUE(isSuccess(validator.addJwkSet(jwks)));
  EXPECT_EQ(validator.keyCount(), 2u);

  EXPECT_TRUE(isSuccess(validator.verify(
      signToken(rsa_key_, {{"alg", "RS256"}, {"kid", "jwk-rsa"}}, payload()))));
  EXPECT_TRUE(isSuccess(validator.verify(
      signToken(ec_key_, {{"alg", "ES256"}, {"kid", "jwk-ec"}}, payload()))));
}

TEST_F(JwtValidatorTest, RejectsUnusableKeys) {
  JwtValidator validator(config_, time_);

  auto pem = validator.addPemKey("bad", "-----BEGIN PUBLIC KEY-----\nAAAA\n");
  ASSERT_TRUE(isError(pem));
  EXPECT_EQ(getError(pem).code, ErrorCode::CONFIG_INVALID);

  auto no_kid = validator.addJwk({{"kty", "RSA"}, {"n", "AQAB"}, {"e", "AQAB"}});
  ASSERT_TRUE(isError(no_kid));

  auto bad_kty = validator.addJwk({{"kty", "oct"}, {"kid", "k"}, {"k", "AQAB"}});
  ASSERT_TRUE(isError(bad_kty));

  auto bad_curve = validator.addJwk(
      {{"kty", "EC"}, {"kid", "k"}, {"crv", "P-999"}, {"x", "AA"}, {"y", "AA"}});
  ASSERT_TRUE(isError(bad_curve));

  auto no_keys = validator.addJwkSet({{"other", 1}});
  ASSERT_TRUE(isError(no_keys));

  EXPECT_EQ(validator.keyCount(), 0u);
}

}  // namespace
}  // namespace resource
}  // namespace tokenkeeper
