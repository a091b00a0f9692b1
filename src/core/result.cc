#include "tokenkeeper/core/result.h"

namespace tokenkeeper {

const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::SUCCESS: return "SUCCESS";
    case ErrorCode::CREDENTIALS_NOT_FOUND: return "CREDENTIALS_NOT_FOUND";
    case ErrorCode::CREDENTIALS_MALFORMED: return "CREDENTIALS_MALFORMED";
    case ErrorCode::PROVIDER_UNAVAILABLE: return "PROVIDER_UNAVAILABLE";
    case ErrorCode::PROVIDER_REJECTED: return "PROVIDER_REJECTED";
    case ErrorCode::PROVIDER_RESPONSE_MALFORMED:
      return "PROVIDER_RESPONSE_MALFORMED";
    case ErrorCode::TOKEN_UNAVAILABLE: return "TOKEN_UNAVAILABLE";
    case ErrorCode::TOKEN_EXPIRED: return "TOKEN_EXPIRED";
    case ErrorCode::TOKEN_UNKNOWN_SLOT: return "TOKEN_UNKNOWN_SLOT";
    case ErrorCode::TOKEN_MANAGER_SHUT_DOWN: return "TOKEN_MANAGER_SHUT_DOWN";
    case ErrorCode::INTROSPECTION_UNAVAILABLE:
      return "INTROSPECTION_UNAVAILABLE";
    case ErrorCode::INTROSPECTION_INVALID: return "INTROSPECTION_INVALID";
    case ErrorCode::INTROSPECTION_RESPONSE_MALFORMED:
      return "INTROSPECTION_RESPONSE_MALFORMED";
    case ErrorCode::INTROSPECTION_NOT_AUTHORIZED:
      return "INTROSPECTION_NOT_AUTHORIZED";
    case ErrorCode::JWT_SIGNATURE_INVALID: return "JWT_SIGNATURE_INVALID";
    case ErrorCode::JWT_EXPIRED: return "JWT_EXPIRED";
    case ErrorCode::JWT_MALFORMED: return "JWT_MALFORMED";
    case ErrorCode::JWT_CLAIMS_MISSING: return "JWT_CLAIMS_MISSING";
    case ErrorCode::JWT_ISSUER_MISMATCH: return "JWT_ISSUER_MISMATCH";
    case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
  }
  return "UNKNOWN";
}

std::string Error::toString() const {
  std::string out = errorCodeName(code);
  if (!message.empty()) {
    out += ": ";
    out += message;
  }
  return out;
}

}  // namespace tokenkeeper
