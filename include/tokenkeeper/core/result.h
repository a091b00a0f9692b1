#ifndef TOKENKEEPER_RESULT_H
#define TOKENKEEPER_RESULT_H

#include <cstdint>
#include <string>
#include <utility>

#include "tokenkeeper/core/compat.h"

namespace tokenkeeper {

/**
 * @brief Error codes, one range per failure family
 */
enum class ErrorCode : int32_t {
  SUCCESS = 0,

  // Credential store
  CREDENTIALS_NOT_FOUND = -1100,
  CREDENTIALS_MALFORMED = -1101,

  // Token provider
  PROVIDER_UNAVAILABLE = -1200,
  PROVIDER_REJECTED = -1201,
  PROVIDER_RESPONSE_MALFORMED = -1202,

  // Token lifecycle manager
  TOKEN_UNAVAILABLE = -1300,
  TOKEN_EXPIRED = -1301,
  TOKEN_UNKNOWN_SLOT = -1302,
  TOKEN_MANAGER_SHUT_DOWN = -1303,

  // Token introspection
  INTROSPECTION_UNAVAILABLE = -1400,
  INTROSPECTION_INVALID = -1401,
  INTROSPECTION_RESPONSE_MALFORMED = -1402,
  INTROSPECTION_NOT_AUTHORIZED = -1403,

  // JWT validation
  JWT_SIGNATURE_INVALID = -1500,
  JWT_EXPIRED = -1501,
  JWT_MALFORMED = -1502,
  JWT_CLAIMS_MISSING = -1503,
  JWT_ISSUER_MISMATCH = -1504,

  // Configuration
  CONFIG_INVALID = -1600
};

/**
 * @brief Stable name of an error code, e.g. "PROVIDER_UNAVAILABLE"
 */
const char* errorCodeName(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::SUCCESS};
  std::string message;

  Error() = default;
  Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

  // "CODE_NAME: message"
  std::string toString() const;
};

inline bool operator==(const Error& a, const Error& b) {
  return a.code == b.code && a.message == b.message;
}

template <typename T>
using Result = variant<T, Error>;

// For operations without a payload
using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<typename std::decay<T>::type> makeSuccess(T&& value) {
  return Result<typename std::decay<T>::type>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(ErrorCode code, const std::string& message) {
  return Result<T>(Error(code, message));
}

template <typename T>
bool isSuccess(const Result<T>& result) {
  return holds_alternative<T>(result);
}

template <typename T>
bool isError(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

template <typename T>
const Error& getError(const Result<T>& result) {
  return get<Error>(result);
}

template <typename T>
const T& getValue(const Result<T>& result) {
  return get<T>(result);
}

template <typename T>
T& getValue(Result<T>& result) {
  return get<T>(result);
}

}  // namespace tokenkeeper

#endif  // TOKENKEEPER_RESULT_H
