#include "tokenkeeper/resource/authenticated_user.h"

#include "tokenkeeper/resource/introspection_client.h"
#include "tokenkeeper/resource/jwt_validator.h"

namespace tokenkeeper {
namespace resource {

AuthenticatedUser AuthenticatedUser::fromIntrospection(
    const IntrospectionResult& result) {
  AuthenticatedUser user;
  if (!result.subject.empty()) {
    user.uid = result.subject;
  }
  user.scopes = result.scope;
  return user;
}

AuthenticatedUser AuthenticatedUser::fromClaims(const JwtClaims& claims) {
  AuthenticatedUser user;
  user.uid = claims.subject;
  user.scopes = claims.scopes;
  return user;
}

bool AuthenticatedUser::hasScope(const std::string& scope) const {
  return scopes.count(scope) != 0;
}

bool AuthenticatedUser::hasScopes(
    const std::vector<std::string>& required) const {
  for (const auto& scope : required) {
    if (!hasScope(scope)) {
      return false;
    }
  }
  return true;
}

VoidResult AuthenticatedUser::authorize(
    const std::vector<std::string>& required) const {
  for (const auto& scope : required) {
    if (!hasScope(scope)) {
      return makeVoidError(Error(
          ErrorCode::INTROSPECTION_NOT_AUTHORIZED,
          "user with uid " + (uid ? *uid : std::string("<unknown>")) +
              " does not have the scope " + scope));
    }
  }
  return makeVoidSuccess();
}

}  // namespace resource
}  // namespace tokenkeeper
