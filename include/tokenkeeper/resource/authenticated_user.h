#ifndef TOKENKEEPER_RESOURCE_AUTHENTICATED_USER_H
#define TOKENKEEPER_RESOURCE_AUTHENTICATED_USER_H

#include <set>
#include <string>
#include <vector>

#include "tokenkeeper/core/compat.h"
#include "tokenkeeper/core/result.h"

namespace tokenkeeper {
namespace resource {

struct IntrospectionResult;
struct JwtClaims;

/**
 * @brief Caller identity and the scopes its token grants
 */
struct AuthenticatedUser {
  optional<std::string> uid;
  std::set<std::string> scopes;

  static AuthenticatedUser fromIntrospection(const IntrospectionResult& result);
  static AuthenticatedUser fromClaims(const JwtClaims& claims);

  bool hasScope(const std::string& scope) const;

  // True when every scope in `required` is granted
  bool hasScopes(const std::vector<std::string>& required) const;

  /**
   * @brief Fails with INTROSPECTION_NOT_AUTHORIZED naming the first
   * missing scope
   */
  VoidResult authorize(const std::vector<std::string>& required) const;
};

}  // namespace resource
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_RESOURCE_AUTHENTICATED_USER_H
