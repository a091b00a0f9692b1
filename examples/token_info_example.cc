#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "tokenkeeper/config/configuration.h"
#include "tokenkeeper/http/http_client.h"
#include "tokenkeeper/resource/authenticated_user.h"
#include "tokenkeeper/resource/introspection_client.h"
#include "tokenkeeper/resource/jwt_validator.h"

using namespace tokenkeeper;

namespace {

void usage(const char* program) {
  std::cerr << "Usage: " << program << " <token> [scope...]\n"
            << "       " << program
            << " --jwt <public-key.pem> <kid> <token> [scope...]\n";
}

int report(const Result<resource::AuthenticatedUser>& user,
           const std::vector<std::string>& scopes) {
  if (isError(user)) {
    std::cout << "rejected: " << getError(user).toString() << std::endl;
    // Unavailable means no decision was possible
    return getError(user).code == ErrorCode::INTROSPECTION_UNAVAILABLE ? 2 : 1;
  }

  auto authorized = getValue(user).authorize(scopes);
  if (isError(authorized)) {
    std::cout << "forbidden: " << getError(authorized).message << std::endl;
    return 1;
  }
  std::cout << "accepted: uid " << getValue(user).uid.value_or("<none>")
            << std::endl;
  return 0;
}

}  // namespace

/**
 * Validates one bearer token, either against the configured token-info
 * endpoints or locally as a JWT signed with the given key.
 */
int main(int argc, char* argv[]) {
  if (argc < 2) {
    usage(argv[0]);
    return 64;
  }

  event::RealTimeSource time_source;

  if (std::string(argv[1]) == "--jwt") {
    if (argc < 5) {
      usage(argv[0]);
      return 64;
    }
    std::ifstream in(argv[2]);
    std::stringstream pem;
    pem << in.rdbuf();

    resource::JwtValidator validator(resource::JwtValidatorConfig(),
                                     time_source);
    auto added = validator.addPemKey(argv[3], pem.str());
    if (isError(added)) {
      std::cerr << getError(added).toString() << std::endl;
      return 1;
    }

    auto claims = validator.verify(argv[4]);
    Result<resource::AuthenticatedUser> user =
        isSuccess(claims)
            ? makeSuccess(resource::AuthenticatedUser::fromClaims(
                  getValue(claims)))
            : makeError<resource::AuthenticatedUser>(getError(claims));
    return report(user, std::vector<std::string>(argv + 5, argv + argc));
  }

  auto configuration = config::loadConfiguration(config::Role::ResourceServer);
  if (isError(configuration)) {
    std::cerr << "Configuration error: "
              << getError(configuration).toString() << std::endl;
    return 1;
  }

  http::CurlHttpClient http;
  resource::IntrospectionClient introspection(
      resource::IntrospectionClient::Config::fromConfiguration(
          getValue(configuration)),
      http, time_source);

  auto result = introspection.introspect(argv[1]);
  Result<resource::AuthenticatedUser> user =
      isSuccess(result)
          ? makeSuccess(
                resource::AuthenticatedUser::fromIntrospection(
                    getValue(result)))
          : makeError<resource::AuthenticatedUser>(getError(result));
  return report(user, std::vector<std::string>(argv + 2, argv + argc));
}
