#ifndef TOKENKEEPER_CONFIG_CONFIGURATION_H
#define TOKENKEEPER_CONFIG_CONFIGURATION_H

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tokenkeeper/config/config_source.h"
#include "tokenkeeper/core/result.h"

namespace tokenkeeper {
namespace config {

enum class GrantType { Password, ClientCredentials };

const char* grantTypeToString(GrantType type);

/**
 * @brief Which side of the library is being configured
 */
enum class Role { Client, ResourceServer, Both };

struct TokenInfoSettings {
  std::string url;
  std::string fallback_url;
  std::string query_parameter;
  size_t cache_max_entries = 10000;

  // Primary first, fallback when set
  std::vector<std::string> endpoints() const;
};

struct TokenProviderSettings {
  std::string url;
  std::string fallback_url;
  std::string realm;
  GrantType grant_type = GrantType::Password;
  // Lifetime assumed when the provider omits expires_in
  std::chrono::seconds default_lifetime{60};

  std::vector<std::string> endpoints() const;
};

struct HttpSettings {
  std::chrono::milliseconds timeout{10000};
};

struct TokenManagerSettings {
  double refresh_factor = 0.8;
  double warning_factor = 0.9;
  std::chrono::milliseconds initial_backoff{1000};
  std::chrono::milliseconds max_backoff{30000};
  // Acquire a token as soon as a slot is registered
  bool warm_up = true;
};

struct CredentialsSettings {
  std::string directory;
  std::string client_file = "client.json";
  // Empty when the grant type needs no user credentials
  std::string user_file = "user.json";
};

/**
 * @brief Immutable process-wide settings
 */
struct Configuration {
  TokenInfoSettings token_info;
  TokenProviderSettings token_provider;
  HttpSettings http;
  TokenManagerSettings token_manager;
  CredentialsSettings credentials;
  std::string log_level = "info";

  /**
   * @brief Build from a merged JSON document; absent keys keep defaults
   *
   * Fails with CONFIG_INVALID when a present key has the wrong type.
   */
  static Result<Configuration> fromJson(const nlohmann::json& document);
};

struct ValidationError {
  enum class Severity { ERROR, WARNING };
  Severity severity;
  std::string path;
  std::string message;
};

struct ValidationResult {
  bool is_valid{true};
  std::vector<ValidationError> errors;

  void addError(const std::string& path, const std::string& message);
  void addWarning(const std::string& path, const std::string& message);

  size_t getErrorCount() const;
  size_t getWarningCount() const;

  // "path: message; path: message" over errors only
  std::string summary() const;
};

ValidationResult validate(const Configuration& configuration, Role role);

/**
 * @brief Environment (and optional TOKENKEEPER_CONFIG file) to a validated
 * Configuration; warnings are logged, errors fail with CONFIG_INVALID
 *
 * On success logging.level becomes the global log level.
 */
Result<Configuration> loadConfiguration(
    Role role, const std::string& prefix = "TOKENKEEPER_");

/**
 * @brief Same as above over explicit sources
 */
Result<Configuration> loadConfiguration(
    Role role, const std::vector<std::shared_ptr<ConfigSource>>& sources);

}  // namespace config
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_CONFIG_CONFIGURATION_H
