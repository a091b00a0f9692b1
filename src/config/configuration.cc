#include "tokenkeeper/config/configuration.h"

#include <cstdlib>
#include <sstream>

#define TOKENKEEPER_LOG_COMPONENT "Config.configuration"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace config {

namespace {

// Reads j[section][key] into `out` when present; type errors are collected
template <typename T>
void readField(const nlohmann::json& document,
               const char* section,
               const char* key,
               T& out,
               std::vector<std::string>& problems) {
  if (!document.contains(section) || !document[section].is_object()) {
    return;
  }
  const auto& node = document[section];
  if (!node.contains(key) || node[key].is_null()) {
    return;
  }
  try {
    out = node[key].get<T>();
  } catch (const nlohmann::json::exception& e) {
    problems.push_back(std::string(section) + "." + key + ": " + e.what());
  }
}

bool isHttpUrl(const std::string& url) {
  return url.compare(0, 7, "http://") == 0 ||
         url.compare(0, 8, "https://") == 0;
}

std::vector<std::string> endpointList(const std::string& primary,
                                      const std::string& fallback) {
  std::vector<std::string> endpoints;
  if (!primary.empty()) {
    endpoints.push_back(primary);
  }
  if (!fallback.empty()) {
    endpoints.push_back(fallback);
  }
  return endpoints;
}

}  // namespace

const char* grantTypeToString(GrantType type) {
  switch (type) {
    case GrantType::Password: return "password";
    case GrantType::ClientCredentials: return "client_credentials";
  }
  return "password";
}

std::vector<std::string> TokenInfoSettings::endpoints() const {
  return endpointList(url, fallback_url);
}

std::vector<std::string> TokenProviderSettings::endpoints() const {
  return endpointList(url, fallback_url);
}

Result<Configuration> Configuration::fromJson(const nlohmann::json& document) {
  Configuration cfg;
  std::vector<std::string> problems;

  if (!document.is_object()) {
    return makeError<Configuration>(ErrorCode::CONFIG_INVALID,
                                    "configuration must be a JSON object");
  }

  readField(document, "token_info", "url", cfg.token_info.url, problems);
  readField(document, "token_info", "fallback_url",
            cfg.token_info.fallback_url, problems);
  readField(document, "token_info", "query_parameter",
            cfg.token_info.query_parameter, problems);
  readField(document, "token_info", "cache_max_entries",
            cfg.token_info.cache_max_entries, problems);

  readField(document, "token_provider", "url", cfg.token_provider.url,
            problems);
  readField(document, "token_provider", "fallback_url",
            cfg.token_provider.fallback_url, problems);
  readField(document, "token_provider", "realm", cfg.token_provider.realm,
            problems);

  std::string grant_type;
  readField(document, "token_provider", "grant_type", grant_type, problems);
  if (grant_type == "client_credentials") {
    cfg.token_provider.grant_type = GrantType::ClientCredentials;
  } else if (grant_type.empty() || grant_type == "password") {
    cfg.token_provider.grant_type = GrantType::Password;
  } else {
    problems.push_back("token_provider.grant_type: unsupported grant type '" +
                       grant_type + "'");
  }

  int64_t lifetime_seconds = cfg.token_provider.default_lifetime.count();
  readField(document, "token_provider", "default_lifetime_seconds",
            lifetime_seconds, problems);
  cfg.token_provider.default_lifetime = std::chrono::seconds(lifetime_seconds);

  int64_t timeout_ms = cfg.http.timeout.count();
  readField(document, "http", "timeout_ms", timeout_ms, problems);
  cfg.http.timeout = std::chrono::milliseconds(timeout_ms);

  readField(document, "token_manager", "refresh_factor",
            cfg.token_manager.refresh_factor, problems);
  readField(document, "token_manager", "warning_factor",
            cfg.token_manager.warning_factor, problems);
  int64_t initial_backoff_ms = cfg.token_manager.initial_backoff.count();
  readField(document, "token_manager", "initial_backoff_ms",
            initial_backoff_ms, problems);
  cfg.token_manager.initial_backoff =
      std::chrono::milliseconds(initial_backoff_ms);
  int64_t max_backoff_ms = cfg.token_manager.max_backoff.count();
  readField(document, "token_manager", "max_backoff_ms", max_backoff_ms,
            problems);
  cfg.token_manager.max_backoff = std::chrono::milliseconds(max_backoff_ms);
  readField(document, "token_manager", "warm_up", cfg.token_manager.warm_up,
            problems);

  readField(document, "credentials", "directory", cfg.credentials.directory,
            problems);
  readField(document, "credentials", "client_file",
            cfg.credentials.client_file, problems);
  readField(document, "credentials", "user_file", cfg.credentials.user_file,
            problems);

  readField(document, "logging", "level", cfg.log_level, problems);

  if (!problems.empty()) {
    std::ostringstream oss;
    for (size_t i = 0; i < problems.size(); ++i) {
      if (i > 0)
        oss << "; ";
      oss << problems[i];
    }
    return makeError<Configuration>(ErrorCode::CONFIG_INVALID, oss.str());
  }

  return makeSuccess(std::move(cfg));
}

void ValidationResult::addError(const std::string& path,
                                const std::string& message) {
  errors.push_back({ValidationError::Severity::ERROR, path, message});
  is_valid = false;
}

void ValidationResult::addWarning(const std::string& path,
                                  const std::string& message) {
  errors.push_back({ValidationError::Severity::WARNING, path, message});
}

size_t ValidationResult::getErrorCount() const {
  size_t count = 0;
  for (const auto& e : errors) {
    if (e.severity == ValidationError::Severity::ERROR)
      ++count;
  }
  return count;
}

size_t ValidationResult::getWarningCount() const {
  return errors.size() - getErrorCount();
}

std::string ValidationResult::summary() const {
  std::ostringstream oss;
  bool first = true;
  for (const auto& e : errors) {
    if (e.severity != ValidationError::Severity::ERROR)
      continue;
    if (!first)
      oss << "; ";
    oss << e.path << ": " << e.message;
    first = false;
  }
  return oss.str();
}

ValidationResult validate(const Configuration& cfg, Role role) {
  ValidationResult result;

  if (role == Role::ResourceServer || role == Role::Both) {
    if (cfg.token_info.url.empty()) {
      result.addError("token_info.url", "token-info URL is required");
    } else if (!isHttpUrl(cfg.token_info.url)) {
      result.addError("token_info.url", "must be an http(s) URL");
    }
    if (cfg.token_info.fallback_url.empty()) {
      result.addWarning("token_info.fallback_url",
                        "no fallback token-info URL configured");
    } else if (!isHttpUrl(cfg.token_info.fallback_url)) {
      result.addError("token_info.fallback_url", "must be an http(s) URL");
    }
    if (cfg.token_info.query_parameter.empty()) {
      result.addError("token_info.query_parameter",
                      "token-info query parameter name is required");
    }
    if (cfg.token_info.cache_max_entries == 0) {
      result.addError("token_info.cache_max_entries", "must be positive");
    }
  }

  if (role == Role::Client || role == Role::Both) {
    if (cfg.token_provider.url.empty()) {
      result.addError("token_provider.url", "token-provider URL is required");
    } else if (!isHttpUrl(cfg.token_provider.url)) {
      result.addError("token_provider.url", "must be an http(s) URL");
    }
    if (!cfg.token_provider.fallback_url.empty() &&
        !isHttpUrl(cfg.token_provider.fallback_url)) {
      result.addError("token_provider.fallback_url",
                      "must be an http(s) URL");
    }
    if (cfg.token_provider.default_lifetime.count() <= 0) {
      result.addError("token_provider.default_lifetime_seconds",
                      "must be positive");
    }

    const double r = cfg.token_manager.refresh_factor;
    const double w = cfg.token_manager.warning_factor;
    if (!(r > 0.0 && r < 1.0)) {
      result.addError("token_manager.refresh_factor",
                      "must be within (0, 1)");
    }
    if (!(w > 0.0 && w < 1.0)) {
      result.addError("token_manager.warning_factor",
                      "must be within (0, 1)");
    }
    if (!(r < w)) {
      result.addError("token_manager",
                      "refresh factor must be below the warning factor");
    }
    if (cfg.token_manager.initial_backoff.count() <= 0) {
      result.addError("token_manager.initial_backoff_ms", "must be positive");
    }
    if (cfg.token_manager.max_backoff < cfg.token_manager.initial_backoff) {
      result.addError("token_manager.max_backoff_ms",
                      "must not be below the initial backoff");
    }

    if (cfg.credentials.directory.empty()) {
      result.addError("credentials.directory",
                      "credentials directory is required");
    }
    if (cfg.credentials.client_file.empty()) {
      result.addError("credentials.client_file",
                      "client credentials file name is required");
    }
    if (cfg.token_provider.grant_type == GrantType::Password &&
        cfg.credentials.user_file.empty()) {
      result.addError("credentials.user_file",
                      "password grant needs a user credentials file");
    }
  }

  if (cfg.http.timeout.count() <= 0) {
    result.addError("http.timeout_ms", "must be positive");
  }

  return result;
}

Result<Configuration> loadConfiguration(Role role, const std::string& prefix) {
  std::vector<std::shared_ptr<ConfigSource>> sources;
  sources.push_back(std::make_shared<EnvironmentConfigSource>(prefix));

  const char* file = std::getenv((prefix + "CONFIG").c_str());
  if (file && *file) {
    sources.push_back(std::make_shared<FileConfigSource>(file));
  }

  return loadConfiguration(role, sources);
}

Result<Configuration> loadConfiguration(
    Role role, const std::vector<std::shared_ptr<ConfigSource>>& sources) {
  auto parsed = Configuration::fromJson(mergeSources(sources));
  if (isError(parsed)) {
    TOKENKEEPER_LOG(Error, "invalid configuration: {}",
                    getError(parsed).message);
    return parsed;
  }

  auto validation = validate(getValue(parsed), role);
  for (const auto& issue : validation.errors) {
    if (issue.severity == ValidationError::Severity::WARNING) {
      TOKENKEEPER_LOG(Warning, "{}: {}", issue.path, issue.message);
    } else {
      TOKENKEEPER_LOG(Error, "{}: {}", issue.path, issue.message);
    }
  }
  if (!validation.is_valid) {
    return makeError<Configuration>(ErrorCode::CONFIG_INVALID,
                                    validation.summary());
  }

  logging::LoggerRegistry::instance().setGlobalLevel(
      logging::stringToLogLevel(getValue(parsed).log_level));
  return parsed;
}

}  // namespace config
}  // namespace tokenkeeper
