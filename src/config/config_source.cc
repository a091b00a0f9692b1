#include "tokenkeeper/config/config_source.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <map>

#define TOKENKEEPER_LOG_COMPONENT "Config.source"
#include "tokenkeeper/logging/log_macros.h"

extern char** environ;  // provided by C runtime

namespace tokenkeeper {
namespace config {

namespace {

using Setter = std::function<void(const std::string&, nlohmann::json&)>;

// Section is created on demand so absent variables leave no trace
Setter stringAt(const char* section, const char* key) {
  return [section, key](const std::string& val, nlohmann::json& j) {
    j[section][key] = val;
  };
}

Setter integerAt(const char* section, const char* key) {
  return [section, key](const std::string& val, nlohmann::json& j) {
    j[section][key] = std::stoll(val);
  };
}

Setter numberAt(const char* section, const char* key) {
  return [section, key](const std::string& val, nlohmann::json& j) {
    j[section][key] = std::stod(val);
  };
}

void mergeInto(nlohmann::json& target, const nlohmann::json& overlay) {
  for (auto it = overlay.begin(); it != overlay.end(); ++it) {
    if (it.value().is_object() && target.contains(it.key()) &&
        target[it.key()].is_object()) {
      mergeInto(target[it.key()], it.value());
    } else {
      target[it.key()] = it.value();
    }
  }
}

}  // namespace

EnvironmentConfigSource::EnvironmentConfigSource(const std::string& prefix)
    : prefix_(prefix) {}

bool EnvironmentConfigSource::hasConfiguration() const {
  for (char** env = environ; env && *env; ++env) {
    std::string var(*env);
    if (var.compare(0, prefix_.length(), prefix_) == 0) {
      return true;
    }
  }
  return false;
}

nlohmann::json EnvironmentConfigSource::loadConfiguration() {
  return parseEnvironmentVariables();
}

nlohmann::json EnvironmentConfigSource::parseEnvironmentVariables() {
  auto config = nlohmann::json::object();

  std::map<std::string, Setter> mappings = {
      {prefix_ + "TOKEN_INFO_URL", stringAt("token_info", "url")},
      {prefix_ + "FALLBACK_TOKEN_INFO_URL",
       stringAt("token_info", "fallback_url")},
      {prefix_ + "TOKEN_INFO_URL_QUERY_PARAMETER",
       stringAt("token_info", "query_parameter")},
      {prefix_ + "TOKEN_INFO_CACHE_MAX_ENTRIES",
       integerAt("token_info", "cache_max_entries")},
      {prefix_ + "TOKEN_PROVIDER_URL", stringAt("token_provider", "url")},
      {prefix_ + "FALLBACK_TOKEN_PROVIDER_URL",
       stringAt("token_provider", "fallback_url")},
      {prefix_ + "TOKEN_PROVIDER_REALM", stringAt("token_provider", "realm")},
      {prefix_ + "TOKEN_PROVIDER_GRANT_TYPE",
       stringAt("token_provider", "grant_type")},
      {prefix_ + "TOKEN_PROVIDER_DEFAULT_LIFETIME_SECONDS",
       integerAt("token_provider", "default_lifetime_seconds")},
      {prefix_ + "HTTP_TIMEOUT_MS", integerAt("http", "timeout_ms")},
      {prefix_ + "TOKEN_MANAGER_REFRESH_FACTOR",
       numberAt("token_manager", "refresh_factor")},
      {prefix_ + "TOKEN_MANAGER_WARNING_FACTOR",
       numberAt("token_manager", "warning_factor")},
      {prefix_ + "TOKEN_MANAGER_INITIAL_BACKOFF_MS",
       integerAt("token_manager", "initial_backoff_ms")},
      {prefix_ + "TOKEN_MANAGER_MAX_BACKOFF_MS",
       integerAt("token_manager", "max_backoff_ms")},
      {prefix_ + "CREDENTIALS_DIR", stringAt("credentials", "directory")},
      {prefix_ + "CLIENT_CREDENTIALS_FILE_NAME",
       stringAt("credentials", "client_file")},
      {prefix_ + "USER_CREDENTIALS_FILE_NAME",
       stringAt("credentials", "user_file")},
      {prefix_ + "LOG_LEVEL",
       [](const std::string& val, nlohmann::json& j) {
         j["logging"]["level"] = val;
       }}};

  // Indirections: the named variable holds the actual value
  const char* url_var = std::getenv((prefix_ + "TOKEN_INFO_URL_ENV_VAR").c_str());
  if (url_var && *url_var) {
    mappings[url_var] = stringAt("token_info", "url");
    mappings.erase(prefix_ + "TOKEN_INFO_URL");
  }
  const char* dir_var =
      std::getenv((prefix_ + "CREDENTIALS_DIR_ENV_VAR").c_str());
  if (dir_var && *dir_var) {
    mappings[dir_var] = stringAt("credentials", "directory");
    mappings.erase(prefix_ + "CREDENTIALS_DIR");
  }

  for (const auto& mapping : mappings) {
    const char* value = std::getenv(mapping.first.c_str());
    if (value) {
      try {
        mapping.second(value, config);
      } catch (const std::exception& e) {
        // Left unset so validation reports the missing value
        TOKENKEEPER_LOG(Warning, "ignoring {}: cannot parse '{}' ({})",
                        mapping.first, value, e.what());
      }
    }
  }

  return config;
}

FileConfigSource::FileConfigSource(const std::string& path) : path_(path) {}

bool FileConfigSource::hasConfiguration() const {
  std::ifstream file(path_);
  return file.good();
}

nlohmann::json FileConfigSource::loadConfiguration() {
  std::ifstream file(path_);
  if (!file.is_open()) {
    TOKENKEEPER_LOG(Warning, "configuration file {} not readable", path_);
    return nlohmann::json::object();
  }

  try {
    nlohmann::json document = nlohmann::json::parse(file);
    if (!document.is_object()) {
      TOKENKEEPER_LOG(Error, "configuration file {} is not a JSON object",
                      path_);
      return nlohmann::json::object();
    }
    return document;
  } catch (const nlohmann::json::parse_error& e) {
    TOKENKEEPER_LOG(Error, "configuration file {} is not valid JSON: {}",
                    path_, e.what());
    return nlohmann::json::object();
  }
}

nlohmann::json mergeSources(
    const std::vector<std::shared_ptr<ConfigSource>>& sources) {
  std::vector<std::shared_ptr<ConfigSource>> ordered(sources.begin(),
                                                     sources.end());
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const std::shared_ptr<ConfigSource>& a,
                      const std::shared_ptr<ConfigSource>& b) {
                     return a->getPriority() < b->getPriority();
                   });

  auto merged = nlohmann::json::object();
  for (const auto& source : ordered) {
    if (!source->hasConfiguration()) {
      continue;
    }
    TOKENKEEPER_LOG(Debug, "merging configuration from {}", source->getName());
    mergeInto(merged, source->loadConfiguration());
  }
  return merged;
}

}  // namespace config
}  // namespace tokenkeeper
