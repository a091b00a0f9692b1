#ifndef TOKENKEEPER_CONFIG_CONFIG_SOURCE_H
#define TOKENKEEPER_CONFIG_CONFIG_SOURCE_H

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tokenkeeper {
namespace config {

/**
 * @brief A provider of raw configuration as a JSON document
 */
class ConfigSource {
 public:
  enum Priority {
    DEFAULT = 0,        // Built-in defaults
    FILE = 100,         // Configuration files
    ENVIRONMENT = 200,  // Environment variables
    OVERRIDE = 300      // Runtime overrides
  };

  virtual ~ConfigSource() = default;

  virtual std::string getName() const = 0;

  /**
   * @brief Higher priority sources override lower ones on merge
   */
  virtual int getPriority() const = 0;

  virtual bool hasConfiguration() const = 0;

  /**
   * @return JSON object, empty when nothing is available
   */
  virtual nlohmann::json loadConfiguration() = 0;
};

/**
 * @brief Reads <prefix>NAME environment variables into the JSON layout
 *
 * TOKEN_INFO_URL_ENV_VAR and CREDENTIALS_DIR_ENV_VAR may name another
 * variable that holds the token-info URL or the credentials directory.
 */
class EnvironmentConfigSource : public ConfigSource {
 public:
  explicit EnvironmentConfigSource(const std::string& prefix = "TOKENKEEPER_");

  std::string getName() const override { return "environment"; }
  int getPriority() const override { return Priority::ENVIRONMENT; }
  bool hasConfiguration() const override;
  nlohmann::json loadConfiguration() override;

  const std::string& prefix() const { return prefix_; }

 private:
  nlohmann::json parseEnvironmentVariables();

  std::string prefix_;
};

/**
 * @brief JSON configuration file with the same layout as the environment
 */
class FileConfigSource : public ConfigSource {
 public:
  explicit FileConfigSource(const std::string& path);

  std::string getName() const override { return "file:" + path_; }
  int getPriority() const override { return Priority::FILE; }
  bool hasConfiguration() const override;
  nlohmann::json loadConfiguration() override;

 private:
  std::string path_;
};

/**
 * @brief Fixed JSON document, for embedding and tests
 */
class StaticConfigSource : public ConfigSource {
 public:
  StaticConfigSource(nlohmann::json document, int priority = OVERRIDE)
      : document_(std::move(document)), priority_(priority) {}

  std::string getName() const override { return "static"; }
  int getPriority() const override { return priority_; }
  bool hasConfiguration() const override { return !document_.empty(); }
  nlohmann::json loadConfiguration() override { return document_; }

 private:
  nlohmann::json document_;
  int priority_;
};

/**
 * @brief Deep-merge all sources in ascending priority order
 */
nlohmann::json mergeSources(
    const std::vector<std::shared_ptr<ConfigSource>>& sources);

}  // namespace config
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_CONFIG_CONFIG_SOURCE_H
