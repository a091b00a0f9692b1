#include <cstdlib>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "tokenkeeper/config/configuration.h"

#include "../mocks/temp_directory.h"

namespace tokenkeeper {
namespace config {
namespace {

using ::testing::HasSubstr;
using nlohmann::json;

json clientDocument() {
  return {{"token_provider", {{"url", "https://auth.example.com/token"}}},
          {"credentials", {{"directory", "/etc/credentials"}}}};
}

json resourceDocument() {
  return {{"token_info",
           {{"url", "https://info.example.com/tokeninfo"},
            {"fallback_url", "https://info2.example.com/tokeninfo"},
            {"query_parameter", "access_token"}}}};
}

TEST(ConfigurationTest, DefaultsWhenAbsent) {
  auto parsed = Configuration::fromJson(json::object());
  ASSERT_TRUE(isSuccess(parsed));
  const auto& cfg = getValue(parsed);
  EXPECT_DOUBLE_EQ(cfg.token_manager.refresh_factor, 0.8);
  EXPECT_DOUBLE_EQ(cfg.token_manager.warning_factor, 0.9);
  EXPECT_EQ(cfg.token_provider.grant_type, GrantType::Password);
  EXPECT_EQ(cfg.token_provider.default_lifetime, std::chrono::seconds(60));
  EXPECT_EQ(cfg.credentials.client_file, "client.json");
  EXPECT_EQ(cfg.credentials.user_file, "user.json");
  EXPECT_TRUE(cfg.token_manager.warm_up);
}

TEST(ConfigurationTest, ReadsAllSections) {
  json document = {
      {"token_info",
       {{"url", "https://info"},
        {"fallback_url", "https://info2"},
        {"query_parameter", "token"},
        {"cache_max_entries", 42}}},
      {"token_provider",
       {{"url", "https://auth"},
        {"realm", "/services"},
        {"grant_type", "client_credentials"},
        {"default_lifetime_seconds", 120}}},
      {"http", {{"timeout_ms", 1500}}},
      {"token_manager",
       {{"refresh_factor", 0.5},
        {"warning_factor", 0.75},
        {"initial_backoff_ms", 200},
        {"max_backoff_ms", 4000},
        {"warm_up", false}}},
      {"credentials", {{"directory", "/creds"}, {"user_file", ""}}},
      {"logging", {{"level", "debug"}}}};

  auto parsed = Configuration::fromJson(document);
  ASSERT_TRUE(isSuccess(parsed)) << getError(parsed).toString();
  const auto& cfg = getValue(parsed);
  EXPECT_EQ(cfg.token_info.endpoints(),
            (std::vector<std::string>{"https://info", "https://info2"}));
  EXPECT_EQ(cfg.token_info.query_parameter, "token");
  EXPECT_EQ(cfg.token_info.cache_max_entries, 42u);
  EXPECT_EQ(cfg.token_provider.endpoints(),
            (std::vector<std::string>{"https://auth"}));
  EXPECT_EQ(cfg.token_provider.realm, "/services");
  EXPECT_EQ(cfg.token_provider.grant_type, GrantType::ClientCredentials);
  EXPECT_EQ(cfg.token_provider.default_lifetime, std::chrono::seconds(120));
  EXPECT_EQ(cfg.http.timeout, std::chrono::milliseconds(1500));
  EXPECT_DOUBLE_EQ(cfg.token_manager.refresh_factor, 0.5);
  EXPECT_DOUBLE_EQ(cfg.token_manager.warning_factor, 0.75);
  EXPECT_EQ(cfg.token_manager.initial_backoff, std::chrono::milliseconds(200));
  EXPECT_EQ(cfg.token_manager.max_backoff, std::chrono::milliseconds(4000));
  EXPECT_FALSE(cfg.token_manager.warm_up);
  EXPECT_EQ(cfg.credentials.directory, "/creds");
  EXPECT_TRUE(cfg.credentials.user_file.empty());
  EXPECT_EQ(cfg.log_level, "debug");
}

TEST(ConfigurationTest, WrongTypesAreReported) {
  json document = {{"http", {{"timeout_ms", "fast"}}},
                   {"token_provider", {{"grant_type", "implicit"}}}};

  auto parsed = Configuration::fromJson(document);
  ASSERT_TRUE(isError(parsed));
  EXPECT_EQ(getError(parsed).code, ErrorCode::CONFIG_INVALID);
  EXPECT_THAT(getError(parsed).message, HasSubstr("http.timeout_ms"));
  EXPECT_THAT(getError(parsed).message, HasSubstr("implicit"));
}

TEST(ValidationTest, ClientRoleNeedsProviderAndCredentials) {
  Configuration cfg;
  auto result = validate(cfg, Role::Client);
  EXPECT_FALSE(result.is_valid);
  EXPECT_THAT(result.summary(), HasSubstr("token_provider.url"));
  EXPECT_THAT(result.summary(), HasSubstr("credentials.directory"));

  // Resource-server settings are not required for a client
  EXPECT_THAT(result.summary(), ::testing::Not(HasSubstr("token_info")));
}

TEST(ValidationTest, FactorsMustBeOrdered) {
  auto cfg = getValue(Configuration::fromJson(clientDocument()));
  EXPECT_TRUE(validate(cfg, Role::Client).is_valid);

  cfg.token_manager.refresh_factor = 0.9;
  cfg.token_manager.warning_factor = 0.8;
  auto result = validate(cfg, Role::Client);
  EXPECT_FALSE(result.is_valid);
  EXPECT_THAT(result.summary(), HasSubstr("refresh factor"));

  cfg.token_manager.refresh_factor = 0.0;
  cfg.token_manager.warning_factor = 1.0;
  result = validate(cfg, Role::Client);
  EXPECT_EQ(result.getErrorCount(), 2u);
}

TEST(ValidationTest, BackoffBounds) {
  auto cfg = getValue(Configuration::fromJson(clientDocument()));
  cfg.token_manager.initial_backoff = std::chrono::milliseconds(5000);
  cfg.token_manager.max_backoff = std::chrono::milliseconds(1000);
  EXPECT_FALSE(validate(cfg, Role::Client).is_valid);
}

TEST(ValidationTest, PasswordGrantNeedsUserFile) {
  auto cfg = getValue(Configuration::fromJson(clientDocument()));
  cfg.credentials.user_file.clear();
  EXPECT_FALSE(validate(cfg, Role::Client).is_valid);

  cfg.token_provider.grant_type = GrantType::ClientCredentials;
  EXPECT_TRUE(validate(cfg, Role::Client).is_valid);
}

TEST(ValidationTest, ResourceServerRole) {
  auto cfg = getValue(Configuration::fromJson(resourceDocument()));
  auto result = validate(cfg, Role::ResourceServer);
  EXPECT_TRUE(result.is_valid) << result.summary();
  EXPECT_EQ(result.getWarningCount(), 0u);

  cfg.token_info.fallback_url.clear();
  result = validate(cfg, Role::ResourceServer);
  EXPECT_TRUE(result.is_valid);
  EXPECT_EQ(result.getWarningCount(), 1u);

  cfg.token_info.query_parameter.clear();
  cfg.token_info.url = "ftp://info";
  result = validate(cfg, Role::ResourceServer);
  EXPECT_EQ(result.getErrorCount(), 2u);
}

TEST(ConfigSourceTest, HigherPriorityWins) {
  std::vector<std::shared_ptr<ConfigSource>> sources = {
      std::make_shared<StaticConfigSource>(
          json{{"http", {{"timeout_ms", 100}}},
               {"logging", {{"level", "warning"}}}},
          ConfigSource::ENVIRONMENT),
      std::make_shared<StaticConfigSource>(
          json{{"http", {{"timeout_ms", 999}}},
               {"token_info", {{"url", "https://info"}}}},
          ConfigSource::FILE)};

  json merged = mergeSources(sources);
  EXPECT_EQ(merged["http"]["timeout_ms"], 100);
  EXPECT_EQ(merged["logging"]["level"], "warning");
  EXPECT_EQ(merged["token_info"]["url"], "https://info");
}

TEST(ConfigSourceTest, FileSource) {
  test::TempDirectory dir;
  dir.write("config.json", R"({"token_provider":{"realm":"/services"}})");
  dir.write("broken.json", "{");

  FileConfigSource good(dir.file("config.json"));
  EXPECT_TRUE(good.hasConfiguration());
  EXPECT_EQ(good.loadConfiguration()["token_provider"]["realm"], "/services");

  FileConfigSource broken(dir.file("broken.json"));
  EXPECT_TRUE(broken.loadConfiguration().empty());

  FileConfigSource missing(dir.file("absent.json"));
  EXPECT_FALSE(missing.hasConfiguration());
}

class EnvironmentConfigTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const auto& name : set_) {
      unsetenv(name.c_str());
    }
  }

  void setVar(const std::string& name, const std::string& value) {
    setenv(name.c_str(), value.c_str(), 1);
    set_.push_back(name);
  }

  std::vector<std::string> set_;
};

TEST_F(EnvironmentConfigTest, MapsVariables) {
  setVar("TKTEST_TOKEN_PROVIDER_URL", "https://auth/token");
  setVar("TKTEST_TOKEN_MANAGER_REFRESH_FACTOR", "0.6");
  setVar("TKTEST_HTTP_TIMEOUT_MS", "2500");
  setVar("TKTEST_CREDENTIALS_DIR", "/creds");
  setVar("TKTEST_LOG_LEVEL", "debug");

  EnvironmentConfigSource source("TKTEST_");
  EXPECT_TRUE(source.hasConfiguration());
  json document = source.loadConfiguration();
  EXPECT_EQ(document["token_provider"]["url"], "https://auth/token");
  EXPECT_DOUBLE_EQ(document["token_manager"]["refresh_factor"].get<double>(),
                   0.6);
  EXPECT_EQ(document["http"]["timeout_ms"], 2500);
  EXPECT_EQ(document["credentials"]["directory"], "/creds");
  EXPECT_EQ(document["logging"]["level"], "debug");
}

TEST_F(EnvironmentConfigTest, IndirectVariables) {
  setVar("TKTEST_TOKEN_INFO_URL_ENV_VAR", "TKTEST_OTHER_INFO_URL");
  setVar("TKTEST_OTHER_INFO_URL", "https://info/indirect");
  setVar("TKTEST_TOKEN_INFO_URL", "https://info/direct");
  setVar("TKTEST_CREDENTIALS_DIR_ENV_VAR", "TKTEST_MOUNTED_DIR");
  setVar("TKTEST_MOUNTED_DIR", "/mnt/creds");

  EnvironmentConfigSource source("TKTEST_");
  json document = source.loadConfiguration();
  EXPECT_EQ(document["token_info"]["url"], "https://info/indirect");
  EXPECT_EQ(document["credentials"]["directory"], "/mnt/creds");
}

TEST_F(EnvironmentConfigTest, UnparsableNumberIsLeftUnset) {
  setVar("TKTEST_HTTP_TIMEOUT_MS", "soon");
  EnvironmentConfigSource source("TKTEST_");
  json document = source.loadConfiguration();
  EXPECT_FALSE(document.contains("http"));
}

TEST_F(EnvironmentConfigTest, LoadConfigurationFailsFast) {
  setVar("TKTEST_TOKEN_PROVIDER_URL", "https://auth/token");

  auto loaded = loadConfiguration(Role::Client, "TKTEST_");
  ASSERT_TRUE(isError(loaded));
  EXPECT_EQ(getError(loaded).code, ErrorCode::CONFIG_INVALID);
  EXPECT_THAT(getError(loaded).message, HasSubstr("credentials.directory"));

  setVar("TKTEST_CREDENTIALS_DIR", "/creds");
  loaded = loadConfiguration(Role::Client, "TKTEST_");
  ASSERT_TRUE(isSuccess(loaded)) << getError(loaded).toString();
  EXPECT_EQ(getValue(loaded).token_provider.url, "https://auth/token");
}

TEST_F(EnvironmentConfigTest, ConfigFileIsMergedBelowEnvironment) {
  test::TempDirectory dir;
  dir.write("config.json",
            R"({"token_provider":{"url":"https://from-file","realm":"/x"},)"
            R"("credentials":{"directory":"/creds"}})");
  setVar("TKTEST_CONFIG", dir.file("config.json"));
  setVar("TKTEST_TOKEN_PROVIDER_URL", "https://from-env");

  auto loaded = loadConfiguration(Role::Client, "TKTEST_");
  ASSERT_TRUE(isSuccess(loaded)) << getError(loaded).toString();
  EXPECT_EQ(getValue(loaded).token_provider.url, "https://from-env");
  EXPECT_EQ(getValue(loaded).token_provider.realm, "/x");
}

}  // namespace
}  // namespace config
}  // namespace tokenkeeper
