#include <gtest/gtest.h>

#include "tokenkeeper/client/token_client.h"

#include "../mocks/mock_token_provider.h"
#include "../mocks/temp_directory.h"

namespace tokenkeeper {
namespace client {
namespace {

class TokenClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_.write("client.json",
               R"({"client_id":"my-client","client_secret":"s3cret"})");
    dir_.write("user.json",
               R"({"application_username":"my-app",)"
               R"("application_password":"app-pass"})");

    configuration_.credentials.directory = dir_.path();
    // Nothing listens on port 1; connections are refused immediately
    configuration_.token_provider.url = "http://127.0.0.1:1/oauth2/access_token";
    configuration_.http.timeout = std::chrono::milliseconds(2000);
    configuration_.token_manager.warm_up = false;
  }

  test::TempDirectory dir_;
  config::Configuration configuration_;
};

TEST_F(TokenClientTest, MissingCredentialsFailFast) {
  configuration_.credentials.directory = dir_.file("absent");

  auto created = TokenClient::create(configuration_);
  ASSERT_TRUE(isError(created));
  EXPECT_EQ(getError(created).code, ErrorCode::CREDENTIALS_NOT_FOUND);
}

TEST_F(TokenClientTest, MalformedCredentialsFailFast) {
  dir_.write("user.json", "{}");

  auto created = TokenClient::create(configuration_);
  ASSERT_TRUE(isError(created));
  EXPECT_EQ(getError(created).code, ErrorCode::CREDENTIALS_MALFORMED);
}

TEST_F(TokenClientTest, UnreachableProviderSurfacesAsUnavailable) {
  auto observer = std::make_shared<test::RecordingObserver>();
  auto created = TokenClient::create(configuration_, observer);
  ASSERT_TRUE(isSuccess(created)) << getError(created).toString();
  auto client = std::move(getValue(created));

  EXPECT_TRUE(client->registerSlot("catalog", {"catalog.read"}));
  EXPECT_FALSE(client->registerSlot("catalog", {"other"}));

  auto token = client->getToken("catalog");
  ASSERT_TRUE(isError(token));
  EXPECT_EQ(getError(token).code, ErrorCode::TOKEN_UNAVAILABLE);

  auto last = client->manager().lastError("catalog");
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->code, ErrorCode::PROVIDER_UNAVAILABLE);
  EXPECT_GE(observer->count(LifecycleEventType::ProviderUnavailable), 1u);

  client->shutdown();
  client->shutdown();

  auto after = client->getToken("catalog");
  ASSERT_TRUE(isError(after));
  EXPECT_EQ(getError(after).code, ErrorCode::TOKEN_MANAGER_SHUT_DOWN);
}

TEST_F(TokenClientTest, ReloadKeepsSnapshotOnFailure) {
  auto created = TokenClient::create(configuration_);
  ASSERT_TRUE(isSuccess(created));
  auto client = std::move(getValue(created));

  dir_.write("client.json",
             R"({"client_id":"my-client","client_secret":"rotated"})");
  auto reloaded = client->reloadCredentials();
  ASSERT_TRUE(isSuccess(reloaded));
  EXPECT_EQ(getValue(reloaded)->client.secret, "rotated");

  dir_.remove("client.json");
  auto failed = client->reloadCredentials();
  ASSERT_TRUE(isError(failed));
  EXPECT_EQ(getError(failed).code, ErrorCode::CREDENTIALS_NOT_FOUND);
}

TEST(LifecycleEventTypeTest, Names) {
  EXPECT_STREQ(lifecycleEventTypeToString(LifecycleEventType::Acquired),
               "acquired");
  EXPECT_STREQ(lifecycleEventTypeToString(LifecycleEventType::Refreshed),
               "refreshed");
  EXPECT_STREQ(lifecycleEventTypeToString(LifecycleEventType::Warning),
               "warning");
  EXPECT_STREQ(lifecycleEventTypeToString(LifecycleEventType::Expired),
               "expired");
  EXPECT_STREQ(
      lifecycleEventTypeToString(LifecycleEventType::ProviderUnavailable),
      "provider_unavailable");
}

TEST(LoggingLifecycleObserverTest, AcceptsEveryEventType) {
  LoggingLifecycleObserver observer;
  LifecycleEvent sample{LifecycleEventType::Acquired, "slot",
                       event::MonotonicTime(), nullopt, nullopt};
  observer.onLifecycleEvent(sample);

  sample.type = LifecycleEventType::ProviderUnavailable;
  sample.error = Error(ErrorCode::PROVIDER_UNAVAILABLE, "down");
  observer.onLifecycleEvent(sample);

  sample.type = LifecycleEventType::Expired;
  sample.expires_at = event::MonotonicTime();
  observer.onLifecycleEvent(sample);
}

}  // namespace
}  // namespace client
}  // namespace tokenkeeper
