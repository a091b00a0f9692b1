#include "tokenkeeper/client/token_client.h"

#define TOKENKEEPER_LOG_COMPONENT "Lifecycle.client"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace client {

Result<std::unique_ptr<TokenClient>> TokenClient::create(
    const config::Configuration& configuration,
    std::shared_ptr<LifecycleObserver> observer) {
  std::unique_ptr<TokenClient> client(new TokenClient());

  client->credentials_.reset(
      new credentials::CredentialStore(configuration.credentials));
  auto loaded = client->credentials_->load();
  if (isError(loaded)) {
    TOKENKEEPER_LOG_ERROR("Cannot start token client: {}",
                          getError(loaded).toString());
    return makeError<std::unique_ptr<TokenClient>>(getError(loaded));
  }

  client->http_.reset(new http::CurlHttpClient());
  client->dispatcher_factory_ = event::createLibeventDispatcherFactory();
  client->worker_ =
      event::createWorker("tokenkeeper", *client->dispatcher_factory_);
  client->executor_.reset(
      new WorkerSlotExecutor(*client->dispatcher_factory_));

  client->provider_.reset(new TokenProviderClient(
      TokenProviderClient::Config::fromConfiguration(configuration),
      *client->http_, client->worker_->dispatcher().timeSource()));

  if (!observer) {
    observer = std::make_shared<LoggingLifecycleObserver>();
  }
  client->manager_.reset(new TokenLifecycleManager(
      configuration.token_manager, *client->credentials_, *client->provider_,
      client->worker_->dispatcher(), *client->executor_, std::move(observer)));

  client->worker_->start();
  TOKENKEEPER_LOG_INFO("Token client started against {} endpoint(s)",
                       client->provider_->config().endpoints.size());
  return makeSuccess(std::move(client));
}

TokenClient::~TokenClient() { shutdown(); }

bool TokenClient::registerSlot(const std::string& name,
                               const std::vector<std::string>& scopes) {
  return manager_->registerSlot(name, scopes);
}

Result<AccessToken> TokenClient::getToken(const std::string& name) {
  return manager_->getToken(name);
}

Result<credentials::CredentialSnapshotPtr> TokenClient::reloadCredentials() {
  return credentials_->reload();
}

void TokenClient::shutdown() {
  if (manager_) {
    manager_->shutdown();
  }
  // Waits for provider calls already in flight
  if (executor_) {
    executor_->shutdown();
  }
  // Timers left armed never fire once the loop has stopped
  if (worker_ && worker_->running()) {
    worker_->stop();
  }
}

}  // namespace client
}  // namespace tokenkeeper
