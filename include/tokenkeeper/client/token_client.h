#ifndef TOKENKEEPER_CLIENT_TOKEN_CLIENT_H
#define TOKENKEEPER_CLIENT_TOKEN_CLIENT_H

#include <memory>
#include <string>
#include <vector>

#include "tokenkeeper/client/lifecycle_observer.h"
#include "tokenkeeper/client/slot_executor.h"
#include "tokenkeeper/client/token_lifecycle_manager.h"
#include "tokenkeeper/client/token_provider.h"
#include "tokenkeeper/config/configuration.h"
#include "tokenkeeper/credentials/credential_store.h"
#include "tokenkeeper/event/event_loop.h"
#include "tokenkeeper/http/http_client.h"

namespace tokenkeeper {
namespace client {

/**
 * @brief Ready-made client side: credentials, provider, a libevent worker
 * thread for the refresh timers, one worker per slot for background
 * acquisitions, and the lifecycle manager
 *
 * Example:
 * @code
 *   auto created = TokenClient::create(configuration);
 *   if (isError(created)) { ... }
 *   auto client = std::move(getValue(created));
 *   client->registerSlot("catalog", {"catalog.read"});
 *   auto token = client->getToken("catalog");
 * @endcode
 */
class TokenClient {
 public:
  /**
   * @brief Load credentials (failing fast) and start the worker
   *
   * @param observer Receives lifecycle events; a LoggingLifecycleObserver
   *                 is used when null
   */
  static Result<std::unique_ptr<TokenClient>> create(
      const config::Configuration& configuration,
      std::shared_ptr<LifecycleObserver> observer = nullptr);

  ~TokenClient();

  TokenClient(const TokenClient&) = delete;
  TokenClient& operator=(const TokenClient&) = delete;

  bool registerSlot(const std::string& name,
                    const std::vector<std::string>& scopes);

  Result<AccessToken> getToken(const std::string& name);

  /**
   * @brief Re-read the credential files; the old snapshot stays on failure
   */
  Result<credentials::CredentialSnapshotPtr> reloadCredentials();

  /**
   * @brief Stop refreshing and join the worker threads. Idempotent.
   */
  void shutdown();

  TokenLifecycleManager& manager() { return *manager_; }

 private:
  TokenClient() = default;

  std::unique_ptr<credentials::CredentialStore> credentials_;
  std::unique_ptr<http::CurlHttpClient> http_;
  std::unique_ptr<TokenProviderClient> provider_;
  event::DispatcherFactoryPtr dispatcher_factory_;
  event::WorkerPtr worker_;
  std::unique_ptr<WorkerSlotExecutor> executor_;
  std::unique_ptr<TokenLifecycleManager> manager_;
};

}  // namespace client
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_CLIENT_TOKEN_CLIENT_H
