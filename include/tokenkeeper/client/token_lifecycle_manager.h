#ifndef TOKENKEEPER_CLIENT_TOKEN_LIFECYCLE_MANAGER_H
#define TOKENKEEPER_CLIENT_TOKEN_LIFECYCLE_MANAGER_H

#include <memory>
#include <string>
#include <vector>

#include "tokenkeeper/client/access_token.h"
#include "tokenkeeper/client/lifecycle_observer.h"
#include "tokenkeeper/client/slot_executor.h"
#include "tokenkeeper/client/token_provider.h"
#include "tokenkeeper/config/configuration.h"
#include "tokenkeeper/core/compat.h"
#include "tokenkeeper/core/result.h"
#include "tokenkeeper/credentials/credential_store.h"
#include "tokenkeeper/event/event_loop.h"

/**
 * @file token_lifecycle_manager.h
 * @brief Named token slots kept fresh in the background
 */

namespace tokenkeeper {
namespace client {

/**
 * @brief Where a slot is in its token's lifetime
 *
 *   Empty -> Acquiring -> Valid -> Refreshing -> Valid
 *                           |                      |
 *                           +---> Warning ---------+--> Expired
 */
enum class SlotState { Empty, Acquiring, Valid, Refreshing, Warning, Expired };

const char* slotStateToString(SlotState state);

/**
 * @brief Keeps one access token per registered slot
 *
 * With refresh factor r and warning factor w (0 < r < w < 1) and a token of
 * lifetime L issued at t0:
 *  - a refresh is scheduled at t0 + r*L; failed refreshes are retried with
 *    exponential backoff while the current token is still valid
 *  - if the token has not been replaced by t0 + w*L, one Warning event is
 *    emitted for it
 *  - at expires_at the slot becomes Expired and getToken() fails with
 *    TOKEN_EXPIRED until an acquisition succeeds again
 *
 * Timers run on the injected dispatcher. A due refresh is handed to the
 * executor, which calls the provider off the dispatcher thread and posts the
 * outcome back, so one slot's slow provider never delays another slot's
 * timers. getToken() may be called from any thread and never waits for a
 * background refresh: it returns the current token while one is valid.
 * Only an empty or expired slot makes the caller perform (or wait for) an
 * acquisition, and at most one acquisition per slot is in flight at any
 * time.
 */
class TokenLifecycleManager {
 public:
  /**
   * @throws std::invalid_argument unless 0 < refresh < warning < 1
   */
  TokenLifecycleManager(const config::TokenManagerSettings& settings,
                        credentials::CredentialStore& credentials,
                        TokenProvider& provider,
                        event::Dispatcher& dispatcher,
                        SlotExecutor& executor,
                        std::shared_ptr<LifecycleObserver> observer = nullptr);
  ~TokenLifecycleManager();

  TokenLifecycleManager(const TokenLifecycleManager&) = delete;
  TokenLifecycleManager& operator=(const TokenLifecycleManager&) = delete;

  /**
   * @brief Declare a slot. Returns false if the name is already taken, in
   * which case the existing slot and its scopes are kept.
   */
  bool registerSlot(const std::string& name,
                    const std::vector<std::string>& scopes);

  /**
   * @brief Current valid token for the slot
   *
   * Fails with TOKEN_UNKNOWN_SLOT, TOKEN_UNAVAILABLE (nothing acquired yet),
   * TOKEN_EXPIRED, or TOKEN_MANAGER_SHUT_DOWN once shut down and the last
   * token is no longer valid.
   */
  Result<AccessToken> getToken(const std::string& name);

  optional<SlotState> slotState(const std::string& name) const;

  /**
   * @brief Failure of the slot's most recent acquisition, if it failed
   */
  optional<Error> lastError(const std::string& name) const;

  std::vector<std::string> slotNames() const;

  /**
   * @brief Cancel all scheduled work. Idempotent; in-flight results are
   * discarded.
   */
  void shutdown();

 private:
  class Impl;
  std::shared_ptr<Impl> impl_;
};

}  // namespace client
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_CLIENT_TOKEN_LIFECYCLE_MANAGER_H
