#ifndef TOKENKEEPER_CLIENT_LIFECYCLE_OBSERVER_H
#define TOKENKEEPER_CLIENT_LIFECYCLE_OBSERVER_H

#include <string>

#include "tokenkeeper/core/compat.h"
#include "tokenkeeper/core/result.h"
#include "tokenkeeper/event/event_loop.h"

namespace tokenkeeper {
namespace client {

enum class LifecycleEventType {
  Acquired,   // first token for a slot, or first after expiry
  Refreshed,  // replaced a still-valid token
  Warning,    // token passed the warning point without being replaced
  Expired,    // token reached expires_at without being replaced
  ProviderUnavailable  // an acquisition attempt failed; error is set
};

const char* lifecycleEventTypeToString(LifecycleEventType type);

struct LifecycleEvent {
  LifecycleEventType type;
  std::string slot;
  event::MonotonicTime at;
  // Set for Acquired, Refreshed, Warning and Expired
  optional<event::MonotonicTime> expires_at;
  // Set for ProviderUnavailable
  optional<Error> error;
};

/**
 * @brief Receives token lifecycle events
 *
 * Called synchronously on the thread that caused the transition, possibly
 * while the slot's acquisition lock is held. Implementations must not call
 * back into the manager for the same slot.
 */
class LifecycleObserver {
 public:
  virtual ~LifecycleObserver() = default;

  virtual void onLifecycleEvent(const LifecycleEvent& event) = 0;
};

/**
 * @brief Writes every event to the "Lifecycle.events" logger
 */
class LoggingLifecycleObserver : public LifecycleObserver {
 public:
  void onLifecycleEvent(const LifecycleEvent& event) override;
};

}  // namespace client
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_CLIENT_LIFECYCLE_OBSERVER_H
