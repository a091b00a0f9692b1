#include "tokenkeeper/client/lifecycle_observer.h"

#define TOKENKEEPER_LOG_COMPONENT "Lifecycle.events"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace client {

const char* lifecycleEventTypeToString(LifecycleEventType type) {
  switch (type) {
    case LifecycleEventType::Acquired: return "acquired";
    case LifecycleEventType::Refreshed: return "refreshed";
    case LifecycleEventType::Warning: return "warning";
    case LifecycleEventType::Expired: return "expired";
    case LifecycleEventType::ProviderUnavailable:
      return "provider_unavailable";
  }
  return "unknown";
}

void LoggingLifecycleObserver::onLifecycleEvent(const LifecycleEvent& event) {
  switch (event.type) {
    case LifecycleEventType::Acquired:
    case LifecycleEventType::Refreshed:
      TOKENKEEPER_LOG_INFO("Token {} for slot '{}'",
                           lifecycleEventTypeToString(event.type), event.slot);
      break;
    case LifecycleEventType::Warning:
      TOKENKEEPER_LOG_WARNING(
          "Token for slot '{}' is close to expiry and has not been refreshed",
          event.slot);
      break;
    case LifecycleEventType::Expired:
      TOKENKEEPER_LOG_WARNING("Token for slot '{}' expired", event.slot);
      break;
    case LifecycleEventType::ProviderUnavailable:
      TOKENKEEPER_LOG_WARNING(
          "Token acquisition for slot '{}' failed: {}", event.slot,
          event.error ? event.error->toString() : std::string("unknown"));
      break;
  }
}

}  // namespace client
}  // namespace tokenkeeper
