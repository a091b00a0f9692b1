#include "tokenkeeper/event/time_conversion.h"

namespace tokenkeeper {
namespace event {

std::chrono::nanoseconds boundedLifetime(double seconds) {
  const std::chrono::nanoseconds max_lifetime = kMaxTrackedLifetime;
  if (!(seconds > 0)) {
    return std::chrono::nanoseconds(0);
  }
  if (seconds >= std::chrono::duration<double>(max_lifetime).count()) {
    return max_lifetime;
  }
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(seconds));
}

SystemTime systemTimeFromEpochSeconds(double seconds) {
  if (!(seconds > 0)) {
    return SystemTime();
  }
  // One second of headroom keeps the rounded double below the integer limit
  const double limit =
      std::chrono::duration<double>(SystemTime::duration::max()).count() - 1;
  if (seconds >= limit) {
    return SystemTime::max();
  }
  return SystemTime(std::chrono::duration_cast<SystemTime::duration>(
      std::chrono::duration<double>(seconds)));
}

}  // namespace event
}  // namespace tokenkeeper
