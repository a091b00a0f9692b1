#ifndef TOKENKEEPER_CLIENT_ACCESS_TOKEN_H
#define TOKENKEEPER_CLIENT_ACCESS_TOKEN_H

#include <chrono>
#include <set>
#include <string>

#include "tokenkeeper/event/event_loop.h"

namespace tokenkeeper {
namespace client {

/**
 * @brief Bearer token as issued by the provider
 *
 * Both instants are on the monotonic clock; issued_at is taken before the
 * provider request was sent so the lifetime is never overestimated.
 */
struct AccessToken {
  std::string value;
  event::MonotonicTime issued_at;
  event::MonotonicTime expires_at;
  std::set<std::string> scope;

  std::chrono::nanoseconds lifetime() const { return expires_at - issued_at; }

  bool isValidAt(event::MonotonicTime now) const { return now < expires_at; }

  /**
   * @brief issued_at + factor * lifetime
   */
  event::MonotonicTime pointInLifetime(double factor) const {
    return issued_at + std::chrono::duration_cast<std::chrono::nanoseconds>(
                           lifetime() * factor);
  }
};

}  // namespace client
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_CLIENT_ACCESS_TOKEN_H
