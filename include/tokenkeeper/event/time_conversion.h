#ifndef TOKENKEEPER_EVENT_TIME_CONVERSION_H
#define TOKENKEEPER_EVENT_TIME_CONVERSION_H

#include <chrono>

#include "tokenkeeper/event/event_loop.h"

/**
 * @file time_conversion.h
 * @brief Range-safe conversion of remote timestamps and lifetimes
 *
 * Lifetimes and epoch times arrive as JSON numbers of any magnitude. The
 * clocks count nanoseconds in 64 bits, so every conversion saturates
 * instead of overflowing.
 */

namespace tokenkeeper {
namespace event {

// Longest lifetime tracked for a token; longer lifetimes are shortened
constexpr std::chrono::hours kMaxTrackedLifetime{24 * 365};

/**
 * @brief `seconds` as a duration in [0, kMaxTrackedLifetime]
 *
 * Zero, negative and NaN inputs give zero.
 */
std::chrono::nanoseconds boundedLifetime(double seconds);

/**
 * @brief Epoch seconds as a SystemTime, saturating at the clock's range
 *
 * Values at or before the epoch (and NaN) give the epoch; values past the
 * last representable instant give SystemTime::max().
 */
SystemTime systemTimeFromEpochSeconds(double seconds);

}  // namespace event
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_EVENT_TIME_CONVERSION_H
