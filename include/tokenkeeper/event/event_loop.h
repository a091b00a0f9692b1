#ifndef TOKENKEEPER_EVENT_EVENT_LOOP_H
#define TOKENKEEPER_EVENT_EVENT_LOOP_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace tokenkeeper {
namespace event {

class Dispatcher;
class Timer;

using TimerCb = std::function<void()>;
using PostCb = std::function<void()>;

using TimerPtr = std::unique_ptr<Timer>;
using DispatcherPtr = std::unique_ptr<Dispatcher>;

using MonotonicTime = std::chrono::steady_clock::time_point;
using SystemTime = std::chrono::system_clock::time_point;

/**
 * @brief Run modes for the event loop
 */
enum class RunType {
  Block,        // Run until there are no more pending events
  NonBlock,     // Process ready events and return
  RunUntilExit  // Run until exit() is called
};

/**
 * @brief Source of both clocks used by the library
 *
 * Token lifetimes are tracked on the monotonic clock. The system clock is
 * only consulted to translate absolute epoch timestamps (JWT exp, token-info
 * exp) into monotonic deadlines.
 */
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual MonotonicTime monotonicTime() const = 0;
  virtual SystemTime systemTime() const = 0;
};

/**
 * @brief TimeSource backed by std::chrono clocks
 */
class RealTimeSource : public TimeSource {
 public:
  MonotonicTime monotonicTime() const override;
  SystemTime systemTime() const override;
};

/**
 * @brief One-shot timer owned by the code that created it
 *
 * Timers must be enabled and disabled on the dispatcher thread. Destroying a
 * timer cancels it.
 */
class Timer {
 public:
  virtual ~Timer() = default;

  /**
   * Disable a pending timeout without destroying the timer.
   */
  virtual void disableTimer() = 0;

  /**
   * Enable a pending timeout. If already enabled, the timeout is rescheduled.
   */
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;

  /**
   * Return whether the timer is currently armed.
   */
  virtual bool enabled() = 0;
};

/**
 * @brief Event dispatcher interface
 *
 * Callbacks posted from any thread run on the dispatcher thread in FIFO
 * order. Timer callbacks also run on the dispatcher thread.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  /**
   * Post a callback to run on the dispatcher thread. Thread-safe.
   */
  virtual void post(PostCb callback) = 0;

  /**
   * Return whether the caller is on the dispatcher thread.
   */
  virtual bool isThreadSafe() const = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  /**
   * Exit the event loop. Safe to call from any thread.
   */
  virtual void exit() = 0;

  virtual void run(RunType type) = 0;

  /**
   * Clock the dispatcher's timers are measured against.
   */
  virtual const TimeSource& timeSource() const = 0;
};

/**
 * @brief Factory for creating dispatchers
 */
class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;

  virtual const std::string& backendName() const = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

DispatcherFactoryPtr createLibeventDispatcherFactory();

/**
 * @brief A thread running one dispatcher until stopped
 */
class Worker {
 public:
  virtual ~Worker() = default;

  virtual void start() = 0;

  /**
   * Ask the dispatcher to exit and join the thread.
   */
  virtual void stop() = 0;

  virtual bool running() const = 0;

  virtual Dispatcher& dispatcher() = 0;
};

using WorkerPtr = std::unique_ptr<Worker>;

WorkerPtr createWorker(const std::string& name,
                       DispatcherFactory& dispatcher_factory);

}  // namespace event
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_EVENT_EVENT_LOOP_H
