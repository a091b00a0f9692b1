#ifndef TOKENKEEPER_EVENT_LIBEVENT_DISPATCHER_H
#define TOKENKEEPER_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <thread>

#include "tokenkeeper/event/event_loop.h"

// Forward declarations for libevent types
struct event_base;
struct event;

namespace tokenkeeper {
namespace event {

using libevent_event = struct event;

/**
 * @brief Libevent-based implementation of the Dispatcher interface
 *
 * Cross-thread posts wake the loop through a non-blocking pipe.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  const std::string& name() override { return name_; }
  void post(PostCb callback) override;
  bool isThreadSafe() const override;
  TimerPtr createTimer(TimerCb cb) override;
  void exit() override;
  void run(RunType type) override;
  const TimeSource& timeSource() const override { return time_source_; }

  event_base* base() { return base_; }

 private:
  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;
    bool enabled() override;

   private:
    static void timerCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    TimerCb cb_;
    libevent_event* event_{nullptr};
    bool enabled_;
  };

  void initializeLibevent();
  static void postWakeupCallback(int fd, short events, void* arg);
  void runPostCallbacks();

  std::string name_;
  event_base* base_{nullptr};
  RealTimeSource time_source_;

  // Wakeup pipe for cross-thread posts
  int wakeup_fd_[2]{-1, -1};
  libevent_event* wakeup_event_{nullptr};

  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;

  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};
};

class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override;
  const std::string& backendName() const override;

 private:
  static const std::string backend_name_;
};

}  // namespace event
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_EVENT_LIBEVENT_DISPATCHER_H
