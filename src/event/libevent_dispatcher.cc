#include "tokenkeeper/event/libevent_dispatcher.h"

#include <mutex>
#include <stdexcept>

#include <unistd.h>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#define TOKENKEEPER_LOG_COMPONENT "Event.dispatcher"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace event {

namespace {

// Threading support must be enabled once, before the first event_base
void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

}  // namespace

MonotonicTime RealTimeSource::monotonicTime() const {
  return std::chrono::steady_clock::now();
}

SystemTime RealTimeSource::systemTime() const {
  return std::chrono::system_clock::now();
}

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();
  initializeLibevent();
}

LibeventDispatcher::~LibeventDispatcher() {
  // Pending callbacks may own timers; release them while the base is alive
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    std::queue<PostCb> empty;
    post_callbacks_.swap(empty);
  }

  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_fd_[0] >= 0) {
    close(wakeup_fd_[0]);
  }
  if (wakeup_fd_[1] >= 0) {
    close(wakeup_fd_[1]);
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  struct event_config* config = event_config_new();
  if (config) {
    event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
    base_ = event_base_new_with_config(config);
    event_config_free(config);
  } else {
    base_ = event_base_new();
  }

  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  const char* method = event_base_get_method(base_);
  TOKENKEEPER_LOG(Debug, "dispatcher {} using backend {}", name_,
                  method ? method : "unknown");

  if (pipe(wakeup_fd_) != 0) {
    throw std::runtime_error("Failed to create wakeup pipe");
  }

  evutil_make_socket_nonblocking(wakeup_fd_[0]);
  evutil_make_socket_nonblocking(wakeup_fd_[1]);

  wakeup_event_ =
      event_new(base_, wakeup_fd_[0], EV_READ | EV_PERSIST,
                reinterpret_cast<event_callback_fn>(
                    &LibeventDispatcher::postWakeupCallback),
                this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }

  event_add(wakeup_event_, nullptr);
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  // Also from the dispatcher thread: the loop may be about to block
  if (need_wakeup) {
    char byte = 1;
    ssize_t rc = write(wakeup_fd_[1], &byte, 1);
    (void)rc;  // EAGAIN means a wakeup is already pending
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  // Not running yet: callers need synchronization
  std::thread::id running_on = thread_id_.load();
  if (running_on == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == running_on;
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  event_base_loopbreak(base_);
  // A loop entered after the break was issued still sees the pipe
  post([]() {});
}

void LibeventDispatcher::run(RunType type) {
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();

  int flags = 0;
  switch (type) {
    case RunType::Block:
      break;
    case RunType::NonBlock:
      flags = EVLOOP_NONBLOCK;
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        event_base_loop(base_, EVLOOP_ONCE);
        runPostCallbacks();
      }
      // Cleared only here so an exit() issued before run() still applies
      exit_requested_ = false;
      thread_id_ = std::thread::id();
      return;
  }

  event_base_loop(base_, flags);
  runPostCallbacks();
  if (type == RunType::Block) {
    exit_requested_ = false;
  }
  thread_id_ = std::thread::id();
}

void LibeventDispatcher::postWakeupCallback(int fd,
                                            short /*events*/,
                                            void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
    // Drain
  }

  dispatcher->runPostCallbacks();
  if (dispatcher->exit_requested_) {
    event_base_loopbreak(dispatcher->base_);
  }
}

void LibeventDispatcher::runPostCallbacks() {
  std::queue<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }

  while (!callbacks.empty()) {
    callbacks.front()();
    callbacks.pop();
  }
}

LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : dispatcher_(dispatcher), cb_(std::move(cb)), enabled_(false) {
  event_ = evtimer_new(
      dispatcher_.base(),
      reinterpret_cast<event_callback_fn>(&TimerImpl::timerCallback), this);
  if (!event_) {
    throw std::runtime_error("Failed to create timer");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  if (enabled_ && event_) {
    event_del(event_);
    enabled_ = false;
  }
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  if (duration.count() < 0) {
    duration = std::chrono::milliseconds(0);
  }

  struct timeval tv;
  tv.tv_sec = duration.count() / 1000;
  tv.tv_usec = (duration.count() % 1000) * 1000;

  event_add(event_, &tv);
  enabled_ = true;
}

bool LibeventDispatcher::TimerImpl::enabled() { return enabled_; }

void LibeventDispatcher::TimerImpl::timerCallback(int /*fd*/,
                                                  short /*events*/,
                                                  void* arg) {
  auto* timer = static_cast<TimerImpl*>(arg);
  timer->enabled_ = false;
  timer->cb_();
}

const std::string LibeventDispatcherFactory::backend_name_ = "libevent";

DispatcherPtr LibeventDispatcherFactory::createDispatcher(
    const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

const std::string& LibeventDispatcherFactory::backendName() const {
  return backend_name_;
}

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace tokenkeeper
