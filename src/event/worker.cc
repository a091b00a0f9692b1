#include <atomic>
#include <thread>

#include <pthread.h>

#include "tokenkeeper/event/event_loop.h"

#define TOKENKEEPER_LOG_COMPONENT "Event.worker"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace event {

/**
 * @brief Default implementation of Worker
 */
class WorkerImpl : public Worker {
 public:
  WorkerImpl(const std::string& name, DispatcherPtr dispatcher)
      : name_(name), dispatcher_(std::move(dispatcher)), running_(false) {}

  ~WorkerImpl() override { stop(); }

  void start() override {
    if (running_.exchange(true)) {
      return;  // Already running
    }

    thread_ = std::make_unique<std::thread>([this]() { threadRoutine(); });
  }

  void stop() override {
    if (!running_.exchange(false)) {
      return;  // Already stopped
    }

    dispatcher_->exit();

    if (thread_ && thread_->joinable()) {
      thread_->join();
    }
    thread_.reset();
  }

  bool running() const override { return running_.load(); }

  Dispatcher& dispatcher() override { return *dispatcher_; }

 private:
  void threadRoutine() {
    // Linux limits thread names to 15 characters
    pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());

    TOKENKEEPER_LOG(Debug, "worker {} started", name_);
    dispatcher_->run(RunType::RunUntilExit);
    TOKENKEEPER_LOG(Debug, "worker {} exited", name_);
  }

  std::string name_;
  DispatcherPtr dispatcher_;
  std::atomic<bool> running_;
  std::unique_ptr<std::thread> thread_;
};

WorkerPtr createWorker(const std::string& name,
                       DispatcherFactory& dispatcher_factory) {
  return std::make_unique<WorkerImpl>(
      name, dispatcher_factory.createDispatcher(name));
}

}  // namespace event
}  // namespace tokenkeeper
