#include "tokenkeeper/client/slot_executor.h"


#define TOKENKEEPER_LOG_COMPONENT "Lifecycle.executor"
#include "tokenkeeper/logging/log_macros.h"

namespace tokenkeeper {
namespace client {

WorkerSlotExecutor::WorkerSlotExecutor(
    event::DispatcherFactory& dispatcher_factory)
    : dispatcher_factory_(dispatcher_factory) {}

WorkerSlotExecutor::~WorkerSlotExecutor() { shutdown(); }

void WorkerSlotExecutor::post(const std::string& slot,
                              std::function<void()> work) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_) {
    TOKENKEEPER_LOG_DEBUG("Dropping work for slot '{}' after shutdown", slot);
    return;
  }
  auto it = workers_.find(slot);
  if (it == workers_.end()) {
    event::WorkerPtr worker =
        event::createWorker("tk-" + slot, dispatcher_factory_);
    worker->start();
    it = workers_.emplace(slot, std::move(worker)).first;
    TOKENKEEPER_LOG_DEBUG("Started worker for slot '{}'", slot);
  }
  it->second->dispatcher().post(std::move(work));
}

void WorkerSlotExecutor::shutdown() {
  std::map<std::string, event::WorkerPtr> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
    workers.swap(workers_);
  }
  // Joined outside the lock; running work may still post
  for (auto& entry : workers) {
    entry.second->stop();
  }
}

size_t WorkerSlotExecutor::workerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return workers_.size();
}

void DispatcherSlotExecutor::post(const std::string&,
                                  std::function<void()> work) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!shut_down_) {
    dispatcher_.post(std::move(work));
  }
}

void DispatcherSlotExecutor::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  shut_down_ = true;
}

}  // namespace client
}  // namespace tokenkeeper
