#ifndef TOKENKEEPER_CLIENT_SLOT_EXECUTOR_H
#define TOKENKEEPER_CLIENT_SLOT_EXECUTOR_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "tokenkeeper/event/event_loop.h"

/**
 * @file slot_executor.h
 * @brief Where background acquisitions for token slots run
 */

namespace tokenkeeper {
namespace client {

/**
 * @brief Runs background work on behalf of token slots
 *
 * Work posted for one slot runs in posting order. Work for different slots
 * may run concurrently, so a slow provider call for one slot does not delay
 * another.
 */
class SlotExecutor {
 public:
  virtual ~SlotExecutor() = default;

  virtual void post(const std::string& slot, std::function<void()> work) = 0;

  /**
   * @brief Stop accepting work and wait for running work to finish.
   * Idempotent.
   */
  virtual void shutdown() = 0;
};

/**
 * @brief One worker thread per slot, started on the slot's first post
 */
class WorkerSlotExecutor : public SlotExecutor {
 public:
  explicit WorkerSlotExecutor(event::DispatcherFactory& dispatcher_factory);
  ~WorkerSlotExecutor() override;

  void post(const std::string& slot, std::function<void()> work) override;
  void shutdown() override;

  size_t workerCount() const;

 private:
  event::DispatcherFactory& dispatcher_factory_;
  mutable std::mutex mutex_;
  std::map<std::string, event::WorkerPtr> workers_;
  bool shut_down_{false};
};

/**
 * @brief Runs all slot work on a single dispatcher
 */
class DispatcherSlotExecutor : public SlotExecutor {
 public:
  explicit DispatcherSlotExecutor(event::Dispatcher& dispatcher)
      : dispatcher_(dispatcher) {}

  void post(const std::string& slot, std::function<void()> work) override;
  void shutdown() override;

 private:
  event::Dispatcher& dispatcher_;
  std::mutex mutex_;
  bool shut_down_{false};
};

}  // namespace client
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_CLIENT_SLOT_EXECUTOR_H
