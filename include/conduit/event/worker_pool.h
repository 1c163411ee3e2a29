#ifndef CONDUIT_EVENT_WORKER_POOL_H
#define CONDUIT_EVENT_WORKER_POOL_H

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "conduit/event/event_loop.h"

namespace conduit {
namespace event {

/**
 * @brief A thread running one dispatcher until stopped.
 */
class Worker {
 public:
  Worker(const std::string& name, DispatcherFactory& factory);
  ~Worker();

  void start();
  void stop();

  Dispatcher& dispatcher() { return *dispatcher_; }
  bool running() const { return running_; }

 private:
  DispatcherPtr dispatcher_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

/**
 * @brief Fixed set of workers handed out round-robin.
 *
 * Each connection is pinned to the worker it was assigned when created.
 */
class WorkerPool {
 public:
  WorkerPool(size_t num_workers, DispatcherFactory& factory);
  ~WorkerPool();

  void start();
  void stop();

  Dispatcher& nextDispatcher();
  Worker& getWorker(size_t index) { return *workers_.at(index); }
  size_t size() const { return workers_.size(); }

 private:
  std::vector<std::unique_ptr<Worker>> workers_;
  std::atomic<size_t> next_{0};
};

}  // namespace event
}  // namespace conduit

#endif  // CONDUIT_EVENT_WORKER_POOL_H
