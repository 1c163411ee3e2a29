#include "conduit/event/worker_pool.h"

#include <stdexcept>

#define CONDUIT_LOG_COMPONENT "event.worker"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace event {

Worker::Worker(const std::string& name, DispatcherFactory& factory)
    : dispatcher_(factory.createDispatcher(name)) {}

Worker::~Worker() { stop(); }

void Worker::start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread([this]() {
    CONDUIT_LOG_DEBUG("worker {} started", dispatcher_->name());
    dispatcher_->run(RunType::RunUntilExit);
    CONDUIT_LOG_DEBUG("worker {} exited", dispatcher_->name());
  });
}

void Worker::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  dispatcher_->exit();
  if (thread_.joinable()) {
    thread_.join();
  }
}

WorkerPool::WorkerPool(size_t num_workers, DispatcherFactory& factory) {
  if (num_workers == 0) {
    throw std::invalid_argument("worker pool needs at least one worker");
  }
  workers_.reserve(num_workers);
  for (size_t i = 0; i < num_workers; ++i) {
    workers_.push_back(
        std::make_unique<Worker>("worker_" + std::to_string(i), factory));
  }
}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
  for (auto& worker : workers_) {
    worker->start();
  }
}

void WorkerPool::stop() {
  for (auto& worker : workers_) {
    worker->stop();
  }
}

Dispatcher& WorkerPool::nextDispatcher() {
  size_t index = next_.fetch_add(1) % workers_.size();
  return workers_[index]->dispatcher();
}

}  // namespace event
}  // namespace conduit
