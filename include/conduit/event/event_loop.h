#ifndef CONDUIT_EVENT_EVENT_LOOP_H
#define CONDUIT_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace conduit {
namespace network {
class DnsResolver;
using DnsResolverSharedPtr = std::shared_ptr<DnsResolver>;
}  // namespace network

namespace event {

class Dispatcher;
class FileEvent;
class Timer;
class DeferredDeletable;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;
using DeferredDeletablePtr = std::unique_ptr<DeferredDeletable>;

using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;

// Readiness bits reported to FileReadyCb
enum class FileReadyType : uint32_t { Read = 0x01, Write = 0x02 };

enum class RunType {
  // Until no events remain registered
  Block,
  // A single pass over whatever is ready now
  NonBlock,
  // Until exit()
  RunUntilExit
};

// Destroyed on a later loop iteration. Channels close from inside their own
// callbacks and cannot be freed in place.
class DeferredDeletable {
 public:
  virtual ~DeferredDeletable() = default;
};

// Level-triggered readiness notifications for one descriptor
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  // Replace the set of monitored event types
  virtual void setEnabled(uint32_t events) = 0;
};

// One-shot timer; enableTimer() on an armed timer re-arms it
class Timer {
 public:
  virtual ~Timer() = default;

  virtual void disableTimer() = 0;
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;
};

/**
 * @brief Single-threaded event loop.
 *
 * Every channel is driven by exactly one dispatcher and its state is only
 * touched from that dispatcher's thread. post() is the one entry point that
 * may be called from anywhere; the thread that last entered run() becomes
 * the dispatcher thread.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  // Queue a callback for the dispatcher thread; callable from any thread
  virtual void post(PostCb callback) = 0;

  // True on the dispatcher thread
  virtual bool isThreadSafe() const = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       uint32_t events) = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  /**
   * Asynchronous resolver bound to this dispatcher's loop.
   */
  virtual network::DnsResolverSharedPtr createDnsResolver() = 0;

  /**
   * Submit an item for deletion in a later loop iteration.
   */
  virtual void deferredDelete(DeferredDeletablePtr&& to_delete) = 0;

  virtual void exit() = 0;

  virtual void run(RunType type) = 0;
};

class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

DispatcherFactoryPtr createLibeventDispatcherFactory();

}  // namespace event
}  // namespace conduit

#endif  // CONDUIT_EVENT_EVENT_LOOP_H
