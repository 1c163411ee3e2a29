#ifndef CONDUIT_EVENT_LIBEVENT_DISPATCHER_H
#define CONDUIT_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <vector>

#include "conduit/event/event_loop.h"

struct event_base;
struct event;

namespace conduit {
namespace event {

using libevent_event = struct event;

/**
 * Dispatcher on a libevent event_base.
 *
 * Posted callbacks are queued under a mutex and the loop is woken through a
 * self-pipe. Threading support (evthread_use_pthreads) is enabled once per
 * process before the first base is created.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  const std::string& name() override { return name_; }
  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  FileEventPtr createFileEvent(int fd,
                               FileReadyCb cb,
                               uint32_t events) override;
  TimerPtr createTimer(TimerCb cb) override;
  network::DnsResolverSharedPtr createDnsResolver() override;
  void deferredDelete(DeferredDeletablePtr&& to_delete) override;
  void exit() override;
  void run(RunType type) override;

 private:
  class FileEventImpl : public FileEvent {
   public:
    FileEventImpl(LibeventDispatcher& dispatcher,
                  int fd,
                  FileReadyCb cb,
                  uint32_t events);
    ~FileEventImpl() override;

    void setEnabled(uint32_t events) override;

   private:
    static void eventCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    int fd_;
    FileReadyCb cb_;
    libevent_event* event_;
    uint32_t enabled_events_{0};
    bool event_added_{false};
  };

  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;

   private:
    static void timerCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    TimerCb cb_;
    libevent_event* event_;
    bool enabled_{false};
  };

  void runPostCallbacks();
  void runDeferredDeletes();
  void initializeLibevent();
  // Drops pending posts and deletes; only safe off-loop or on the loop thread
  void drainPending();

  static void postWakeupCallback(int fd, short events, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};

  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;
  int wakeup_fd_[2]{-1, -1};
  libevent_event* wakeup_event_{nullptr};

  std::vector<DeferredDeletablePtr> deferred_delete_list_;
  // Zero-delay timer that empties deferred_delete_list_
  std::unique_ptr<TimerImpl> deferred_delete_timer_;
  bool deferred_delete_scheduled_{false};
};

class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override;
};

}  // namespace event
}  // namespace conduit

#endif  // CONDUIT_EVENT_LIBEVENT_DISPATCHER_H
