#include "conduit/event/libevent_dispatcher.h"

#include <unistd.h>

#include <mutex>
#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#include "conduit/network/dns_resolver.h"

#define CONDUIT_LOG_COMPONENT "event.libevent"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace event {

namespace {

short toLibeventEvents(uint32_t events) {
  short result = EV_PERSIST;
  if (events & static_cast<uint32_t>(FileReadyType::Read)) {
    result |= EV_READ;
  }
  if (events & static_cast<uint32_t>(FileReadyType::Write)) {
    result |= EV_WRITE;
  }
  return result;
}

uint32_t fromLibeventEvents(short events) {
  uint32_t result = 0;
  if (events & EV_READ) {
    result |= static_cast<uint32_t>(FileReadyType::Read);
  }
  if (events & EV_WRITE) {
    result |= static_cast<uint32_t>(FileReadyType::Write);
  }
  return result;
}

// Threading support must be enabled before the first event_base exists
void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();
  initializeLibevent();
}

LibeventDispatcher::~LibeventDispatcher() {
  drainPending();
  deferred_delete_timer_.reset();
  deferred_delete_list_.clear();

  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_fd_[0] >= 0) {
    ::close(wakeup_fd_[0]);
  }
  if (wakeup_fd_[1] >= 0) {
    ::close(wakeup_fd_[1]);
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

  CONDUIT_LOG_DEBUG("dispatcher {} using libevent backend {}", name_,
                    event_base_get_method(base_));

  if (::pipe(wakeup_fd_) != 0) {
    throw std::runtime_error("Failed to create wakeup pipe");
  }
  evutil_make_socket_nonblocking(wakeup_fd_[0]);
  evutil_make_socket_nonblocking(wakeup_fd_[1]);

  wakeup_event_ = event_new(base_, wakeup_fd_[0], EV_READ | EV_PERSIST,
                            &LibeventDispatcher::postWakeupCallback, this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }
  event_add(wakeup_event_, nullptr);

  deferred_delete_timer_ = std::make_unique<TimerImpl>(*this, [this]() {
    deferred_delete_scheduled_ = false;
    runDeferredDeletes();
  });
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  if (need_wakeup) {
    char byte = 1;
    ssize_t rc = ::write(wakeup_fd_[1], &byte, 1);
    (void)rc;  // EAGAIN means a wakeup is already pending
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  std::thread::id owner = thread_id_.load();
  if (owner == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == owner;
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 uint32_t events) {
  return std::make_unique<FileEventImpl>(*this, fd, std::move(cb), events);
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

network::DnsResolverSharedPtr LibeventDispatcher::createDnsResolver() {
  return network::createEvdnsResolver(base_);
}

void LibeventDispatcher::deferredDelete(DeferredDeletablePtr&& to_delete) {
  deferred_delete_list_.push_back(std::move(to_delete));
  if (!deferred_delete_scheduled_) {
    deferred_delete_timer_->enableTimer(std::chrono::milliseconds(0));
    deferred_delete_scheduled_ = true;
  }
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  if (isThreadSafe()) {
    event_base_loopbreak(base_);
  } else {
    // run() may not have started yet and would reset the flag
    post([this]() {
      exit_requested_ = true;
      event_base_loopbreak(base_);
    });
  }
}

void LibeventDispatcher::run(RunType type) {
  exit_requested_ = false;
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();

  switch (type) {
    case RunType::Block:
      event_base_loop(base_, 0);
      break;
    case RunType::NonBlock:
      event_base_loop(base_, EVLOOP_NONBLOCK);
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        event_base_loop(base_, EVLOOP_ONCE);
        runPostCallbacks();
      }
      return;
  }

  runPostCallbacks();
}

void LibeventDispatcher::drainPending() {
  if (isThreadSafe() || thread_id_.load() == std::thread::id()) {
    runDeferredDeletes();
    std::lock_guard<std::mutex> lock(post_mutex_);
    std::queue<PostCb> empty;
    post_callbacks_.swap(empty);
  }
}

void LibeventDispatcher::postWakeupCallback(int fd, short, void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  char buffer[256];
  while (::read(fd, buffer, sizeof(buffer)) > 0) {
  }

  dispatcher->runPostCallbacks();
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

void LibeventDispatcher::runDeferredDeletes() {
  // Deleting may enqueue more deferred deletes
  while (!deferred_delete_list_.empty()) {
    std::vector<DeferredDeletablePtr> to_delete;
    to_delete.swap(deferred_delete_list_);
  }
}

// FileEventImpl

LibeventDispatcher::FileEventImpl::FileEventImpl(LibeventDispatcher& dispatcher,
                                                 int fd,
                                                 FileReadyCb cb,
                                                 uint32_t events)
    : dispatcher_(dispatcher),
      fd_(fd),
      cb_(std::move(cb)),
      event_(event_new(dispatcher.base_, fd, 0, &FileEventImpl::eventCallback,
                       this)) {
  if (!event_) {
    throw std::runtime_error("Failed to create file event");
  }
  setEnabled(events);
}

LibeventDispatcher::FileEventImpl::~FileEventImpl() {
  if (event_) {
    if (event_added_) {
      event_del(event_);
    }
    event_free(event_);
  }
}

void LibeventDispatcher::FileEventImpl::setEnabled(uint32_t events) {
  if (enabled_events_ == events && event_added_) {
    return;
  }
  enabled_events_ = events;

  if (event_added_) {
    event_del(event_);
    event_added_ = false;
  }
  if (events != 0) {
    event_assign(event_, dispatcher_.base_, fd_,
                 toLibeventEvents(events),
                 &FileEventImpl::eventCallback, this);
    event_add(event_, nullptr);
    event_added_ = true;
  }
}

void LibeventDispatcher::FileEventImpl::eventCallback(int, short events,
                                                      void* arg) {
  auto* file_event = static_cast<FileEventImpl*>(arg);

  uint32_t ready_events = fromLibeventEvents(events);
  if (ready_events != 0) {
    file_event->cb_(ready_events);
  }
}

// TimerImpl

LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : dispatcher_(dispatcher),
      cb_(std::move(cb)),
      event_(evtimer_new(dispatcher.base_, &TimerImpl::timerCallback, this)) {
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
  if (enabled_) {
    event_del(event_);
    enabled_ = false;
  }
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  struct timeval tv;
  tv.tv_sec = duration.count() / 1000;
  tv.tv_usec = (duration.count() % 1000) * 1000;
  event_add(event_, &tv);
  enabled_ = true;
}

void LibeventDispatcher::TimerImpl::timerCallback(int, short, void* arg) {
  auto* timer = static_cast<TimerImpl*>(arg);
  timer->enabled_ = false;
  timer->cb_();
}

// LibeventDispatcherFactory

DispatcherPtr LibeventDispatcherFactory::createDispatcher(
    const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace conduit
