#ifndef CONDUIT_CORE_COMPLETION_SINK_H
#define CONDUIT_CORE_COMPLETION_SINK_H

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "conduit/core/result.h"

namespace conduit {

/**
 * @brief Single-fire terminal signal.
 *
 * A sink ends in exactly one of three states: completed with a value,
 * completed with an error, or cancelled. The subscriber callback is moved
 * out of the sink by the winning transition and invoked once; every later
 * attempt returns false and delivers nothing.
 *
 * Cancellation never reaches the subscriber. It runs the hooks registered
 * with onCancel() instead, which is how producers release the resources
 * behind a pending result.
 */
template <typename T>
class CompletionSink {
 public:
  using Callback = std::function<void(Result<T>)>;

  explicit CompletionSink(Callback callback) : callback_(std::move(callback)) {}

  CompletionSink(const CompletionSink&) = delete;
  CompletionSink& operator=(const CompletionSink&) = delete;

  bool success(T value) { return complete(Result<T>(std::move(value))); }

  bool error(const Error& error) { return complete(Result<T>(error)); }

  bool complete(Result<T> result) {
    if (!transition(State::Completed)) {
      return false;
    }
    Callback callback;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      callback.swap(callback_);
      cancel_hooks_.clear();
    }
    if (callback) {
      callback(std::move(result));
    }
    return true;
  }

  // Terminates silently. Returns false if a result was already delivered.
  bool cancel() {
    if (!transition(State::Cancelled)) {
      return false;
    }
    std::vector<std::function<void()>> hooks;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Callback dropped;
      dropped.swap(callback_);
      hooks.swap(cancel_hooks_);
    }
    for (auto& hook : hooks) {
      hook();
    }
    return true;
  }

  // Registers a hook run on cancel(). Runs immediately if already cancelled.
  void onCancel(std::function<void()> hook) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      State state = state_.load();
      if (state == State::Pending) {
        cancel_hooks_.push_back(std::move(hook));
        return;
      }
      if (state == State::Completed) {
        return;
      }
    }
    hook();
  }

  bool isTerminated() const { return state_.load() != State::Pending; }
  bool isCompleted() const { return state_.load() == State::Completed; }
  bool isCancelled() const { return state_.load() == State::Cancelled; }

 private:
  enum class State : uint8_t { Pending, Completed, Cancelled };

  bool transition(State next) {
    State expected = State::Pending;
    return state_.compare_exchange_strong(expected, next);
  }

  std::atomic<State> state_{State::Pending};
  std::mutex mutex_;
  Callback callback_;
  std::vector<std::function<void()>> cancel_hooks_;
};

template <typename T>
using CompletionSinkPtr = std::shared_ptr<CompletionSink<T>>;

}  // namespace conduit

#endif  // CONDUIT_CORE_COMPLETION_SINK_H
