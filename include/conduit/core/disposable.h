#ifndef CONDUIT_CORE_DISPOSABLE_H
#define CONDUIT_CORE_DISPOSABLE_H

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace conduit {

/**
 * Handle to a subscription or any other cancellable activity.
 * dispose() is idempotent.
 */
class Disposable {
 public:
  virtual ~Disposable() = default;

  virtual void dispose() = 0;
  virtual bool isDisposed() const = 0;
};

using DisposablePtr = std::shared_ptr<Disposable>;

// Runs an action the first time it is disposed
class ActionDisposable : public Disposable {
 public:
  explicit ActionDisposable(std::function<void()> action)
      : action_(std::move(action)) {}

  void dispose() override {
    if (disposed_.exchange(true)) {
      return;
    }
    std::function<void()> action;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      action.swap(action_);
    }
    if (action) {
      action();
    }
  }

  bool isDisposed() const override { return disposed_.load(); }

 private:
  std::atomic<bool> disposed_{false};
  std::mutex mutex_;
  std::function<void()> action_;
};

// Holds the current inner disposable of a chain. Replacing the inner after
// dispose() disposes the replacement immediately.
class SerialDisposable : public Disposable {
 public:
  void replace(DisposablePtr next) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!disposed_) {
        current_.swap(next);
        return;
      }
    }
    if (next) {
      next->dispose();
    }
  }

  void dispose() override {
    DisposablePtr current;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (disposed_) {
        return;
      }
      disposed_ = true;
      current.swap(current_);
    }
    if (current) {
      current->dispose();
    }
  }

  bool isDisposed() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
  }

 private:
  mutable std::mutex mutex_;
  bool disposed_{false};
  DisposablePtr current_;
};

inline DisposablePtr makeDisposable(std::function<void()> action) {
  return std::make_shared<ActionDisposable>(std::move(action));
}

}  // namespace conduit

#endif  // CONDUIT_CORE_DISPOSABLE_H
