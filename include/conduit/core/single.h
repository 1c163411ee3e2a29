#ifndef CONDUIT_CORE_SINGLE_H
#define CONDUIT_CORE_SINGLE_H

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "conduit/core/completion_sink.h"
#include "conduit/core/disposable.h"
#include "conduit/core/result.h"

namespace conduit {

/**
 * @brief Lazy, subscribe-driven producer of exactly one Result<T>.
 *
 * Nothing happens until subscribe(). Each subscription runs the source
 * again with a fresh CompletionSink, so a Single can be retried by simply
 * subscribing once more. Disposing the returned handle cancels the sink.
 */
template <typename T>
class Single {
 public:
  using value_type = T;
  using Subscriber = std::function<void(Result<T>)>;
  using Source = std::function<void(const CompletionSinkPtr<T>&)>;

  explicit Single(Source source) : source_(std::move(source)) {}

  static Single<T> just(T value) {
    return Single<T>([value](const CompletionSinkPtr<T>& sink) {
      sink->success(value);
    });
  }

  static Single<T> error(const Error& err) {
    return Single<T>(
        [err](const CompletionSinkPtr<T>& sink) { sink->error(err); });
  }

  static Single<T> defer(std::function<Single<T>()> factory) {
    return Single<T>([factory](const CompletionSinkPtr<T>& sink) {
      factory().subscribeSink(sink);
    });
  }

  DisposablePtr subscribe(Subscriber subscriber) const {
    auto sink = std::make_shared<CompletionSink<T>>(std::move(subscriber));
    std::weak_ptr<CompletionSink<T>> weak_sink = sink;
    auto handle = makeDisposable([weak_sink]() {
      if (auto s = weak_sink.lock()) {
        s->cancel();
      }
    });
    source_(sink);
    return handle;
  }

  // Runs the source against an existing sink
  void subscribeSink(const CompletionSinkPtr<T>& sink) const { source_(sink); }

  template <typename F, typename U = std::invoke_result_t<F, T>>
  Single<U> map(F fn) const {
    Source source = source_;
    return Single<U>([source, fn](const CompletionSinkPtr<U>& downstream) {
      auto upstream = std::make_shared<CompletionSink<T>>(
          [downstream, fn](Result<T> result) {
            if (auto* err = get_error(result)) {
              downstream->error(*err);
              return;
            }
            downstream->success(fn(std::move(get<T>(result))));
          });
      std::weak_ptr<CompletionSink<T>> weak_upstream = upstream;
      downstream->onCancel([weak_upstream]() {
        if (auto up = weak_upstream.lock()) {
          up->cancel();
        }
      });
      source(upstream);
    });
  }

  // Continues with the Single produced by fn once this one succeeds
  template <typename F, typename S = std::invoke_result_t<F, T>>
  S flatMap(F fn) const {
    using U = typename S::value_type;
    Source source = source_;
    return S([source, fn](const CompletionSinkPtr<U>& downstream) {
      auto serial = std::make_shared<SerialDisposable>();
      downstream->onCancel([serial]() { serial->dispose(); });
      auto upstream = std::make_shared<CompletionSink<T>>(
          [downstream, fn, serial](Result<T> result) {
            if (auto* err = get_error(result)) {
              downstream->error(*err);
              return;
            }
            S next = fn(std::move(get<T>(result)));
            serial->replace(next.subscribe(
                [downstream](Result<U> r) { downstream->complete(std::move(r)); }));
          });
      std::weak_ptr<CompletionSink<T>> weak_upstream = upstream;
      serial->replace(makeDisposable([weak_upstream]() {
        if (auto up = weak_upstream.lock()) {
          up->cancel();
        }
      }));
      source(upstream);
    });
  }

  /**
   * Resubscribes to the source whenever it fails with an error accepted by
   * should_retry. Attempts are strictly sequential: the next subscription
   * starts from inside the terminal callback of the previous one, and is
   * registered for cancellation before its source runs.
   */
  Single<T> retryWhen(std::function<bool(const Error&)> should_retry) const {
    Source source = source_;
    return Single<T>([source, should_retry](const CompletionSinkPtr<T>& sink) {
      auto serial = std::make_shared<SerialDisposable>();
      sink->onCancel([serial]() { serial->dispose(); });

      auto attempt = std::make_shared<std::function<void()>>();
      std::weak_ptr<std::function<void()>> weak_attempt = attempt;
      *attempt = [source, should_retry, sink, serial, weak_attempt]() {
        auto self = weak_attempt.lock();
        auto upstream = std::make_shared<CompletionSink<T>>(
            [self, should_retry, sink](Result<T> result) {
              auto* err = get_error(result);
              if (err && !sink->isTerminated() && should_retry(*err)) {
                (*self)();
                return;
              }
              sink->complete(std::move(result));
            });
        std::weak_ptr<CompletionSink<T>> weak_upstream = upstream;
        serial->replace(makeDisposable([weak_upstream]() {
          if (auto up = weak_upstream.lock()) {
            up->cancel();
          }
        }));
        if (serial->isDisposed()) {
          return;
        }
        source(upstream);
      };
      (*attempt)();
    });
  }

  // Observes the terminal result without altering it
  Single<T> doOnResult(std::function<void(const Result<T>&)> observer) const {
    Source source = source_;
    return Single<T>([source, observer](const CompletionSinkPtr<T>& downstream) {
      auto upstream = std::make_shared<CompletionSink<T>>(
          [downstream, observer](Result<T> result) {
            observer(result);
            downstream->complete(std::move(result));
          });
      std::weak_ptr<CompletionSink<T>> weak_upstream = upstream;
      downstream->onCancel([weak_upstream]() {
        if (auto up = weak_upstream.lock()) {
          up->cancel();
        }
      });
      source(upstream);
    });
  }

 private:
  Source source_;
};

using Completion = Single<std::nullptr_t>;

}  // namespace conduit

#endif  // CONDUIT_CORE_SINGLE_H
