#ifndef CONDUIT_HTTP_BODY_STREAM_H
#define CONDUIT_HTTP_BODY_STREAM_H

#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <string>

#include "conduit/core/compat.h"
#include "conduit/core/result.h"
#include "conduit/core/single.h"

namespace conduit {
namespace event {
class Dispatcher;
}

namespace http {

class BodyStream;
using BodyStreamSharedPtr = std::shared_ptr<BodyStream>;

/**
 * Demand handle given to the single subscriber of a BodyStream.
 * May be used from any thread.
 */
class BodySubscription {
 public:
  static constexpr uint64_t kUnbounded = std::numeric_limits<uint64_t>::max();

  explicit BodySubscription(std::weak_ptr<BodyStream> stream)
      : stream_(std::move(stream)) {}

  // Allow n more chunks to be delivered
  void request(uint64_t n);

  // Stop delivery. Buffered chunks are dropped and the response is released.
  void cancel();

 private:
  std::weak_ptr<BodyStream> stream_;
};

using BodySubscriptionPtr = std::shared_ptr<BodySubscription>;

/**
 * Backpressured stream of response body chunks with at most one
 * subscriber.
 *
 * The producer side (push, complete, fail) runs on the channel's
 * dispatcher. Chunks are buffered until the subscriber requests them;
 * while nothing is requested and the buffer grows past the high
 * watermark, reading from the channel is paused through the read control
 * callback, and resumed once the buffer drains below half of it.
 */
class BodyStream : public std::enable_shared_from_this<BodyStream> {
 public:
  using OnNext = std::function<void(std::string chunk)>;
  // nullopt on a complete body
  using OnDone = std::function<void(const optional<Error>& error)>;
  using ReadControl = std::function<void(bool disable)>;
  using CancelCb = std::function<void()>;

  BodyStream(event::Dispatcher& dispatcher, size_t high_watermark);

  void setReadControl(ReadControl control) { read_control_ = std::move(control); }
  void setCancelCallback(CancelCb cb) { cancel_cb_ = std::move(cb); }

  // Producer side
  void push(std::string chunk);
  void complete();
  void fail(const Error& error);

  /**
   * Subscribe to the body. Nothing is delivered before request().
   * A second subscriber is rejected through its OnDone with NotActive.
   */
  BodySubscriptionPtr subscribe(OnNext on_next, OnDone on_done);

  // Whole body as one string; requests everything
  Single<std::string> aggregate();

  bool isTerminated() const { return done_; }
  size_t bufferedBytes() const { return buffered_bytes_; }
  bool readsPaused() const { return reads_paused_; }

 private:
  friend class BodySubscription;

  void runInDispatcher(std::function<void()> fn);
  void doSubscribe(OnNext on_next, OnDone on_done);
  void doRequest(uint64_t n);
  void doCancel();
  void drain();
  void updateReadState();

  event::Dispatcher& dispatcher_;
  const size_t high_watermark_;
  ReadControl read_control_;
  CancelCb cancel_cb_;

  std::deque<std::string> buffered_;
  size_t buffered_bytes_{0};
  uint64_t demand_{0};

  OnNext on_next_;
  OnDone on_done_;
  bool subscribed_{false};
  bool cancelled_{false};
  bool done_{false};
  bool delivered_done_{false};
  optional<Error> error_;
  bool draining_{false};
  bool reads_paused_{false};
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_BODY_STREAM_H
