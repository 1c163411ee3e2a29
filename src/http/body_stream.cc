#include "conduit/http/body_stream.h"

#include "conduit/event/event_loop.h"
#include "conduit/http/client_errors.h"

#define CONDUIT_LOG_COMPONENT "http.body"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace http {

void BodySubscription::request(uint64_t n) {
  if (auto stream = stream_.lock()) {
    std::weak_ptr<BodyStream> weak = stream;
    stream->runInDispatcher([weak, n]() {
      if (auto s = weak.lock()) {
        s->doRequest(n);
      }
    });
  }
}

void BodySubscription::cancel() {
  if (auto stream = stream_.lock()) {
    std::weak_ptr<BodyStream> weak = stream;
    stream->runInDispatcher([weak]() {
      if (auto s = weak.lock()) {
        s->doCancel();
      }
    });
  }
}

BodyStream::BodyStream(event::Dispatcher& dispatcher, size_t high_watermark)
    : dispatcher_(dispatcher), high_watermark_(high_watermark) {}

void BodyStream::runInDispatcher(std::function<void()> fn) {
  if (dispatcher_.isThreadSafe()) {
    fn();
    return;
  }
  auto self = shared_from_this();
  dispatcher_.post([self, fn]() { fn(); });
}

void BodyStream::push(std::string chunk) {
  if (done_ || cancelled_) {
    return;
  }
  if (chunk.empty()) {
    return;
  }
  buffered_bytes_ += chunk.size();
  buffered_.push_back(std::move(chunk));
  drain();
  updateReadState();
}

void BodyStream::complete() {
  if (done_) {
    return;
  }
  done_ = true;
  drain();
}

void BodyStream::fail(const Error& error) {
  if (done_) {
    return;
  }
  done_ = true;
  error_ = error;
  // A failed body does not deliver what is still buffered
  buffered_.clear();
  buffered_bytes_ = 0;
  drain();
}

BodySubscriptionPtr BodyStream::subscribe(OnNext on_next, OnDone on_done) {
  auto self = shared_from_this();
  runInDispatcher([self, on_next, on_done]() {
    self->doSubscribe(on_next, on_done);
  });
  return std::make_shared<BodySubscription>(self);
}

void BodyStream::doSubscribe(OnNext on_next, OnDone on_done) {
  if (subscribed_) {
    if (on_done) {
      on_done(clientError(ClientErrorCode::NotActive,
                          "Only one body subscriber is allowed"));
    }
    return;
  }
  subscribed_ = true;
  on_next_ = std::move(on_next);
  on_done_ = std::move(on_done);
  drain();
}

void BodyStream::doRequest(uint64_t n) {
  if (n == 0 || cancelled_) {
    return;
  }
  if (n == BodySubscription::kUnbounded ||
      demand_ > BodySubscription::kUnbounded - n) {
    demand_ = BodySubscription::kUnbounded;
  } else {
    demand_ += n;
  }
  drain();
  updateReadState();
}

void BodyStream::doCancel() {
  if (cancelled_ || delivered_done_) {
    return;
  }
  cancelled_ = true;
  buffered_.clear();
  buffered_bytes_ = 0;
  on_next_ = nullptr;
  on_done_ = nullptr;
  CancelCb cb;
  cb.swap(cancel_cb_);
  if (cb) {
    cb();
  }
}

void BodyStream::drain() {
  if (!subscribed_ || cancelled_ || draining_) {
    return;
  }
  // on_next may request more; the loop picks that up
  draining_ = true;
  while (demand_ > 0 && !buffered_.empty() && !cancelled_) {
    std::string chunk = std::move(buffered_.front());
    buffered_.pop_front();
    buffered_bytes_ -= chunk.size();
    if (demand_ != BodySubscription::kUnbounded) {
      --demand_;
    }
    if (on_next_) {
      on_next_(std::move(chunk));
    }
  }
  draining_ = false;

  if (done_ && buffered_.empty() && !delivered_done_ && !cancelled_) {
    delivered_done_ = true;
    OnDone on_done;
    on_done.swap(on_done_);
    on_next_ = nullptr;
    if (on_done) {
      on_done(error_);
    }
  }
}

void BodyStream::updateReadState() {
  if (!read_control_) {
    return;
  }
  if (!reads_paused_ && demand_ == 0 && buffered_bytes_ > high_watermark_) {
    CONDUIT_LOG_DEBUG("{} body bytes buffered without demand, pausing reads",
                      buffered_bytes_);
    reads_paused_ = true;
    read_control_(true);
  } else if (reads_paused_ &&
             (buffered_bytes_ <= high_watermark_ / 2 || done_)) {
    reads_paused_ = false;
    read_control_(false);
  }
}

Single<std::string> BodyStream::aggregate() {
  std::weak_ptr<BodyStream> weak = shared_from_this();
  return Single<std::string>(
      [weak](const CompletionSinkPtr<std::string>& sink) {
        auto stream = weak.lock();
        if (!stream) {
          sink->error(clientError(ClientErrorCode::NotActive,
                                  "Response body is no longer available"));
          return;
        }
        auto body = std::make_shared<std::string>();
        auto subscription = stream->subscribe(
            [body](std::string chunk) { body->append(chunk); },
            [sink, body](const optional<Error>& error) {
              if (error) {
                sink->error(*error);
              } else {
                sink->success(std::move(*body));
              }
            });
        sink->onCancel([subscription]() { subscription->cancel(); });
        subscription->request(BodySubscription::kUnbounded);
      });
}

}  // namespace http
}  // namespace conduit
