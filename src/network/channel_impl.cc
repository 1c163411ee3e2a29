#include "conduit/network/channel_impl.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#define CONDUIT_LOG_COMPONENT "network.channel"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace network {

namespace {

constexpr uint32_t kReadEvent = static_cast<uint32_t>(event::FileReadyType::Read);
constexpr uint32_t kWriteEvent =
    static_cast<uint32_t>(event::FileReadyType::Write);

// Keeps a file event alive until the dispatcher is out of its callback
struct DeferredFileEvent : public event::DeferredDeletable {
  explicit DeferredFileEvent(event::FileEventPtr&& event)
      : event_(std::move(event)) {}
  event::FileEventPtr event_;
};

}  // namespace

std::atomic<uint64_t> ChannelImpl::next_id_{1};

ChannelImpl::ChannelImpl(event::Dispatcher& dispatcher,
                         int fd,
                         AddressConstSharedPtr remote_address,
                         TransportSocketPtr transport,
                         const ChannelOptions& options)
    : id_(next_id_++),
      dispatcher_(dispatcher),
      fd_(fd),
      remote_address_(std::move(remote_address)),
      transport_(std::move(transport)),
      pipeline_(*this),
      write_buffer_([this]() { onWriteBufferLow(); },
                    [this]() { onWriteBufferHigh(); }) {
  write_buffer_.setWatermarks(options.write_buffer_high_watermark);
  transport_->setTransportSocketCallbacks(*this);
}

ChannelImpl::~ChannelImpl() {
  if (file_event_) {
    if (dispatcher_.isThreadSafe()) {
      file_event_.reset();
    } else {
      std::shared_ptr<event::FileEvent> event(std::move(file_event_));
      dispatcher_.post([event]() {});
    }
  }
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

int ChannelImpl::connect(ConnectCb cb) {
  int rc;
  do {
    rc = ::connect(fd_, remote_address_->sockAddr(),
                   remote_address_->sockAddrLen());
  } while (rc != 0 && errno == EINTR);

  if (rc != 0 && errno != EINPROGRESS) {
    connect_errno_ = errno;
    return connect_errno_;
  }

  connect_cb_ = std::move(cb);
  tcp_connecting_ = true;
  createFileEvent();
  CONDUIT_LOG_DEBUG("[C{}] connecting to {}", id_, remote_address_->asString());
  return 0;
}

void ChannelImpl::createFileEvent() {
  std::weak_ptr<ChannelImpl> weak_self = weak_from_this();
  file_event_ = dispatcher_.createFileEvent(
      fd_,
      [weak_self](uint32_t events) {
        if (auto self = weak_self.lock()) {
          self->onFileEvent(events);
        }
      },
      0);
  updateEvents();
}

void ChannelImpl::updateEvents() {
  if (!file_event_ || state_ == State::Closed) {
    return;
  }
  uint32_t events = 0;
  if (tcp_connecting_) {
    events = kWriteEvent;
  } else {
    if (read_disable_count_ == 0) {
      events |= kReadEvent;
    }
    if (write_buffer_.length() > 0 || write_ready_requested_) {
      events |= kWriteEvent;
    }
  }
  file_event_->setEnabled(events);
}

void ChannelImpl::onFileEvent(uint32_t events) {
  if (state_ == State::Closed) {
    return;
  }
  if (events & kWriteEvent) {
    onWriteReady();
  }
  if (state_ != State::Closed && (events & kReadEvent)) {
    onReadReady();
  }
}

void ChannelImpl::onWriteReady() {
  if (tcp_connecting_) {
    int error = 0;
    socklen_t len = sizeof(error);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error, &len) != 0) {
      error = errno;
    }
    tcp_connecting_ = false;
    if (error != 0) {
      connect_errno_ = error;
      CONDUIT_LOG_DEBUG("[C{}] connect to {} failed: {}", id_,
                        remote_address_->asString(), std::strerror(error));
      closeInternal(ChannelEvent::RemoteClose);
      return;
    }
    updateEvents();
    transport_->onConnected();
    return;
  }

  write_ready_requested_ = false;
  flushWriteBuffer();
}

void ChannelImpl::onReadReady() {
  if (read_disable_count_ > 0) {
    return;
  }

  OwnedBuffer buffer;
  IoResult result = transport_->doRead(buffer);

  // Holds the channel if a stage drops the last outside reference
  auto self = shared_from_this();
  if (buffer.length() > 0 && state_ == State::Open) {
    pipeline_.fireRead(std::make_unique<BytesMessage>(std::move(buffer)));
  }

  if (state_ == State::Closed) {
    return;
  }
  if (result.action_ == PostIoAction::Close) {
    CONDUIT_LOG_DEBUG("[C{}] read failed: {}", id_,
                      transport_->failureReason());
    closeInternal(ChannelEvent::RemoteClose);
  } else if (result.end_stream_read_) {
    CONDUIT_LOG_DEBUG("[C{}] remote end closed", id_);
    closeInternal(ChannelEvent::RemoteClose);
  }
}

void ChannelImpl::write(Buffer& data) {
  if (state_ == State::Closed) {
    CONDUIT_LOG_DEBUG("[C{}] write of {} bytes on closed channel dropped", id_,
                      data.length());
    data.drain(data.length());
    return;
  }
  write_buffer_.move(data);
  if (state_ == State::Open) {
    flushWriteBuffer();
  }
}

void ChannelImpl::flushWriteBuffer() {
  if (state_ != State::Open && !(state_ == State::Connecting && !tcp_connecting_)) {
    return;
  }
  IoResult result = transport_->doWrite(write_buffer_);
  if (result.action_ == PostIoAction::Close) {
    CONDUIT_LOG_DEBUG("[C{}] write failed: {}", id_,
                      transport_->failureReason());
    closeInternal(ChannelEvent::RemoteClose);
    return;
  }
  updateEvents();
}

bool ChannelImpl::isWritable() const {
  return !write_buffer_.aboveHighWatermark();
}

void ChannelImpl::addWritabilityCallback(WritabilityCb cb) {
  writability_callbacks_.push_back(std::move(cb));
}

void ChannelImpl::onWriteBufferHigh() {
  for (auto& cb : writability_callbacks_) {
    cb(false);
  }
}

void ChannelImpl::onWriteBufferLow() {
  for (auto& cb : writability_callbacks_) {
    cb(true);
  }
}

void ChannelImpl::readDisable(bool disable) {
  if (state_ == State::Closed) {
    return;
  }
  if (disable) {
    ++read_disable_count_;
  } else if (read_disable_count_ > 0) {
    --read_disable_count_;
  }
  updateEvents();
}

void ChannelImpl::close() { closeInternal(ChannelEvent::LocalClose); }

void ChannelImpl::addCloseCallback(CloseCb cb) {
  if (state_ == State::Closed) {
    cb();
    return;
  }
  close_callbacks_.push_back(std::move(cb));
}

void ChannelImpl::raiseEvent(ChannelEvent event) {
  if (state_ == State::Closed) {
    return;
  }
  if (event == ChannelEvent::Connected) {
    state_ = State::Open;
    CONDUIT_LOG_DEBUG("[C{}] connected to {} over {}", id_,
                      remote_address_->asString(), transport_->protocol());
    updateEvents();
    ConnectCb cb = std::move(connect_cb_);
    if (cb) {
      cb(ChannelEvent::Connected);
    }
    if (state_ == State::Open && write_buffer_.length() > 0) {
      flushWriteBuffer();
    }
    return;
  }
  closeInternal(event);
}

void ChannelImpl::requestWriteReady() {
  write_ready_requested_ = true;
  updateEvents();
}

std::string ChannelImpl::failureReason() const {
  std::string reason = transport_->failureReason();
  if (reason.empty() && connect_errno_ != 0) {
    reason = std::strerror(connect_errno_);
  }
  return reason;
}

void ChannelImpl::closeInternal(ChannelEvent event) {
  if (state_ == State::Closed) {
    return;
  }
  auto self = shared_from_this();

  if (event == ChannelEvent::LocalClose && state_ == State::Open &&
      write_buffer_.length() > 0) {
    // Best effort, never blocks
    transport_->doWrite(write_buffer_);
  }

  State previous = state_;
  state_ = State::Closed;
  CONDUIT_LOG_DEBUG("[C{}] closing ({})", id_,
                    event == ChannelEvent::LocalClose ? "local" : "remote");

  transport_->closeSocket(event);
  if (file_event_) {
    file_event_->setEnabled(0);
    dispatcher_.deferredDelete(
        std::make_unique<DeferredFileEvent>(std::move(file_event_)));
  }
  ::close(fd_);
  fd_ = -1;

  if (previous != State::Open) {
    ConnectCb cb = std::move(connect_cb_);
    if (cb) {
      cb(event);
    }
  }

  pipeline_.fireChannelInactive();

  std::vector<CloseCb> callbacks;
  callbacks.swap(close_callbacks_);
  for (auto& cb : callbacks) {
    cb();
  }

  writability_callbacks_.clear();
  operations_.set(nullptr);
  pipeline_.clear();
}

}  // namespace network
}  // namespace conduit
