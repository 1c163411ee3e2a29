#ifndef CONDUIT_NETWORK_CHANNEL_IMPL_H
#define CONDUIT_NETWORK_CHANNEL_IMPL_H

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "conduit/buffer.h"
#include "conduit/event/event_loop.h"
#include "conduit/network/channel.h"
#include "conduit/network/transport_socket.h"

namespace conduit {
namespace network {

struct ChannelOptions {
  uint32_t write_buffer_high_watermark{64 * 1024};
};

/**
 * Socket-backed channel.
 *
 * Lifecycle: Connecting -> Open -> Closed. The connect callback sees
 * Connected once the transport is ready (after TLS for secure channels)
 * or a close event if the connection never got there.
 */
class ChannelImpl : public Channel,
                    public TransportSocketCallbacks,
                    public std::enable_shared_from_this<ChannelImpl> {
 public:
  using ConnectCb = std::function<void(ChannelEvent event)>;

  ChannelImpl(event::Dispatcher& dispatcher,
              int fd,
              AddressConstSharedPtr remote_address,
              TransportSocketPtr transport,
              const ChannelOptions& options);
  ~ChannelImpl() override;

  /**
   * Start a non-blocking connect to the remote address.
   * @return 0, or the errno of an immediate failure (no callback then)
   */
  int connect(ConnectCb cb);

  // Channel
  uint64_t id() const override { return id_; }
  event::Dispatcher& dispatcher() override { return dispatcher_; }
  Pipeline& pipeline() override { return pipeline_; }
  OperationsSlot& operations() override { return operations_; }
  void write(Buffer& data) override;
  bool isWritable() const override;
  void addWritabilityCallback(WritabilityCb cb) override;
  void readDisable(bool disable) override;
  bool readEnabled() const override { return read_disable_count_ == 0; }
  void close() override;
  bool isOpen() const override { return state_ != State::Closed; }
  void addCloseCallback(CloseCb cb) override;
  const AddressConstSharedPtr& remoteAddress() const override {
    return remote_address_;
  }
  bool secure() const override { return transport_->secure(); }

  // TransportSocketCallbacks
  int fd() const override { return fd_; }
  void raiseEvent(ChannelEvent event) override;
  void requestWriteReady() override;

  std::string failureReason() const;

  // errno of a failed TCP connect, 0 otherwise
  int connectErrno() const { return connect_errno_; }

 private:
  enum class State { Connecting, Open, Closed };

  void createFileEvent();
  void onFileEvent(uint32_t events);
  void onReadReady();
  void onWriteReady();
  void flushWriteBuffer();
  void updateEvents();
  void closeInternal(ChannelEvent event);
  void onWriteBufferHigh();
  void onWriteBufferLow();

  static std::atomic<uint64_t> next_id_;

  const uint64_t id_;
  event::Dispatcher& dispatcher_;
  int fd_;
  AddressConstSharedPtr remote_address_;
  TransportSocketPtr transport_;
  State state_{State::Connecting};
  bool tcp_connecting_{false};
  bool write_ready_requested_{false};
  uint32_t read_disable_count_{0};
  int connect_errno_{0};

  Pipeline pipeline_;
  OperationsSlot operations_;
  WatermarkBuffer write_buffer_;
  event::FileEventPtr file_event_;
  ConnectCb connect_cb_;
  std::vector<CloseCb> close_callbacks_;
  std::vector<WritabilityCb> writability_callbacks_;
};

using ChannelImplSharedPtr = std::shared_ptr<ChannelImpl>;

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_CHANNEL_IMPL_H
