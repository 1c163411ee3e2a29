#ifndef CONDUIT_NETWORK_CHANNEL_H
#define CONDUIT_NETWORK_CHANNEL_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "conduit/buffer.h"
#include "conduit/network/address.h"
#include "conduit/network/operations_slot.h"
#include "conduit/network/pipeline.h"

namespace conduit {
namespace event {
class Dispatcher;
}

namespace network {

class Channel;
using ChannelSharedPtr = std::shared_ptr<Channel>;

/**
 * One established client connection.
 *
 * A channel is driven by exactly one dispatcher. Apart from
 * operations(), which may be read and swapped from any thread, every
 * method must be called on that dispatcher's thread.
 */
class Channel {
 public:
  using CloseCb = std::function<void()>;
  // true once the write buffer drains below its low watermark, false
  // when it crosses the high watermark
  using WritabilityCb = std::function<void(bool writable)>;

  virtual ~Channel() = default;

  virtual uint64_t id() const = 0;

  virtual event::Dispatcher& dispatcher() = 0;

  virtual Pipeline& pipeline() = 0;

  virtual OperationsSlot& operations() = 0;

  // Queues data for writing, draining it. Dropped if the channel is closed.
  virtual void write(Buffer& data) = 0;

  virtual bool isWritable() const = 0;

  virtual void addWritabilityCallback(WritabilityCb cb) = 0;

  // Stop or resume reading from the socket
  virtual void readDisable(bool disable) = 0;

  virtual bool readEnabled() const = 0;

  // Flushes what can be written without blocking, then closes.
  // Idempotent.
  virtual void close() = 0;

  virtual bool isOpen() const = 0;

  // Runs after the pipeline has been told the channel went inactive.
  // Runs immediately if the channel is already closed.
  virtual void addCloseCallback(CloseCb cb) = 0;

  virtual const AddressConstSharedPtr& remoteAddress() const = 0;

  virtual bool secure() const = 0;
};

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_CHANNEL_H
