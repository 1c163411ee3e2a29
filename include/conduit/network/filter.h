#ifndef CONDUIT_NETWORK_FILTER_H
#define CONDUIT_NETWORK_FILTER_H

#include <memory>
#include <string>

#include "conduit/buffer.h"

namespace conduit {
namespace network {

class Channel;
class ReadFilter;
class ReadFilterCallbacks;

using ReadFilterSharedPtr = std::shared_ptr<ReadFilter>;

/**
 * Unit of data travelling through a channel pipeline.
 *
 * The first stage receives BytesMessage; codec stages replace it with
 * decoded protocol objects for the stages after them.
 */
class Message {
 public:
  virtual ~Message() = default;
};

using MessagePtr = std::unique_ptr<Message>;

/**
 * Raw bytes read from the transport
 */
class BytesMessage : public Message {
 public:
  BytesMessage() = default;
  explicit BytesMessage(const std::string& data) : data_(data) {}
  explicit BytesMessage(OwnedBuffer&& data) : data_(std::move(data)) {}

  OwnedBuffer& data() { return data_; }
  const OwnedBuffer& data() const { return data_; }

 private:
  OwnedBuffer data_;
};

/**
 * Read filter callbacks interface
 *
 * Provided to read filters for interacting with the channel
 */
class ReadFilterCallbacks {
 public:
  virtual ~ReadFilterCallbacks() = default;

  virtual Channel& channel() = 0;

  /**
   * Hand a message to the stage after this one.
   * Messages that reach the end of the pipeline are dropped.
   */
  virtual void fireRead(MessagePtr message) = 0;
};

/**
 * Read filter interface
 *
 * One named inbound stage of a channel pipeline
 */
class ReadFilter {
 public:
  virtual ~ReadFilter() = default;

  // Called once when the filter is added to a pipeline
  virtual void initializeReadFilterCallbacks(
      ReadFilterCallbacks& callbacks) = 0;

  virtual void onRead(MessagePtr message) = 0;

  // The channel closed. Every stage is told, in pipeline order.
  virtual void onChannelInactive() {}
};

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_FILTER_H
