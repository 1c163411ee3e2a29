#ifndef CONDUIT_NETWORK_OPERATIONS_SLOT_H
#define CONDUIT_NETWORK_OPERATIONS_SLOT_H

#include <atomic>
#include <memory>
#include <string>

#include "conduit/core/result.h"
#include "conduit/network/filter.h"

namespace conduit {
namespace network {

/**
 * Protocol handler bound to a channel.
 *
 * The pipeline's terminal stage hands every decoded message to whichever
 * operations object currently owns the channel.
 */
class ChannelOperations {
 public:
  virtual ~ChannelOperations() = default;

  virtual void onInboundNext(MessagePtr message) = 0;

  // The channel closed
  virtual void onInboundClose() = 0;

  virtual void onInboundError(const Error& error) = 0;

  // For logging
  virtual std::string name() const = 0;
};

using ChannelOperationsSharedPtr = std::shared_ptr<ChannelOperations>;

/**
 * Per-channel ownership cell for the active ChannelOperations.
 *
 * Handing a channel from one protocol handler to another is a single
 * compare-and-set, so at most one of two competing transfers wins.
 */
class OperationsSlot {
 public:
  OperationsSlot() = default;
  OperationsSlot(const OperationsSlot&) = delete;
  OperationsSlot& operator=(const OperationsSlot&) = delete;

  ChannelOperationsSharedPtr get() const { return std::atomic_load(&current_); }

  void set(ChannelOperationsSharedPtr next) {
    std::atomic_store(&current_, std::move(next));
  }

  // Replace expected with next; false if another owner got there first
  bool compareAndSet(const ChannelOperationsSharedPtr& expected,
                     ChannelOperationsSharedPtr next) {
    ChannelOperationsSharedPtr observed = expected;
    return std::atomic_compare_exchange_strong(&current_, &observed,
                                               std::move(next));
  }

 private:
  ChannelOperationsSharedPtr current_;
};

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_OPERATIONS_SLOT_H
