#ifndef CONDUIT_HTTP_REACTIVE_BRIDGE_H
#define CONDUIT_HTTP_REACTIVE_BRIDGE_H

#include "conduit/network/filter.h"

namespace conduit {
namespace http {

/**
 * Last pipeline stage: hands every message to the ChannelOperations that
 * currently owns the channel. Decoder failures become onInboundError,
 * the channel going inactive becomes onInboundClose.
 */
class ReactiveBridge : public network::ReadFilter {
 public:
  static constexpr const char* kName = "reactive_bridge";

  void initializeReadFilterCallbacks(
      network::ReadFilterCallbacks& callbacks) override {
    callbacks_ = &callbacks;
  }
  void onRead(network::MessagePtr message) override;
  void onChannelInactive() override;

 private:
  network::ReadFilterCallbacks* callbacks_{nullptr};
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_REACTIVE_BRIDGE_H
