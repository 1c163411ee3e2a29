#include "conduit/http/reactive_bridge.h"

#include "conduit/http/client_errors.h"
#include "conduit/http/http_object.h"
#include "conduit/network/channel.h"

#define CONDUIT_LOG_COMPONENT "http.bridge"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace http {

void ReactiveBridge::onRead(network::MessagePtr message) {
  network::Channel& channel = callbacks_->channel();
  auto ops = channel.operations().get();
  if (!ops) {
    CONDUIT_LOG_DEBUG("channel {} has no operations, message dropped",
                      channel.id());
    return;
  }
  if (auto* failure = dynamic_cast<HttpDecoderFailure*>(message.get())) {
    ops->onInboundError(clientError(ClientErrorCode::ProtocolError,
                                    failure->reason));
    return;
  }
  ops->onInboundNext(std::move(message));
}

void ReactiveBridge::onChannelInactive() {
  auto ops = callbacks_->channel().operations().get();
  if (ops) {
    ops->onInboundClose();
  }
}

}  // namespace http
}  // namespace conduit
