#ifndef CONDUIT_HTTP_WEBSOCKET_FRAME_H
#define CONDUIT_HTTP_WEBSOCKET_FRAME_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "conduit/core/result.h"

namespace conduit {
namespace http {

enum class WebSocketOpcode : uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

inline bool isControlOpcode(WebSocketOpcode opcode) {
  return static_cast<uint8_t>(opcode) >= 0x8;
}

struct WebSocketFrame {
  bool fin{true};
  WebSocketOpcode opcode{WebSocketOpcode::Text};
  std::string payload;
};

// Close status codes (RFC 6455 section 7.4.1)
constexpr uint16_t kCloseNormal = 1000;
constexpr uint16_t kCloseGoingAway = 1001;
constexpr uint16_t kCloseProtocolError = 1002;
constexpr uint16_t kCloseNoStatus = 1005;
constexpr uint16_t kCloseMessageTooBig = 1009;

/**
 * Serialize one frame. Client frames must be masked; the key is applied
 * to the payload in place of a random one when given.
 */
std::string encodeWebSocketFrame(const WebSocketFrame& frame,
                                 bool mask,
                                 uint32_t masking_key);

// Masked client frame with a random key. Fails only when the CSPRNG does.
Result<std::string> encodeClientFrame(const WebSocketFrame& frame);

// Close payload: status code in network order, then the reason
std::string encodeClosePayload(uint16_t code, const std::string& reason);

// kCloseNoStatus when the payload carries no code
uint16_t decodeCloseCode(const std::string& payload);

/**
 * Incremental frame decoder. Bytes may arrive split anywhere.
 * Masked frames are unmasked; the decoder does not require either.
 */
class WebSocketFrameDecoder {
 public:
  explicit WebSocketFrameDecoder(size_t max_payload = 16 * 1024 * 1024)
      : max_payload_(max_payload) {}

  // Append data and move every complete frame to out.
  // Fails with ProtocolError on a malformed or oversized frame.
  VoidResult decode(const char* data, size_t length,
                    std::vector<WebSocketFrame>& out);

  size_t buffered() const { return buffer_.size(); }

 private:
  std::string buffer_;
  const size_t max_payload_;
};

// Random 16 byte nonce, base64 encoded, for Sec-WebSocket-Key
Result<std::string> generateWebSocketKey();

// base64(SHA-1(key + GUID)) expected in Sec-WebSocket-Accept
std::string computeWebSocketAccept(const std::string& key);

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_WEBSOCKET_FRAME_H
