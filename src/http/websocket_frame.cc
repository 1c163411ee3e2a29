#include "conduit/http/websocket_frame.h"

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include "conduit/http/client_errors.h"

namespace conduit {
namespace http {

namespace {

const char kWebSocketGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string base64Encode(const unsigned char* data, size_t length) {
  std::string out(4 * ((length + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                data, static_cast<int>(length));
  out.resize(written > 0 ? static_cast<size_t>(written) : 0);
  return out;
}

// Fills out from the OpenSSL CSPRNG; the error names what was being made
VoidResult randomBytes(unsigned char* out, size_t length, const char* what) {
  if (RAND_bytes(out, static_cast<int>(length)) == 1) {
    return makeVoidSuccess();
  }
  char reason[256] = "unknown error";
  unsigned long code = ERR_get_error();
  if (code != 0) {
    ERR_error_string_n(code, reason, sizeof(reason));
  }
  ERR_clear_error();
  return makeVoidError(clientError(
      ClientErrorCode::ProtocolError,
      fmt::format("No random bytes for {}: {}", what, reason)));
}

}  // namespace

std::string encodeWebSocketFrame(const WebSocketFrame& frame,
                                 bool mask,
                                 uint32_t masking_key) {
  const std::string& payload = frame.payload;
  const uint64_t length = payload.size();

  std::string out;
  out.reserve(payload.size() + 14);
  out.push_back(static_cast<char>((frame.fin ? 0x80 : 0x00) |
                                  static_cast<uint8_t>(frame.opcode)));

  const uint8_t mask_bit = mask ? 0x80 : 0x00;
  if (length < 126) {
    out.push_back(static_cast<char>(mask_bit | length));
  } else if (length <= 0xFFFF) {
    out.push_back(static_cast<char>(mask_bit | 126));
    out.push_back(static_cast<char>((length >> 8) & 0xFF));
    out.push_back(static_cast<char>(length & 0xFF));
  } else {
    out.push_back(static_cast<char>(mask_bit | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      out.push_back(static_cast<char>((length >> shift) & 0xFF));
    }
  }

  if (!mask) {
    out += payload;
    return out;
  }

  uint8_t key[4] = {
      static_cast<uint8_t>((masking_key >> 24) & 0xFF),
      static_cast<uint8_t>((masking_key >> 16) & 0xFF),
      static_cast<uint8_t>((masking_key >> 8) & 0xFF),
      static_cast<uint8_t>(masking_key & 0xFF)};
  out.append(reinterpret_cast<const char*>(key), 4);
  for (size_t i = 0; i < payload.size(); ++i) {
    out.push_back(static_cast<char>(payload[i] ^ key[i % 4]));
  }
  return out;
}

Result<std::string> encodeClientFrame(const WebSocketFrame& frame) {
  uint32_t key = 0;
  VoidResult random = randomBytes(reinterpret_cast<unsigned char*>(&key),
                                  sizeof(key), "the masking key");
  if (auto* error = get_error(random)) {
    return makeError<std::string>(*error);
  }
  return makeSuccess(encodeWebSocketFrame(frame, true, key));
}

std::string encodeClosePayload(uint16_t code, const std::string& reason) {
  std::string payload;
  payload.push_back(static_cast<char>((code >> 8) & 0xFF));
  payload.push_back(static_cast<char>(code & 0xFF));
  // Control frame payloads are limited to 125 bytes
  payload += reason.substr(0, 123);
  return payload;
}

uint16_t decodeCloseCode(const std::string& payload) {
  if (payload.size() < 2) {
    return kCloseNoStatus;
  }
  return static_cast<uint16_t>(
      (static_cast<uint8_t>(payload[0]) << 8) | static_cast<uint8_t>(payload[1]));
}

VoidResult WebSocketFrameDecoder::decode(const char* data, size_t length,
                                         std::vector<WebSocketFrame>& out) {
  buffer_.append(data, length);

  size_t offset = 0;
  while (buffer_.size() - offset >= 2) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(buffer_.data()) + offset;
    const size_t available = buffer_.size() - offset;

    if (p[0] & 0x70) {
      return makeVoidError(clientError(ClientErrorCode::ProtocolError,
                                       "WebSocket frame uses reserved bits"));
    }
    const bool fin = (p[0] & 0x80) != 0;
    const auto opcode = static_cast<WebSocketOpcode>(p[0] & 0x0F);
    const bool masked = (p[1] & 0x80) != 0;
    uint64_t payload_length = p[1] & 0x7F;

    size_t header_length = 2;
    if (payload_length == 126) {
      header_length += 2;
    } else if (payload_length == 127) {
      header_length += 8;
    }
    if (masked) {
      header_length += 4;
    }
    if (available < header_length) {
      break;
    }

    if (payload_length == 126) {
      payload_length = (static_cast<uint64_t>(p[2]) << 8) | p[3];
    } else if (payload_length == 127) {
      payload_length = 0;
      for (int i = 0; i < 8; ++i) {
        payload_length = (payload_length << 8) | p[2 + i];
      }
    }

    if (isControlOpcode(opcode) && (payload_length > 125 || !fin)) {
      return makeVoidError(clientError(ClientErrorCode::ProtocolError,
                                       "Invalid WebSocket control frame"));
    }
    if (payload_length > max_payload_) {
      return makeVoidError(clientError(
          ClientErrorCode::ProtocolError,
          fmt::format("WebSocket frame of {} bytes exceeds {} bytes",
                      payload_length, max_payload_)));
    }
    if (available - header_length < payload_length) {
      break;
    }

    WebSocketFrame frame;
    frame.fin = fin;
    frame.opcode = opcode;
    frame.payload.assign(reinterpret_cast<const char*>(p + header_length),
                         static_cast<size_t>(payload_length));
    if (masked) {
      const uint8_t* key = p + header_length - 4;
      for (size_t i = 0; i < frame.payload.size(); ++i) {
        frame.payload[i] = static_cast<char>(frame.payload[i] ^ key[i % 4]);
      }
    }
    out.push_back(std::move(frame));
    offset += header_length + static_cast<size_t>(payload_length);
  }

  buffer_.erase(0, offset);
  return makeVoidSuccess();
}

Result<std::string> generateWebSocketKey() {
  unsigned char nonce[16];
  VoidResult random = randomBytes(nonce, sizeof(nonce), "the handshake key");
  if (auto* error = get_error(random)) {
    return makeError<std::string>(*error);
  }
  return makeSuccess(base64Encode(nonce, sizeof(nonce)));
}

std::string computeWebSocketAccept(const std::string& key) {
  std::string input = key + kWebSocketGuid;
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(),
       digest);
  return base64Encode(digest, sizeof(digest));
}

}  // namespace http
}  // namespace conduit
