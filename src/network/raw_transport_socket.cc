#include <sys/socket.h>

#include <cerrno>
#include <cstring>

#include "conduit/network/transport_socket.h"

namespace conduit {
namespace network {

namespace {
constexpr size_t kReadChunkSize = 16384;
// Upper bound per readiness event so one busy channel cannot starve others
constexpr size_t kMaxReadsPerEvent = 16;
}  // namespace

void RawTransportSocket::onConnected() {
  callbacks_->raiseEvent(ChannelEvent::Connected);
}

IoResult RawTransportSocket::doRead(Buffer& buffer) {
  uint64_t total = 0;
  char chunk[kReadChunkSize];

  for (size_t i = 0; i < kMaxReadsPerEvent; ++i) {
    ssize_t rc = ::recv(callbacks_->fd(), chunk, sizeof(chunk), 0);
    if (rc > 0) {
      buffer.add(chunk, static_cast<size_t>(rc));
      total += static_cast<uint64_t>(rc);
      if (static_cast<size_t>(rc) < sizeof(chunk)) {
        break;
      }
      continue;
    }
    if (rc == 0) {
      return IoResult::endStream(total);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      break;
    }
    failure_reason_ = std::strerror(errno);
    return IoResult::close(total);
  }
  return IoResult::success(total);
}

IoResult RawTransportSocket::doWrite(Buffer& buffer) {
  uint64_t total = 0;
  while (buffer.length() > 0) {
    size_t len = buffer.length();
    const void* data = buffer.linearize(len);
    ssize_t rc = ::send(callbacks_->fd(), data, len, MSG_NOSIGNAL);
    if (rc > 0) {
      buffer.drain(static_cast<size_t>(rc));
      total += static_cast<uint64_t>(rc);
      continue;
    }
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    if (rc < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      break;
    }
    failure_reason_ = rc < 0 ? std::strerror(errno) : "send returned 0";
    return IoResult::close(total);
  }
  return IoResult::success(total);
}

}  // namespace network
}  // namespace conduit
