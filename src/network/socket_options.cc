#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>

#include "conduit/network/socket_options.h"

namespace conduit {
namespace network {

namespace {

VoidResult setOption(int fd, int level, int name, const void* value,
                     socklen_t len, const char* label) {
  if (::setsockopt(fd, level, name, value, len) != 0) {
    return makeVoidError(Error(errno, std::string("Failed to set ") + label +
                                          ": " + std::strerror(errno)));
  }
  return makeVoidSuccess();
}

}  // namespace

VoidResult applySocketOptions(int fd, const SocketOptions& options) {
  int flag = options.tcp_no_delay ? 1 : 0;
  auto result =
      setOption(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag), "TCP_NODELAY");
  if (is_error(result)) {
    return result;
  }

  if (options.keep_alive) {
    int keepalive = 1;
    result = setOption(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive,
                       sizeof(keepalive), "SO_KEEPALIVE");
    if (is_error(result)) {
      return result;
    }
  }

  if (options.linger_seconds >= 0) {
    struct linger lng;
    lng.l_onoff = 1;
    lng.l_linger = options.linger_seconds;
    result = setOption(fd, SOL_SOCKET, SO_LINGER, &lng, sizeof(lng),
                       "SO_LINGER");
    if (is_error(result)) {
      return result;
    }
  }

  if (options.receive_buffer_size > 0) {
    result = setOption(fd, SOL_SOCKET, SO_RCVBUF, &options.receive_buffer_size,
                       sizeof(options.receive_buffer_size), "SO_RCVBUF");
    if (is_error(result)) {
      return result;
    }
  }

  if (options.send_buffer_size > 0) {
    result = setOption(fd, SOL_SOCKET, SO_SNDBUF, &options.send_buffer_size,
                       sizeof(options.send_buffer_size), "SO_SNDBUF");
    if (is_error(result)) {
      return result;
    }
  }

#ifdef SO_NOSIGPIPE
  int nosigpipe = 1;
  result = setOption(fd, SOL_SOCKET, SO_NOSIGPIPE, &nosigpipe,
                     sizeof(nosigpipe), "SO_NOSIGPIPE");
  if (is_error(result)) {
    return result;
  }
#endif

  return makeVoidSuccess();
}

VoidResult setNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    return makeVoidError(
        Error(errno, std::string("Failed to set O_NONBLOCK: ") +
                         std::strerror(errno)));
  }
  return makeVoidSuccess();
}

}  // namespace network
}  // namespace conduit
