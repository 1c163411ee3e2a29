#ifndef CONDUIT_NETWORK_SOCKET_OPTIONS_H
#define CONDUIT_NETWORK_SOCKET_OPTIONS_H

#include <string>

#include "conduit/core/result.h"

namespace conduit {
namespace network {

struct SocketOptions {
  bool tcp_no_delay{true};
  bool keep_alive{false};
  // Negative leaves SO_LINGER untouched
  int linger_seconds{-1};
  // Zero keeps the system default
  int receive_buffer_size{0};
  int send_buffer_size{0};
};

// Applies options to a TCP socket; fails on the first rejected option
VoidResult applySocketOptions(int fd, const SocketOptions& options);

VoidResult setNonBlocking(int fd);

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_SOCKET_OPTIONS_H
