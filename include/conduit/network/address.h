#ifndef CONDUIT_NETWORK_ADDRESS_H
#define CONDUIT_NETWORK_ADDRESS_H

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <memory>
#include <string>

namespace conduit {
namespace network {

class InetAddress;
using AddressConstSharedPtr = std::shared_ptr<const InetAddress>;

enum class IpVersion { v4, v6 };

/**
 * IPv4 or IPv6 socket address.
 */
class InetAddress {
 public:
  // Copies the sockaddr; nullptr for families other than AF_INET/AF_INET6
  static AddressConstSharedPtr fromSockAddr(const sockaddr* addr,
                                            socklen_t len);

  // Parses a numeric address; nullptr if ip is not a literal
  static AddressConstSharedPtr parse(const std::string& ip, uint16_t port);

  const sockaddr* sockAddr() const {
    return reinterpret_cast<const sockaddr*>(&storage_);
  }
  socklen_t sockAddrLen() const { return len_; }
  int family() const { return storage_.ss_family; }
  IpVersion version() const {
    return family() == AF_INET6 ? IpVersion::v6 : IpVersion::v4;
  }

  uint16_t port() const;

  // Address without port
  std::string ip() const;

  // "1.2.3.4:80" or "[::1]:80"
  std::string asString() const;

  bool operator==(const InetAddress& rhs) const;
  bool operator!=(const InetAddress& rhs) const { return !(*this == rhs); }

 private:
  InetAddress() = default;

  sockaddr_storage storage_{};
  socklen_t len_{0};
};

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_ADDRESS_H
