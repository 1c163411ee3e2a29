#include <arpa/inet.h>

#include <cstring>

#include "conduit/network/address.h"

namespace conduit {
namespace network {

AddressConstSharedPtr InetAddress::fromSockAddr(const sockaddr* addr,
                                                socklen_t len) {
  if (addr == nullptr) {
    return nullptr;
  }
  if (addr->sa_family == AF_INET && len >= sizeof(sockaddr_in)) {
    std::shared_ptr<InetAddress> result(new InetAddress());
    std::memcpy(&result->storage_, addr, sizeof(sockaddr_in));
    result->len_ = sizeof(sockaddr_in);
    return result;
  }
  if (addr->sa_family == AF_INET6 && len >= sizeof(sockaddr_in6)) {
    std::shared_ptr<InetAddress> result(new InetAddress());
    std::memcpy(&result->storage_, addr, sizeof(sockaddr_in6));
    result->len_ = sizeof(sockaddr_in6);
    return result;
  }
  return nullptr;
}

AddressConstSharedPtr InetAddress::parse(const std::string& ip,
                                         uint16_t port) {
  sockaddr_in v4{};
  if (::inet_pton(AF_INET, ip.c_str(), &v4.sin_addr) == 1) {
    v4.sin_family = AF_INET;
    v4.sin_port = htons(port);
    return fromSockAddr(reinterpret_cast<const sockaddr*>(&v4), sizeof(v4));
  }

  std::string literal = ip;
  if (literal.size() > 2 && literal.front() == '[' && literal.back() == ']') {
    literal = literal.substr(1, literal.size() - 2);
  }
  sockaddr_in6 v6{};
  if (::inet_pton(AF_INET6, literal.c_str(), &v6.sin6_addr) == 1) {
    v6.sin6_family = AF_INET6;
    v6.sin6_port = htons(port);
    return fromSockAddr(reinterpret_cast<const sockaddr*>(&v6), sizeof(v6));
  }
  return nullptr;
}

uint16_t InetAddress::port() const {
  if (family() == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_port);
  }
  return ntohs(reinterpret_cast<const sockaddr_in*>(&storage_)->sin_port);
}

std::string InetAddress::ip() const {
  char buf[INET6_ADDRSTRLEN] = {0};
  if (family() == AF_INET6) {
    ::inet_ntop(AF_INET6,
                &reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_addr,
                buf, sizeof(buf));
  } else {
    ::inet_ntop(AF_INET,
                &reinterpret_cast<const sockaddr_in*>(&storage_)->sin_addr,
                buf, sizeof(buf));
  }
  return buf;
}

std::string InetAddress::asString() const {
  if (family() == AF_INET6) {
    return "[" + ip() + "]:" + std::to_string(port());
  }
  return ip() + ":" + std::to_string(port());
}

bool InetAddress::operator==(const InetAddress& rhs) const {
  return len_ == rhs.len_ && std::memcmp(&storage_, &rhs.storage_, len_) == 0;
}

}  // namespace network
}  // namespace conduit
