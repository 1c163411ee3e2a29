#ifndef CONDUIT_NETWORK_DNS_RESOLVER_H
#define CONDUIT_NETWORK_DNS_RESOLVER_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "conduit/core/result.h"
#include "conduit/network/address.h"

struct event_base;

namespace conduit {
namespace network {

/**
 * In-flight resolution. Valid until its callback runs or it is cancelled.
 */
class ActiveDnsQuery {
 public:
  virtual ~ActiveDnsQuery() = default;

  // The callback will not be invoked after cancel()
  virtual void cancel() = 0;
};

/**
 * Asynchronous host name resolution bound to one dispatcher.
 * Callbacks run on that dispatcher's thread.
 */
class DnsResolver {
 public:
  using ResolveCb =
      std::function<void(Result<std::vector<AddressConstSharedPtr>>)>;

  virtual ~DnsResolver() = default;

  /**
   * Resolve host to socket addresses carrying port.
   * @return the pending query, or nullptr if the callback already ran
   */
  virtual ActiveDnsQuery* resolve(const std::string& host,
                                  uint16_t port,
                                  ResolveCb callback) = 0;
};

using DnsResolverSharedPtr = std::shared_ptr<DnsResolver>;

// Resolver using libevent's evdns on the given loop
DnsResolverSharedPtr createEvdnsResolver(event_base* base);

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_DNS_RESOLVER_H
