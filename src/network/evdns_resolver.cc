#include <event2/dns.h>
#include <event2/util.h>

#include <list>
#include <stdexcept>

#include "conduit/network/dns_resolver.h"

#define CONDUIT_LOG_COMPONENT "network.dns"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace network {

namespace {

class EvdnsResolver;

class EvdnsQuery : public ActiveDnsQuery {
 public:
  EvdnsQuery(EvdnsResolver& parent, std::string host, uint16_t port,
             DnsResolver::ResolveCb callback)
      : parent_(parent),
        host_(std::move(host)),
        port_(port),
        callback_(std::move(callback)) {}

  void cancel() override;

  EvdnsResolver& parent_;
  std::string host_;
  uint16_t port_;
  DnsResolver::ResolveCb callback_;
  evdns_getaddrinfo_request* request_{nullptr};
  bool cancelled_{false};
  bool completed_{false};
  bool in_cancel_{false};
  bool in_resolve_{false};
  std::list<std::unique_ptr<EvdnsQuery>>::iterator self_;
};

class EvdnsResolver : public DnsResolver {
 public:
  explicit EvdnsResolver(event_base* base)
      : dns_base_(evdns_base_new(base, EVDNS_BASE_INITIALIZE_NAMESERVERS)) {
    if (!dns_base_) {
      throw std::runtime_error("Failed to create evdns base");
    }
  }

  ~EvdnsResolver() override {
    // Cancelled requests still call back once with EVUTIL_EAI_CANCEL
    destroying_ = true;
    for (auto& query : pending_) {
      query->cancelled_ = true;
      if (query->request_ && !query->completed_) {
        evdns_getaddrinfo_cancel(query->request_);
      }
    }
    pending_.clear();
    evdns_base_free(dns_base_, 0);
  }

  ActiveDnsQuery* resolve(const std::string& host,
                          uint16_t port,
                          ResolveCb callback) override {
    auto query =
        std::make_unique<EvdnsQuery>(*this, host, port, std::move(callback));
    EvdnsQuery* raw = query.get();
    pending_.push_front(std::move(query));
    raw->self_ = pending_.begin();

    evutil_addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    hints.ai_flags = EVUTIL_AI_ADDRCONFIG;

    std::string service = std::to_string(port);
    CONDUIT_LOG_DEBUG("resolving {}:{}", host, port);
    raw->in_resolve_ = true;
    evdns_getaddrinfo_request* request =
        evdns_getaddrinfo(dns_base_, host.c_str(), service.c_str(), &hints,
                          &EvdnsResolver::onResolved, raw);
    raw->in_resolve_ = false;
    if (raw->completed_) {
      // Literal addresses and immediate failures complete inline
      release(*raw);
      return nullptr;
    }
    raw->request_ = request;
    return raw;
  }

  void release(EvdnsQuery& query) { pending_.erase(query.self_); }

  bool destroying_{false};

 private:
  static void onResolved(int result, evutil_addrinfo* res, void* arg) {
    auto* query = static_cast<EvdnsQuery*>(arg);
    query->completed_ = true;

    if (query->cancelled_) {
      if (res) {
        evutil_freeaddrinfo(res);
      }
      if (!query->in_cancel_ && !query->parent_.destroying_) {
        query->parent_.release(*query);
      }
      return;
    }

    DnsResolver::ResolveCb callback = std::move(query->callback_);
    std::string host = query->host_;
    if (!query->in_resolve_) {
      query->parent_.release(*query);
    }

    if (result != 0) {
      if (res) {
        evutil_freeaddrinfo(res);
      }
      CONDUIT_LOG_DEBUG("resolution of {} failed: {}", host,
                        evutil_gai_strerror(result));
      callback(makeError<std::vector<AddressConstSharedPtr>>(
          result, "Failed to resolve " + host + ": " +
                      evutil_gai_strerror(result)));
      return;
    }

    std::vector<AddressConstSharedPtr> addresses;
    for (evutil_addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
      auto address = InetAddress::fromSockAddr(
          ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
      if (address) {
        addresses.push_back(std::move(address));
      }
    }
    if (res) {
      evutil_freeaddrinfo(res);
    }

    if (addresses.empty()) {
      callback(makeError<std::vector<AddressConstSharedPtr>>(
          EVUTIL_EAI_NONAME, "No addresses found for " + host));
      return;
    }
    callback(makeSuccess(std::move(addresses)));
  }

  evdns_base* dns_base_;
  std::list<std::unique_ptr<EvdnsQuery>> pending_;
};

void EvdnsQuery::cancel() {
  if (cancelled_ || completed_) {
    return;
  }
  cancelled_ = true;
  callback_ = nullptr;
  // onResolved runs with EVUTIL_EAI_CANCEL, either now or on a later pass
  in_cancel_ = true;
  evdns_getaddrinfo_cancel(request_);
  in_cancel_ = false;
  if (completed_) {
    parent_.release(*this);
  }
}

}  // namespace

DnsResolverSharedPtr createEvdnsResolver(event_base* base) {
  return std::make_shared<EvdnsResolver>(base);
}

}  // namespace network
}  // namespace conduit
