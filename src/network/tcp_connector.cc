#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include "conduit/event/event_loop.h"
#include "conduit/network/connector.h"
#include "conduit/transport/ssl_transport_socket.h"

#define CONDUIT_LOG_COMPONENT "network.connector"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace network {

/**
 * One connect() call. Lives on the connector's dispatcher thread until it
 * delivers its result or is abandoned.
 */
class TcpConnector::ConnectAttempt
    : public std::enable_shared_from_this<ConnectAttempt> {
 public:
  ConnectAttempt(std::shared_ptr<TcpConnector> parent,
                 ConnectRequest request,
                 ConnectCallback callback)
      : parent_(std::move(parent)),
        request_(std::move(request)),
        callback_(std::move(callback)) {}

  void start() {
    if (!callback_) {
      return;
    }
    // Owns itself until it delivers a result or is abandoned
    self_ = shared_from_this();
    auto self = self_;
    std::weak_ptr<ConnectAttempt> weak_self = self_;
    timer_ = parent_->dispatcher_.createTimer([weak_self]() {
      if (auto attempt = weak_self.lock()) {
        attempt->onTimeout();
      }
    });
    timer_->enableTimer(parent_->config_.connect_timeout);

    if (request_.secure && !parent_->config_.ssl_context) {
      fail(0, "No TLS context configured for " + target());
      return;
    }

    query_ = parent_->resolver().resolve(
        request_.host, request_.port,
        [self](Result<std::vector<AddressConstSharedPtr>> result) {
          self->query_ = nullptr;
          self->onResolved(std::move(result));
        });
  }

  void abandon() {
    callback_ = nullptr;
    cleanup();
  }

 private:
  std::string target() const {
    return request_.host + ":" + std::to_string(request_.port);
  }

  void onResolved(Result<std::vector<AddressConstSharedPtr>> result) {
    if (!callback_) {
      return;
    }
    if (auto* error = get_error(result)) {
      fail(error->code, error->message);
      return;
    }
    addresses_ = std::move(*get_value(result));
    tryNextAddress();
  }

  void tryNextAddress() {
    while (callback_ && next_address_ < addresses_.size()) {
      AddressConstSharedPtr address = addresses_[next_address_++];
      int fd = ::socket(address->family(), SOCK_STREAM | SOCK_CLOEXEC, 0);
      if (fd < 0) {
        last_error_ = std::string("socket() failed: ") + std::strerror(errno);
        continue;
      }

      VoidResult configured = setNonBlocking(fd);
      if (is_success(configured)) {
        configured = applySocketOptions(fd, parent_->config_.socket_options);
      }
      if (auto* error = get_error(configured)) {
        ::close(fd);
        fail(error->code, error->message);
        return;
      }

      TransportSocketPtr transport;
      if (request_.secure) {
        transport = std::make_unique<transport::SslTransportSocket>(
            parent_->config_.ssl_context, request_.host,
            parent_->config_.ssl_handshake_timeout);
      } else {
        transport = std::make_unique<RawTransportSocket>();
      }

      auto channel = std::make_shared<ChannelImpl>(
          parent_->dispatcher_, fd, address, std::move(transport),
          parent_->config_.channel_options);
      std::weak_ptr<ConnectAttempt> weak_self = shared_from_this();
      int rc = channel->connect([weak_self](ChannelEvent event) {
        if (auto self = weak_self.lock()) {
          self->onChannelEvent(event);
        }
      });
      if (rc != 0) {
        last_error_ = "connect to " + address->asString() +
                      " failed: " + std::strerror(rc);
        CONDUIT_LOG_DEBUG("{}", last_error_);
        continue;
      }
      channel_ = std::move(channel);
      return;
    }

    if (callback_) {
      fail(ECONNREFUSED, "Failed to connect to " + target() +
                             (last_error_.empty() ? "" : ": " + last_error_));
    }
  }

  void onChannelEvent(ChannelEvent event) {
    if (!callback_) {
      return;
    }
    if (event == ChannelEvent::Connected) {
      ChannelSharedPtr channel = channel_;
      channel_.reset();
      succeed(std::move(channel));
      return;
    }

    auto failed = std::move(channel_);
    if (failed->connectErrno() != 0) {
      last_error_ = "connect to " + failed->remoteAddress()->asString() +
                    " failed: " + std::strerror(failed->connectErrno());
      CONDUIT_LOG_DEBUG("{}", last_error_);
      tryNextAddress();
      return;
    }
    std::string reason = failed->failureReason();
    fail(0, "Failed to connect to " + target() + ": " +
                (reason.empty() ? "connection closed" : reason));
  }

  void onTimeout() {
    if (!callback_) {
      return;
    }
    fail(ETIMEDOUT,
         "Connection to " + target() + " timed out after " +
             std::to_string(parent_->config_.connect_timeout.count()) + "ms");
  }

  void succeed(ChannelSharedPtr channel) {
    ConnectCallback callback = std::move(callback_);
    cleanup();
    CONDUIT_LOG_DEBUG("[C{}] connected to {}", channel->id(), target());
    callback(makeSuccess(std::move(channel)));
  }

  void fail(int code, const std::string& message) {
    ConnectCallback callback = std::move(callback_);
    cleanup();
    CONDUIT_LOG_DEBUG("{}", message);
    if (callback) {
      callback(makeError<ChannelSharedPtr>(code, message));
    }
  }

  void cleanup() {
    if (timer_) {
      timer_->disableTimer();
    }
    if (query_) {
      query_->cancel();
      query_ = nullptr;
    }
    if (channel_) {
      auto channel = std::move(channel_);
      channel->close();
    }
    if (self_) {
      // Released on a later pass, never from inside our own callbacks
      auto keep = std::move(self_);
      parent_->dispatcher_.post([keep]() {});
    }
  }

  std::shared_ptr<TcpConnector> parent_;
  ConnectRequest request_;
  ConnectCallback callback_;
  event::TimerPtr timer_;
  ActiveDnsQuery* query_{nullptr};
  std::vector<AddressConstSharedPtr> addresses_;
  size_t next_address_{0};
  std::string last_error_;
  ChannelImplSharedPtr channel_;
  std::shared_ptr<ConnectAttempt> self_;
};

TcpConnector::TcpConnector(event::Dispatcher& dispatcher,
                           TcpConnectorConfig config)
    : dispatcher_(dispatcher), config_(std::move(config)) {}

DnsResolver& TcpConnector::resolver() {
  if (!resolver_) {
    resolver_ = dispatcher_.createDnsResolver();
  }
  return *resolver_;
}

DisposablePtr TcpConnector::connect(const ConnectRequest& request,
                                    ConnectCallback callback) {
  auto attempt = std::make_shared<ConnectAttempt>(shared_from_this(), request,
                                                  std::move(callback));
  dispatcher_.post([attempt]() { attempt->start(); });

  std::weak_ptr<ConnectAttempt> weak_attempt = attempt;
  event::Dispatcher* dispatcher = &dispatcher_;
  return makeDisposable([weak_attempt, dispatcher]() {
    dispatcher->post([weak_attempt]() {
      if (auto attempt = weak_attempt.lock()) {
        attempt->abandon();
      }
    });
  });
}

}  // namespace network
}  // namespace conduit
