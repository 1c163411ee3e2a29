/**
 * @file ssl_transport_socket.cc
 * @brief TLS client transport over a non-blocking socket
 */

#include "conduit/transport/ssl_transport_socket.h"

#include <algorithm>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#define CONDUIT_LOG_COMPONENT "transport.ssl"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace transport {

namespace {
constexpr size_t kReadChunkSize = 16384;
}  // namespace

SslTransportSocket::SslTransportSocket(
    SslContextSharedPtr context,
    std::string server_name,
    std::chrono::milliseconds handshake_timeout)
    : context_(std::move(context)),
      server_name_(std::move(server_name)),
      handshake_timeout_(handshake_timeout) {}

SslTransportSocket::~SslTransportSocket() {
  if (ssl_) {
    SSL_free(ssl_);
  }
}

void SslTransportSocket::setTransportSocketCallbacks(
    network::TransportSocketCallbacks& callbacks) {
  callbacks_ = &callbacks;
}

std::string SslTransportSocket::protocol() const {
  if (ssl_ && handshake_complete_) {
    return SSL_get_version(ssl_);
  }
  return "tls";
}

std::string SslTransportSocket::sslErrorReason(int ret) {
  int ssl_error = SSL_get_error(ssl_, ret);
  std::string queue = drainOpenSslErrors();
  switch (ssl_error) {
    case SSL_ERROR_ZERO_RETURN:
      return "TLS connection closed";
    case SSL_ERROR_SYSCALL:
      return queue.empty() ? "TLS syscall error" : "TLS syscall error: " + queue;
    case SSL_ERROR_SSL: {
      std::string reason = "TLS protocol error";
      long verify = SSL_get_verify_result(ssl_);
      if (verify != X509_V_OK) {
        reason += std::string(": certificate verification failed: ") +
                  X509_verify_cert_error_string(verify);
      } else if (!queue.empty()) {
        reason += ": " + queue;
      }
      return reason;
    }
    default:
      return "TLS error " + std::to_string(ssl_error);
  }
}

void SslTransportSocket::onConnected() {
  auto ssl = context_->newSsl(server_name_);
  if (is_error(ssl)) {
    failure_reason_ = get_error(ssl)->message;
    callbacks_->raiseEvent(network::ChannelEvent::RemoteClose);
    return;
  }
  ssl_ = *get_value(ssl);
  if (SSL_set_fd(ssl_, callbacks_->fd()) != 1) {
    failure_reason_ = "Failed to attach socket: " + drainOpenSslErrors();
    callbacks_->raiseEvent(network::ChannelEvent::RemoteClose);
    return;
  }
  SSL_set_connect_state(ssl_);

  if (handshake_timeout_.count() > 0) {
    handshake_timer_ =
        callbacks_->dispatcher().createTimer([this]() { onHandshakeTimeout(); });
    handshake_timer_->enableTimer(handshake_timeout_);
  }

  if (doHandshake() == HandshakeStatus::Failed) {
    callbacks_->raiseEvent(network::ChannelEvent::RemoteClose);
  }
}

SslTransportSocket::HandshakeStatus SslTransportSocket::doHandshake() {
  ERR_clear_error();
  int ret = SSL_do_handshake(ssl_);
  if (ret == 1) {
    handshake_complete_ = true;
    if (handshake_timer_) {
      handshake_timer_->disableTimer();
    }
    CONDUIT_LOG_DEBUG("TLS handshake with {} complete: {} {}", server_name_,
                      SSL_get_version(ssl_), SSL_get_cipher_name(ssl_));
    callbacks_->raiseEvent(network::ChannelEvent::Connected);
    return HandshakeStatus::Complete;
  }

  int ssl_error = SSL_get_error(ssl_, ret);
  if (ssl_error == SSL_ERROR_WANT_READ) {
    return HandshakeStatus::InProgress;
  }
  if (ssl_error == SSL_ERROR_WANT_WRITE) {
    callbacks_->requestWriteReady();
    return HandshakeStatus::InProgress;
  }

  failure_reason_ = "TLS handshake failed: " + sslErrorReason(ret);
  CONDUIT_LOG_DEBUG("{}", failure_reason_);
  return HandshakeStatus::Failed;
}

void SslTransportSocket::onHandshakeTimeout() {
  if (handshake_complete_) {
    return;
  }
  failure_reason_ = "TLS handshake timed out after " +
                    std::to_string(handshake_timeout_.count()) + "ms";
  callbacks_->raiseEvent(network::ChannelEvent::RemoteClose);
}

network::IoResult SslTransportSocket::doRead(Buffer& buffer) {
  if (!ssl_) {
    return network::IoResult::success();
  }
  if (!handshake_complete_) {
    HandshakeStatus status = doHandshake();
    if (status == HandshakeStatus::Failed) {
      return network::IoResult::close();
    }
    if (status == HandshakeStatus::InProgress) {
      return network::IoResult::success();
    }
  }

  uint64_t total = 0;
  char chunk[kReadChunkSize];
  while (true) {
    ERR_clear_error();
    int ret = SSL_read(ssl_, chunk, sizeof(chunk));
    if (ret > 0) {
      buffer.add(chunk, static_cast<size_t>(ret));
      total += static_cast<uint64_t>(ret);
      continue;
    }
    int ssl_error = SSL_get_error(ssl_, ret);
    if (ssl_error == SSL_ERROR_WANT_READ) {
      break;
    }
    if (ssl_error == SSL_ERROR_WANT_WRITE) {
      callbacks_->requestWriteReady();
      break;
    }
    if (ssl_error == SSL_ERROR_ZERO_RETURN) {
      return network::IoResult::endStream(total);
    }
    if (ssl_error == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
      // Peer closed without close_notify
      return network::IoResult::endStream(total);
    }
    failure_reason_ = sslErrorReason(ret);
    return network::IoResult::close(total);
  }
  return network::IoResult::success(total);
}

network::IoResult SslTransportSocket::doWrite(Buffer& buffer) {
  if (!ssl_) {
    return network::IoResult::success();
  }
  if (!handshake_complete_) {
    HandshakeStatus status = doHandshake();
    if (status == HandshakeStatus::Failed) {
      return network::IoResult::close();
    }
    if (status == HandshakeStatus::InProgress) {
      return network::IoResult::success();
    }
  }

  uint64_t total = 0;
  while (buffer.length() > 0) {
    size_t len = std::min<size_t>(buffer.length(), kReadChunkSize);
    const void* data = buffer.linearize(len);
    ERR_clear_error();
    int ret = SSL_write(ssl_, data, static_cast<int>(len));
    if (ret > 0) {
      buffer.drain(static_cast<size_t>(ret));
      total += static_cast<uint64_t>(ret);
      continue;
    }
    int ssl_error = SSL_get_error(ssl_, ret);
    if (ssl_error == SSL_ERROR_WANT_WRITE || ssl_error == SSL_ERROR_WANT_READ) {
      break;
    }
    failure_reason_ = sslErrorReason(ret);
    return network::IoResult::close(total);
  }
  return network::IoResult::success(total);
}

void SslTransportSocket::closeSocket(network::ChannelEvent event) {
  if (handshake_timer_) {
    handshake_timer_->disableTimer();
  }
  if (ssl_ && handshake_complete_ && !shutdown_sent_ &&
      event == network::ChannelEvent::LocalClose) {
    shutdown_sent_ = true;
    ERR_clear_error();
    // One non-blocking close_notify, no wait for the peer's
    SSL_shutdown(ssl_);
  }
}

}  // namespace transport
}  // namespace conduit
