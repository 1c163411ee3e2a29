/**
 * @file ssl_context.h
 * @brief Client TLS context shared by all secure channels of a client
 */

#ifndef CONDUIT_TRANSPORT_SSL_CONTEXT_H
#define CONDUIT_TRANSPORT_SSL_CONTEXT_H

#include <memory>
#include <string>
#include <vector>

#include "conduit/core/result.h"

// Forward declare OpenSSL types to avoid exposing OpenSSL headers
typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace conduit {
namespace transport {

class SslContext;
using SslContextSharedPtr = std::shared_ptr<SslContext>;

struct SslContextConfig {
  // Verify the server certificate chain and host name
  bool verify_peer{true};
  // PEM bundle; system default paths when empty
  std::string ca_file;
  std::vector<std::string> protocols{"TLSv1.2", "TLSv1.3"};
  std::vector<std::string> alpn_protocols{"http/1.1"};
};

/**
 * Owns an SSL_CTX. Immutable after creation and safe to share across
 * dispatcher threads.
 */
class SslContext {
 public:
  static Result<SslContextSharedPtr> create(const SslContextConfig& config);

  ~SslContext();

  SslContext(const SslContext&) = delete;
  SslContext& operator=(const SslContext&) = delete;

  /**
   * New client connection object for server_name. Sets SNI and, when
   * peer verification is on, the expected host name.
   * Caller owns the result.
   */
  Result<SSL*> newSsl(const std::string& server_name) const;

  const SslContextConfig& config() const { return config_; }

 private:
  SslContext(SSL_CTX* ctx, const SslContextConfig& config);

  static VoidResult initialize(SSL_CTX* ctx, const SslContextConfig& config);

  SSL_CTX* ctx_;
  const SslContextConfig config_;
};

// Pops the OpenSSL error queue into one message
std::string drainOpenSslErrors();

}  // namespace transport
}  // namespace conduit

#endif  // CONDUIT_TRANSPORT_SSL_CONTEXT_H
