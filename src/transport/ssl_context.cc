#include "conduit/transport/ssl_context.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>

#include <mutex>

#define CONDUIT_LOG_COMPONENT "transport.ssl"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace transport {

namespace {

void initializeOpenSSL() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS |
                         OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                     nullptr);
  });
}

int protocolToVersion(const std::string& protocol) {
  if (protocol == "TLSv1.2") return TLS1_2_VERSION;
  if (protocol == "TLSv1.3") return TLS1_3_VERSION;
  return 0;
}

bool isIpLiteral(const std::string& host) {
  unsigned char buf[sizeof(struct in6_addr)];
  return ::inet_pton(AF_INET, host.c_str(), buf) == 1 ||
         ::inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

}  // namespace

std::string drainOpenSslErrors() {
  std::string result;
  unsigned long code;
  while ((code = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    if (!result.empty()) {
      result += "; ";
    }
    result += buf;
  }
  return result;
}

Result<SslContextSharedPtr> SslContext::create(const SslContextConfig& config) {
  initializeOpenSSL();

  SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
  if (!ctx) {
    return makeError<SslContextSharedPtr>(
        0, "Failed to create SSL context: " + drainOpenSslErrors());
  }

  auto result = initialize(ctx, config);
  if (is_error(result)) {
    SSL_CTX_free(ctx);
    return makeError<SslContextSharedPtr>(*get_error(result));
  }

  return makeSuccess(
      std::shared_ptr<SslContext>(new SslContext(ctx, config)));
}

SslContext::SslContext(SSL_CTX* ctx, const SslContextConfig& config)
    : ctx_(ctx), config_(config) {}

SslContext::~SslContext() {
  if (ctx_) {
    SSL_CTX_free(ctx_);
  }
}

VoidResult SslContext::initialize(SSL_CTX* ctx, const SslContextConfig& config) {
  int min_version = 0;
  int max_version = 0;
  for (const auto& protocol : config.protocols) {
    int version = protocolToVersion(protocol);
    if (version == 0) {
      return makeVoidError(Error(0, "Unsupported TLS protocol: " + protocol));
    }
    if (min_version == 0 || version < min_version) min_version = version;
    if (version > max_version) max_version = version;
  }
  if (min_version != 0 &&
      (SSL_CTX_set_min_proto_version(ctx, min_version) != 1 ||
       SSL_CTX_set_max_proto_version(ctx, max_version) != 1)) {
    return makeVoidError(
        Error(0, "Failed to set TLS versions: " + drainOpenSslErrors()));
  }

  if (config.verify_peer) {
    int rc = config.ca_file.empty()
                 ? SSL_CTX_set_default_verify_paths(ctx)
                 : SSL_CTX_load_verify_locations(ctx, config.ca_file.c_str(),
                                                 nullptr);
    if (rc != 1) {
      return makeVoidError(Error(0, "Failed to load CA certificates: " +
                                        drainOpenSslErrors()));
    }
    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_verify_depth(ctx, 10);
  } else {
    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
  }

  if (!config.alpn_protocols.empty()) {
    std::vector<unsigned char> wire;
    for (const auto& proto : config.alpn_protocols) {
      wire.push_back(static_cast<unsigned char>(proto.size()));
      wire.insert(wire.end(), proto.begin(), proto.end());
    }
    // Returns 0 on success
    if (SSL_CTX_set_alpn_protos(ctx, wire.data(),
                                static_cast<unsigned int>(wire.size())) != 0) {
      return makeVoidError(
          Error(0, "Failed to configure ALPN: " + drainOpenSslErrors()));
    }
  }

  SSL_CTX_set_mode(ctx, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER |
                            SSL_MODE_ENABLE_PARTIAL_WRITE);
  return makeVoidSuccess();
}

Result<SSL*> SslContext::newSsl(const std::string& server_name) const {
  SSL* ssl = SSL_new(ctx_);
  if (!ssl) {
    return makeError<SSL*>(
        0, "Failed to create SSL connection: " + drainOpenSslErrors());
  }

  bool ip_literal = isIpLiteral(server_name);
  if (!server_name.empty() && !ip_literal &&
      SSL_set_tlsext_host_name(ssl, server_name.c_str()) != 1) {
    SSL_free(ssl);
    return makeError<SSL*>(
        0, "Failed to set SNI host name: " + drainOpenSslErrors());
  }

  if (config_.verify_peer && !server_name.empty()) {
    X509_VERIFY_PARAM* param = SSL_get0_param(ssl);
    int rc = ip_literal
                 ? X509_VERIFY_PARAM_set1_ip_asc(param, server_name.c_str())
                 : X509_VERIFY_PARAM_set1_host(param, server_name.c_str(), 0);
    if (rc != 1) {
      SSL_free(ssl);
      return makeError<SSL*>(
          0, "Failed to set expected peer name: " + drainOpenSslErrors());
    }
  }

  CONDUIT_LOG_DEBUG("new TLS connection for {}", server_name);
  return makeSuccess(ssl);
}

}  // namespace transport
}  // namespace conduit
