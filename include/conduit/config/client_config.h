#ifndef CONDUIT_CONFIG_CLIENT_CONFIG_H
#define CONDUIT_CONFIG_CLIENT_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace conduit {
namespace config {

/**
 * @brief Configuration validation error
 *
 * Thrown when configuration validation fails, providing detailed error context
 */
class ConfigValidationError : public std::runtime_error {
 public:
  ConfigValidationError(const std::string& field, const std::string& reason)
      : std::runtime_error("Configuration validation failed for field '" +
                           field + "': " + reason),
        field_(field),
        reason_(reason) {}

  const std::string& field() const { return field_; }
  const std::string& reason() const { return reason_; }

 private:
  std::string field_;
  std::string reason_;
};

/**
 * @brief HTTP client configuration
 *
 * host and port, when set, are the base for relative request URIs.
 */
struct ClientConfig {
  std::string host;
  uint16_t port{0};

  bool follow_redirect{false};
  uint32_t max_redirects{50};

  uint32_t connect_timeout_ms{30000};
  uint32_t ssl_handshake_timeout_ms{10000};
  // 0 disables the response head timeout
  uint32_t response_timeout_ms{0};

  // Socket options
  bool tcp_no_delay{true};
  bool keep_alive{false};
  int linger_seconds{-1};
  uint32_t rcvbuf{0};
  uint32_t sndbuf{0};

  size_t websocket_max_aggregate_bytes{8192};
  size_t write_buffer_high_watermark{64 * 1024};
  size_t read_buffer_high_watermark{64 * 1024};

  // TLS
  bool verify_peer{true};
  std::string ca_file;

  uint32_t worker_threads{1};

  // "ignore" or "fail"
  std::string duplicate_response_head{"ignore"};

  std::string log_level{"info"};
  // Component glob ("http.*") to level name, applied after log_level
  std::map<std::string, std::string> log_levels;
  // "text" or "json"
  std::string log_format{"text"};
  // Empty logs to stderr; otherwise a rotating file
  std::string log_file;
  size_t log_max_file_size{10 * 1024 * 1024};
  size_t log_max_files{5};

  /**
   * @brief Validate the client configuration
   * @throws ConfigValidationError if validation fails
   */
  void validate() const;

  nlohmann::json toJson() const;

  // Missing fields keep their defaults
  static ClientConfig fromJson(const nlohmann::json& j);

  bool operator==(const ClientConfig& other) const {
    return toJson() == other.toJson();
  }
};

/**
 * Load and validate a configuration file. ".yaml" and ".yml" files are
 * read with yaml-cpp, everything else as JSON.
 * @throws ConfigValidationError on unreadable, malformed or invalid files
 */
ClientConfig loadClientConfigFile(const std::string& path);

// YAML text to JSON, scalars typed the way the JSON would have them
nlohmann::json parseYamlToJson(const std::string& content);

}  // namespace config
}  // namespace conduit

#endif  // CONDUIT_CONFIG_CLIENT_CONFIG_H
