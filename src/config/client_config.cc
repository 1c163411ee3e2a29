#include "conduit/config/client_config.h"

#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "conduit/logging/log_level.h"
#include "conduit/logging/log_sink.h"

#define CONDUIT_LOG_COMPONENT "config"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace config {

namespace {

template <typename T>
void readField(const nlohmann::json& j, const char* name, T& target) {
  if (!j.contains(name) || j[name].is_null()) {
    return;
  }
  try {
    target = j[name].get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigValidationError(std::string("client.") + name,
                                "Type error: " + std::string(e.what()));
  }
}

nlohmann::json yamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return nullptr;
    case YAML::NodeType::Scalar: {
      const std::string scalar = node.Scalar();
      if (node.Tag() == "!") {
        // Quoted scalars stay strings
        return scalar;
      }
      if (scalar == "true" || scalar == "false") {
        return node.as<bool>();
      }
      if (scalar == "null" || scalar == "~") {
        return nullptr;
      }
      int64_t integer = 0;
      if (YAML::convert<int64_t>::decode(node, integer)) {
        return integer;
      }
      double number = 0;
      if (scalar.find('.') != std::string::npos &&
          YAML::convert<double>::decode(node, number)) {
        return number;
      }
      return scalar;
    }
    case YAML::NodeType::Sequence: {
      nlohmann::json result = nlohmann::json::array();
      for (const auto& item : node) {
        result.push_back(yamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      nlohmann::json result = nlohmann::json::object();
      for (const auto& pair : node) {
        result[pair.first.as<std::string>()] = yamlToJson(pair.second);
      }
      return result;
    }
    case YAML::NodeType::Undefined:
      break;
  }
  return nullptr;
}

bool endsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

}  // namespace

void ClientConfig::validate() const {
  if (max_redirects > 50) {
    throw ConfigValidationError("client.max_redirects",
                                "Must be between 0 and 50");
  }
  if (connect_timeout_ms == 0) {
    throw ConfigValidationError("client.connect_timeout_ms",
                                "Must be greater than 0");
  }
  if (ssl_handshake_timeout_ms == 0) {
    throw ConfigValidationError("client.ssl_handshake_timeout_ms",
                                "Must be greater than 0");
  }
  if (linger_seconds < -1) {
    throw ConfigValidationError("client.linger_seconds",
                                "Must be -1 (unset) or a number of seconds");
  }
  if (websocket_max_aggregate_bytes == 0) {
    throw ConfigValidationError("client.websocket_max_aggregate_bytes",
                                "Must be greater than 0");
  }
  if (write_buffer_high_watermark == 0) {
    throw ConfigValidationError("client.write_buffer_high_watermark",
                                "Must be greater than 0");
  }
  if (read_buffer_high_watermark == 0) {
    throw ConfigValidationError("client.read_buffer_high_watermark",
                                "Must be greater than 0");
  }
  if (worker_threads == 0 || worker_threads > 256) {
    throw ConfigValidationError("client.worker_threads",
                                "Must be between 1 and 256");
  }
  if (duplicate_response_head != "ignore" &&
      duplicate_response_head != "fail") {
    throw ConfigValidationError("client.duplicate_response_head",
                                "Must be 'ignore' or 'fail', got '" +
                                    duplicate_response_head + "'");
  }
  if (!logging::parseLogLevel(log_level)) {
    throw ConfigValidationError("client.log_level",
                                "Unknown log level '" + log_level + "'");
  }
  for (const auto& entry : log_levels) {
    if (entry.first.empty()) {
      throw ConfigValidationError("client.log_levels",
                                  "Component pattern must not be empty");
    }
    if (!logging::parseLogLevel(entry.second)) {
      throw ConfigValidationError("client.log_levels." + entry.first,
                                  "Unknown log level '" + entry.second + "'");
    }
  }
  if (!logging::parseLogFormat(log_format)) {
    throw ConfigValidationError("client.log_format",
                                "Must be 'text' or 'json', got '" +
                                    log_format + "'");
  }
  if (!log_file.empty()) {
    std::ofstream log_stream(log_file, std::ios::app);
    if (!log_stream.good()) {
      throw ConfigValidationError("client.log_file",
                                  "Cannot open '" + log_file + "' for writing");
    }
  }
  if (!ca_file.empty()) {
    std::ifstream ca_stream(ca_file);
    if (!ca_stream.good()) {
      throw ConfigValidationError("client.ca_file",
                                  "Cannot read '" + ca_file + "'");
    }
  }
}

nlohmann::json ClientConfig::toJson() const {
  nlohmann::json j;
  if (!host.empty()) {
    j["host"] = host;
  }
  if (port != 0) {
    j["port"] = port;
  }
  j["follow_redirect"] = follow_redirect;
  j["max_redirects"] = max_redirects;
  j["connect_timeout_ms"] = connect_timeout_ms;
  j["ssl_handshake_timeout_ms"] = ssl_handshake_timeout_ms;
  j["response_timeout_ms"] = response_timeout_ms;
  j["tcp_no_delay"] = tcp_no_delay;
  j["keep_alive"] = keep_alive;
  j["linger_seconds"] = linger_seconds;
  j["rcvbuf"] = rcvbuf;
  j["sndbuf"] = sndbuf;
  j["websocket_max_aggregate_bytes"] = websocket_max_aggregate_bytes;
  j["write_buffer_high_watermark"] = write_buffer_high_watermark;
  j["read_buffer_high_watermark"] = read_buffer_high_watermark;
  j["verify_peer"] = verify_peer;
  if (!ca_file.empty()) {
    j["ca_file"] = ca_file;
  }
  j["worker_threads"] = worker_threads;
  j["duplicate_response_head"] = duplicate_response_head;
  j["log_level"] = log_level;
  if (!log_levels.empty()) {
    j["log_levels"] = log_levels;
  }
  j["log_format"] = log_format;
  if (!log_file.empty()) {
    j["log_file"] = log_file;
  }
  j["log_max_file_size"] = log_max_file_size;
  j["log_max_files"] = log_max_files;
  return j;
}

ClientConfig ClientConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigValidationError("client", "Expected an object");
  }
  ClientConfig config;
  readField(j, "host", config.host);
  readField(j, "port", config.port);
  readField(j, "follow_redirect", config.follow_redirect);
  readField(j, "max_redirects", config.max_redirects);
  readField(j, "connect_timeout_ms", config.connect_timeout_ms);
  readField(j, "ssl_handshake_timeout_ms", config.ssl_handshake_timeout_ms);
  readField(j, "response_timeout_ms", config.response_timeout_ms);
  readField(j, "tcp_no_delay", config.tcp_no_delay);
  readField(j, "keep_alive", config.keep_alive);
  readField(j, "linger_seconds", config.linger_seconds);
  readField(j, "rcvbuf", config.rcvbuf);
  readField(j, "sndbuf", config.sndbuf);
  readField(j, "websocket_max_aggregate_bytes",
            config.websocket_max_aggregate_bytes);
  readField(j, "write_buffer_high_watermark",
            config.write_buffer_high_watermark);
  readField(j, "read_buffer_high_watermark", config.read_buffer_high_watermark);
  readField(j, "verify_peer", config.verify_peer);
  readField(j, "ca_file", config.ca_file);
  readField(j, "worker_threads", config.worker_threads);
  readField(j, "duplicate_response_head", config.duplicate_response_head);
  readField(j, "log_level", config.log_level);
  readField(j, "log_levels", config.log_levels);
  readField(j, "log_format", config.log_format);
  readField(j, "log_file", config.log_file);
  readField(j, "log_max_file_size", config.log_max_file_size);
  readField(j, "log_max_files", config.log_max_files);
  return config;
}

nlohmann::json parseYamlToJson(const std::string& content) {
  try {
    return yamlToJson(YAML::Load(content));
  } catch (const YAML::ParserException& e) {
    std::ostringstream error;
    error << "YAML parse error at line " << e.mark.line + 1 << ", column "
          << e.mark.column + 1 << ": " << e.msg;
    throw ConfigValidationError("client", error.str());
  }
}

ClientConfig loadClientConfigFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigValidationError("client", "Cannot open '" + path + "'");
  }
  std::stringstream content;
  content << file.rdbuf();

  nlohmann::json j;
  if (endsWith(path, ".yaml") || endsWith(path, ".yml")) {
    j = parseYamlToJson(content.str());
  } else {
    try {
      j = nlohmann::json::parse(content.str());
    } catch (const nlohmann::json::parse_error& e) {
      throw ConfigValidationError(
          "client", "JSON parse error: " + std::string(e.what()));
    }
  }

  // Both a bare object and one nested under "client" are accepted
  if (j.is_object() && j.contains("client")) {
    j = j["client"];
  }
  ClientConfig config = ClientConfig::fromJson(j);
  config.validate();
  CONDUIT_LOG_DEBUG("loaded client configuration from {}", path);
  return config;
}

}  // namespace config
}  // namespace conduit
