#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"registry", LogComponent::REGISTRY},
    {"dispatch", LogComponent::DISPATCH},
    {"delivery", LogComponent::DELIVERY},
    {"web", LogComponent::WEB}};

AppConfig::AppConfig() {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

bool validate_server_config(const ServerConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.port < 1 || config.port > 65535) {
    errors.push_back("Server port must be between 1 and 65535");
    valid = false;
  }

  if (config.host.empty()) {
    errors.push_back("Server host must not be empty");
    valid = false;
  }

  if (config.max_payload_bytes < 1024) {
    errors.push_back("Server max payload must be at least 1024 bytes");
    valid = false;
  }

  return valid;
}

bool validate_dispatch_config(const DispatchConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (config.attempt_timeout_ms < 1 || config.attempt_timeout_ms > 600000) {
    errors.push_back(
        "Dispatch attempt timeout must be between 1 and 600000 milliseconds");
    valid = false;
  }

  if (config.join_grace_ms > 60000) {
    errors.push_back("Dispatch join grace must not exceed 60000 milliseconds");
    valid = false;
  }

  return valid;
}

bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.metrics_path.empty() || config.metrics_path[0] != '/') {
    errors.push_back("Prometheus metrics path must start with '/'");
    valid = false;
  }

  if (config.health_path.empty() || config.health_path[0] != '/') {
    errors.push_back("Prometheus health path must start with '/'");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_server_config(config.server, errors)) {
    valid = false;
  }

  if (!validate_dispatch_config(config.dispatch, errors)) {
    valid = false;
  }

  if (!validate_prometheus_config(config.prometheus, errors)) {
    valid = false;
  }

  if (config.registry.persistence_enabled &&
      config.registry.storage_path.empty()) {
    errors.push_back(
        "Registry storage path must be set when persistence is enabled");
    valid = false;
  }

  for (const auto &[service, url] : config.routes) {
    std::string why;
    if (!Utils::parse_url(url, &why)) {
      errors.push_back("Route '" + service + "' has an invalid URL: " + why);
      valid = false;
    }
  }

  // The relay's own paths cannot be shadowed by the metrics/health routes
  for (const char *reserved : {"/webhook", "/endpoints"}) {
    if (config.prometheus.metrics_path == reserved ||
        config.prometheus.health_path == reserved) {
      errors.push_back(std::string("Prometheus paths cannot use ") + reserved);
      valid = false;
    }
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::STATIC_DIR)
          config.static_dir = value;
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown key '" << key << "'" << std::endl;

      } else if (current_section == "Server") {
        if (key == Keys::SRV_HOST)
          config.server.host = value;
        else if (key == Keys::SRV_PORT)
          config.server.port = Utils::string_to_number<int>(value).value_or(
              config.server.port);
        else if (key == Keys::SRV_ENABLE_CORS)
          config.server.enable_cors = string_to_bool(value);
        else if (key == Keys::SRV_MAX_PAYLOAD_BYTES)
          config.server.max_payload_bytes =
              Utils::string_to_number<size_t>(value).value_or(
                  config.server.max_payload_bytes);

      } else if (current_section == "Dispatch") {
        if (key == Keys::DS_ATTEMPT_TIMEOUT_MS)
          config.dispatch.attempt_timeout_ms =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.dispatch.attempt_timeout_ms);
        else if (key == Keys::DS_JOIN_GRACE_MS)
          config.dispatch.join_grace_ms =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.dispatch.join_grace_ms);
        else if (key == Keys::DS_VERIFY_TLS)
          config.dispatch.verify_tls = string_to_bool(value);
        else if (key == Keys::DS_FORWARD_INBOUND_HEADERS)
          config.dispatch.forward_inbound_headers = string_to_bool(value);
        else if (key == Keys::DS_USER_AGENT)
          config.dispatch.user_agent = value;
        else if (key == Keys::DS_INCLUDE_OUTCOMES)
          config.dispatch.include_outcomes = string_to_bool(value);

      } else if (current_section == "Registry") {
        if (key == Keys::RG_PERSISTENCE_ENABLED)
          config.registry.persistence_enabled = string_to_bool(value);
        else if (key == Keys::RG_STORAGE_PATH)
          config.registry.storage_path = value;

      } else if (current_section == "Routes") {
        config.routes[key] = value;

      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto it = key_to_component_map.find(Utils::to_lower_copy(key));
          if (it != key_to_component_map.end())
            config.logging.log_levels[it->second] = string_to_log_level(value);
          else
            std::cerr << "Warning (Config Line " << line_num
                      << "): Unknown logging component '" << key << "'"
                      << std::endl;
        }

      } else if (current_section == "Prometheus") {
        if (key == Keys::PROMETHEUS_ENABLED)
          config.prometheus.enabled = string_to_bool(value);
        else if (key == Keys::PROMETHEUS_METRICS_PATH)
          config.prometheus.metrics_path = value;
        else if (key == Keys::PROMETHEUS_HEALTH_PATH)
          config.prometheus.health_path = value;
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

void apply_environment_overrides(AppConfig &config) {
  const char *port_env = std::getenv("PORT");
  if (!port_env || !*port_env)
    return;

  auto port = Utils::string_to_number<int>(Utils::trim_copy(port_env));
  if (port && *port >= 1 && *port <= 65535) {
    config.server.port = *port;
  } else {
    std::cerr << "Warning: Ignoring invalid PORT value '" << port_env << "'"
              << std::endl;
  }
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
