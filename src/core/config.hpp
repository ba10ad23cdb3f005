#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *STATIC_DIR = "static_dir";

// Server Settings
constexpr const char *SRV_HOST = "host";
constexpr const char *SRV_PORT = "port";
constexpr const char *SRV_ENABLE_CORS = "enable_cors";
constexpr const char *SRV_MAX_PAYLOAD_BYTES = "max_payload_bytes";

// Dispatch Settings
constexpr const char *DS_ATTEMPT_TIMEOUT_MS = "attempt_timeout_ms";
constexpr const char *DS_JOIN_GRACE_MS = "join_grace_ms";
constexpr const char *DS_VERIFY_TLS = "verify_tls";
constexpr const char *DS_FORWARD_INBOUND_HEADERS = "forward_inbound_headers";
constexpr const char *DS_USER_AGENT = "user_agent";
constexpr const char *DS_INCLUDE_OUTCOMES = "include_outcomes";

// Registry Settings
constexpr const char *RG_PERSISTENCE_ENABLED = "persistence_enabled";
constexpr const char *RG_STORAGE_PATH = "storage_path";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Prometheus Settings
constexpr const char *PROMETHEUS_ENABLED = "enabled";
constexpr const char *PROMETHEUS_METRICS_PATH = "metrics_path";
constexpr const char *PROMETHEUS_HEALTH_PATH = "health_path";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct ServerConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
  bool enable_cors = true;
  size_t max_payload_bytes = 1024 * 1024;
};

struct DispatchConfig {
  uint32_t attempt_timeout_ms = 5000;
  // Extra time the engine waits past the attempt timeout before it gives up
  // on an attempt that has not reported back.
  uint32_t join_grace_ms = 250;
  bool verify_tls = false;
  bool forward_inbound_headers = true;
  std::string user_agent = "webhook-relay/1.0";
  bool include_outcomes = true;
};

struct RegistryConfig {
  bool persistence_enabled = true;
  std::string storage_path = "endpoints.json";
};

struct PrometheusConfig {
  bool enabled = true;
  std::string metrics_path = "/metrics";
  std::string health_path = "/health";
};

struct AppConfig {
  std::string static_dir = "static";

  ServerConfig server;
  DispatchConfig dispatch;
  RegistryConfig registry;
  LoggingConfig logging;
  PrometheusConfig prometheus;

  // [Routes]: service name -> fixed destination URL
  std::map<std::string, std::string> routes;

  AppConfig();
};

LogLevel string_to_log_level(const std::string &level_str_raw);

// Validation functions for configuration parameters
bool validate_server_config(const ServerConfig &config,
                            std::vector<std::string> &errors);
bool validate_dispatch_config(const DispatchConfig &config,
                              std::vector<std::string> &errors);
bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

// PORT overrides [Server] port when it holds a valid port number.
void apply_environment_overrides(AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
