#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "dispatch/dispatch_engine.hpp"
#include "io/delivery/http_delivery_agent.hpp"
#include "io/web/web_server.hpp"
#include "registry/endpoint_registry.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_config_requested = false;

// A simple, safe signal handler function
void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM) {
    g_shutdown_requested = true;
  } else if (signum == SIGHUP) {
    g_reload_config_requested = true;
  }
}

std::shared_ptr<const Config::AppConfig>
effective_config(const Config::ConfigManager &manager) {
  auto config = std::make_shared<Config::AppConfig>(*manager.get_config());
  Config::apply_environment_overrides(*config);
  return config;
}

int main(int argc, char *argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGHUP, signal_handler);
  // A destination closing mid-write must fail that attempt, not the process.
  std::signal(SIGPIPE, SIG_IGN);

  const std::string config_path = argc > 1 ? argv[1] : "config.ini";

  Config::ConfigManager config_manager;
  const bool config_loaded = config_manager.load_configuration(config_path);
  auto config = effective_config(config_manager);
  LogManager::instance().configure(config->logging);
  if (!config_loaded)
    LOG(LogLevel::WARN, LogComponent::CONFIG,
        "Running with default configuration values");

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Starting webhook relay with configuration from " << config_path);

  EndpointRegistry registry(config->registry);
  registry.load(config->routes);

  auto metrics_registry = MetricsRegistry::instance().get_registry();
  RelayMetrics relay_metrics(*metrics_registry);
  relay_metrics.set_active_endpoints(registry.active_count());

  DispatchEngine engine(registry,
                        std::make_shared<HttpDeliveryAgent>(config->dispatch),
                        config->dispatch, &relay_metrics);

  WebServer web_server(config, registry, engine, metrics_registry);
  if (!web_server.start()) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Could not start the web server, exiting.");
    return 1;
  }

  while (!g_shutdown_requested) {
    if (g_reload_config_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CONFIG,
          "SIGHUP received, reloading " << config_path);
      if (config_manager.load_configuration(config_path)) {
        config = effective_config(config_manager);
        LogManager::instance().configure(config->logging);
        engine.reconfigure(config->dispatch,
                           std::make_shared<HttpDeliveryAgent>(config->dispatch));
        web_server.reconfigure(config);
        LOG(LogLevel::INFO, LogComponent::CONFIG,
            "Configuration reloaded. Server address, CORS and storage "
            "settings apply after a restart.");
      } else {
        LOG(LogLevel::WARN, LogComponent::CONFIG,
            "Reload failed, keeping the current configuration");
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown requested.");
  web_server.stop();
  return 0;
}
