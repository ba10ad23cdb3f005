#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/config.hpp"
#include "core/event.hpp"
#include "httplib.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <prometheus/registry.h>
#include <string>
#include <thread>

class DispatchEngine;
class EndpointRegistry;

// Inbound HTTP surface: the /webhook receivers, the /endpoints management
// API used by the UI, health and metrics, and the static UI mount.
class WebServer {
public:
  WebServer(std::shared_ptr<const Config::AppConfig> config,
            EndpointRegistry &registry, DispatchEngine &engine,
            std::shared_ptr<prometheus::Registry> metrics_registry = nullptr);
  ~WebServer();

  // Binds and starts serving on a background thread. Port 0 picks a free
  // port, see port(). Returns false if the address cannot be bound.
  bool start();
  void stop();

  // Swaps settings read per request (routes, include_outcomes).
  void reconfigure(std::shared_ptr<const Config::AppConfig> config);

  int port() const { return bound_port_; }
  bool is_running() const;

  // Copies request headers into an Event, dropping the pseudo-headers
  // httplib adds for the peer and local addresses.
  static HeaderList collect_inbound_headers(const httplib::Request &req);

private:
  void register_routes();
  void run();

  std::shared_ptr<const Config::AppConfig> current_config() const;
  void handle_webhook(const httplib::Request &req, httplib::Response &res);
  void handle_service_webhook(const httplib::Request &req,
                              httplib::Response &res);

  // Runs a handler and maps relay exceptions to status codes.
  void guarded(const char *route, httplib::Response &res,
               const std::function<void()> &handler);

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::atomic<bool> shutdown_flag_{false};

  mutable std::mutex config_mutex_;
  std::shared_ptr<const Config::AppConfig> config_;

  std::string host_;
  int port_;
  int bound_port_ = -1;
  EndpointRegistry &registry_;
  DispatchEngine &engine_;
  std::shared_ptr<prometheus::Registry> metrics_registry_;
};

#endif // WEB_SERVER_HPP
