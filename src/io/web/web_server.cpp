#include "web_server.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "dispatch/dispatch_engine.hpp"
#include "dispatch/result_aggregator.hpp"
#include "registry/endpoint_registry.hpp"
#include "utils/json_formatter.hpp"

#include <chrono>
#include <filesystem>
#include <prometheus/text_serializer.h>
#include <utility>
#include <vector>

namespace {

constexpr const char *kJson = "application/json";

nlohmann::json parse_json_body(const httplib::Request &req) {
  try {
    return nlohmann::json::parse(req.body);
  } catch (const nlohmann::json::parse_error &e) {
    throw ValidationError("Invalid JSON payload", e.what());
  }
}

} // namespace

WebServer::WebServer(std::shared_ptr<const Config::AppConfig> config,
                     EndpointRegistry &registry, DispatchEngine &engine,
                     std::shared_ptr<prometheus::Registry> metrics_registry)
    : config_(std::move(config)), host_(config_->server.host),
      port_(config_->server.port), registry_(registry), engine_(engine),
      metrics_registry_(std::move(metrics_registry)) {
  server_ = std::make_unique<httplib::Server>();
  server_->set_payload_max_length(config_->server.max_payload_bytes);

  if (config_->server.enable_cors) {
    server_->set_default_headers(
        {{"Access-Control-Allow-Origin", "*"},
         {"Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS"},
         {"Access-Control-Allow-Headers", "Content-Type"}});
    server_->Options(R"(.*)", [](const httplib::Request &,
                                 httplib::Response &res) { res.status = 204; });
  }

  const std::string &ui_path = config_->static_dir;
  if (!ui_path.empty() && std::filesystem::is_directory(ui_path)) {
    if (!server_->set_mount_point("/", ui_path)) {
      LOG(LogLevel::WARN, LogComponent::WEB,
          "Failed to set mount point for UI. UI will not be available.");
    }
  } else {
    LOG(LogLevel::WARN, LogComponent::WEB,
        "Static directory '" << ui_path
                             << "' not found. UI will not be available.");
  }

  server_->set_logger([](const httplib::Request &req,
                         const httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::WEB,
        req.method << " " << req.path << " from " << req.remote_addr << " -> "
                   << res.status);
  });

  register_routes();

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Web server initialized for " << host_ << ":" << port_);
}

WebServer::~WebServer() {
  if (server_thread_.joinable())
    stop();
}

std::shared_ptr<const Config::AppConfig> WebServer::current_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return config_;
}

void WebServer::reconfigure(std::shared_ptr<const Config::AppConfig> config) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_ = std::move(config);
}

HeaderList WebServer::collect_inbound_headers(const httplib::Request &req) {
  HeaderList headers;
  for (const auto &[name, value] : req.headers) {
    if (name == "REMOTE_ADDR" || name == "REMOTE_PORT" ||
        name == "LOCAL_ADDR" || name == "LOCAL_PORT")
      continue;
    headers.emplace_back(name, value);
  }
  return headers;
}

void WebServer::guarded(const char *route, httplib::Response &res,
                        const std::function<void()> &handler) {
  try {
    handler();
  } catch (const ValidationError &e) {
    res.status = 400;
    res.set_content(JsonFormatter::format_error_body(e.what(), e.details()),
                    kJson);
  } catch (const NotFoundError &e) {
    res.status = 404;
    res.set_content(JsonFormatter::format_error_body(e.what()), kJson);
  } catch (const InternalError &e) {
    LOG(LogLevel::ERROR, LogComponent::WEB,
        "Internal error handling " << route << ": " << e.what());
    res.status = 500;
    res.set_content(
        JsonFormatter::format_error_body("Internal server error", e.what()),
        kJson);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::WEB,
        "Unexpected error handling " << route << ": " << e.what());
    res.status = 500;
    res.set_content(
        JsonFormatter::format_error_body("Internal server error", e.what()),
        kJson);
  }
}

void WebServer::register_routes() {
  server_->Get("/endpoints", [this](const httplib::Request &,
                                    httplib::Response &res) {
    guarded("GET /endpoints", res, [&] {
      res.set_content(
          JsonFormatter::endpoints_to_json_array(registry_.list()).dump(),
          kJson);
    });
  });

  server_->Post("/endpoints", [this](const httplib::Request &req,
                                     httplib::Response &res) {
    guarded("POST /endpoints", res, [&] {
      nlohmann::json body = parse_json_body(req);
      if (!body.is_object() || !body.contains("url") ||
          !body["url"].is_string() || !body.contains("name") ||
          !body["name"].is_string())
        throw ValidationError("Invalid request body",
                              "expected {url: string, name: string, "
                              "is_active?: boolean}");

      bool is_active = false;
      if (body.contains("is_active")) {
        if (!body["is_active"].is_boolean())
          throw ValidationError("Invalid request body",
                                "is_active must be a boolean");
        is_active = body["is_active"].get<bool>();
      }

      auto endpoints = registry_.create(body["name"].get<std::string>(),
                                        body["url"].get<std::string>(),
                                        is_active);
      res.set_content(JsonFormatter::endpoints_to_json_array(endpoints).dump(),
                      kJson);
    });
  });

  server_->Put(R"(/endpoints/([^/]+)/status)",
               [this](const httplib::Request &req, httplib::Response &res) {
                 guarded("PUT /endpoints/{id}/status", res, [&] {
                   const std::string id = req.matches[1];
                   nlohmann::json body = parse_json_body(req);
                   if (!body.is_object() || !body.contains("is_active") ||
                       !body["is_active"].is_boolean())
                     throw ValidationError("Invalid request body",
                                           "expected {is_active: boolean}");

                   Endpoint updated = registry_.update_status(
                       id, body["is_active"].get<bool>());
                   res.set_content(
                       JsonFormatter::endpoint_to_json_object(updated).dump(),
                       kJson);
                 });
               });

  server_->Delete(R"(/endpoints/([^/]+))",
                  [this](const httplib::Request &req, httplib::Response &res) {
                    guarded("DELETE /endpoints/{id}", res, [&] {
                      const std::string id = req.matches[1];
                      auto endpoints = registry_.remove(id);
                      res.set_content(
                          JsonFormatter::endpoints_to_json_array(endpoints)
                              .dump(),
                          kJson);
                    });
                  });

  server_->Post("/webhook",
                [this](const httplib::Request &req, httplib::Response &res) {
                  guarded("POST /webhook", res,
                          [&] { handle_webhook(req, res); });
                });

  server_->Post(R"(/webhook/([^/]+))",
                [this](const httplib::Request &req, httplib::Response &res) {
                  guarded("POST /webhook/{service}", res,
                          [&] { handle_service_webhook(req, res); });
                });

  server_->Get(config_->prometheus.health_path,
               [this](const httplib::Request &, httplib::Response &res) {
                 nlohmann::json j{{"status", "ok"},
                                  {"endpoints", registry_.size()},
                                  {"active_endpoints", registry_.active_count()}};
                 res.set_content(j.dump(), kJson);
               });

  if (config_->prometheus.enabled && metrics_registry_) {
    server_->Get(config_->prometheus.metrics_path,
                 [this](const httplib::Request &req, httplib::Response &res) {
                   LOG(LogLevel::DEBUG, LogComponent::WEB,
                       "Received request for metrics from "
                           << req.remote_addr);
                   prometheus::TextSerializer serializer;
                   auto collected_metrics = metrics_registry_->Collect();
                   res.set_content(serializer.Serialize(collected_metrics),
                                   "text/plain; version=0.0.4");
                 });
  }
}

void WebServer::handle_webhook(const httplib::Request &req,
                               httplib::Response &res) {
  // Only well-formed JSON is relayed; the bytes forwarded are the original
  // body, not a re-serialization.
  parse_json_body(req);

  Event event;
  event.payload = req.body;
  event.headers = collect_inbound_headers(req);

  DispatchResult result = engine_.dispatch(event);
  res.set_content(
      ResultAggregator::to_json(result,
                                current_config()->dispatch.include_outcomes)
          .dump(),
      kJson);
}

void WebServer::handle_service_webhook(const httplib::Request &req,
                                       httplib::Response &res) {
  const std::string service = req.matches[1];
  auto config = current_config();

  auto route = config->routes.find(service);
  if (route == config->routes.end())
    throw NotFoundError("Unknown webhook service: " + service);

  parse_json_body(req);

  Event event;
  event.payload = req.body;
  event.headers = collect_inbound_headers(req);

  Endpoint destination;
  destination.id = service;
  destination.name = "Static " + service + " endpoint";
  destination.url = route->second;
  destination.is_active = true;

  DispatchResult result = engine_.dispatch_to({destination}, event);
  res.set_content(
      ResultAggregator::to_json(result, config->dispatch.include_outcomes)
          .dump(),
      kJson);
}

bool WebServer::start() {
  if (server_thread_.joinable())
    return true; // Already running

  if (port_ == 0) {
    bound_port_ = server_->bind_to_any_port(host_);
  } else {
    bound_port_ = server_->bind_to_port(host_, port_) ? port_ : -1;
  }

  if (bound_port_ <= 0) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Web server failed to bind " << host_ << ":" << port_);
    return false;
  }

  shutdown_flag_ = false;
  server_thread_ = std::thread(&WebServer::run, this);

  // The socket is already listening; wait for the accept loop as well.
  for (int i = 0; i < 200 && !server_->is_running(); ++i)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Webhook relay listening on " << host_ << ":" << bound_port_);
  return true;
}

void WebServer::stop() {
  shutdown_flag_ = true;
  if (server_)
    server_->stop();

  if (server_thread_.joinable())
    server_thread_.join();

  LOG(LogLevel::INFO, LogComponent::CORE, "Web server stopped.");
}

bool WebServer::is_running() const {
  return server_ && server_->is_running();
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Web server starting on a background thread...");
  if (!server_->listen_after_bind()) {
    if (!shutdown_flag_)
      LOG(LogLevel::FATAL, LogComponent::CORE,
          "Web server stopped accepting on " << host_ << ":" << bound_port_);
  }
}
