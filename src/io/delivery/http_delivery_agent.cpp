#include "io/delivery/http_delivery_agent.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "utils/utils.hpp"

#include <exception>
#include <type_traits>
#include <unordered_set>

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               start);
}

// httplib reports an expired read/write timeout as a plain Read/Write error,
// so elapsed time decides between a timeout and a dropped connection.
DeliveryErrorKind classify_transport_error(httplib::Error err,
                                           std::chrono::milliseconds elapsed,
                                           std::chrono::milliseconds timeout) {
  const bool deadline_reached = elapsed.count() * 10 >= timeout.count() * 9;
  switch (err) {
  case httplib::Error::ConnectionTimeout:
    return DeliveryErrorKind::TIMEOUT;
  case httplib::Error::Read:
  case httplib::Error::Write:
    return deadline_reached ? DeliveryErrorKind::TIMEOUT
                            : DeliveryErrorKind::CONNECTION_ERROR;
  case httplib::Error::Connection:
  case httplib::Error::BindIPAddress:
  case httplib::Error::SSLConnection:
  case httplib::Error::SSLServerVerification:
    return deadline_reached ? DeliveryErrorKind::TIMEOUT
                            : DeliveryErrorKind::CONNECTION_ERROR;
  default:
    return deadline_reached ? DeliveryErrorKind::TIMEOUT
                            : DeliveryErrorKind::OTHER;
  }
}

} // namespace

HttpDeliveryAgent::HttpDeliveryAgent(const Config::DispatchConfig &config)
    : verify_tls_(config.verify_tls),
      forward_inbound_headers_(config.forward_inbound_headers),
      user_agent_(config.user_agent) {}

bool HttpDeliveryAgent::is_excluded_header(const std::string &name) {
  static const std::unordered_set<std::string> excluded = {
      "host",          "content-length",      "content-type",
      "connection",    "keep-alive",          "transfer-encoding",
      "te",            "trailer",             "upgrade",
      "proxy-authorization", "proxy-authenticate"};
  return excluded.count(Utils::to_lower_copy(name)) > 0;
}

DeliveryOutcome HttpDeliveryAgent::attempt(const Endpoint &endpoint,
                                           const Event &event,
                                           std::chrono::milliseconds timeout,
                                           AttemptCancellation &cancellation) {
  const auto start = Clock::now();

  if (cancellation.is_cancelled())
    return DeliveryOutcome::failed(endpoint, DeliveryErrorKind::TIMEOUT,
                                   std::nullopt, "cancelled before start",
                                   elapsed_since(start));

  std::string url_error;
  auto url = Utils::parse_url(endpoint.url, &url_error);
  if (!url) {
    LOG(LogLevel::ERROR, LogComponent::DELIVERY,
        "Cannot deliver to " << endpoint.name << ": invalid URL '"
                             << endpoint.url << "' (" << url_error << ")");
    return DeliveryOutcome::failed(endpoint, DeliveryErrorKind::OTHER,
                                   std::nullopt, "invalid URL: " + url_error,
                                   elapsed_since(start));
  }

  httplib::Headers headers;
  if (forward_inbound_headers_) {
    for (const auto &[name, value] : event.headers) {
      if (!is_excluded_header(name))
        headers.emplace(name, value);
    }
  }
  headers.emplace("Host", url->host_header());
  if (headers.find("User-Agent") == headers.end())
    headers.emplace("User-Agent", user_agent_);

  DeliveryOutcome outcome;
  auto send_request = [&](auto &client) {
    // Only SSLClient has certificate settings
    if constexpr (std::is_same_v<std::decay_t<decltype(client)>,
                                 httplib::SSLClient>) {
      client.enable_server_certificate_verification(verify_tls_);
    }
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    // Read/write timeouts restart on every byte; this one caps the request.
    client.set_max_timeout(timeout);
    client.set_keep_alive(false);

    // The hook closes the socket from the engine's thread; it must be gone
    // before `client` is.
    struct HookGuard {
      AttemptCancellation &cancellation;
      ~HookGuard() { cancellation.clear_hook(); }
    } guard{cancellation};
    cancellation.set_hook([&client] { client.stop(); });
    if (cancellation.is_cancelled()) {
      outcome = DeliveryOutcome::failed(endpoint, DeliveryErrorKind::TIMEOUT,
                                        std::nullopt, "cancelled before start",
                                        elapsed_since(start));
      return;
    }

    auto res =
        client.Post(url->path, headers, event.payload, "application/json");
    auto latency = elapsed_since(start);

    if (res && res->status >= 200 && res->status < 300) {
      LOG(LogLevel::DEBUG, LogComponent::DELIVERY,
          "Successfully forwarded to " << endpoint.name << ": status "
                                       << res->status << " in "
                                       << latency.count() << "ms");
      outcome = DeliveryOutcome::succeeded(endpoint, res->status, latency);
    } else if (res) {
      LOG(LogLevel::WARN, LogComponent::DELIVERY,
          "Endpoint " << endpoint.name << " returned error status "
                      << res->status << ": " << res->body);
      outcome = DeliveryOutcome::failed(endpoint, DeliveryErrorKind::HTTP_ERROR,
                                        res->status, res->body, latency);
    } else {
      auto err = res.error();
      auto kind = cancellation.is_cancelled()
                      ? DeliveryErrorKind::TIMEOUT
                      : classify_transport_error(err, latency, timeout);
      LOG(LogLevel::WARN, LogComponent::DELIVERY,
          "Failed to send request to "
              << endpoint.name << " (" << endpoint.url
              << "): " << httplib::to_string(err) << " after "
              << latency.count() << "ms ["
              << delivery_error_kind_to_string(kind) << "]");
      outcome = DeliveryOutcome::failed(endpoint, kind, std::nullopt,
                                        httplib::to_string(err), latency);
    }
  };

  try {
    if (url->is_https()) {
      httplib::SSLClient cli(url->host, url->port);
      send_request(cli);
    } else {
      httplib::Client cli(url->host, url->port);
      send_request(cli);
    }
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::DELIVERY,
        "Unexpected error delivering to " << endpoint.name << ": "
                                          << e.what());
    outcome = DeliveryOutcome::failed(endpoint, DeliveryErrorKind::OTHER,
                                      std::nullopt, e.what(),
                                      elapsed_since(start));
  }
  return outcome;
}
