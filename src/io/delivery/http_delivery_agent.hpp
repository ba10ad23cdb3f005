#ifndef HTTP_DELIVERY_AGENT_HPP
#define HTTP_DELIVERY_AGENT_HPP

#include "core/config.hpp"
#include "io/delivery/base_delivery_agent.hpp"

#include <string>

// POSTs the raw event payload as application/json with cpp-httplib.
// https:// endpoints go through httplib::SSLClient.
class HttpDeliveryAgent : public IDeliveryAgent {
public:
  explicit HttpDeliveryAgent(const Config::DispatchConfig &config);

  DeliveryOutcome attempt(const Endpoint &endpoint, const Event &event,
                          std::chrono::milliseconds timeout,
                          AttemptCancellation &cancellation) override;
  const char *get_name() const override { return "HttpDeliveryAgent"; }

  // True for headers that are never copied from the inbound request.
  static bool is_excluded_header(const std::string &name);

private:
  bool verify_tls_;
  bool forward_inbound_headers_;
  std::string user_agent_;
};

#endif // HTTP_DELIVERY_AGENT_HPP
