#include "delivery.hpp"
#include "endpoint.hpp"

#include <utility>

std::string delivery_error_kind_to_string(DeliveryErrorKind kind) {
  switch (kind) {
  case DeliveryErrorKind::NONE:
    return "none";
  case DeliveryErrorKind::TIMEOUT:
    return "timeout";
  case DeliveryErrorKind::CONNECTION_ERROR:
    return "connection_error";
  case DeliveryErrorKind::HTTP_ERROR:
    return "http_error";
  case DeliveryErrorKind::OTHER:
    return "other";
  }
  return "other";
}

DeliveryOutcome DeliveryOutcome::succeeded(const Endpoint &endpoint,
                                           int http_status,
                                           std::chrono::milliseconds latency) {
  DeliveryOutcome outcome;
  outcome.endpoint_id = endpoint.id;
  outcome.endpoint_name = endpoint.name;
  outcome.url = endpoint.url;
  outcome.success = true;
  outcome.http_status = http_status;
  outcome.latency = latency;
  return outcome;
}

DeliveryOutcome DeliveryOutcome::failed(const Endpoint &endpoint,
                                        DeliveryErrorKind kind,
                                        std::optional<int> http_status,
                                        std::string detail,
                                        std::chrono::milliseconds latency) {
  DeliveryOutcome outcome;
  outcome.endpoint_id = endpoint.id;
  outcome.endpoint_name = endpoint.name;
  outcome.url = endpoint.url;
  outcome.success = false;
  outcome.http_status = http_status;
  outcome.error_kind =
      kind == DeliveryErrorKind::NONE ? DeliveryErrorKind::OTHER : kind;

  std::string label = delivery_error_kind_to_string(outcome.error_kind);
  if (outcome.error_kind == DeliveryErrorKind::HTTP_ERROR && http_status)
    label += ":" + std::to_string(*http_status);
  outcome.error = std::move(label);

  outcome.error_detail = std::move(detail);
  outcome.latency = latency;
  return outcome;
}
