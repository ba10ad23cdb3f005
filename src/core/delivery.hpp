#ifndef DELIVERY_HPP
#define DELIVERY_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct Endpoint;

enum class DeliveryErrorKind { NONE, TIMEOUT, CONNECTION_ERROR, HTTP_ERROR, OTHER };

// "timeout", "connection_error", "http_error", "other" ("none" for success)
std::string delivery_error_kind_to_string(DeliveryErrorKind kind);

struct DeliveryOutcome {
  std::string endpoint_id;
  std::string endpoint_name;
  std::string url;
  bool success = false;
  std::optional<int> http_status;
  // Classified failure: "timeout", "connection_error", "http_error:<code>"
  // or "other". Empty on success.
  std::optional<std::string> error;
  DeliveryErrorKind error_kind = DeliveryErrorKind::NONE;
  // Transport message for logs, never parsed.
  std::string error_detail;
  std::chrono::milliseconds latency{0};

  static DeliveryOutcome succeeded(const Endpoint &endpoint, int http_status,
                                   std::chrono::milliseconds latency);
  static DeliveryOutcome failed(const Endpoint &endpoint,
                                DeliveryErrorKind kind,
                                std::optional<int> http_status,
                                std::string detail,
                                std::chrono::milliseconds latency);
};

struct DispatchResult {
  size_t total = 0;
  size_t succeeded = 0;
  size_t failed = 0;
  std::vector<DeliveryOutcome> outcomes; // in snapshot order
};

#endif // DELIVERY_HPP
